#include "deccalc/big_int.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace deccalc {

namespace {

// Scratch mpz_t that is cleared on scope exit.
struct GmpInt {
    mpz_t value;
    GmpInt() { mpz_init(value); }
    ~GmpInt() { mpz_clear(value); }
    GmpInt(const GmpInt&) = delete;
    GmpInt& operator=(const GmpInt&) = delete;
};

// mpz_get_str allocates through GMP's allocator, so it must be released the same way.
std::string take_gmp_string(char* raw) {
    if (!raw) return "0";
    std::string out(raw);
    void (*free_fn)(void*, size_t) = nullptr;
    mp_get_memory_functions(nullptr, nullptr, &free_fn);
    if (free_fn) free_fn(raw, std::strlen(raw) + 1U);
    return out.empty() ? "0" : out;
}

} // namespace

BigInt::BigInt() { mpz_init(value_); }

BigInt::BigInt(const BigInt& other) { mpz_init_set(value_, other.value_); }

BigInt::BigInt(BigInt&& other) noexcept {
    mpz_init(value_);
    mpz_swap(value_, other.value_);
}

BigInt& BigInt::operator=(const BigInt& other) {
    if (this != &other) mpz_set(value_, other.value_);
    return *this;
}

BigInt& BigInt::operator=(BigInt&& other) noexcept {
    mpz_swap(value_, other.value_);
    return *this;
}

BigInt::~BigInt() { mpz_clear(value_); }

BigInt BigInt::from_decimal(std::string_view text) {
    std::size_t start = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        start = 1;
    }
    if (text.size() <= start) throw std::invalid_argument("Invalid integer literal: '" + std::string(text) + "'");

    for (std::size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            throw std::invalid_argument("Invalid integer literal: '" + std::string(text) + "'");
    }

    BigInt out;
    // mpz_set_str wants a NUL-terminated buffer and rejects a leading '+'.
    std::string digits(text.substr(start));
    if (mpz_set_str(out.value_, digits.c_str(), 10) != 0)
        throw std::invalid_argument("Invalid integer literal: '" + std::string(text) + "'");
    if (negative) mpz_neg(out.value_, out.value_);
    return out;
}

BigInt BigInt::times_pow10(unsigned long exp) const {
    GmpInt scale;
    mpz_ui_pow_ui(scale.value, 10U, exp);
    BigInt out;
    mpz_mul(out.value_, value_, scale.value);
    return out;
}

std::string BigInt::to_string() const {
    return take_gmp_string(mpz_get_str(nullptr, 10, value_));
}

} // namespace deccalc
