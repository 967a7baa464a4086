#pragma once
#include <string>
#include <string_view>

#include <gmp.h>

namespace deccalc {

// Immutable arbitrary-precision integer over GMP's mpz_t.
class BigInt {
public:
    BigInt();
    BigInt(const BigInt& other);
    BigInt(BigInt&& other) noexcept;
    BigInt& operator=(const BigInt& other);
    BigInt& operator=(BigInt&& other) noexcept;
    ~BigInt();

    /// Optional leading '+' or '-', then one or more base-10 digits.
    /// Throws std::invalid_argument otherwise.
    static BigInt from_decimal(std::string_view text);

    /// this * 10^exp
    BigInt times_pow10(unsigned long exp) const;

    std::string to_string() const;

    int sign() const { return mpz_sgn(value_); }
    bool operator==(const BigInt& other) const { return mpz_cmp(value_, other.value_) == 0; }
    bool operator!=(const BigInt& other) const { return !(*this == other); }

private:
    mpz_t value_;
};

} // namespace deccalc
