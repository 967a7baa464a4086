#include "deccalc/decimal_format.hpp"
#include "deccalc/big_int.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace deccalc {

// Shortest fixed-notation string that reads back as the same double.
// Only used for |x| in [1e-6, 1e16), where it stays under 64 chars.
static std::string shortest_fixed(double x) {
    std::array<char, 64> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), x, std::chars_format::fixed);
    if (res.ec != std::errc()) throw std::runtime_error("to_chars failed");
    return std::string(buf.data(), res.ptr);
}

static std::string shortest_scientific(double x) {
    std::array<char, 64> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), x, std::chars_format::scientific);
    if (res.ec != std::errc()) throw std::runtime_error("to_chars failed");
    return std::string(buf.data(), res.ptr);
}

void trim_trailing_zeros(std::string& s) {
    if (s.find('.') == std::string::npos) return;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
}

// digits * 10^-shift, written with an explicit decimal point.
static std::string place_decimal_point(const std::string& digits, std::size_t shift) {
    const std::size_t len = digits.size();
    if (shift >= len) return "0." + std::string(shift - len, '0') + digits;
    return digits.substr(0, len - shift) + "." + digits.substr(len - shift);
}

// magnitude * 10^exp for a non-negative magnitude, as plain decimal.
static std::string expand_scientific(double magnitude, int exp) {
    std::array<char, 64> buf{};
    int n = std::snprintf(buf.data(), buf.size(), "%.15f", magnitude);
    if (n < 0 || static_cast<std::size_t>(n) >= buf.size()) throw std::runtime_error("mantissa does not fit");
    std::string mantissa(buf.data(), static_cast<std::size_t>(n));
    trim_trailing_zeros(mantissa);

    std::string int_part = mantissa;
    std::string frac_part;
    auto dot = mantissa.find('.');
    if (dot != std::string::npos) {
        int_part = mantissa.substr(0, dot);
        frac_part = mantissa.substr(dot + 1);
    }

    BigInt digits = BigInt::from_decimal(int_part + frac_part);
    const long adjusted = static_cast<long>(exp) - static_cast<long>(frac_part.size());

    if (adjusted >= 0) return digits.times_pow10(static_cast<unsigned long>(adjusted)).to_string();
    return place_decimal_point(digits.to_string(), static_cast<std::size_t>(-adjusted));
}

std::string format_full_decimal(double x) {
    if (std::isnan(x)) return "NaN";
    if (std::isinf(x)) return x > 0 ? "Infinity" : "-Infinity";

    const double ax = std::fabs(x);
    if (ax >= 1e-6 && ax < 1e16) {
        std::string s = shortest_fixed(x);
        trim_trailing_zeros(s);
        return s;
    }

    const std::string sci = shortest_scientific(x);
    const auto e = sci.find('e');
    if (e == std::string::npos) throw std::runtime_error("no exponent in '" + sci + "'");
    const double mantissa = std::strtod(sci.substr(0, e).c_str(), nullptr);
    const int exp = static_cast<int>(std::strtol(sci.c_str() + e + 1, nullptr, 10));

    // -0.0 has a non-negative mantissa and comes out as "0"
    std::string out = mantissa < 0 ? "-" + expand_scientific(-mantissa, exp) : expand_scientific(std::fabs(mantissa), exp);
    trim_trailing_zeros(out);
    return out;
}

} // namespace deccalc
