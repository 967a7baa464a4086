#pragma once
#include <string>

namespace deccalc {

/// Render x as a plain decimal string, never in scientific notation.
/// NaN and infinities become "NaN", "Infinity" and "-Infinity".
/// Digits of the shortest round-trip form are shifted across the decimal
/// point with BigInt arithmetic, so 1e20 prints all 21 digits exactly.
std::string format_full_decimal(double x);

// Drop trailing zeros after a '.', then the '.' itself if nothing is left.
// Strings without a '.' are left alone.
void trim_trailing_zeros(std::string& s);

} // namespace deccalc
