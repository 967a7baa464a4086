#include <gtest/gtest.h>
#include <deccalc/decimal_format.hpp>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace {

using deccalc::format_full_decimal;

TEST(DecimalFormat, SpecialValues) {
    EXPECT_EQ(format_full_decimal(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(format_full_decimal(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(format_full_decimal(-std::numeric_limits<double>::infinity()), "-Infinity");
    EXPECT_EQ(format_full_decimal(0.0), "0");
    EXPECT_EQ(format_full_decimal(-0.0), "0");
}

TEST(DecimalFormat, PlainRange) {
    EXPECT_EQ(format_full_decimal(2.0), "2");
    EXPECT_EQ(format_full_decimal(-2.5), "-2.5");
    EXPECT_EQ(format_full_decimal(0.1), "0.1");
    EXPECT_EQ(format_full_decimal(123.456), "123.456");
    EXPECT_EQ(format_full_decimal(0.1 + 0.2), "0.30000000000000004");
    EXPECT_EQ(format_full_decimal(1234567890123456.0), "1234567890123456");
}

TEST(DecimalFormat, LargeValuesKeepEveryDigit) {
    EXPECT_EQ(format_full_decimal(1e20), "100000000000000000000");
    EXPECT_EQ(format_full_decimal(-1e20), "-100000000000000000000");
    EXPECT_EQ(format_full_decimal(1e16), "10000000000000000");
    EXPECT_EQ(format_full_decimal(1e15), "1000000000000000");
    EXPECT_EQ(format_full_decimal(1.5e20), "150000000000000000000");
    EXPECT_EQ(format_full_decimal(123e6), "123000000");

    std::string s = format_full_decimal(1.5e300);
    ASSERT_EQ(s.size(), 301u);
    EXPECT_EQ(s.substr(0, 2), "15");
    EXPECT_EQ(s.find_first_not_of('0', 2), std::string::npos);
}

TEST(DecimalFormat, SmallValuesKeepEveryDigit) {
    EXPECT_EQ(format_full_decimal(1e-20), "0.00000000000000000001");
    EXPECT_EQ(format_full_decimal(1e-6), "0.000001");
    EXPECT_EQ(format_full_decimal(1.5e-7), "0.00000015");
    EXPECT_EQ(format_full_decimal(-2.5e-8), "-0.000000025");
    EXPECT_EQ(format_full_decimal(1.25e-10), "0.000000000125");

    std::string s = format_full_decimal(std::numeric_limits<double>::denorm_min());
    ASSERT_EQ(s.size(), 326u);
    EXPECT_EQ(s.substr(0, 2), "0.");
    EXPECT_EQ(s.back(), '5');
}

TEST(DecimalFormat, RoundTripsInPlainRange) {
    const double values[] = {1e-6, 3.14159, 0.000123, 42.0, 123456.789, 9.999e15, -7.25, 1.0 / 3.0,
                             1.2345678901234567e-5, 1.0 / 3.0 * 1e-5, 1.0 / 7.0 * 1e-5, -2.0 / 3.0 * 1e-5};
    for (double v : values) {
        const std::string s = format_full_decimal(v);
        EXPECT_EQ(s.find_first_of("eE"), std::string::npos) << s;
        EXPECT_EQ(std::strtod(s.c_str(), nullptr), v) << s;
    }
}

TEST(DecimalFormat, SeventeenDigitsBelowOneTenThousandth) {
    EXPECT_EQ(format_full_decimal(1.2345678901234567e-5), "0.000012345678901234568");
    EXPECT_EQ(format_full_decimal(1.0 / 3.0 * 1e-5), "0.0000033333333333333333");
    EXPECT_EQ(format_full_decimal(1.0 / 7.0 * 1e-5), "0.0000014285714285714286");
}

TEST(DecimalFormat, SameInputSameOutput) {
    const double v = 6.02214076e23;
    const std::string first = format_full_decimal(v);
    format_full_decimal(1e-20);
    format_full_decimal(-3.5);
    EXPECT_EQ(format_full_decimal(v), first);
    EXPECT_EQ(first, "602214076000000000000000");
}

TEST(DecimalFormat, TrimTrailingZeros) {
    std::string a = "2.000000";
    deccalc::trim_trailing_zeros(a);
    EXPECT_EQ(a, "2");

    std::string b = "1.2500";
    deccalc::trim_trailing_zeros(b);
    EXPECT_EQ(b, "1.25");

    std::string c = "1000";
    deccalc::trim_trailing_zeros(c);
    EXPECT_EQ(c, "1000");

    std::string d = "0.";
    deccalc::trim_trailing_zeros(d);
    EXPECT_EQ(d, "0");
}

} // namespace
