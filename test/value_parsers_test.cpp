#include "pqstudio/value_parsers.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace pqstudio;

// ============================================================================
// BOOL
// ============================================================================

TEST(ParseBoolTest, RecognizedForms) {
  bool v = false;
  for (const char* s : {"true", "TRUE", "t", "Yes", "y", "1", "  true "}) {
    EXPECT_EQ(parse_bool(s, v), ParseStatus::OK) << s;
    EXPECT_TRUE(v) << s;
  }
  for (const char* s : {"false", "False", "F", "no", "N", "0"}) {
    EXPECT_EQ(parse_bool(s, v), ParseStatus::OK) << s;
    EXPECT_FALSE(v) << s;
  }
}

TEST(ParseBoolTest, Rejects) {
  bool v = false;
  EXPECT_EQ(parse_bool("", v), ParseStatus::EMPTY);
  EXPECT_EQ(parse_bool("   ", v), ParseStatus::EMPTY);
  EXPECT_EQ(parse_bool("maybe", v), ParseStatus::INVALID);
  EXPECT_EQ(parse_bool("2", v), ParseStatus::INVALID);
  EXPECT_EQ(parse_bool("truee", v), ParseStatus::INVALID);
}

// ============================================================================
// INTEGERS
// ============================================================================

TEST(ParseIntegerTest, Int32) {
  int32_t v = 0;
  EXPECT_EQ(parse_int32("12", v), ParseStatus::OK);
  EXPECT_EQ(v, 12);
  EXPECT_EQ(parse_int32(" -42 ", v), ParseStatus::OK);
  EXPECT_EQ(v, -42);
  EXPECT_EQ(parse_int32("+7", v), ParseStatus::OK);
  EXPECT_EQ(v, 7);
  EXPECT_EQ(parse_int32("2147483647", v), ParseStatus::OK);
  EXPECT_EQ(v, std::numeric_limits<int32_t>::max());
  EXPECT_EQ(parse_int32("-2147483648", v), ParseStatus::OK);
  EXPECT_EQ(v, std::numeric_limits<int32_t>::min());
}

TEST(ParseIntegerTest, FractionIsNotAnInteger) {
  int32_t v = 99;
  EXPECT_EQ(parse_int32("12.5", v), ParseStatus::NOT_INTEGER);
  EXPECT_EQ(parse_int32("1e3", v), ParseStatus::NOT_INTEGER);
  EXPECT_EQ(v, 99);
}

TEST(ParseIntegerTest, OutOfRange) {
  int32_t v32 = 0;
  EXPECT_EQ(parse_int32("2147483648", v32), ParseStatus::OUT_OF_RANGE);
  int64_t v64 = 0;
  EXPECT_EQ(parse_int64("9223372036854775808", v64), ParseStatus::OUT_OF_RANGE);
  EXPECT_EQ(parse_int64("9223372036854775807", v64), ParseStatus::OK);
  EXPECT_EQ(v64, std::numeric_limits<int64_t>::max());
}

TEST(ParseIntegerTest, Invalid) {
  int64_t v = 0;
  EXPECT_EQ(parse_int64("", v), ParseStatus::EMPTY);
  EXPECT_EQ(parse_int64("abc", v), ParseStatus::INVALID);
  EXPECT_EQ(parse_int64("12abc", v), ParseStatus::INVALID);
  EXPECT_EQ(parse_int64("++1", v), ParseStatus::INVALID);
  EXPECT_EQ(parse_int64("1 2", v), ParseStatus::INVALID);
}

// ============================================================================
// FLOATS
// ============================================================================

TEST(ParseFloatTest, Float64) {
  double v = 0;
  EXPECT_EQ(parse_float64("3.25", v), ParseStatus::OK);
  EXPECT_DOUBLE_EQ(v, 3.25);
  EXPECT_EQ(parse_float64("-1e-3", v), ParseStatus::OK);
  EXPECT_DOUBLE_EQ(v, -0.001);
  EXPECT_EQ(parse_float64("+2", v), ParseStatus::OK);
  EXPECT_DOUBLE_EQ(v, 2.0);
}

TEST(ParseFloatTest, SpecialValues) {
  double v = 0;
  EXPECT_EQ(parse_float64("nan", v), ParseStatus::OK);
  EXPECT_TRUE(std::isnan(v));
  EXPECT_EQ(parse_float64("inf", v), ParseStatus::OK);
  EXPECT_TRUE(std::isinf(v) && v > 0);
  EXPECT_EQ(parse_float64("-Infinity", v), ParseStatus::OK);
  EXPECT_TRUE(std::isinf(v) && v < 0);
}

TEST(ParseFloatTest, OverflowIsOutOfRange) {
  float f = 0;
  EXPECT_EQ(parse_float32("1e39", f), ParseStatus::OUT_OF_RANGE);
  double d = 0;
  EXPECT_EQ(parse_float64("1e400", d), ParseStatus::OUT_OF_RANGE);
}

TEST(ParseFloatTest, Invalid) {
  double v = 0;
  EXPECT_EQ(parse_float64("", v), ParseStatus::EMPTY);
  EXPECT_EQ(parse_float64("1.2.3", v), ParseStatus::INVALID);
  EXPECT_EQ(parse_float64("one", v), ParseStatus::INVALID);
}

// ============================================================================
// DATES AND TIMESTAMPS
// ============================================================================

TEST(ParseDateTest, Valid) {
  int32_t days = -1;
  EXPECT_EQ(parse_date("1970-01-01", days), ParseStatus::OK);
  EXPECT_EQ(days, 0);
  EXPECT_EQ(parse_date("1969-12-31", days), ParseStatus::OK);
  EXPECT_EQ(days, -1);
  EXPECT_EQ(parse_date("2000-03-01", days), ParseStatus::OK);
  EXPECT_EQ(days, 11017);
  EXPECT_EQ(parse_date("2024-02-29", days), ParseStatus::OK);
  EXPECT_EQ(days, 19782);
}

TEST(ParseDateTest, Invalid) {
  int32_t days = 0;
  EXPECT_EQ(parse_date("2023-02-29", days), ParseStatus::INVALID);
  EXPECT_EQ(parse_date("2023-13-01", days), ParseStatus::INVALID);
  EXPECT_EQ(parse_date("2023-1-01", days), ParseStatus::INVALID);
  EXPECT_EQ(parse_date("01/02/2023", days), ParseStatus::INVALID);
  EXPECT_EQ(parse_date("0000-01-01", days), ParseStatus::OUT_OF_RANGE);
  EXPECT_EQ(parse_date("", days), ParseStatus::EMPTY);
}

TEST(ParseTimestampTest, Units) {
  int64_t v = 0;
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00:01", TimeUnit::MILLIS, false, v), ParseStatus::OK);
  EXPECT_EQ(v, 1000);
  EXPECT_EQ(parse_timestamp("1970-01-01 00:00:01.5", TimeUnit::MICROS, false, v),
            ParseStatus::OK);
  EXPECT_EQ(v, 1500000);
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00:00.000000001", TimeUnit::NANOS, false, v),
            ParseStatus::OK);
  EXPECT_EQ(v, 1);
  EXPECT_EQ(parse_timestamp("1970-01-02", TimeUnit::MILLIS, false, v), ParseStatus::OK);
  EXPECT_EQ(v, 86400000);
}

TEST(ParseTimestampTest, BeforeEpoch) {
  int64_t v = 0;
  EXPECT_EQ(parse_timestamp("1969-12-31T23:59:59.999999", TimeUnit::MICROS, false, v),
            ParseStatus::OK);
  EXPECT_EQ(v, -1);
}

TEST(ParseTimestampTest, ExtraFractionDigits) {
  int64_t v = 0;
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00:00.1230", TimeUnit::MILLIS, false, v),
            ParseStatus::OK);
  EXPECT_EQ(v, 123);
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00:00.1234", TimeUnit::MILLIS, false, v),
            ParseStatus::PRECISION_LOSS);
}

TEST(ParseTimestampTest, ZoneRequiresUtcColumn) {
  int64_t v = 0;
  EXPECT_EQ(parse_timestamp("1970-01-01T01:00:00+01:00", TimeUnit::MILLIS, true, v),
            ParseStatus::OK);
  EXPECT_EQ(v, 0);
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00:00Z", TimeUnit::MILLIS, true, v), ParseStatus::OK);
  EXPECT_EQ(v, 0);
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00:00Z", TimeUnit::MILLIS, false, v),
            ParseStatus::ZONE_NOT_ALLOWED);
}

TEST(ParseTimestampTest, Invalid) {
  int64_t v = 0;
  EXPECT_EQ(parse_timestamp("1970-01-01T25:00:00", TimeUnit::MILLIS, false, v),
            ParseStatus::INVALID);
  EXPECT_EQ(parse_timestamp("1970-01-01T00:00", TimeUnit::MILLIS, false, v),
            ParseStatus::INVALID);
  EXPECT_EQ(parse_timestamp("yesterday", TimeUnit::MILLIS, false, v), ParseStatus::INVALID);
}

TEST(FormatTimestampTest, CanonicalForm) {
  EXPECT_EQ(format_timestamp(0, TimeUnit::MICROS, false), "1970-01-01T00:00:00");
  EXPECT_EQ(format_timestamp(1500000, TimeUnit::MICROS, false), "1970-01-01T00:00:01.500000");
  EXPECT_EQ(format_timestamp(-1, TimeUnit::MILLIS, true), "1969-12-31T23:59:59.999Z");
  EXPECT_EQ(format_date(-1), "1969-12-31");
  EXPECT_EQ(format_date(19782), "2024-02-29");
}

TEST(FormatTimestampTest, ParsesBack) {
  for (int64_t v : {int64_t{0}, int64_t{-1}, int64_t{1700000000123456}, int64_t{-86400000001}}) {
    std::string text = format_timestamp(v, TimeUnit::MICROS, true);
    int64_t back = 0;
    ASSERT_EQ(parse_timestamp(text, TimeUnit::MICROS, true, back), ParseStatus::OK) << text;
    EXPECT_EQ(back, v) << text;
  }
}

// ============================================================================
// DECIMALS
// ============================================================================

TEST(ParseDecimalTest, ScalesExactly) {
  Int128 v = 0;
  EXPECT_EQ(parse_decimal("123.45", 10, 2, v), ParseStatus::OK);
  EXPECT_TRUE(v == 12345);
  EXPECT_EQ(parse_decimal("-0.5", 10, 2, v), ParseStatus::OK);
  EXPECT_TRUE(v == -50);
  EXPECT_EQ(parse_decimal("7", 10, 2, v), ParseStatus::OK);
  EXPECT_TRUE(v == 700);
  EXPECT_EQ(parse_decimal("1.230", 10, 2, v), ParseStatus::OK);
  EXPECT_TRUE(v == 123);
}

TEST(ParseDecimalTest, Limits) {
  Int128 v = 0;
  EXPECT_EQ(parse_decimal("1.234", 10, 2, v), ParseStatus::PRECISION_LOSS);
  EXPECT_EQ(parse_decimal("123456789", 10, 2, v), ParseStatus::OUT_OF_RANGE);
  EXPECT_EQ(parse_decimal("12345678", 10, 2, v), ParseStatus::OK);
  EXPECT_EQ(parse_decimal("00012345678", 10, 2, v), ParseStatus::OK);
  EXPECT_EQ(parse_decimal("1e3", 10, 2, v), ParseStatus::INVALID);
  EXPECT_EQ(parse_decimal(".", 10, 2, v), ParseStatus::INVALID);
  EXPECT_EQ(parse_decimal("", 10, 2, v), ParseStatus::EMPTY);
}

TEST(ParseDecimalTest, ThirtyEightDigits) {
  Int128 v = 0;
  std::string nines(38, '9');
  EXPECT_EQ(parse_decimal(nines, 38, 0, v), ParseStatus::OK);
  EXPECT_EQ(format_int128(v), nines);
  EXPECT_EQ(decimal_digits(v), 38);
}

TEST(FormatDecimalTest, Scale) {
  EXPECT_EQ(format_decimal(12345, 2), "123.45");
  EXPECT_EQ(format_decimal(-5, 2), "-0.05");
  EXPECT_EQ(format_decimal(0, 3), "0.000");
  EXPECT_EQ(format_decimal(42, 0), "42");
}

TEST(FormatInt128Test, Extremes) {
  Int128 min = static_cast<Int128>(static_cast<unsigned __int128>(1) << 127);
  EXPECT_EQ(format_int128(min), "-170141183460469231731687303715884105728");
  EXPECT_EQ(format_int128(0), "0");
  EXPECT_EQ(decimal_digits(0), 1);
  EXPECT_EQ(decimal_digits(-1000), 4);
}

// ============================================================================
// FLOAT FORMATTING
// ============================================================================

TEST(FormatFloatTest, ShortestRoundTrip) {
  EXPECT_EQ(format_float64(0.1), "0.1");
  EXPECT_EQ(format_float64(91.5), "91.5");
  EXPECT_EQ(format_float32(0.1f), "0.1");
  EXPECT_EQ(format_float64(std::nan("")), "NaN");
  EXPECT_EQ(format_float64(-std::numeric_limits<double>::infinity()), "-inf");
  EXPECT_EQ(format_float32(std::numeric_limits<float>::infinity()), "inf");
}

TEST(TrimAsciiTest, Whitespace) {
  EXPECT_EQ(trim_ascii("  a b \t\r\n"), "a b");
  EXPECT_EQ(trim_ascii(""), "");
  EXPECT_EQ(trim_ascii(" \t "), "");
}

TEST(ParseStatusTest, Reasons) {
  EXPECT_STREQ(parse_status_reason(ParseStatus::NOT_INTEGER), "value is not an integer");
  EXPECT_STREQ(parse_status_reason(ParseStatus::OK), "ok");
}
