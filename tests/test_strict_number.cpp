#include <numscan/numscan.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

using namespace numscan;

// Scan + resolve with default options.
static Number num(std::string_view json) {
  ScanResult s = scan(json);
  if (!s)
    return Number::invalid();
  return resolve(json.substr(0, s.extent), s.found);
}

// Valid RFC 8259 numbers: always accepted
TEST(StrictNumber, ValidNumbersAccepted) {
  const std::vector<std::string> cases = {
      "0",    "123",  "-5",    "3.14",   "1.5e2",  "-0.5",
      "1e10", "1E10", "1e+10", "-1.5e-3", "0e5",   "0.5",
      "-0",   "-0.0", "0E-2",  "1234567890.0987654321"};
  for (const auto &json : cases)
    EXPECT_TRUE(num(json).valid()) << "rejected valid number: " << json;
}

TEST(StrictNumber, SmallIntegers) {
  Number n = num("123");
  ASSERT_TRUE(n.is_int());
  EXPECT_EQ(n.as_int64(), 123);

  n = num("-45");
  ASSERT_TRUE(n.is_int());
  EXPECT_EQ(n.as_int64(), -45);

  n = num("0");
  ASSERT_TRUE(n.is_int());
  EXPECT_EQ(n.as_int64(), 0);

  // "-0" is an integer zero, not a float.
  n = num("-0");
  ASSERT_TRUE(n.is_int());
  EXPECT_EQ(n.as_int64(), 0);
}

TEST(StrictNumber, DelimiterAndEndOfBufferAgree) {
  Number a = num("123,");
  Number b = num("123");
  ASSERT_TRUE(a.is_int());
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.as_int64(), 123);
}

TEST(StrictNumber, Int64Limits) {
  Number n = num("9223372036854775807");
  ASSERT_TRUE(n.is_int());
  EXPECT_EQ(n.as_int64(), std::numeric_limits<int64_t>::max());

  n = num("-9223372036854775808");
  ASSERT_TRUE(n.is_int());
  EXPECT_EQ(n.as_int64(), std::numeric_limits<int64_t>::min());
}

TEST(StrictNumber, UnsignedRange) {
  Number n = num("9223372036854775808");
  ASSERT_TRUE(n.is_uint64());
  EXPECT_EQ(n.as_uint64(), 9223372036854775808ULL);

  n = num("18446744073709551615");
  ASSERT_TRUE(n.is_uint64());
  EXPECT_EQ(n.as_uint64(), std::numeric_limits<uint64_t>::max());
}

TEST(StrictNumber, OverflowFallsBackToFloat) {
  Number n = num("18446744073709551616");
  ASSERT_TRUE(n.is_double());
  EXPECT_TRUE(n.overflowed_integer());
  EXPECT_EQ(n.as_double(), 18446744073709551616.0);

  // Negative overflow never tries the unsigned parse.
  n = num("-9223372036854775809");
  ASSERT_TRUE(n.is_double());
  EXPECT_TRUE(n.overflowed_integer());
  EXPECT_EQ(n.as_double(), -9223372036854775808.0);
}

TEST(StrictNumber, TooLongForIntegerPath) {
  Number n = num("123456789012345678901");
  ASSERT_TRUE(n.is_double());
  EXPECT_TRUE(n.overflowed_integer());
  EXPECT_DOUBLE_EQ(n.as_double(), 123456789012345678901.0);

  n = num("-100000000000000000000000");
  ASSERT_TRUE(n.is_double());
  EXPECT_TRUE(n.overflowed_integer());
  EXPECT_DOUBLE_EQ(n.as_double(), -1e23);
}

TEST(StrictNumber, FloatsAreNotOverflowed) {
  Number n = num("1.5");
  ASSERT_TRUE(n.is_double());
  EXPECT_FALSE(n.overflowed_integer());
  EXPECT_EQ(n.as_double(), 1.5);

  n = num("1e5");
  ASSERT_TRUE(n.is_double());
  EXPECT_FALSE(n.overflowed_integer());
  EXPECT_EQ(n.as_double(), 100000.0);

  n = num("2.5e-3]");
  ASSERT_TRUE(n.is_double());
  EXPECT_DOUBLE_EQ(n.as_double(), 0.0025);

  n = num("-0.0");
  ASSERT_TRUE(n.is_double());
  EXPECT_EQ(n.as_double(), 0.0);
  EXPECT_TRUE(std::signbit(n.as_double()));
}

TEST(StrictNumber, LeadingZerosRejected) {
  const std::vector<std::string> cases = {
      "01",    "007",   "-00",  "-01",  "00.5", "05",
      "-05.5", "-00.5", "-01E4", "00e1", "0123"};
  for (const auto &json : cases)
    EXPECT_FALSE(num(json).valid()) << "accepted leading zero: " << json;
}

TEST(StrictNumber, LeadingZeroBeforeFloatMarker) {
  EXPECT_TRUE(num("0.5").is_double());
  EXPECT_TRUE(num("0e5").is_double());
  EXPECT_TRUE(num("0E5").is_double());
  EXPECT_TRUE(num("-0.5").is_double());
  EXPECT_TRUE(num("-0e1").is_double());
}

TEST(StrictNumber, DanglingSignOrPointRejected) {
  for (const char *json : {"-", ".", "1.", "-.5", "1e", "1E", "1e-", "1e+"})
    EXPECT_FALSE(num(json).valid()) << "accepted: " << json;
}

TEST(StrictNumber, MalformedInteriorRejected) {
  for (const char *json :
       {"1.2.3", "1e5.5", "1-2", "1+2", "1ee5", "1e5e5", "--1", "+1", "+123"})
    EXPECT_FALSE(num(json).valid()) << "accepted: " << json;
}

TEST(StrictNumber, NonNumberBytesRejected) {
  for (const char *json : {"12a", "1\xC3\xA9", "0x10", "Infinity", "NaN"})
    EXPECT_FALSE(num(json).valid()) << "accepted: " << json;
}

TEST(StrictNumber, FloatOverflowIsInvalid) {
  for (const char *json : {"1e400", "-1e400", "1.7976931348623159e308",
                           "123.456e789"})
    EXPECT_FALSE(num(json).valid()) << "accepted: " << json;

  // Integer-shaped literal beyond the double range.
  const std::string huge = "1" + std::string(400, '0');
  EXPECT_FALSE(num(huge).valid());
  EXPECT_TRUE(tape::parse_number(huge).is_end());

  EXPECT_TRUE(tape::parse_number("1e400").is_end());
  EXPECT_TRUE(tape::parse_number("-1e400,").is_end());
}

TEST(StrictNumber, FloatUnderflowResolvesToZero) {
  Number n = num("1e-400");
  ASSERT_TRUE(n.is_double());
  EXPECT_FALSE(n.overflowed_integer());
  EXPECT_EQ(n.as_double(), 0.0);
  EXPECT_FALSE(std::signbit(n.as_double()));

  n = num("-1e-400");
  ASSERT_TRUE(n.is_double());
  EXPECT_EQ(n.as_double(), 0.0);
  EXPECT_TRUE(std::signbit(n.as_double()));

  tape::Words w = tape::parse_number("1e-400]");
  EXPECT_EQ(w.tag(), tape::Tag::Float);
  EXPECT_EQ(w.value_word, 0u);
}

TEST(StrictNumber, LargestFiniteDoubleAccepted) {
  Number n = num("1.7976931348623157e308");
  ASSERT_TRUE(n.is_double());
  EXPECT_EQ(n.as_double(), std::numeric_limits<double>::max());
}

TEST(StrictNumber, DecimalMagnitude) {
  EXPECT_GT(detail::decimal_magnitude("1e400"), 0);
  EXPECT_GT(detail::decimal_magnitude("-123.4e306"), 0);
  EXPECT_LT(detail::decimal_magnitude("1e-400"), 0);
  EXPECT_LT(detail::decimal_magnitude("0.0001e-330"), 0);
  EXPECT_GT(detail::decimal_magnitude("1e99999999999999999999999"), 0);
  EXPECT_LT(detail::decimal_magnitude("1e-99999999999999999999999"), 0);
}

TEST(StrictNumber, ResolveIsIdempotent) {
  for (const char *json : {"42", "-1.25e7", "18446744073709551616",
                           "18446744073709551615", "1.2.3"}) {
    tape::Words a = tape::parse_number(json);
    tape::Words b = tape::parse_number(json);
    EXPECT_EQ(a, b) << json;
    EXPECT_EQ(num(json), num(json)) << json;
  }
}

TEST(StrictNumber, EmptyTokenIsInvalid) {
  EXPECT_FALSE(resolve("", 0).valid());
}
