#include <numscan/numscan.hpp>
#include <gtest/gtest.h>
#include <string>

using namespace numscan;

TEST(Classify, Digits) {
  for (char c = '0'; c <= '9'; ++c) {
    EXPECT_EQ(classify(c), PartOfNumber | Digit) << "digit " << c;
    EXPECT_TRUE(is_digit(c));
  }
}

TEST(Classify, SignsAndFloatMarkers) {
  EXPECT_EQ(classify('-'), PartOfNumber | Minus | MustHaveDigitNext);
  EXPECT_EQ(classify('.'), PartOfNumber | FloatOnly | MustHaveDigitNext);
  EXPECT_EQ(classify('+'), PartOfNumber);
  EXPECT_EQ(classify('e'), PartOfNumber | FloatOnly);
  EXPECT_EQ(classify('E'), PartOfNumber | FloatOnly);

  EXPECT_TRUE(is_float_only('.'));
  EXPECT_TRUE(is_float_only('e'));
  EXPECT_FALSE(is_float_only('-'));
  EXPECT_FALSE(is_float_only('0'));
}

TEST(Classify, Delimiters) {
  for (char c : std::string(",}] \t\r\n:")) {
    EXPECT_EQ(classify(c), EndOfValue) << "byte " << int(c);
    EXPECT_TRUE(is_end_of_value(c));
  }
  // Opening brackets and quotes never end a number.
  EXPECT_EQ(classify('{'), 0);
  EXPECT_EQ(classify('['), 0);
  EXPECT_EQ(classify('"'), 0);
}

TEST(Classify, EverythingElseIsEmpty) {
  const std::string known = "0123456789.+-eE,}] \t\r\n:";
  for (int b = 0; b < 256; ++b) {
    const char c = static_cast<char>(b);
    if (known.find(c) != std::string::npos)
      continue;
    EXPECT_EQ(classify(static_cast<uint8_t>(b)), 0) << "byte " << b;
  }
}

TEST(Classify, NonAsciiRejected) {
  for (int b = 0x80; b < 0x100; ++b)
    EXPECT_EQ(classify(static_cast<uint8_t>(b)), 0) << "byte " << b;
}

TEST(Classify, UsableAtCompileTime) {
  static_assert(classify('7') == (PartOfNumber | Digit));
  static_assert(classify('x') == 0);
  SUCCEED();
}
