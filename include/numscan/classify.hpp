/**
 * @file classify.hpp
 * @brief Byte classifier for JSON number tokens
 *
 * License: MIT
 */

#ifndef NUMSCAN_CLASSIFY_HPP
#define NUMSCAN_CLASSIFY_HPP

#include "config.hpp"

#include <array>
#include <cstdint>

namespace numscan {

// ============================================================================
// Grammar-role flags
// ============================================================================

enum CharFlags : uint8_t {
  PartOfNumber = 1 << 0,
  FloatOnly = 1 << 1, // '.', 'e', 'E' force the float path
  Minus = 1 << 2,
  EndOfValue = 1 << 3, // delimiters that terminate a number
  Digit = 1 << 4,
  MustHaveDigitNext = 1 << 5 // '.' and '-' need a digit right after them
};

// ============================================================================
// Lookup Table (consteval-style, built once at compile time)
// ============================================================================

namespace lookup {

constexpr std::array<uint8_t, 256> make_number_table() {
  std::array<uint8_t, 256> t{};
  for (int c = '0'; c <= '9'; ++c)
    t[c] = PartOfNumber | Digit;
  t['.'] = PartOfNumber | FloatOnly | MustHaveDigitNext;
  t['+'] = PartOfNumber;
  t['-'] = PartOfNumber | Minus | MustHaveDigitNext;
  t['e'] = PartOfNumber | FloatOnly;
  t['E'] = PartOfNumber | FloatOnly;

  t[','] = EndOfValue;
  t['}'] = EndOfValue;
  t[']'] = EndOfValue;
  t[' '] = EndOfValue;
  t['\t'] = EndOfValue;
  t['\r'] = EndOfValue;
  t['\n'] = EndOfValue;
  t[':'] = EndOfValue;
  return t;
}

// Every byte not listed above (including all of 0x80-0xFF) maps to 0.
alignas(64) inline constexpr std::array<uint8_t, 256> number_table =
    make_number_table();

} // namespace lookup

NUMSCAN_INLINE constexpr uint8_t classify(uint8_t c) noexcept {
  return lookup::number_table[c];
}

NUMSCAN_INLINE constexpr uint8_t classify(char c) noexcept {
  return lookup::number_table[static_cast<unsigned char>(c)];
}

NUMSCAN_INLINE constexpr bool is_digit(char c) noexcept {
  return (classify(c) & Digit) != 0;
}

NUMSCAN_INLINE constexpr bool is_float_only(char c) noexcept {
  return (classify(c) & FloatOnly) != 0;
}

NUMSCAN_INLINE constexpr bool is_end_of_value(char c) noexcept {
  return classify(c) == EndOfValue;
}

} // namespace numscan

#endif // NUMSCAN_CLASSIFY_HPP
