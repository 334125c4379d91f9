/**
 * @file resolver.hpp
 * @brief Numeric resolver: integer-first parsing with float fallback
 *
 * Integer-shaped literals keep their exact value whenever they fit a signed
 * or unsigned 64-bit integer. Everything else goes through the standard
 * decimal-to-binary conversion (std::from_chars), annotated when an integer
 * literal had to be widened to a double.
 *
 * License: MIT
 */

#ifndef NUMSCAN_RESOLVER_HPP
#define NUMSCAN_RESOLVER_HPP

#include "classify.hpp"
#include "config.hpp"
#include "number.hpp"
#include "options.hpp"

#include <charconv> // from_chars for integers and doubles
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>

namespace numscan {
namespace detail {

// Optional sign plus 19-20 digits covers every int64/uint64 value.
constexpr size_t kMaxIntLen = 20;

enum class IntParse { Ok, Range, Syntax };

// The whole token must be consumed; a partial match is a syntax error.
template <typename T>
NUMSCAN_INLINE IntParse parse_integer(std::string_view s, T &out) noexcept {
  const char *const last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), last, out, 10);
  if (ec == std::errc::result_out_of_range)
    return IntParse::Range;
  if (ec != std::errc() || ptr != last)
    return IntParse::Syntax;
  return IntParse::Ok;
}

// Decimal position of the first significant digit plus the exponent.
// Only called for literals from_chars reported out of range, so the
// mantissa is known to be non-zero and the sign of the result tells
// overflow (> 0) from underflow.
inline int64_t decimal_magnitude(std::string_view s) noexcept {
  constexpr int64_t kSaturate = int64_t(1) << 40;
  size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;

  int64_t magnitude = 0;
  bool significant = false;
  for (; i < s.size() && is_digit(s[i]); ++i) {
    if (s[i] != '0')
      significant = true;
    if (significant && magnitude < kSaturate)
      ++magnitude;
  }
  if (i < s.size() && s[i] == '.') {
    for (++i; i < s.size() && is_digit(s[i]); ++i) {
      if (significant)
        continue;
      if (s[i] != '0')
        significant = true;
      else if (magnitude > -kSaturate)
        --magnitude;
    }
  }

  int64_t exponent = 0;
  bool negative_exp = false;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
      negative_exp = s[i++] == '-';
    for (; i < s.size() && is_digit(s[i]); ++i) {
      if (exponent < kSaturate)
        exponent = exponent * 10 + (s[i] - '0');
    }
  }
  return magnitude + (negative_exp ? -exponent : exponent);
}

// True when a digit before the exponent is non-zero, i.e. the literal does
// not denote zero.
inline bool has_nonzero_mantissa(std::string_view s) noexcept {
  for (char c : s) {
    if (c == 'e' || c == 'E')
      break;
    if (c >= '1' && c <= '9')
      return true;
  }
  return false;
}

// Value the IEEE-754 conversion rounds an out-of-range literal to.
inline double out_of_range_value(std::string_view s) noexcept {
  const bool negative = !s.empty() && s[0] == '-';
  const double v = decimal_magnitude(s) > 0
                       ? std::numeric_limits<double>::infinity()
                       : 0.0;
  return negative ? -v : v;
}

} // namespace detail

/**
 * @brief Resolve a scanned token into the narrowest exact representation.
 *
 * @param token the accepted extent of the literal (see scan())
 * @param found union of the CharFlags seen while scanning it
 *
 * Never throws and never allocates. Every rejection cause yields
 * NumberKind::Invalid.
 */
NUMSCAN_INLINE Number resolve(std::string_view token, uint8_t found,
                              const NumberOptions &options = {}) noexcept {
  const char *const buf = token.data();
  const size_t len = token.size();
  if (NUMSCAN_UNLIKELY(len == 0))
    return Number::invalid();

  const bool has_minus = (found & Minus) != 0;
  bool overflowed = false;

  // Integers first, unless the token cannot possibly be one.
  if ((found & FloatOnly) == 0 && len <= detail::kMaxIntLen) {
    if (!has_minus) {
      if (len > 1 && buf[0] == '0')
        return Number::invalid();
    } else if (len > 2 && buf[1] == '0') {
      return Number::invalid();
    }

    int64_t i64 = 0;
    detail::IntParse r = detail::parse_integer(token, i64);
    if (NUMSCAN_LIKELY(r == detail::IntParse::Ok))
      return Number(i64);
    if (r == detail::IntParse::Range)
      overflowed = true;

    if (!has_minus && options.allow_uint64) {
      uint64_t u64 = 0;
      r = detail::parse_integer(token, u64);
      if (r == detail::IntParse::Ok)
        return Number(u64);
      if (r == detail::IntParse::Range)
        overflowed = true;
    }
  } else if ((found & FloatOnly) == 0) {
    // Integer shaped but longer than any 64-bit integer can be.
    overflowed = true;
  }

  if (overflowed && !options.allow_overflowed_integers)
    return Number::invalid();

  // A leading zero may only be followed by '.', 'e' or 'E'.
  const size_t d = buf[0] == '-' ? 1 : 0;
  if (len > d + 1 && buf[d] == '0' && !is_float_only(buf[d + 1]))
    return Number::invalid();

  double value = 0;
  auto [ptr, ec] =
      std::from_chars(buf, buf + len, value, std::chars_format::general);
  if (ptr != buf + len)
    return Number::invalid();
  if (ec == std::errc::result_out_of_range)
    value = detail::out_of_range_value(token);
  else if (NUMSCAN_UNLIKELY(ec != std::errc()))
    return Number::invalid();

  // Some standard libraries report over/underflow as success with the
  // rounded value, so check the value rather than the error code.
  if (NUMSCAN_UNLIKELY(std::isinf(value)) && !options.allow_infinite_floats)
    return Number::invalid();
  if (NUMSCAN_UNLIKELY(value == 0) && !options.allow_float_underflow &&
      detail::has_nonzero_mantissa(token))
    return Number::invalid();
  return Number(value, overflowed);
}

} // namespace numscan

#endif // NUMSCAN_RESOLVER_HPP
