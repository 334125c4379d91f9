/**
 * @file numscan.hpp
 * @brief numscan - JSON number literal scanner and classifier
 * @version 1.0.0
 *
 * Resolves the number literal at the start of a byte buffer into the
 * narrowest exact representation:
 *
 * - Single pass, zero allocation, no shared mutable state
 * - Exact int64 / uint64 values whenever the literal fits
 * - IEEE-754 double fallback, annotated when an integer overflowed
 * - Two-word tape encoding for document builders (tape.hpp)
 * - Type-Safe: std::optional at the typed API, (0, 0) only on the raw tape
 *
 * License: MIT
 */

#ifndef NUMSCAN_HPP
#define NUMSCAN_HPP

#include "classify.hpp"
#include "config.hpp"
#include "error.hpp"
#include "number.hpp"
#include "options.hpp"
#include "resolver.hpp"
#include "scanner.hpp"
#include "tape.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace numscan {

// ============================================================================
// Global API
// ============================================================================

struct NumberToken {
  Number value;
  size_t extent = 0; // bytes consumed from the start of the buffer
};

// Resolve the literal at buf[0] and report where it ends.
inline std::optional<NumberToken> scan_number(std::string_view buf,
                                              NumberOptions options = {}) {
  const ScanResult s = scan(buf);
  if (!s)
    return std::nullopt;
  Number n = resolve(buf.substr(0, s.extent), s.found, options);
  if (!n)
    return std::nullopt;
  return NumberToken{n, s.extent};
}

inline std::optional<Number> try_parse_number(std::string_view buf,
                                              NumberOptions options = {}) noexcept {
  const ScanResult s = scan(buf);
  if (!s)
    return std::nullopt;
  Number n = resolve(buf.substr(0, s.extent), s.found, options);
  if (!n)
    return std::nullopt;
  return n;
}

// Throwing variant. ParseError::offset is the byte that stopped the scan,
// or 0 when the token was complete but did not resolve. Tokens never span
// lines, so the position is always on line 1.
inline Number parse_number(std::string_view buf, NumberOptions options = {}) {
  size_t stop = 0;
  const ScanResult s = detail::scan_until(buf, stop);
  if (!s) {
    if (stop >= buf.size())
      throw ParseError("Invalid number: unexpected end of input", 1, stop + 1,
                       stop, Error::InvalidNumber);
    throw ParseError(std::string("Invalid number: unexpected '") + buf[stop] +
                         "'",
                     1, stop + 1, stop, Error::InvalidNumber);
  }
  const std::string_view token = buf.substr(0, s.extent);
  Number n = resolve(token, s.found, options);
  if (!n)
    throw ParseError("Invalid number '" + std::string(token) + "'", 1, 1, 0,
                     Error::InvalidNumber);
  return n;
}

} // namespace numscan

#endif // NUMSCAN_HPP
