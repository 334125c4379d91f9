/**
 * @file scanner.hpp
 * @brief Token scanner: finds the extent of a JSON number literal
 *
 * License: MIT
 */

#ifndef NUMSCAN_SCANNER_HPP
#define NUMSCAN_SCANNER_HPP

#include "classify.hpp"
#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace numscan {

struct ScanResult {
  size_t extent = 0; // bytes belonging to the token, 0 if rejected
  uint8_t found = 0; // union of CharFlags over [0, extent)

  explicit operator bool() const { return extent != 0; }
};

namespace detail {

// `stop` receives the index of the byte that ended the scan: the delimiter,
// the offending byte, or buf.size() at end of input.
NUMSCAN_INLINE ScanResult scan_until(std::string_view buf,
                                     size_t &stop) noexcept {
  const char *const p = buf.data();
  const size_t n = buf.size();

  ScanResult r;
  for (size_t i = 0; i < n; ++i) {
    const uint8_t t = classify(p[i]);
    stop = i;
    if (NUMSCAN_UNLIKELY(t == 0))
      return {};
    if (t == EndOfValue)
      return r;
    if (t & MustHaveDigitNext) {
      if (i + 1 >= n || (classify(p[i + 1]) & Digit) == 0)
        return {};
    }
    r.found |= t;
    r.extent = i + 1;
  }
  stop = n;
  return r;
}

} // namespace detail

/**
 * @brief Walk the buffer from its first byte until a delimiter or the end.
 *
 * Any byte that is neither part of a number nor a delimiter rejects the whole
 * token, as does a '.' or '-' that is not immediately followed by a digit.
 * The terminating delimiter is left to the caller.
 */
NUMSCAN_INLINE ScanResult scan(std::string_view buf) noexcept {
  size_t stop = 0;
  return detail::scan_until(buf, stop);
}

} // namespace numscan

#endif // NUMSCAN_SCANNER_HPP
