/**
 * @file options.hpp
 * @brief Number resolution options
 *
 * License: MIT
 */

#ifndef NUMSCAN_OPTIONS_HPP
#define NUMSCAN_OPTIONS_HPP

namespace numscan {

// Defaults give the tape format's behaviour (tape::parse_number always uses
// them). allow_overflowed_integers and allow_float_underflow only reject
// more input when turned off. allow_uint64 = false moves values above
// INT64_MAX to the overflowed float path instead. allow_infinite_floats
// only accepts more input when turned on.
struct NumberOptions {
  // Integers in (INT64_MAX, UINT64_MAX] resolve to UnsignedInteger.
  // When false they take the overflowed float path instead.
  bool allow_uint64 = true;

  // Integer-shaped literals that fit no 64-bit integer fall back to an
  // overflowed float. When false they are invalid.
  bool allow_overflowed_integers = true;

  // Literals too large for a double resolve to +-inf. Off by default: an
  // overflowing float parse is invalid.
  bool allow_infinite_floats = false;

  // Non-zero literals too small for a double resolve to +-0.0. When false
  // they are invalid.
  bool allow_float_underflow = true;
};

} // namespace numscan

#endif // NUMSCAN_OPTIONS_HPP
