/**
 * @file number.hpp
 * @brief Resolved JSON number: kind + exact value bits
 *
 * License: MIT
 */

#ifndef NUMSCAN_NUMBER_HPP
#define NUMSCAN_NUMBER_HPP

#include "error.hpp"

#include <bit>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>

namespace numscan {

enum class NumberKind : uint8_t {
  Invalid = 0,
  SignedInteger,
  UnsignedInteger,
  Float
};

inline const char *kind_name(NumberKind k) {
  switch (k) {
  case NumberKind::Invalid:
    return "invalid";
  case NumberKind::SignedInteger:
    return "integer";
  case NumberKind::UnsignedInteger:
    return "unsigned integer";
  case NumberKind::Float:
    return "float";
  default:
    return "unknown";
  }
}

class Number {
  NumberKind kind_ = NumberKind::Invalid;
  bool overflowed_integer_ = false;

  union {
    int64_t int_val;
    uint64_t uint_val;
    double double_val;
  };

public:
  Number() : uint_val(0) {}
  explicit Number(int64_t i) : kind_(NumberKind::SignedInteger), int_val(i) {}
  explicit Number(uint64_t u)
      : kind_(NumberKind::UnsignedInteger), uint_val(u) {}
  explicit Number(double d, bool overflowed_integer = false)
      : kind_(NumberKind::Float), overflowed_integer_(overflowed_integer),
        double_val(d) {}

  static Number invalid() { return Number(); }

  // Rebuild from raw tape bits.
  static Number from_bits(NumberKind kind, uint64_t bits,
                          bool overflowed_integer = false) {
    switch (kind) {
    case NumberKind::SignedInteger:
      return Number(static_cast<int64_t>(bits));
    case NumberKind::UnsignedInteger:
      return Number(bits);
    case NumberKind::Float:
      return Number(std::bit_cast<double>(bits), overflowed_integer);
    default:
      return Number();
    }
  }

  NumberKind kind() const { return kind_; }
  bool valid() const { return kind_ != NumberKind::Invalid; }
  explicit operator bool() const { return valid(); }

  bool is_int() const { return kind_ == NumberKind::SignedInteger; }
  bool is_uint64() const { return kind_ == NumberKind::UnsignedInteger; }
  bool is_double() const { return kind_ == NumberKind::Float; }
  bool is_number() const { return valid(); }

  // Only meaningful for Float: the literal had integer shape but did not fit.
  bool overflowed_integer() const {
    return kind_ == NumberKind::Float && overflowed_integer_;
  }

  // Raw value word: two's complement, natural binary or IEEE-754 layout.
  uint64_t bits() const {
    switch (kind_) {
    case NumberKind::SignedInteger:
      return static_cast<uint64_t>(int_val);
    case NumberKind::UnsignedInteger:
      return uint_val;
    case NumberKind::Float:
      return std::bit_cast<uint64_t>(double_val);
    default:
      return 0;
    }
  }

  int64_t as_int64() const {
    switch (kind_) {
    case NumberKind::SignedInteger:
      return int_val;
    case NumberKind::UnsignedInteger:
      if (uint_val >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        throw TypeError("unsigned integer value overflows int64",
                        Error::OutOfRange);
      return static_cast<int64_t>(uint_val);
    case NumberKind::Float:
      // 2^63 is exactly representable; anything >= it does not fit.
      if (!(double_val < 9223372036854775808.0)) {
        if (double_val != double_val)
          throw TypeError("float value is not a number", Error::OutOfRange);
        throw TypeError("float value overflows int64", Error::OutOfRange);
      }
      if (double_val < -9223372036854775808.0)
        throw TypeError("float value underflows int64", Error::OutOfRange);
      return static_cast<int64_t>(double_val);
    default:
      throw TypeError("Not a number");
    }
  }

  uint64_t as_uint64() const {
    switch (kind_) {
    case NumberKind::SignedInteger:
      if (int_val < 0)
        throw TypeError("integer value is negative", Error::OutOfRange);
      return static_cast<uint64_t>(int_val);
    case NumberKind::UnsignedInteger:
      return uint_val;
    case NumberKind::Float:
      if (double_val != double_val)
        throw TypeError("float value is not a number", Error::OutOfRange);
      if (double_val < 0)
        throw TypeError("float value is negative", Error::OutOfRange);
      if (double_val >= 18446744073709551616.0)
        throw TypeError("float value overflows uint64", Error::OutOfRange);
      return static_cast<uint64_t>(double_val);
    default:
      throw TypeError("Not a number");
    }
  }

  double as_double() const {
    switch (kind_) {
    case NumberKind::SignedInteger:
      return static_cast<double>(int_val);
    case NumberKind::UnsignedInteger:
      return static_cast<double>(uint_val);
    case NumberKind::Float:
      return double_val;
    default:
      throw TypeError("Not a number");
    }
  }

  std::optional<int64_t> get_int64() const {
    try {
      return as_int64();
    } catch (const TypeError &) {
      return std::nullopt;
    }
  }

  std::optional<uint64_t> get_uint64() const {
    try {
      return as_uint64();
    } catch (const TypeError &) {
      return std::nullopt;
    }
  }

  std::optional<double> get_double() const {
    if (!valid())
      return std::nullopt;
    return as_double();
  }

  int64_t get_int64_or(int64_t def) const { return get_int64().value_or(def); }
  uint64_t get_uint64_or(uint64_t def) const {
    return get_uint64().value_or(def);
  }
  double get_double_or(double def) const { return get_double().value_or(def); }

  friend bool operator==(const Number &a, const Number &b) {
    return a.kind_ == b.kind_ &&
           a.overflowed_integer() == b.overflowed_integer() &&
           a.bits() == b.bits();
  }
  friend bool operator!=(const Number &a, const Number &b) { return !(a == b); }
};

inline std::ostream &operator<<(std::ostream &os, const Number &n) {
  switch (n.kind()) {
  case NumberKind::SignedInteger:
    return os << n.as_int64();
  case NumberKind::UnsignedInteger:
    return os << n.as_uint64();
  case NumberKind::Float:
    return os << n.as_double();
  default:
    return os << "<invalid>";
  }
}

} // namespace numscan

#endif // NUMSCAN_NUMBER_HPP
