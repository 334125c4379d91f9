/**
 * @file tape.hpp
 * @brief Two-word tape encoding of resolved numbers
 *
 * A number occupies two consecutive 64-bit tape words:
 *
 *   word 0:  [ tag (8 bits) | 55 reserved bits | OverflowedInteger (bit 0) ]
 *   word 1:  raw value bits (int64 two's complement, uint64, IEEE-754)
 *
 * The pair (0, 0) means "no number here".
 *
 * License: MIT
 */

#ifndef NUMSCAN_TAPE_HPP
#define NUMSCAN_TAPE_HPP

#include "config.hpp"
#include "number.hpp"
#include "resolver.hpp"
#include "scanner.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace numscan {
namespace tape {

// ============================================================================
// Tag layout (shared with the document tape builder)
// ============================================================================

enum class Tag : uint8_t {
  End = 0,
  Integer = 'l',
  Uint = 'u',
  Float = 'd'
};

constexpr unsigned kTagOffset = 56;
constexpr uint64_t kTagMask = uint64_t(0xff) << kTagOffset;
constexpr uint64_t kValueMask = ~kTagMask;

// Low-bit annotations on a Float tag word.
enum FloatFlags : uint64_t {
  OverflowedInteger = 1 << 0
};

static_assert((OverflowedInteger & kTagMask) == 0,
              "float flags must not overlap the tag bits");

inline const char *tag_name(Tag t) {
  switch (t) {
  case Tag::End:
    return "end";
  case Tag::Integer:
    return "integer";
  case Tag::Uint:
    return "unsigned integer";
  case Tag::Float:
    return "float";
  default:
    return "unknown";
  }
}

inline std::ostream &operator<<(std::ostream &os, Tag t) {
  return os << tag_name(t);
}

constexpr uint64_t tag_word(Tag t) {
  return static_cast<uint64_t>(t) << kTagOffset;
}

constexpr Tag tag_of(uint64_t word) {
  return static_cast<Tag>(word >> kTagOffset);
}

constexpr uint64_t float_flags(uint64_t word) { return word & kValueMask; }

struct Words {
  uint64_t tag_word = 0;
  uint64_t value_word = 0;

  Tag tag() const { return tag_of(tag_word); }
  bool is_end() const { return tag_word == 0 && value_word == 0; }

  friend bool operator==(const Words &, const Words &) = default;
};

// ============================================================================
// Encoder / Decoder
// ============================================================================

NUMSCAN_INLINE Words encode(const Number &n) noexcept {
  switch (n.kind()) {
  case NumberKind::SignedInteger:
    return {tag_word(Tag::Integer), n.bits()};
  case NumberKind::UnsignedInteger:
    return {tag_word(Tag::Uint), n.bits()};
  case NumberKind::Float:
    return {tag_word(Tag::Float) |
                (n.overflowed_integer() ? uint64_t(OverflowedInteger) : 0),
            n.bits()};
  default:
    return {};
  }
}

// Inverse of encode(). The end sentinel and foreign tags give nullopt.
inline std::optional<Number> decode(Words w) {
  switch (w.tag()) {
  case Tag::Integer:
    return Number::from_bits(NumberKind::SignedInteger, w.value_word);
  case Tag::Uint:
    return Number::from_bits(NumberKind::UnsignedInteger, w.value_word);
  case Tag::Float:
    return Number::from_bits(NumberKind::Float, w.value_word,
                             (float_flags(w.tag_word) & OverflowedInteger) != 0);
  default:
    return std::nullopt;
  }
}

/**
 * @brief Scan, resolve and encode the number starting at buf[0].
 *
 * Bytes after the number are ignored. Returns (0, 0) when no valid number
 * starts there.
 */
NUMSCAN_INLINE Words parse_number(std::string_view buf) noexcept {
  const ScanResult s = scan(buf);
  if (!s)
    return {};
  return encode(resolve(buf.substr(0, s.extent), s.found));
}

// ============================================================================
// NumberTape: flat sequence of encoded numbers
// ============================================================================

class NumberTape {
  Vector<uint64_t> words_;

public:
  explicit NumberTape(Allocator alloc = {}) : words_(alloc) {}

  // Resolve the literal at the start of buf and append it.
  // Returns the token extent, 0 (nothing appended) if it is invalid.
  size_t append(std::string_view buf, const NumberOptions &options = {}) {
    const ScanResult s = scan(buf);
    if (!s)
      return 0;
    const Number n = resolve(buf.substr(0, s.extent), s.found, options);
    if (!n)
      return 0;
    append(n);
    return s.extent;
  }

  void append(const Number &n) {
    const Words w = encode(n);
    if (w.is_end())
      throw TypeError("Cannot append an invalid number",
                      Error::InvalidNumber);
    words_.push_back(w.tag_word);
    words_.push_back(w.value_word);
  }

  size_t size() const { return words_.size() / 2; }
  bool empty() const { return words_.empty(); }
  void clear() { words_.clear(); }
  void reserve(size_t n) { words_.reserve(n * 2); }

  Words words_at(size_t i) const { return {words_[2 * i], words_[2 * i + 1]}; }

  // Entries are only ever written by append(), so decode cannot fail here.
  Number operator[](size_t i) const { return *decode(words_at(i)); }

  Number at(size_t i) const {
    if (i >= size())
      throw std::out_of_range("NumberTape index " + std::to_string(i) +
                              " out of range");
    return (*this)[i];
  }

  const Vector<uint64_t> &words() const { return words_; }

  class Iterator {
    const NumberTape *tape_;
    size_t idx_;

  public:
    using value_type = Number;
    using difference_type = std::ptrdiff_t;

    Iterator() : tape_(nullptr), idx_(0) {}
    Iterator(const NumberTape *t, size_t i) : tape_(t), idx_(i) {}

    Number operator*() const { return (*tape_)[idx_]; }
    Iterator &operator++() {
      ++idx_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator tmp = *this;
      ++idx_;
      return tmp;
    }
    bool operator==(const Iterator &o) const { return idx_ == o.idx_; }
    bool operator!=(const Iterator &o) const { return idx_ != o.idx_; }
  };

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, size()); }
};

} // namespace tape
} // namespace numscan

#endif // NUMSCAN_TAPE_HPP
