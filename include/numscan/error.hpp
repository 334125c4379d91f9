/**
 * @file error.hpp
 * @brief numscan error codes and exception types
 *
 * License: MIT
 */

#ifndef NUMSCAN_ERROR_HPP
#define NUMSCAN_ERROR_HPP

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace numscan {

enum class Error {
  Ok = 0,
  InvalidNumber,
  TypeMismatch,
  OutOfRange
};

inline const char *error_message(Error e) {
  switch (e) {
  case Error::Ok:
    return "No error";
  case Error::InvalidNumber:
    return "Invalid number";
  case Error::TypeMismatch:
    return "Type mismatch";
  case Error::OutOfRange:
    return "Value out of range";
  default:
    return "Unknown error";
  }
}

class ParseError : public std::runtime_error {
public:
  size_t line, column, offset;
  Error code;

  ParseError(const std::string &msg, size_t l = 0, size_t c = 0, size_t off = 0,
             Error e = Error::InvalidNumber)
      : std::runtime_error(msg), line(l), column(c), offset(off), code(e) {}

  std::string format() const {
    std::ostringstream oss;
    if (line > 0) {
      oss << "Parse error at line " << line << ", column " << column << ": ";
    } else {
      oss << "Parse error: ";
    }
    oss << what();
    return oss.str();
  }
};

class TypeError : public std::runtime_error {
public:
  Error code;

  explicit TypeError(const std::string &msg, Error e = Error::TypeMismatch)
      : std::runtime_error(msg), code(e) {}
};

} // namespace numscan

#endif // NUMSCAN_ERROR_HPP
