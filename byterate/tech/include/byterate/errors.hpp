#pragma once

#include <cstdint>
#include <utility>

#include <fmt/format.h>

#include "byterate/exception.hpp"

namespace byterate {

// A string could not be turned into a magnitude.
class ParseError : public exception {
 public:
  enum class Reason : int8_t { kInvalidNumber, kUnrecognizedUnit };

  template <typename... Args>
  ParseError(Reason reason, fmt::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...), _reason(reason) {}

  [[nodiscard]] Reason reason() const noexcept { return _reason; }

 private:
  Reason _reason;
};

// Conversion or formatting target unit is not part of the unit table.
class UnknownUnitError : public exception {
 public:
  using exception::exception;
};

// Operation would break a value invariant, for instance a decrement going below zero.
class InvariantError : public exception {
 public:
  using exception::exception;
};

class DivideByZeroError : public exception {
 public:
  using exception::exception;
};

class InvalidArgumentError : public exception {
 public:
  using exception::exception;
};

// Requested language is not loaded and no fallback is available.
class UnknownLanguageError : public exception {
 public:
  using exception::exception;
};

// Language table lacks the unit form key resolved by its plural rule.
class MissingFormKeyError : public exception {
 public:
  using exception::exception;
};

}  // namespace byterate
