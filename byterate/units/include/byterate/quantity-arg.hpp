#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>

#include "byterate/unitsparser.hpp"

namespace byterate {

/// Operand accepted by every Size and Rate operation: a raw number already in canonical unit,
/// a human readable string parsed immediately, or a value of the same dimension.
template <Dimension D>
class QuantityArg {
 public:
  template <class T>
    requires(std::is_arithmetic_v<T> && !std::same_as<T, bool>)
  QuantityArg(T value) noexcept : _value(static_cast<double>(value)), _isRaw(true) {}

  QuantityArg(std::string_view str) : QuantityArg(ParseMagnitudeWithUnit(str, D)) {}

  QuantityArg(const char* str) : QuantityArg(std::string_view(str)) {}

  QuantityArg(const std::string& str) : QuantityArg(std::string_view(str)) {}

  template <class Q>
    requires(Q::kDimension == D)
  QuantityArg(const Q& quantity) noexcept : _value(quantity.value()) {}

  /// Canonical value (bytes, or bits per second).
  [[nodiscard]] double value() const noexcept { return _value; }

  /// Tells whether this operand was given as a plain number, or as a string without unit ("1000").
  [[nodiscard]] bool isRaw() const noexcept { return _isRaw; }

 private:
  explicit QuantityArg(ParsedMagnitude parsed) noexcept : _value(parsed.value), _isRaw(parsed.unit == nullptr) {}

  double _value;
  bool _isRaw{false};
};

using SizeArg = QuantityArg<Dimension::kSize>;
using RateArg = QuantityArg<Dimension::kRate>;

}  // namespace byterate
