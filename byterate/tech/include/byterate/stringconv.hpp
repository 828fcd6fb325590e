#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace byterate {

/// Parses the whole of 'str' as a decimal floating point number. A single leading '+' is accepted.
/// Throws InvalidArgumentError if 'str' is empty, malformed, not finite or not entirely consumed.
double StringToDouble(std::string_view str);

/// Rounds half away from zero to 'precision' fractional digits (0 <= precision <= 15).
/// Values too large to be scaled are returned unchanged.
double RoundToPrecision(double value, int8_t precision) noexcept;

/// Appends the shortest decimal representation of 'value' that round-trips ("1.5", "4", "0.1"),
/// always in positional notation ("0.00000015" rather than "1.5e-07").
/// Negative zero is written as "0".
void AppendNumber(std::string& out, double value);

/// Appends 'value' with exactly 'precision' fractional digits ("1.500").
void AppendFixedNumber(std::string& out, double value, int8_t precision);

inline std::string NumberToString(double value) {
  std::string ret;
  AppendNumber(ret, value);
  return ret;
}

}  // namespace byterate
