#pragma once

#include <cstdint>
#include <string_view>

#include "byterate/unit-table.hpp"

namespace byterate {

enum class Dimension : int8_t { kSize, kRate };

struct ParsedMagnitude {
  double value;          // canonical value (bytes, or bits per second)
  const UnitSpec* unit;  // nullptr for a purely numeric string
};

/// Parses a human readable magnitude such as "1.5 MB", "10Mbps", " -3 kB " or "42".
/// Grammar, after trimming surrounding whitespace:
///   [+-]digits[.digits][spaces][unit of 1 to 4 letters]
/// A purely numeric string is already the canonical value.
/// Size units are base 1024 and case-insensitive, rate units base 1000 where byte units count 8 bits.
/// Throws ParseError (kInvalidNumber or kUnrecognizedUnit) if the string cannot be fully consumed,
/// or with kInvalidNumber if the resulting value is not finite.
ParsedMagnitude ParseMagnitudeWithUnit(std::string_view str, Dimension dimension);

inline double ParseMagnitude(std::string_view str, Dimension dimension) {
  return ParseMagnitudeWithUnit(str, dimension).value;
}

}  // namespace byterate
