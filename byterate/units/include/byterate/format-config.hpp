#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace byterate {

struct FormatConfig {
  static constexpr int8_t kMaxPrecision = 15;

  FormatConfig& withPrecision(std::optional<int8_t> newPrecision) {
    precision = newPrecision;
    return *this;
  }

  FormatConfig& withDelimiter(std::string_view newDelimiter) {
    delimiter = newDelimiter;
    return *this;
  }

  // Throws InvalidArgumentError if precision is outside [0, kMaxPrecision].
  void validate() const;

  // Number of fractional digits to round to. No rounding when absent.
  std::optional<int8_t> precision;
  // Inserted between the number and the unit symbol.
  std::string delimiter{" "};
};

}  // namespace byterate
