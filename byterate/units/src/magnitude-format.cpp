#include "byterate/magnitude-format.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "byterate/errors.hpp"
#include "byterate/format-config.hpp"
#include "byterate/stringconv.hpp"
#include "byterate/unit-table.hpp"

namespace byterate {

void FormatConfig::validate() const {
  if (precision && (*precision < 0 || *precision > kMaxPrecision)) {
    throw InvalidArgumentError("Invalid precision {}, should be in [0, {}]", *precision, kMaxPrecision);
  }
}

double ConvertTo(double canonical, const UnitSpec& unit, std::optional<int8_t> precision) {
  const double value = canonical / unit.factor();
  if (precision) {
    FormatConfig{}.withPrecision(precision).validate();
    return RoundToPrecision(value, *precision);
  }
  return value;
}

const UnitSpec& SelectHumanUnit(double canonical, UnitFamily family) noexcept {
  const std::span<const UnitSpec> units = FamilyUnits(family);
  const double absValue = std::fabs(canonical);
  for (auto it = units.rbegin(); it != units.rend(); ++it) {
    if (absValue / it->factor() >= 1) {
      return *it;
    }
  }
  return units.front();
}

std::string FormatIn(double canonical, const UnitSpec& unit, const FormatConfig& config) {
  config.validate();
  const double value = canonical / unit.factor();
  std::string ret;
  if (config.precision) {
    AppendFixedNumber(ret, value, *config.precision);
  } else {
    AppendNumber(ret, value);
  }
  ret.append(config.delimiter);
  ret.append(unit.symbol);
  return ret;
}

std::string Humanize(double canonical, UnitFamily family, const FormatConfig& config) {
  config.validate();
  const UnitSpec* unit = &SelectHumanUnit(canonical, family);
  double value = canonical / unit->factor();
  if (config.precision) {
    value = RoundToPrecision(value, *config.precision);
    // rounding up to the base ("1024 kB") moves to the next unit ("1 MB")
    const std::span<const UnitSpec> units = FamilyUnits(family);
    const auto nextPos = static_cast<std::size_t>(unit->exponent) + 1U;
    if (std::fabs(value) >= unit->base && nextPos < units.size()) {
      unit = &units[nextPos];
      value = RoundToPrecision(canonical / unit->factor(), *config.precision);
    }
  }
  std::string ret;
  AppendNumber(ret, value);
  ret.append(config.delimiter);
  ret.append(unit->symbol);
  return ret;
}

}  // namespace byterate
