#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "byterate/format-config.hpp"
#include "byterate/unit-table.hpp"

namespace byterate {

/// Value of 'canonical' expressed in 'unit', rounded half away from zero if a precision is given.
double ConvertTo(double canonical, const UnitSpec& unit, std::optional<int8_t> precision = std::nullopt);

/// Largest unit of 'family' in which the absolute value of 'canonical' is at least 1.
/// Falls back to the base unit of the family for zero and values below one base unit.
const UnitSpec& SelectHumanUnit(double canonical, UnitFamily family) noexcept;

/// Renders "{value}{delimiter}{symbol}" in 'unit'. With a precision, exactly that many fractional
/// digits are printed ("1.500 kB"), otherwise the shortest exact representation ("1.5 kB").
std::string FormatIn(double canonical, const UnitSpec& unit, const FormatConfig& config);

/// Renders 'canonical' in the unit chosen by SelectHumanUnit. The value is rounded to the configured
/// precision but printed without trailing zeros ("1.5 kB" for 1536 bytes).
std::string Humanize(double canonical, UnitFamily family, const FormatConfig& config);

}  // namespace byterate
