#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "byterate/ipow.hpp"

namespace byterate {

enum class UnitFamily : int8_t { kSize, kRateBit, kRateByte };

struct UnitSpec {
  /// Number of canonical units (bytes, or bits per second) represented by one of this unit.
  [[nodiscard]] constexpr double factor() const noexcept {
    const double scale = ipow(static_cast<double>(base), static_cast<uint32_t>(exponent));
    return family == UnitFamily::kRateByte ? scale * 8 : scale;
  }

  std::string_view symbol;
  int8_t exponent;
  int16_t base;
  UnitFamily family;
};

// Sorted by increasing exponent, the exponent being the index in the table.
inline constexpr UnitSpec kSizeUnits[] = {
    {"B", 0, 1024, UnitFamily::kSize},  {"kB", 1, 1024, UnitFamily::kSize}, {"MB", 2, 1024, UnitFamily::kSize},
    {"GB", 3, 1024, UnitFamily::kSize}, {"TB", 4, 1024, UnitFamily::kSize}, {"PB", 5, 1024, UnitFamily::kSize},
    {"EB", 6, 1024, UnitFamily::kSize}, {"ZB", 7, 1024, UnitFamily::kSize}, {"YB", 8, 1024, UnitFamily::kSize}};

inline constexpr UnitSpec kRateBitUnits[] = {
    {"bps", 0, 1000, UnitFamily::kRateBit},  {"kbps", 1, 1000, UnitFamily::kRateBit},
    {"Mbps", 2, 1000, UnitFamily::kRateBit}, {"Gbps", 3, 1000, UnitFamily::kRateBit},
    {"Tbps", 4, 1000, UnitFamily::kRateBit}, {"Pbps", 5, 1000, UnitFamily::kRateBit},
    {"Ebps", 6, 1000, UnitFamily::kRateBit}, {"Zbps", 7, 1000, UnitFamily::kRateBit},
    {"Ybps", 8, 1000, UnitFamily::kRateBit}};

inline constexpr UnitSpec kRateByteUnits[] = {
    {"Bps", 0, 1000, UnitFamily::kRateByte},  {"kBps", 1, 1000, UnitFamily::kRateByte},
    {"MBps", 2, 1000, UnitFamily::kRateByte}, {"GBps", 3, 1000, UnitFamily::kRateByte},
    {"TBps", 4, 1000, UnitFamily::kRateByte}, {"PBps", 5, 1000, UnitFamily::kRateByte},
    {"EBps", 6, 1000, UnitFamily::kRateByte}, {"ZBps", 7, 1000, UnitFamily::kRateByte},
    {"YBps", 8, 1000, UnitFamily::kRateByte}};

static_assert(kRateByteUnits[2].factor() == 8 * kRateBitUnits[2].factor());

std::span<const UnitSpec> FamilyUnits(UnitFamily family) noexcept;

/// Case-insensitive lookup among size units. Returns nullptr if not found.
const UnitSpec* FindSizeUnit(std::string_view symbol) noexcept;

/// Lookup among both rate families. An exact-case match wins, then a case-insensitive one,
/// bit family first ("mbps" is megabits, "MBps" is megabytes).
const UnitSpec* FindRateUnit(std::string_view symbol) noexcept;

/// Same as above, but throw UnknownUnitError if not found.
const UnitSpec& SizeUnit(std::string_view symbol);
const UnitSpec& RateUnit(std::string_view symbol);

}  // namespace byterate
