#include "byterate/unit-table.hpp"

#include <span>
#include <string_view>
#include <utility>

#include "byterate/errors.hpp"
#include "byterate/string-equal-ignore-case.hpp"

namespace byterate {

namespace {

const UnitSpec* FindExact(std::span<const UnitSpec> units, std::string_view symbol) noexcept {
  for (const UnitSpec& unit : units) {
    if (unit.symbol == symbol) {
      return &unit;
    }
  }
  return nullptr;
}

const UnitSpec* FindIgnoreCase(std::span<const UnitSpec> units, std::string_view symbol) noexcept {
  for (const UnitSpec& unit : units) {
    if (CaseInsensitiveEqual(unit.symbol, symbol)) {
      return &unit;
    }
  }
  return nullptr;
}

}  // namespace

std::span<const UnitSpec> FamilyUnits(UnitFamily family) noexcept {
  switch (family) {
    case UnitFamily::kSize:
      return kSizeUnits;
    case UnitFamily::kRateBit:
      return kRateBitUnits;
    case UnitFamily::kRateByte:
      return kRateByteUnits;
    default:
      std::unreachable();
  }
}

const UnitSpec* FindSizeUnit(std::string_view symbol) noexcept { return FindIgnoreCase(kSizeUnits, symbol); }

const UnitSpec* FindRateUnit(std::string_view symbol) noexcept {
  const UnitSpec* ret = FindExact(kRateBitUnits, symbol);
  if (ret == nullptr) {
    ret = FindExact(kRateByteUnits, symbol);
  }
  if (ret == nullptr) {
    ret = FindIgnoreCase(kRateBitUnits, symbol);
  }
  if (ret == nullptr) {
    ret = FindIgnoreCase(kRateByteUnits, symbol);
  }
  return ret;
}

const UnitSpec& SizeUnit(std::string_view symbol) {
  const UnitSpec* ret = FindSizeUnit(symbol);
  if (ret == nullptr) {
    throw UnknownUnitError("Unknown size unit '{}'", symbol);
  }
  return *ret;
}

const UnitSpec& RateUnit(std::string_view symbol) {
  const UnitSpec* ret = FindRateUnit(symbol);
  if (ret == nullptr) {
    throw UnknownUnitError("Unknown rate unit '{}'", symbol);
  }
  return *ret;
}

}  // namespace byterate
