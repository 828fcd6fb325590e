#include "byterate/rate.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/duration-format.hpp"
#include "byterate/errors.hpp"
#include "byterate/format-config.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/magnitude-collections.hpp"
#include "byterate/magnitude-format.hpp"
#include "byterate/size.hpp"
#include "byterate/stringconv.hpp"
#include "byterate/transfer-math.hpp"
#include "byterate/unit-table.hpp"
#include "byterate/unitsparser.hpp"

namespace byterate {

namespace {

Rate FromUnitSpec(double value, const UnitSpec& unit, bool displayAsBits) noexcept {
  return Rate(value * unit.factor(), true, displayAsBits);
}

}  // namespace

Rate Rate::bps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateBitUnits[0], displayAsBits);
}
Rate Rate::kbps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateBitUnits[1], displayAsBits);
}
Rate Rate::mbps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateBitUnits[2], displayAsBits);
}
Rate Rate::gbps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateBitUnits[3], displayAsBits);
}
Rate Rate::tbps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateBitUnits[4], displayAsBits);
}

Rate Rate::bytesPerSec(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateByteUnits[0], displayAsBits);
}
Rate Rate::kBps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateByteUnits[1], displayAsBits);
}
Rate Rate::MBps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateByteUnits[2], displayAsBits);
}
Rate Rate::GBps(double value, bool displayAsBits) noexcept {
  return FromUnitSpec(value, kRateByteUnits[3], displayAsBits);
}

Rate Rate::fromUnit(double value, std::string_view unit, std::optional<bool> displayAsBits) {
  const UnitSpec& unitSpec = RateUnit(unit);
  return FromUnitSpec(value, unitSpec, displayAsBits.value_or(unitSpec.family == UnitFamily::kRateBit));
}

Rate Rate::fromHumanReadable(std::string_view str, std::optional<bool> displayAsBits) {
  const ParsedMagnitude parsed = ParseMagnitudeWithUnit(str, kDimension);
  const bool inferredAsBits = parsed.unit == nullptr || parsed.unit->family == UnitFamily::kRateBit;
  return Rate(parsed.value, true, displayAsBits.value_or(inferredAsBits));
}

double Rate::getValue(std::string_view unit, std::optional<int8_t> precision) const {
  double ret;
  if (unit == "bit") {
    ret = _bitsPerSecond;
  } else if (unit == "byte") {
    ret = toBytes();
  } else {
    return ConvertTo(_bitsPerSecond, RateUnit(unit), precision);
  }
  if (precision) {
    FormatConfig{}.withPrecision(precision).validate();
    ret = RoundToPrecision(ret, *precision);
  }
  return ret;
}

std::string Rate::to(std::string_view unit, std::optional<int8_t> precision, std::string_view delimiter) const {
  return FormatIn(_bitsPerSecond, RateUnit(unit), FormatConfig{}.withPrecision(precision).withDelimiter(delimiter));
}

std::string Rate::humanizeValue(double bitsPerSecond, bool asBits, std::optional<int8_t> precision,
                                std::string_view delimiter) {
  return Humanize(bitsPerSecond, asBits ? UnitFamily::kRateBit : UnitFamily::kRateByte,
                  FormatConfig{}.withPrecision(precision).withDelimiter(delimiter));
}

Rate Rate::throttle(double factor) const {
  if (!(factor >= 0 && factor <= 1)) {
    throw InvalidArgumentError("Throttle factor {} should be in [0, 1]", factor);
  }
  return multiply(factor);
}

double Rate::transferTime(SizeArg size, TransferConvention convention) const {
  return TransferSeconds(size.value(), _bitsPerSecond, convention);
}

std::string Rate::formattedTransferTime(SizeArg size, const LanguageRegistry& registry,
                                        std::optional<std::string_view> languageCode,
                                        TransferConvention convention) const {
  return FormatDuration(transferTime(size, convention), registry, languageCode);
}

Size Rate::transferAmount(double seconds) const noexcept {
  return Size(TransferredBytes(_bitsPerSecond, seconds));
}

std::vector<Rate> Rate::range(RateArg start, RateArg end, RateArg step, bool displayAsBits) {
  std::vector<Rate> ret;
  for (double bitsPerSecond : RangeValues(start.value(), end.value(), step.value())) {
    ret.emplace_back(bitsPerSecond, true, displayAsBits);
  }
  return ret;
}

Rate Rate::sum(std::span<const RateArg> rates, bool displayAsBits) noexcept {
  return Rate(SumOf(rates), true, displayAsBits);
}

Rate Rate::average(std::span<const RateArg> rates, bool displayAsBits) {
  return Rate(AverageOf(rates), true, displayAsBits);
}

Rate Rate::maximum(std::span<const RateArg> rates, bool displayAsBits) {
  return Rate(MaximumOf(rates), true, displayAsBits);
}

Rate Rate::minimum(std::span<const RateArg> rates, bool displayAsBits) {
  return Rate(MinimumOf(rates), true, displayAsBits);
}

}  // namespace byterate
