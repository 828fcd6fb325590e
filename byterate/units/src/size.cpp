#include "byterate/size.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/duration-format.hpp"
#include "byterate/format-config.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/magnitude-collections.hpp"
#include "byterate/magnitude-format.hpp"
#include "byterate/rate.hpp"
#include "byterate/transfer-math.hpp"
#include "byterate/unit-table.hpp"
#include "byterate/unitsparser.hpp"

namespace byterate {

namespace {
Size FromExponent(double value, int exponent) noexcept { return Size(value * kSizeUnits[exponent].factor()); }
}  // namespace

Size Size::kb(double value) noexcept { return FromExponent(value, 1); }
Size Size::mb(double value) noexcept { return FromExponent(value, 2); }
Size Size::gb(double value) noexcept { return FromExponent(value, 3); }
Size Size::tb(double value) noexcept { return FromExponent(value, 4); }
Size Size::pb(double value) noexcept { return FromExponent(value, 5); }
Size Size::eb(double value) noexcept { return FromExponent(value, 6); }
Size Size::zb(double value) noexcept { return FromExponent(value, 7); }
Size Size::yb(double value) noexcept { return FromExponent(value, 8); }

Size Size::fromUnit(double value, std::string_view unit) { return Size(value * SizeUnit(unit).factor()); }

Size Size::fromHumanReadable(std::string_view str) { return Size(ParseMagnitude(str, kDimension)); }

double Size::getValue(std::string_view unit, std::optional<int8_t> precision) const {
  return ConvertTo(_bytes, SizeUnit(unit), precision);
}

std::string Size::to(std::string_view unit, std::optional<int8_t> precision, std::string_view delimiter) const {
  return FormatIn(_bytes, SizeUnit(unit), FormatConfig{}.withPrecision(precision).withDelimiter(delimiter));
}

std::string Size::humanizeValue(double bytes, std::optional<int8_t> precision, std::string_view delimiter) {
  return Humanize(bytes, UnitFamily::kSize, FormatConfig{}.withPrecision(precision).withDelimiter(delimiter));
}

double Size::getTransferTime(const Rate& rate, TransferConvention convention) const {
  return TransferSeconds(_bytes, rate.value(), convention);
}

double Size::getTransferTime(SizeArg bytesPerSecond) const {
  return TransferSecondsAtBandwidth(_bytes, bytesPerSecond.value());
}

std::string Size::getFormattedTransferTime(const Rate& rate, const LanguageRegistry& registry,
                                           std::optional<std::string_view> languageCode,
                                           TransferConvention convention) const {
  return FormatDuration(getTransferTime(rate, convention), registry, languageCode);
}

std::vector<Size> Size::range(SizeArg start, SizeArg end, SizeArg step) {
  std::vector<Size> ret;
  for (double bytes : RangeValues(start.value(), end.value(), step.value())) {
    ret.emplace_back(bytes);
  }
  return ret;
}

Size Size::sum(std::span<const SizeArg> sizes) noexcept { return Size(SumOf(sizes)); }

Size Size::average(std::span<const SizeArg> sizes) { return Size(AverageOf(sizes)); }

Size Size::maximum(std::span<const SizeArg> sizes) { return Size(MaximumOf(sizes)); }

Size Size::minimum(std::span<const SizeArg> sizes) { return Size(MinimumOf(sizes)); }

}  // namespace byterate
