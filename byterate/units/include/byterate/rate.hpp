#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/language-registry.hpp"
#include "byterate/magnitude-ops.hpp"
#include "byterate/quantity-arg.hpp"
#include "byterate/size.hpp"
#include "byterate/transfer-math.hpp"
#include "byterate/unitsparser.hpp"

namespace byterate {

/// Data transfer rate, stored as a number of bits per second.
/// Units are base 1000, byte units ("MBps") being worth 8 bits units ("Mbps").
/// The display preference only selects the unit family used when rendering without an explicit unit.
class Rate : public MagnitudeOps<Rate, Dimension::kRate> {
 public:
  static constexpr Dimension kDimension = Dimension::kRate;
  static constexpr int8_t kDefaultPrecision = 2;
  static constexpr double kDefaultRangeStep = 1000;

  Rate() noexcept = default;

  /// A raw number, or a string without unit ("1000"), is in bits per second if 'isBits', else in bytes per second.
  /// Strings with a unit ("10 Mbps", "1.5 MBps") and other rates are already canonical.
  explicit Rate(RateArg value, bool isBits = true, bool displayAsBits = true) noexcept
      : _bitsPerSecond(value.isRaw() && !isBits ? value.value() * 8 : value.value()), _displayAsBits(displayAsBits) {}

  static Rate bps(double value, bool displayAsBits = true) noexcept;
  static Rate kbps(double value, bool displayAsBits = true) noexcept;
  static Rate mbps(double value, bool displayAsBits = true) noexcept;
  static Rate gbps(double value, bool displayAsBits = true) noexcept;
  static Rate tbps(double value, bool displayAsBits = true) noexcept;

  static Rate bytesPerSec(double value, bool displayAsBits = false) noexcept;
  static Rate kBps(double value, bool displayAsBits = false) noexcept;
  static Rate MBps(double value, bool displayAsBits = false) noexcept;
  static Rate GBps(double value, bool displayAsBits = false) noexcept;

  /// Display preference defaults to the family of 'unit'.
  /// Throws UnknownUnitError if 'unit' is not a rate unit.
  static Rate fromUnit(double value, std::string_view unit, std::optional<bool> displayAsBits = std::nullopt);

  /// Display preference defaults to the family of the parsed unit, bits for a plain number.
  /// Throws ParseError if 'str' is not a valid human readable rate.
  static Rate fromHumanReadable(std::string_view str, std::optional<bool> displayAsBits = std::nullopt);

  /// Bits per second.
  [[nodiscard]] double value() const noexcept { return _bitsPerSecond; }

  [[nodiscard]] double toBits() const noexcept { return _bitsPerSecond; }

  /// Bytes per second.
  [[nodiscard]] double toBytes() const noexcept { return _bitsPerSecond / 8; }

  [[nodiscard]] bool displayAsBits() const noexcept { return _displayAsBits; }

  [[nodiscard]] Rate withDisplayAs(bool displayAsBits) const noexcept {
    return Rate(_bitsPerSecond, true, displayAsBits);
  }

  [[nodiscard]] Rate withValue(double bitsPerSecond) const noexcept {
    return Rate(bitsPerSecond, true, _displayAsBits);
  }

  /// Value in 'unit', or in bits / bytes per second for the pseudo units "bit" and "byte".
  /// Throws UnknownUnitError for any other unknown unit.
  [[nodiscard]] double getValue(std::string_view unit, std::optional<int8_t> precision = std::nullopt) const;

  /// Renders the value in 'unit', for instance to("Mbps", 3, "_") gives "100.000_Mbps".
  [[nodiscard]] std::string to(std::string_view unit, std::optional<int8_t> precision = std::nullopt,
                               std::string_view delimiter = " ") const;

  [[nodiscard]] std::string toKbps(std::optional<int8_t> precision = std::nullopt) const {
    return to("kbps", precision);
  }
  [[nodiscard]] std::string toMbps(std::optional<int8_t> precision = std::nullopt) const {
    return to("Mbps", precision);
  }
  [[nodiscard]] std::string toGbps(std::optional<int8_t> precision = std::nullopt) const {
    return to("Gbps", precision);
  }
  [[nodiscard]] std::string toTbps(std::optional<int8_t> precision = std::nullopt) const {
    return to("Tbps", precision);
  }
  [[nodiscard]] std::string toKBps(std::optional<int8_t> precision = std::nullopt) const {
    return to("kBps", precision);
  }
  [[nodiscard]] std::string toMBps(std::optional<int8_t> precision = std::nullopt) const {
    return to("MBps", precision);
  }
  [[nodiscard]] std::string toGBps(std::optional<int8_t> precision = std::nullopt) const {
    return to("GBps", precision);
  }

  /// Renders the value in the largest unit of the chosen family in which it is at least 1.
  /// Family defaults to the display preference.
  [[nodiscard]] std::string toString(std::optional<bool> asBits = std::nullopt,
                                     std::optional<int8_t> precision = kDefaultPrecision,
                                     std::string_view delimiter = " ") const {
    return humanizeValue(_bitsPerSecond, asBits.value_or(_displayAsBits), precision, delimiter);
  }

  static std::string humanizeValue(double bitsPerSecond, bool asBits = true,
                                   std::optional<int8_t> precision = kDefaultPrecision,
                                   std::string_view delimiter = " ");

  /// Multiplies this rate by 'factor'.
  /// Throws InvalidArgumentError if factor is outside [0, 1].
  [[nodiscard]] Rate throttle(double factor) const;

  /// Seconds needed to transfer 'size' at this rate.
  /// Throws InvalidArgumentError if this rate is not strictly positive.
  [[nodiscard]] double transferTime(SizeArg size, TransferConvention convention = TransferConvention::kNominal) const;

  [[nodiscard]] std::string formattedTransferTime(SizeArg size, const LanguageRegistry& registry,
                                                  std::optional<std::string_view> languageCode = std::nullopt,
                                                  TransferConvention convention = TransferConvention::kNominal) const;

  /// Size transferred at this rate during 'seconds' (bits per second * seconds / 8 bytes).
  [[nodiscard]] Size transferAmount(double seconds) const noexcept;

  [[nodiscard]] Size estimateFileSize(double seconds) const noexcept { return transferAmount(seconds); }

  /// Rates from 'start' to 'end' included, spaced by 'step'.
  /// Throws InvalidArgumentError if end < start or if step is not strictly positive.
  static std::vector<Rate> range(RateArg start, RateArg end, RateArg step = kDefaultRangeStep,
                                 bool displayAsBits = true);

  static Rate sum(std::span<const RateArg> rates, bool displayAsBits = true) noexcept;
  static Rate sum(std::initializer_list<RateArg> rates, bool displayAsBits = true) noexcept {
    return sum(Args(rates.begin(), rates.size()), displayAsBits);
  }

  // average, maximum and minimum throw InvalidArgumentError on an empty collection.

  static Rate average(std::span<const RateArg> rates, bool displayAsBits = true);
  static Rate average(std::initializer_list<RateArg> rates, bool displayAsBits = true) {
    return average(Args(rates.begin(), rates.size()), displayAsBits);
  }

  static Rate maximum(std::span<const RateArg> rates, bool displayAsBits = true);
  static Rate maximum(std::initializer_list<RateArg> rates, bool displayAsBits = true) {
    return maximum(Args(rates.begin(), rates.size()), displayAsBits);
  }

  static Rate minimum(std::span<const RateArg> rates, bool displayAsBits = true);
  static Rate minimum(std::initializer_list<RateArg> rates, bool displayAsBits = true) {
    return minimum(Args(rates.begin(), rates.size()), displayAsBits);
  }

  /// Ordering and equality only consider the canonical value, not the display preference.
  std::partial_ordering operator<=>(const Rate& other) const noexcept {
    return _bitsPerSecond <=> other._bitsPerSecond;
  }
  bool operator==(const Rate& other) const noexcept { return _bitsPerSecond == other._bitsPerSecond; }

 private:
  double _bitsPerSecond{};
  bool _displayAsBits{true};
};

}  // namespace byterate

template <>
struct fmt::formatter<byterate::Rate> : fmt::formatter<std::string_view> {
  auto format(const byterate::Rate& rate, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(rate.toString(), ctx);
  }
};
