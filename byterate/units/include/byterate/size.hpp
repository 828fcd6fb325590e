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
#include "byterate/transfer-math.hpp"
#include "byterate/unitsparser.hpp"

namespace byterate {

class Rate;

/// Digital storage size, stored as a number of bytes.
/// Units are base 1024: 1 kB is 1024 bytes.
class Size : public MagnitudeOps<Size, Dimension::kSize> {
 public:
  static constexpr Dimension kDimension = Dimension::kSize;
  static constexpr int8_t kDefaultPrecision = 2;

  Size() noexcept = default;

  /// Number of bytes, human readable string ("1.5 MB") or another size.
  explicit Size(SizeArg bytes) noexcept : _bytes(bytes.value()) {}

  static Size b(double value) noexcept { return Size(value); }
  static Size kb(double value) noexcept;
  static Size mb(double value) noexcept;
  static Size gb(double value) noexcept;
  static Size tb(double value) noexcept;
  static Size pb(double value) noexcept;
  static Size eb(double value) noexcept;
  static Size zb(double value) noexcept;
  static Size yb(double value) noexcept;

  /// Throws UnknownUnitError if 'unit' is not a size unit.
  static Size fromUnit(double value, std::string_view unit);

  /// Throws ParseError if 'str' is not a valid human readable size.
  static Size fromHumanReadable(std::string_view str);

  static Size fromBits(double bits) noexcept { return Size(bits / 8); }

  /// Number of bytes.
  [[nodiscard]] double value() const noexcept { return _bytes; }

  [[nodiscard]] double toBits() const noexcept { return _bytes * 8; }

  [[nodiscard]] Size withValue(double bytes) const noexcept { return Size(bytes); }

  /// Value in 'unit', rounded if a precision is given.
  /// Throws UnknownUnitError if 'unit' is not a size unit.
  [[nodiscard]] double getValue(std::string_view unit, std::optional<int8_t> precision = std::nullopt) const;

  /// Renders the value in 'unit', for instance to("kB", 3) gives "1.500 kB" for 1536 bytes.
  [[nodiscard]] std::string to(std::string_view unit, std::optional<int8_t> precision = std::nullopt,
                               std::string_view delimiter = " ") const;

  [[nodiscard]] std::string toKb(std::optional<int8_t> precision = std::nullopt) const { return to("kB", precision); }
  [[nodiscard]] std::string toMb(std::optional<int8_t> precision = std::nullopt) const { return to("MB", precision); }
  [[nodiscard]] std::string toGb(std::optional<int8_t> precision = std::nullopt) const { return to("GB", precision); }
  [[nodiscard]] std::string toTb(std::optional<int8_t> precision = std::nullopt) const { return to("TB", precision); }

  /// Renders the value in the largest unit in which it is at least 1 ("1.5 kB").
  [[nodiscard]] std::string humanize(std::optional<int8_t> precision = kDefaultPrecision,
                                     std::string_view delimiter = " ") const {
    return humanizeValue(_bytes, precision, delimiter);
  }

  [[nodiscard]] std::string toString() const { return humanize(); }

  static std::string humanizeValue(double bytes, std::optional<int8_t> precision = kDefaultPrecision,
                                   std::string_view delimiter = " ");

  /// Seconds needed to transfer this size at 'rate'.
  /// Throws InvalidArgumentError if the rate is not strictly positive.
  [[nodiscard]] double getTransferTime(const Rate& rate,
                                       TransferConvention convention = TransferConvention::kNominal) const;

  /// Seconds needed to transfer this size at a bandwidth expressed in bytes per second.
  /// Throws InvalidArgumentError if the bandwidth is not strictly positive.
  [[nodiscard]] double getTransferTime(SizeArg bytesPerSecond) const;

  /// Localized duration of the transfer of this size at 'rate'.
  [[nodiscard]] std::string getFormattedTransferTime(const Rate& rate, const LanguageRegistry& registry,
                                                     std::optional<std::string_view> languageCode = std::nullopt,
                                                     TransferConvention convention = TransferConvention::kNominal) const;

  /// Sizes from 'start' to 'end' included, spaced by 'step'.
  /// Throws InvalidArgumentError if end < start or if step is not strictly positive.
  static std::vector<Size> range(SizeArg start, SizeArg end, SizeArg step);

  static Size sum(std::span<const SizeArg> sizes) noexcept;
  static Size sum(std::initializer_list<SizeArg> sizes) noexcept { return sum(Args(sizes.begin(), sizes.size())); }

  // average, maximum and minimum throw InvalidArgumentError on an empty collection.

  static Size average(std::span<const SizeArg> sizes);
  static Size average(std::initializer_list<SizeArg> sizes) { return average(Args(sizes.begin(), sizes.size())); }

  static Size maximum(std::span<const SizeArg> sizes);
  static Size maximum(std::initializer_list<SizeArg> sizes) { return maximum(Args(sizes.begin(), sizes.size())); }

  static Size minimum(std::span<const SizeArg> sizes);
  static Size minimum(std::initializer_list<SizeArg> sizes) { return minimum(Args(sizes.begin(), sizes.size())); }

  std::partial_ordering operator<=>(const Size& other) const noexcept { return _bytes <=> other._bytes; }
  bool operator==(const Size& other) const noexcept { return _bytes == other._bytes; }

 private:
  double _bytes{};
};

}  // namespace byterate

template <>
struct fmt::formatter<byterate::Size> : fmt::formatter<std::string_view> {
  auto format(const byterate::Size& size, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(size.humanize(), ctx);
  }
};
