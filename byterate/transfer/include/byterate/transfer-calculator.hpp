#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "byterate/language-registry.hpp"
#include "byterate/quantity-arg.hpp"
#include "byterate/size.hpp"
#include "byterate/transfer-math.hpp"

namespace byterate {

/// Transfer time and amount computations between sizes and rates.
/// The convention only applies to transfer times, amounts are always bits per second * seconds / 8.
/// Operands may be values, human readable strings or raw canonical numbers (bytes, bits per second).
class TransferCalculator {
 public:
  TransferCalculator() noexcept = default;

  explicit TransferCalculator(TransferConvention convention) noexcept : _convention(convention) {}

  [[nodiscard]] TransferConvention convention() const noexcept { return _convention; }

  /// Seconds needed to transfer 'size' at 'rate'.
  /// Throws InvalidArgumentError if the rate is not strictly positive.
  [[nodiscard]] double transferTime(SizeArg size, RateArg rate) const;

  /// Seconds needed to transfer 'size' at a bandwidth in bytes per second ("10 MB" meaning 10 MB per second).
  /// Throws InvalidArgumentError if the bandwidth is not strictly positive.
  [[nodiscard]] static double transferTimeAtBandwidth(SizeArg size, SizeArg bytesPerSecond);

  /// Size transferred at 'rate' during 'seconds'.
  [[nodiscard]] Size transferAmount(RateArg rate, double seconds) const noexcept;

  /// Size transferred at a bandwidth in bytes per second during 'seconds'.
  [[nodiscard]] static Size transferAmountAtBandwidth(SizeArg bytesPerSecond, double seconds) noexcept;

  [[nodiscard]] Size estimateFileSize(RateArg rate, double seconds) const noexcept {
    return transferAmount(rate, seconds);
  }

  /// Localized transfer time of 'size' at 'rate', see FormatDuration.
  [[nodiscard]] std::string formattedTransferTime(SizeArg size, RateArg rate, const LanguageRegistry& registry,
                                                  std::optional<std::string_view> languageCode = std::nullopt) const;

 private:
  TransferConvention _convention{TransferConvention::kNominal};
};

}  // namespace byterate
