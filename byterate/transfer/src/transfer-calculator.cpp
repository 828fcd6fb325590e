#include "byterate/transfer-calculator.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "byterate/duration-format.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/log.hpp"
#include "byterate/size.hpp"
#include "byterate/transfer-math.hpp"

namespace byterate {

double TransferCalculator::transferTime(SizeArg size, RateArg rate) const {
  const double seconds = TransferSeconds(size.value(), rate.value(), _convention);
  log::debug("{} bytes at {} bps take {} s", size.value(), rate.value(), seconds);
  return seconds;
}

double TransferCalculator::transferTimeAtBandwidth(SizeArg size, SizeArg bytesPerSecond) {
  return TransferSecondsAtBandwidth(size.value(), bytesPerSecond.value());
}

Size TransferCalculator::transferAmount(RateArg rate, double seconds) const noexcept {
  return Size(TransferredBytes(rate.value(), seconds));
}

Size TransferCalculator::transferAmountAtBandwidth(SizeArg bytesPerSecond, double seconds) noexcept {
  return Size(bytesPerSecond.value() * seconds);
}

std::string TransferCalculator::formattedTransferTime(SizeArg size, RateArg rate, const LanguageRegistry& registry,
                                                      std::optional<std::string_view> languageCode) const {
  return FormatDuration(transferTime(size, rate), registry, languageCode);
}

}  // namespace byterate
