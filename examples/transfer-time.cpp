#include <byterate/byterate.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string_view>

using namespace byterate;

// Usage: transfer-time <size> <rate> [language] [--exact]
// Example: transfer-time "4 GB" "100 Mbps" fr
int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <size> <rate> [language] [--exact]\n";
    return EXIT_FAILURE;
  }

  std::optional<std::string_view> language;
  TransferConvention convention = TransferConvention::kNominal;
  for (int argPos = 3; argPos < argc; ++argPos) {
    const std::string_view arg = argv[argPos];
    if (arg == "--exact") {
      convention = TransferConvention::kExact;
    } else {
      language = arg;
    }
  }

  try {
    LanguageRegistry registry;
    LoadBuiltinLanguages(registry);

    const TransferCalculator calculator(convention);
    const Size size = Size::fromHumanReadable(argv[1]);
    const Rate rate = Rate::fromHumanReadable(argv[2]);

    std::cout << fmt::format("{} at {}: {} ({} s)\n", size, rate,
                             calculator.formattedTransferTime(size, rate, registry, language),
                             calculator.transferTime(size, rate));
    std::cout << fmt::format("In one hour at {}: {}\n", rate, calculator.transferAmount(rate, 3600));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
