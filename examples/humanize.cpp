#include <byterate/byterate.hpp>
#include <cstdlib>
#include <iostream>
#include <string_view>

using namespace byterate;

// Usage: humanize <size|rate> <value>...
// Parses each value ("1536", "1.5 GB", "100 Mbps") and prints it in various units.
int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <size|rate> <value>...\n";
    return EXIT_FAILURE;
  }
  const std::string_view kind = argv[1];
  if (kind != "size" && kind != "rate") {
    std::cerr << "Unknown kind '" << kind << "', expected 'size' or 'rate'\n";
    return EXIT_FAILURE;
  }

  try {
    for (int argPos = 2; argPos < argc; ++argPos) {
      if (kind == "size") {
        const Size size = Size::fromHumanReadable(argv[argPos]);
        std::cout << argv[argPos] << " -> " << size.humanize() << " (" << size.value() << " bytes, " << size.toMb(3)
                  << ", " << size.toBits() << " bits)\n";
      } else {
        const Rate rate = Rate::fromHumanReadable(argv[argPos]);
        std::cout << argv[argPos] << " -> " << rate.toString(true) << " / " << rate.toString(false) << " ("
                  << rate.value() << " bps)\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
