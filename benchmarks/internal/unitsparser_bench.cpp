#include <benchmark/benchmark.h>

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "byterate/format-config.hpp"
#include "byterate/magnitude-format.hpp"
#include "byterate/stringconv.hpp"
#include "byterate/unit-table.hpp"
#include "byterate/unitsparser.hpp"

using namespace byterate;

namespace {

std::vector<std::string> GenerateQuantities(UnitFamily family) {
  constexpr std::size_t kCount = 10'000;

  std::mt19937_64 rng(0xC0FFEE);
  std::uniform_int_distribution<int> unitDist(0, 8);
  std::uniform_real_distribution<double> valueDist(0, 1000);

  const auto units = FamilyUnits(family);
  std::vector<std::string> quantities;
  quantities.reserve(kCount);
  for (std::size_t pos = 0; pos < kCount; ++pos) {
    std::string quantity = NumberToString(valueDist(rng));
    quantity.push_back(' ');
    quantity.append(units[static_cast<std::size_t>(unitDist(rng))].symbol);
    quantities.push_back(std::move(quantity));
  }
  return quantities;
}

void BM_ParseSize(benchmark::State& state) {
  const auto quantities = GenerateQuantities(UnitFamily::kSize);
  std::size_t pos = 0;
  for ([[maybe_unused]] auto iter : state) {
    benchmark::DoNotOptimize(ParseMagnitude(quantities[pos], Dimension::kSize));
    pos = (pos + 1) % quantities.size();
  }
}

void BM_ParseRate(benchmark::State& state) {
  const auto quantities = GenerateQuantities(UnitFamily::kRateByte);
  std::size_t pos = 0;
  for ([[maybe_unused]] auto iter : state) {
    benchmark::DoNotOptimize(ParseMagnitude(quantities[pos], Dimension::kRate));
    pos = (pos + 1) % quantities.size();
  }
}

void BM_HumanizeSize(benchmark::State& state) {
  std::mt19937_64 rng(0xBEEF);
  std::uniform_real_distribution<double> bytesDist(0, 1e15);
  std::vector<double> values(1024);
  for (double& value : values) {
    value = bytesDist(rng);
  }
  const FormatConfig config = FormatConfig{}.withPrecision(2);
  std::size_t pos = 0;
  for ([[maybe_unused]] auto iter : state) {
    benchmark::DoNotOptimize(Humanize(values[pos], UnitFamily::kSize, config));
    pos = (pos + 1) % values.size();
  }
}

}  // namespace

BENCHMARK(BM_ParseSize);
BENCHMARK(BM_ParseRate);
BENCHMARK(BM_HumanizeSize);

BENCHMARK_MAIN();
