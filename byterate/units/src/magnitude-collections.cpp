#include "byterate/magnitude-collections.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include "byterate/errors.hpp"
#include "byterate/log.hpp"

namespace byterate {

namespace {
constexpr double kMaxRangeSize = 1 << 24;
// tolerance on the number of steps so that 0.1 to 0.3 by 0.1 still includes its end
constexpr double kStepsEpsilon = 1e-9;
}  // namespace

std::vector<double> RangeValues(double start, double end, double step) {
  if (!std::isfinite(start) || !std::isfinite(end) || !std::isfinite(step)) {
    throw InvalidArgumentError("Range bounds and step should be finite");
  }
  if (end < start) {
    throw InvalidArgumentError("Range end {} is lower than its start {}", end, start);
  }
  if (step <= 0) {
    throw InvalidArgumentError("Range step {} should be strictly positive", step);
  }
  const double nbSteps = std::floor(((end - start) / step) + kStepsEpsilon);
  if (nbSteps >= kMaxRangeSize) {
    throw InvalidArgumentError("Range from {} to {} by {} has too many elements", start, end, step);
  }

  std::vector<double> ret;
  ret.reserve(static_cast<std::size_t>(nbSteps) + 1U);
  // multiplying instead of accumulating avoids drift, the last element never exceeds 'end'
  for (std::size_t stepPos = 0; stepPos <= static_cast<std::size_t>(nbSteps); ++stepPos) {
    ret.push_back(std::min(start + (static_cast<double>(stepPos) * step), end));
  }
  log::debug("Generated range of {} values from {} to {}", ret.size(), start, end);
  return ret;
}

}  // namespace byterate
