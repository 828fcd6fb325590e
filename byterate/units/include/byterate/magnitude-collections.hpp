#pragma once

#include <algorithm>
#include <span>
#include <vector>

#include "byterate/errors.hpp"
#include "byterate/quantity-arg.hpp"

namespace byterate {

/// Canonical values from 'start' to 'end', both included, spaced by 'step'.
/// Throws InvalidArgumentError if end < start, if step is not strictly positive or if any bound is not finite.
std::vector<double> RangeValues(double start, double end, double step);

template <Dimension D>
double SumOf(std::span<const QuantityArg<D>> values) noexcept {
  double ret = 0;
  for (const auto& value : values) {
    ret += value.value();
  }
  return ret;
}

/// Throws InvalidArgumentError on an empty collection.
template <Dimension D>
double AverageOf(std::span<const QuantityArg<D>> values) {
  if (values.empty()) {
    throw InvalidArgumentError("Cannot compute the average of an empty collection");
  }
  return SumOf(values) / static_cast<double>(values.size());
}

/// Throws InvalidArgumentError on an empty collection.
template <Dimension D>
double MaximumOf(std::span<const QuantityArg<D>> values) {
  if (values.empty()) {
    throw InvalidArgumentError("Cannot compute the maximum of an empty collection");
  }
  return std::ranges::max(values, {}, &QuantityArg<D>::value).value();
}

/// Throws InvalidArgumentError on an empty collection.
template <Dimension D>
double MinimumOf(std::span<const QuantityArg<D>> values) {
  if (values.empty()) {
    throw InvalidArgumentError("Cannot compute the minimum of an empty collection");
  }
  return std::ranges::min(values, {}, &QuantityArg<D>::value).value();
}

}  // namespace byterate
