#pragma once

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <span>
#include <utility>

#include "byterate/compare-mode.hpp"
#include "byterate/errors.hpp"
#include "byterate/quantity-arg.hpp"
#include "byterate/unitsparser.hpp"

namespace byterate {

template <Dimension D>
using MagnitudeRange = std::pair<QuantityArg<D>, QuantityArg<D>>;

/// Arithmetic and comparison shared by Size and Rate.
/// Derived provides 'double value() const noexcept' and 'Derived withValue(double) const', the latter
/// returning a copy of itself holding another canonical value (so that Rate keeps its display preference).
/// Every operation is pure and returns a new value.
template <class Derived, Dimension D>
class MagnitudeOps {
 public:
  using Arg = QuantityArg<D>;
  using Args = std::span<const Arg>;
  using Range = MagnitudeRange<D>;

  /// Returns -1, 0 or 1 if this value is respectively lower, equal or greater than 'other'.
  [[nodiscard]] int compare(Arg other) const noexcept {
    const double lhs = val();
    const double rhs = other.value();
    return lhs < rhs ? -1 : static_cast<int>(rhs < lhs);
  }

  [[nodiscard]] bool equalTo(Arg other) const noexcept { return val() == other.value(); }
  [[nodiscard]] bool equalTo(Args others, CompareMode mode = CompareMode::kAll) const noexcept {
    return matches(others, mode, [this](const Arg& arg) { return equalTo(arg); });
  }
  [[nodiscard]] bool equalTo(std::initializer_list<Arg> others, CompareMode mode = CompareMode::kAll) const noexcept {
    return equalTo(Args(others.begin(), others.size()), mode);
  }

  [[nodiscard]] bool lessThan(Arg other) const noexcept { return val() < other.value(); }
  [[nodiscard]] bool lessThan(Args others, CompareMode mode = CompareMode::kAll) const noexcept {
    return matches(others, mode, [this](const Arg& arg) { return lessThan(arg); });
  }
  [[nodiscard]] bool lessThan(std::initializer_list<Arg> others, CompareMode mode = CompareMode::kAll) const noexcept {
    return lessThan(Args(others.begin(), others.size()), mode);
  }

  [[nodiscard]] bool lessThanOrEqual(Arg other) const noexcept { return val() <= other.value(); }
  [[nodiscard]] bool lessThanOrEqual(Args others, CompareMode mode = CompareMode::kAll) const noexcept {
    return matches(others, mode, [this](const Arg& arg) { return lessThanOrEqual(arg); });
  }
  [[nodiscard]] bool lessThanOrEqual(std::initializer_list<Arg> others,
                                     CompareMode mode = CompareMode::kAll) const noexcept {
    return lessThanOrEqual(Args(others.begin(), others.size()), mode);
  }

  [[nodiscard]] bool greaterThan(Arg other) const noexcept { return val() > other.value(); }
  [[nodiscard]] bool greaterThan(Args others, CompareMode mode = CompareMode::kAll) const noexcept {
    return matches(others, mode, [this](const Arg& arg) { return greaterThan(arg); });
  }
  [[nodiscard]] bool greaterThan(std::initializer_list<Arg> others,
                                 CompareMode mode = CompareMode::kAll) const noexcept {
    return greaterThan(Args(others.begin(), others.size()), mode);
  }

  [[nodiscard]] bool greaterThanOrEqual(Arg other) const noexcept { return val() >= other.value(); }
  [[nodiscard]] bool greaterThanOrEqual(Args others, CompareMode mode = CompareMode::kAll) const noexcept {
    return matches(others, mode, [this](const Arg& arg) { return greaterThanOrEqual(arg); });
  }
  [[nodiscard]] bool greaterThanOrEqual(std::initializer_list<Arg> others,
                                        CompareMode mode = CompareMode::kAll) const noexcept {
    return greaterThanOrEqual(Args(others.begin(), others.size()), mode);
  }

  /// Inclusive on both ends.
  [[nodiscard]] bool between(Arg min, Arg max) const noexcept {
    return min.value() <= val() && val() <= max.value();
  }

  /// Tells whether this value is between the bounds of the given ranges, combined with 'mode'.
  [[nodiscard]] bool inRanges(std::span<const Range> ranges, CompareMode mode = CompareMode::kAny) const noexcept {
    if (mode == CompareMode::kAll) {
      return std::ranges::all_of(ranges, [this](const Range& range) { return between(range.first, range.second); });
    }
    return std::ranges::any_of(ranges, [this](const Range& range) { return between(range.first, range.second); });
  }
  [[nodiscard]] bool inRanges(std::initializer_list<Range> ranges, CompareMode mode = CompareMode::kAny) const noexcept {
    return inRanges(std::span<const Range>(ranges.begin(), ranges.size()), mode);
  }

  [[nodiscard]] bool isZero() const noexcept { return val() == 0; }
  [[nodiscard]] bool isPositive() const noexcept { return val() > 0; }
  [[nodiscard]] bool isNegative() const noexcept { return val() < 0; }

  [[nodiscard]] Derived increment(Arg other) const { return derived().withValue(val() + other.value()); }

  /// Throws InvariantError if 'other' is greater than this value.
  [[nodiscard]] Derived decrement(Arg other) const {
    if (other.value() > val()) {
      throw InvariantError("Cannot decrement {} by {}, result would be negative", val(), other.value());
    }
    return derived().withValue(val() - other.value());
  }

  [[nodiscard]] Derived multiply(double factor) const { return derived().withValue(val() * factor); }

  /// Throws DivideByZeroError if 'other' is zero.
  [[nodiscard]] Derived divide(Arg other) const {
    if (other.value() == 0) {
      throw DivideByZeroError("Division by zero");
    }
    return derived().withValue(val() / other.value());
  }

  /// Remainder of the integral parts, with the sign of the dividend.
  /// Throws DivideByZeroError if the integral part of 'other' is zero.
  [[nodiscard]] Derived modulo(Arg other) const {
    const double divisor = std::trunc(other.value());
    if (divisor == 0) {
      throw DivideByZeroError("Modulo by zero");
    }
    return derived().withValue(std::fmod(std::trunc(val()), divisor));
  }

  [[nodiscard]] Derived abs() const { return derived().withValue(std::fabs(val())); }

  [[nodiscard]] Derived min(Arg other) const { return derived().withValue(std::min(val(), other.value())); }
  [[nodiscard]] Derived min(Args others) const {
    double ret = val();
    for (const Arg& arg : others) {
      ret = std::min(ret, arg.value());
    }
    return derived().withValue(ret);
  }
  [[nodiscard]] Derived min(std::initializer_list<Arg> others) const {
    return min(Args(others.begin(), others.size()));
  }

  [[nodiscard]] Derived max(Arg other) const { return derived().withValue(std::max(val(), other.value())); }
  [[nodiscard]] Derived max(Args others) const {
    double ret = val();
    for (const Arg& arg : others) {
      ret = std::max(ret, arg.value());
    }
    return derived().withValue(ret);
  }
  [[nodiscard]] Derived max(std::initializer_list<Arg> others) const {
    return max(Args(others.begin(), others.size()));
  }

 private:
  const Derived& derived() const noexcept { return static_cast<const Derived&>(*this); }

  double val() const noexcept { return derived().value(); }

  template <class Pred>
  static bool matches(Args others, CompareMode mode, Pred pred) {
    if (mode == CompareMode::kAll) {
      return std::ranges::all_of(others, pred);
    }
    return std::ranges::any_of(others, pred);
  }
};

}  // namespace byterate
