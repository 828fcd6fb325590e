#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace byterate {

/// Chooses which form of a time unit to use for a given count.
/// 'unit' is the singular base name of the unit ("second", "minute", "hour", "day"),
/// the returned key is looked up in the forms of the language table.
class PluralRule {
 public:
  virtual ~PluralRule() = default;

  [[nodiscard]] virtual std::string formKey(int64_t count, std::string_view unit) const = 0;
};

// 1 -> "unit", anything else -> "units".
class DefaultPluralRule final : public PluralRule {
 public:
  [[nodiscard]] std::string formKey(int64_t count, std::string_view unit) const override;
};

// One / few / many rule of Russian and other East Slavic languages:
// 1, 21, 31... -> "unit", 2-4, 22-24... -> "unit_few", others -> "units".
class SlavicPluralRule final : public PluralRule {
 public:
  [[nodiscard]] std::string formKey(int64_t count, std::string_view unit) const override;
};

// Simplified Arabic rule without dual: 1 and 2 -> "unit", 3 to 10 -> "units", 0 and 11+ -> "units_many".
class ArabicPluralRule final : public PluralRule {
 public:
  [[nodiscard]] std::string formKey(int64_t count, std::string_view unit) const override;
};

// For languages without grammatical number (Japanese, Chinese): always "units".
class InvariantPluralRule final : public PluralRule {
 public:
  [[nodiscard]] std::string formKey(int64_t count, std::string_view unit) const override;
};

class FunctionPluralRule final : public PluralRule {
 public:
  using Function = std::function<std::string(int64_t, std::string_view)>;

  explicit FunctionPluralRule(Function function);

  [[nodiscard]] std::string formKey(int64_t count, std::string_view unit) const override {
    return _function(count, unit);
  }

 private:
  Function _function;
};

/// Returns the rule named 'name' among "default", "slavic", "arabic" and "invariant".
/// Throws InvalidArgumentError for any other name.
std::shared_ptr<const PluralRule> MakePluralRule(std::string_view name);

}  // namespace byterate
