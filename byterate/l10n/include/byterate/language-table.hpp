#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "byterate/plural-rule.hpp"

namespace byterate {

/// Strings and rules used to render durations in one language.
struct LanguageTable {
  static constexpr std::string_view kValuePlaceholder = "{value}";
  static constexpr std::string_view kUnitPlaceholder = "{unit}";

  LanguageTable& withCode(std::string_view newCode) {
    code = newCode;
    return *this;
  }

  LanguageTable& withName(std::string_view newName) {
    name = newName;
    return *this;
  }

  LanguageTable& withFormat(std::string_view newFormat) {
    format = newFormat;
    return *this;
  }

  LanguageTable& withSeparator(std::string_view newSeparator) {
    separator = newSeparator;
    return *this;
  }

  LanguageTable& withLessThanSecond(std::string_view phrase) {
    lessThanSecond = phrase;
    return *this;
  }

  LanguageTable& withForm(std::string_view key, std::string_view value) {
    forms.insert_or_assign(std::string(key), std::string(value));
    return *this;
  }

  LanguageTable& withPluralRule(std::shared_ptr<const PluralRule> rule) {
    pluralRule = std::move(rule);
    return *this;
  }

  LanguageTable& withPluralFunction(FunctionPluralRule::Function function) {
    return withPluralRule(std::make_shared<FunctionPluralRule>(std::move(function)));
  }

  /// Returns the string registered under 'key'.
  /// Throws MissingFormKeyError if there is none.
  [[nodiscard]] const std::string& form(std::string_view key) const;

  /// Rule in use, DefaultPluralRule if none was set.
  [[nodiscard]] const PluralRule& rule() const noexcept;

  // Throws InvalidArgumentError if the code is empty, the format lacks one of its placeholders
  // or the "less than a second" phrase is empty.
  void validate() const;

  std::string code;
  std::string name;
  // Pattern of one unit segment, with {value} and {unit} placeholders.
  std::string format{"{value} {unit}"};
  std::string separator{", "};
  std::string lessThanSecond;
  // Unit forms keyed by the keys produced by the plural rule ("second", "seconds", "second_few"...)
  std::map<std::string, std::string, std::less<>> forms;
  std::shared_ptr<const PluralRule> pluralRule;
};

}  // namespace byterate
