#include "byterate/language-table.hpp"

#include <string>
#include <string_view>

#include "byterate/errors.hpp"
#include "byterate/plural-rule.hpp"

namespace byterate {

const std::string& LanguageTable::form(std::string_view key) const {
  const auto it = forms.find(key);
  if (it == forms.end()) {
    throw MissingFormKeyError("Language '{}' has no form '{}'", code, key);
  }
  return it->second;
}

const PluralRule& LanguageTable::rule() const noexcept {
  static const DefaultPluralRule kDefaultRule;
  return pluralRule ? *pluralRule : kDefaultRule;
}

void LanguageTable::validate() const {
  if (code.empty()) {
    throw InvalidArgumentError("Language code should not be empty");
  }
  if (!format.contains(kValuePlaceholder) || !format.contains(kUnitPlaceholder)) {
    throw InvalidArgumentError("Format '{}' of language '{}' should contain {} and {}", format, code,
                               kValuePlaceholder, kUnitPlaceholder);
  }
  if (lessThanSecond.empty()) {
    throw InvalidArgumentError("'less than a second' phrase of language '{}' should not be empty", code);
  }
}

}  // namespace byterate
