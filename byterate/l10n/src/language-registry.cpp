#include "byterate/language-registry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "byterate/errors.hpp"
#include "byterate/language-table.hpp"
#include "byterate/log.hpp"

namespace byterate {

void LanguageRegistry::addLanguage(std::string_view code, LanguageTable table) {
  table.code = code;
  table.validate();

  const auto [it, inserted] = _tables.insert_or_assign(std::string(code), std::move(table));
  log::debug("Language '{}' {}", it->first, inserted ? "added" : "replaced");
  if (_defaultLanguage.empty()) {
    _defaultLanguage = it->first;
    log::debug("Default language is now '{}'", _defaultLanguage);
  }
}

std::string LanguageRegistry::loadLanguage(const Loader& loader) {
  LanguageTable table = loader();
  std::string code = table.code;
  addLanguage(code, std::move(table));
  return code;
}

void LanguageRegistry::setDefaultLanguage(std::string_view code) {
  if (!isLanguageLoaded(code)) {
    throw UnknownLanguageError("Cannot set default language to '{}' which is not loaded", code);
  }
  _defaultLanguage = code;
  log::debug("Default language is now '{}'", _defaultLanguage);
}

std::vector<std::string> LanguageRegistry::loadedLanguages() const {
  std::vector<std::string> ret;
  ret.reserve(_tables.size());
  for (const auto& [code, table] : _tables) {
    ret.push_back(code);
  }
  return ret;
}

const LanguageTable& LanguageRegistry::resolve(std::optional<std::string_view> code) const {
  const std::string_view requested = code ? *code : std::string_view(_defaultLanguage);
  auto it = _tables.find(requested);
  if (it != _tables.end()) {
    return it->second;
  }
  it = _tables.find(kFallbackLanguage);
  if (it == _tables.end()) {
    throw UnknownLanguageError("Language '{}' is not loaded and no '{}' fallback is available", requested,
                               kFallbackLanguage);
  }
  log::warn("Language '{}' is not loaded, falling back to '{}'", requested, kFallbackLanguage);
  return it->second;
}

}  // namespace byterate
