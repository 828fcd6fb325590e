#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/language-table.hpp"

namespace byterate {

/// Set of loaded language tables, one of them being the default.
/// A fresh registry is empty and has no default: the first added language becomes the default.
/// Reading from several threads is safe, mutations should be done before sharing the registry.
class LanguageRegistry {
 public:
  static constexpr std::string_view kFallbackLanguage = "en";

  using Loader = std::function<LanguageTable()>;

  /// Validates then inserts or replaces the table under 'code'.
  void addLanguage(std::string_view code, LanguageTable table);

  /// Inserts the table returned by 'loader' under its own code, which is returned.
  std::string loadLanguage(const Loader& loader);

  /// Throws UnknownLanguageError if 'code' is not loaded.
  void setDefaultLanguage(std::string_view code);

  /// Empty if no language has been loaded yet.
  [[nodiscard]] std::string_view defaultLanguage() const noexcept { return _defaultLanguage; }

  [[nodiscard]] bool isLanguageLoaded(std::string_view code) const noexcept { return _tables.contains(code); }

  /// Loaded language codes, sorted.
  [[nodiscard]] std::vector<std::string> loadedLanguages() const;

  /// Returns the table of 'code', or of the default language if no code is given.
  /// Falls back to English if that language is not loaded, and throws UnknownLanguageError if English is not loaded either.
  [[nodiscard]] const LanguageTable& resolve(std::optional<std::string_view> code = std::nullopt) const;

  [[nodiscard]] bool empty() const noexcept { return _tables.empty(); }

  [[nodiscard]] auto size() const noexcept { return _tables.size(); }

 private:
  std::map<std::string, LanguageTable, std::less<>> _tables;
  std::string _defaultLanguage;
};

}  // namespace byterate
