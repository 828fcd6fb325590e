#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"

namespace byterate {

/// Codes of the languages shipped with the library, English first.
std::span<const std::string_view> BuiltinLanguageCodes() noexcept;

/// Returns a copy of the shipped table of 'code'.
/// Throws UnknownLanguageError if there is none.
LanguageTable BuiltinLanguage(std::string_view code);

/// Adds every shipped language to 'registry', English first so that it becomes the default of an empty registry.
/// Returns the loaded codes.
std::vector<std::string> LoadBuiltinLanguages(LanguageRegistry& registry);

}  // namespace byterate
