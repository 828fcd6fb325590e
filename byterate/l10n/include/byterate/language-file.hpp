#pragma once

#ifdef BYTERATE_ENABLE_GLAZE

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"

namespace byterate {

/// Reads a JSON language file shaped like
///   {"language_code": "fr", "language_name": "Français",
///    "time": {"format": "{value} {unit}", "separator": " et ", "less_than_second": "...",
///             "plural_rule": "default", "second": "seconde", "seconds": "secondes", ...}}
/// Every key of "time" other than the four settings above is a unit form.
/// The code is 'code' if given, else "language_code", else the file name if shaped like "xx", "xx-YY" or "xx_YY".
/// Throws InvalidArgumentError if the file cannot be read, is not valid JSON, has no code or an invalid table.
LanguageTable LoadLanguageFile(const std::filesystem::path& path, std::optional<std::string_view> code = std::nullopt);

/// Loads into 'registry' every regular file of 'directory' with given extension, in path order.
/// Files that cannot be loaded are logged and skipped. Returns the loaded codes.
/// Throws InvalidArgumentError if 'directory' is not a directory.
std::vector<std::string> LoadLanguagesFromDirectory(LanguageRegistry& registry,
                                                    const std::filesystem::path& directory,
                                                    std::string_view extension = ".json");

}  // namespace byterate

#endif  // BYTERATE_ENABLE_GLAZE
