#include "byterate/language-file.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "byterate/cctype.hpp"
#include "byterate/errors.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"
#include "byterate/log.hpp"
#include "byterate/plural-rule.hpp"

namespace byterate {

namespace {

struct LanguageFileContent {
  std::optional<std::string> language_code;
  std::optional<std::string> language_name;
  std::map<std::string, std::string> time;
};

}  // namespace

}  // namespace byterate

template <>
struct glz::meta<byterate::LanguageFileContent> {
  using T = byterate::LanguageFileContent;
  static constexpr auto value =
      glz::object("language_code", &T::language_code, "language_name", &T::language_name, "time", &T::time);
};

namespace byterate {

namespace {

constexpr std::string_view kFormatKey = "format";
constexpr std::string_view kSeparatorKey = "separator";
constexpr std::string_view kLessThanSecondKey = "less_than_second";
constexpr std::string_view kPluralRuleKey = "plural_rule";

constexpr bool IsLanguageCodeLike(std::string_view stem) noexcept {
  const auto isLetter = [](char ch) { return isalpha(ch); };
  if (stem.size() == 2) {
    return std::ranges::all_of(stem, isLetter);
  }
  return stem.size() == 5 && (stem[2] == '-' || stem[2] == '_') && isalpha(stem[0]) && isalpha(stem[1]) &&
         isalpha(stem[3]) && isalpha(stem[4]);
}

static_assert(IsLanguageCodeLike("en") && IsLanguageCodeLike("pt-BR") && IsLanguageCodeLike("zh_TW"));
static_assert(!IsLanguageCodeLike("english") && !IsLanguageCodeLike("e1"));

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw InvalidArgumentError("Unable to open language file {}", path.string());
  }
  return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

}  // namespace

LanguageTable LoadLanguageFile(const std::filesystem::path& path, std::optional<std::string_view> code) {
  const std::string buffer = ReadFile(path);

  LanguageFileContent content;
  const auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(content, buffer);
  if (ec) {
    log::error("Invalid JSON in language file {}: {}", path.string(), glz::format_error(ec, buffer));
    throw InvalidArgumentError("Invalid JSON in language file {}", path.filename().string());
  }

  LanguageTable table;
  if (code) {
    table.code = *code;
  } else if (content.language_code && !content.language_code->empty()) {
    table.code = std::move(*content.language_code);
  } else {
    const std::string stem = path.stem().string();
    if (!IsLanguageCodeLike(stem)) {
      throw InvalidArgumentError("Cannot determine the language code of file {}", path.filename().string());
    }
    table.code = stem;
  }
  if (content.language_name) {
    table.name = std::move(*content.language_name);
  }

  for (auto& [key, value] : content.time) {
    if (key == kFormatKey) {
      table.format = std::move(value);
    } else if (key == kSeparatorKey) {
      table.separator = std::move(value);
    } else if (key == kLessThanSecondKey) {
      table.lessThanSecond = std::move(value);
    } else if (key == kPluralRuleKey) {
      table.pluralRule = MakePluralRule(value);
    } else {
      table.forms.insert_or_assign(key, std::move(value));
    }
  }

  table.validate();
  log::debug("Loaded language '{}' from {}", table.code, path.string());
  return table;
}

std::vector<std::string> LoadLanguagesFromDirectory(LanguageRegistry& registry,
                                                    const std::filesystem::path& directory,
                                                    std::string_view extension) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    throw InvalidArgumentError("{} is not a directory", directory.string());
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(directory)) {
    if (entry.is_regular_file() && entry.path().extension() == extension) {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);

  std::vector<std::string> codes;
  codes.reserve(files.size());
  for (const auto& file : files) {
    try {
      codes.push_back(registry.loadLanguage([&file] { return LoadLanguageFile(file); }));
    } catch (const exception& ex) {
      log::error("Skipping language file {}: {}", file.string(), ex.what());
    }
  }
  return codes;
}

}  // namespace byterate
