#include "byterate/duration-format.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include "byterate/errors.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"

namespace byterate {

namespace {

constexpr int64_t kSecondsPerMinute = 60;
constexpr int64_t kMinutesPerHour = 60;
constexpr int64_t kHoursPerDay = 24;

// Appends 'format' to 'out', each placeholder being replaced by its value.
void AppendSubstituted(std::string& out, std::string_view format, int64_t count, std::string_view unitForm) {
  while (!format.empty()) {
    const auto bracePos = format.find('{');
    out.append(format.substr(0, bracePos));
    if (bracePos == std::string_view::npos) {
      break;
    }
    format.remove_prefix(bracePos);
    if (format.starts_with(LanguageTable::kValuePlaceholder)) {
      fmt::format_to(std::back_inserter(out), "{}", count);
      format.remove_prefix(LanguageTable::kValuePlaceholder.size());
    } else if (format.starts_with(LanguageTable::kUnitPlaceholder)) {
      out.append(unitForm);
      format.remove_prefix(LanguageTable::kUnitPlaceholder.size());
    } else {
      out.push_back('{');
      format.remove_prefix(1);
    }
  }
}

void AppendUnit(std::string& out, int64_t count, std::string_view unit, const LanguageTable& table) {
  const std::string& unitForm = table.form(table.rule().formKey(count, unit));
  AppendSubstituted(out, table.format, count, unitForm);
}

// First unit is always rendered, the second one only when not zero.
std::string TwoUnits(int64_t firstCount, std::string_view firstUnit, int64_t secondCount,
                     std::string_view secondUnit, const LanguageTable& table) {
  std::string ret;
  AppendUnit(ret, firstCount, firstUnit, table);
  if (secondCount > 0) {
    ret.append(table.separator);
    AppendUnit(ret, secondCount, secondUnit, table);
  }
  return ret;
}

}  // namespace

std::string RenderUnit(int64_t count, std::string_view unit, const LanguageTable& table) {
  std::string ret;
  AppendUnit(ret, count, unit, table);
  return ret;
}

std::string FormatDuration(double seconds, const LanguageTable& table) {
  if (!std::isfinite(seconds)) {
    throw InvalidArgumentError("Cannot format a non finite duration");
  }
  if (seconds < 1) {
    return table.lessThanSecond;
  }
  // clamped to the int64 range
  static constexpr double kMaxSeconds = 9.2e18;
  const auto totalSeconds = static_cast<int64_t>(std::fmin(seconds, kMaxSeconds));

  const int64_t minutes = totalSeconds / kSecondsPerMinute;
  const int64_t remSeconds = totalSeconds % kSecondsPerMinute;
  if (minutes < 1) {
    return RenderUnit(remSeconds, "second", table);
  }

  const int64_t hours = minutes / kMinutesPerHour;
  const int64_t remMinutes = minutes % kMinutesPerHour;
  if (hours < 1) {
    return TwoUnits(remMinutes, "minute", remSeconds, "second", table);
  }

  const int64_t days = hours / kHoursPerDay;
  const int64_t remHours = hours % kHoursPerDay;
  if (days < 1) {
    return TwoUnits(remHours, "hour", remMinutes, "minute", table);
  }
  return TwoUnits(days, "day", remHours, "hour", table);
}

std::string FormatDuration(double seconds, const LanguageRegistry& registry,
                           std::optional<std::string_view> languageCode) {
  return FormatDuration(seconds, registry.resolve(languageCode));
}

}  // namespace byterate
