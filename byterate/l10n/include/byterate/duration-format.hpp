#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"

namespace byterate {

/// Renders 'count' of 'unit' ("second", "minute", "hour" or "day") with the format of 'table',
/// the unit form being chosen by the plural rule of the table.
/// Throws MissingFormKeyError if the table has no such form.
std::string RenderUnit(int64_t count, std::string_view unit, const LanguageTable& table);

/// Human readable duration with at most two units, the second one being omitted when zero:
///  - below 1 second: the "less than a second" phrase of the language
///  - below 1 minute: seconds only ("42 seconds")
///  - below 1 hour: minutes and seconds ("2 minutes, 10 seconds")
///  - below 1 day: hours and minutes, seconds are dropped
///  - otherwise: days and hours ("2 days, 12 hours")
/// Fractional seconds are truncated. Throws InvalidArgumentError if 'seconds' is not finite.
std::string FormatDuration(double seconds, const LanguageTable& table);

/// Same as above, with the table resolved from 'registry' (see LanguageRegistry::resolve).
std::string FormatDuration(double seconds, const LanguageRegistry& registry,
                           std::optional<std::string_view> languageCode = std::nullopt);

}  // namespace byterate
