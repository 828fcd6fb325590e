#include "byterate/unitsparser.hpp"

#include <cmath>
#include <cstddef>
#include <string_view>

#include "byterate/cctype.hpp"
#include "byterate/errors.hpp"
#include "byterate/log.hpp"
#include "byterate/string-trim.hpp"
#include "byterate/stringconv.hpp"
#include "byterate/unit-table.hpp"

namespace byterate {

namespace {

constexpr std::size_t kMaxUnitLen = 4;

std::size_t SkipDigits(std::string_view str, std::size_t pos) {
  while (pos < str.size() && isdigit(str[pos])) {
    ++pos;
  }
  return pos;
}

// Returns the length of the numeric prefix of str, or 0 if it does not start with a well formed number.
std::size_t NumberPrefixLen(std::string_view str) {
  std::size_t pos = 0;
  if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
    ++pos;
  }
  std::size_t endPos = SkipDigits(str, pos);
  if (endPos == pos) {
    return 0;
  }
  if (endPos < str.size() && str[endPos] == '.') {
    const std::size_t fracBeg = endPos + 1;
    endPos = SkipDigits(str, fracBeg);
    if (endPos == fracBeg) {
      return 0;
    }
  }
  return endPos;
}

[[noreturn]] void ThrowInvalidNumber(std::string_view str) {
  log::error("Invalid numeric portion in '{}'", str);
  throw ParseError(ParseError::Reason::kInvalidNumber, "Invalid numeric portion in '{}'", str);
}

[[noreturn]] void ThrowUnrecognizedUnit(std::string_view str, std::string_view unitStr) {
  log::error("Unrecognized unit '{}' in '{}'", unitStr, str);
  throw ParseError(ParseError::Reason::kUnrecognizedUnit, "Unrecognized unit '{}' in '{}'", unitStr, str);
}

}  // namespace

ParsedMagnitude ParseMagnitudeWithUnit(std::string_view str, Dimension dimension) {
  const std::string_view trimmed = TrimSpaces(str);
  const std::size_t numberLen = NumberPrefixLen(trimmed);
  if (numberLen == 0) {
    ThrowInvalidNumber(str);
  }
  // a number glued to something else than a unit, like "1.2.3" or "1,5"
  if (numberLen < trimmed.size() && !isspace(trimmed[numberLen]) && !isalpha(trimmed[numberLen])) {
    ThrowInvalidNumber(str);
  }

  double number;
  try {
    number = StringToDouble(trimmed.substr(0, numberLen));
  } catch (const InvalidArgumentError&) {
    ThrowInvalidNumber(str);
  }

  const std::string_view unitStr = TrimSpaces(trimmed.substr(numberLen));
  if (unitStr.empty()) {
    return {number, nullptr};
  }
  if (unitStr.size() > kMaxUnitLen) {
    ThrowUnrecognizedUnit(str, unitStr);
  }
  for (char ch : unitStr) {
    if (!isalpha(ch)) {
      ThrowUnrecognizedUnit(str, unitStr);
    }
  }

  const UnitSpec* unit = dimension == Dimension::kSize ? FindSizeUnit(unitStr) : FindRateUnit(unitStr);
  if (unit == nullptr) {
    ThrowUnrecognizedUnit(str, unitStr);
  }
  const double canonical = number * unit->factor();
  if (!std::isfinite(canonical)) {
    ThrowInvalidNumber(str);
  }
  return {canonical, unit};
}

}  // namespace byterate
