#include "byterate/stringconv.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include "byterate/errors.hpp"
#include "byterate/ipow.hpp"
#include "byterate/log.hpp"

namespace byterate {

double StringToDouble(std::string_view str) {
  const char* begPtr = str.data();
  const char* endPtr = begPtr + str.size();
  if (begPtr != endPtr && *begPtr == '+') {
    ++begPtr;
    if (begPtr != endPtr && *begPtr == '-') {
      // "+-23" is not a number
      begPtr = endPtr;
    }
  }

  double ret;
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);
  if (errc != std::errc() || ptr != endPtr || begPtr == endPtr || !std::isfinite(ret)) {
    log::error("Unable to decode '{}' into a floating point number", str);
    throw InvalidArgumentError("StringToDouble conversion failed");
  }
  return ret;
}

double RoundToPrecision(double value, int8_t precision) noexcept {
  const double scale = static_cast<double>(ipow10(static_cast<uint32_t>(precision)));
  const double scaled = value * scale;
  if (!std::isfinite(scaled)) {
    return value;
  }
  return std::round(scaled) / scale;
}

namespace {

// Rewrites the scientific notation written from 'begPos' ("1.5e-07") in positional notation ("0.00000015").
void ExpandExponent(std::string& out, std::string::size_type begPos) {
  const auto expPos = out.find('e', begPos);
  if (expPos == std::string::npos) {
    return;
  }
  std::string_view expStr(out.data() + expPos + 1, out.size() - expPos - 1);
  if (!expStr.empty() && expStr.front() == '+') {
    expStr.remove_prefix(1);
  }
  int exponent = 0;
  std::from_chars(expStr.data(), expStr.data() + expStr.size(), exponent);

  const bool negative = out[begPos] == '-';
  const std::string_view mantissa(out.data() + begPos + static_cast<std::string::size_type>(negative),
                                  expPos - begPos - static_cast<std::string::size_type>(negative));
  std::string digits;
  digits.reserve(mantissa.size());
  int intLen = static_cast<int>(mantissa.size());
  for (std::string_view::size_type pos = 0; pos < mantissa.size(); ++pos) {
    if (mantissa[pos] == '.') {
      intLen = static_cast<int>(pos);
    } else {
      digits.push_back(mantissa[pos]);
    }
  }

  const int pointPos = intLen + exponent;
  std::string expanded;
  if (negative) {
    expanded.push_back('-');
  }
  if (pointPos <= 0) {
    expanded.append("0.");
    expanded.append(static_cast<std::string::size_type>(-pointPos), '0');
    expanded.append(digits);
  } else if (static_cast<std::string::size_type>(pointPos) >= digits.size()) {
    expanded.append(digits);
    expanded.append(static_cast<std::string::size_type>(pointPos) - digits.size(), '0');
  } else {
    expanded.append(digits, 0, static_cast<std::string::size_type>(pointPos));
    expanded.push_back('.');
    expanded.append(digits, static_cast<std::string::size_type>(pointPos));
  }
  out.replace(begPos, std::string::npos, expanded);
}

}  // namespace

void AppendNumber(std::string& out, double value) {
  if (value == 0) {
    // also covers -0
    out.push_back('0');
    return;
  }
  const auto begPos = out.size();
  fmt::format_to(std::back_inserter(out), "{}", value);
  ExpandExponent(out, begPos);
}

void AppendFixedNumber(std::string& out, double value, int8_t precision) {
  // round ourselves first, printf-like rounding of ties is not half away from zero
  value = RoundToPrecision(value, precision);
  const auto begPos = out.size();
  fmt::format_to(std::back_inserter(out), "{:.{}f}", value, precision);
  // "-0.00" can still appear when a tiny negative value rounds to zero
  if (out[begPos] == '-' && out.find_first_not_of("0.", begPos + 1) == std::string::npos) {
    out.erase(begPos, 1);
  }
}

}  // namespace byterate
