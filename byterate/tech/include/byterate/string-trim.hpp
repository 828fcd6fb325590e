#pragma once

#include <string_view>

#include "byterate/cctype.hpp"

namespace byterate {

// Trim leading and trailing ASCII whitespace (space, \t, \n, \v, \f, \r).
constexpr std::string_view TrimSpaces(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && isspace(*begin)) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (!isspace(*end)) {
      ++end;
      break;
    }
  }
  return {begin, end};
}

}  // namespace byterate
