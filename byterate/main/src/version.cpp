#include "byterate/version.hpp"

#include <fmt/format.h>
#include <spdlog/version.h>

#include <string>

#include "byterate/features.hpp"

namespace byterate {

std::string fullVersionString() {
  return fmt::format("byterate {}\n  logging: spdlog {}.{}.{}\n  language files: {}", version(), SPDLOG_VER_MAJOR,
                     SPDLOG_VER_MINOR, SPDLOG_VER_PATCH, glazeEnabled() ? "glaze" : "disabled");
}

}  // namespace byterate
