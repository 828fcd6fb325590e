#pragma once

#include <string>
#include <string_view>

#ifndef BYTERATE_VERSION_STR
#error "BYTERATE_VERSION_STR must be defined via build system"
#endif

namespace byterate {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return BYTERATE_VERSION_STR; }

// Multiline description of the version and of the libraries in use:
//   byterate <version>
//     logging: spdlog <version>
//     language files: glaze | disabled
std::string fullVersionString();

}  // namespace byterate
