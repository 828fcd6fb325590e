#pragma once

namespace byterate {

#ifdef BYTERATE_ENABLE_GLAZE
constexpr bool glazeEnabled() { return true; }
#else
constexpr bool glazeEnabled() { return false; }
#endif

}  // namespace byterate
