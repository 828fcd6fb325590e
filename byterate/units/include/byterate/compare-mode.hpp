#pragma once

#include <cstdint>

namespace byterate {

// How a predicate evaluated against several operands is combined.
// On an empty collection, kAll is true and kAny is false.
enum class CompareMode : int8_t { kAll, kAny };

}  // namespace byterate
