#pragma once

// IWYU pragma: begin_exports
#include "byterate/builtin-languages.hpp"
#include "byterate/compare-mode.hpp"
#include "byterate/duration-format.hpp"
#include "byterate/errors.hpp"
#include "byterate/features.hpp"
#include "byterate/format-config.hpp"
#include "byterate/language-file.hpp"
#include "byterate/language-registry.hpp"
#include "byterate/language-table.hpp"
#include "byterate/plural-rule.hpp"
#include "byterate/quantity-arg.hpp"
#include "byterate/rate.hpp"
#include "byterate/size.hpp"
#include "byterate/transfer-calculator.hpp"
#include "byterate/transfer-math.hpp"
#include "byterate/version.hpp"
// IWYU pragma: end_exports
