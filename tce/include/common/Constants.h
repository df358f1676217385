#pragma once

#include <cstddef>

namespace TCE {
namespace Constants {

// Decimal places used by assertAlmostEqual when `places` is omitted
constexpr int DEFAULT_DECIMAL_PLACES = 7;

// Upper bound on the number of cases generated from a range() loop
constexpr size_t MAX_PARAMETRIZE_CASES = 100;

// Maximum length of a generated parametrize id before it is truncated
constexpr size_t MAX_CASE_ID_LENGTH = 40;

// Complexity score at or above which essential tier is recommended
constexpr int ESSENTIAL_TIER_SCORE_THRESHOLD = 4;

constexpr int CUSTOM_PREFIX_WEIGHT = 2;
constexpr int NESTED_CLASS_WEIGHT = 2;
constexpr int MAX_UNSUPPORTED_WEIGHT = 3;

// Indentation used for blocks synthesized from scratch
constexpr const char *DEFAULT_INDENT = "    ";

}  // namespace Constants
}  // namespace TCE
