#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace TCE {

/**
 * @brief How much rewriting risk a run accepts, fixed for the whole run
 *
 * Tiers are ordered: a rewrite allowed at a tier is allowed at every higher tier.
 */
enum class DegradationTier { Essential = 0, Advanced = 1, Experimental = 2 };

inline bool tierAllows(DegradationTier current, DegradationTier required) {
    return static_cast<int>(current) >= static_cast<int>(required);
}

inline std::string tierToString(DegradationTier tier) {
    switch (tier) {
    case DegradationTier::Essential:
        return "essential";
    case DegradationTier::Advanced:
        return "advanced";
    case DegradationTier::Experimental:
        return "experimental";
    }
    return "unknown";
}

inline std::optional<DegradationTier> tierFromString(std::string_view name) {
    if (name == "essential") {
        return DegradationTier::Essential;
    }
    if (name == "advanced") {
        return DegradationTier::Advanced;
    }
    if (name == "experimental") {
        return DegradationTier::Experimental;
    }
    return std::nullopt;
}

}  // namespace TCE
