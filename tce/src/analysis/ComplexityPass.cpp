#include "analysis/AnalysisPasses.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include <algorithm>
#include <format>

namespace TCE {

void ComplexityPass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    (void)module;
    (void)config;
    ComplexityFact complexity;

    size_t customPrefixTests = 0;
    for (const auto *function : facts.getFunctions()) {
        customPrefixTests += function->hasCustomPrefix ? 1 : 0;
    }
    if (customPrefixTests > 0) {
        complexity.score += Constants::CUSTOM_PREFIX_WEIGHT;
        complexity.reasons.push_back(std::format("{} tests use custom prefixes", customPrefixTests));
    }

    for (const auto *cls : facts.getClasses()) {
        if (cls->isNested && cls->derivesFromTestCase) {
            complexity.score += Constants::NESTED_CLASS_WEIGHT;
            complexity.reasons.push_back("nested test class " + cls->qualifiedName);
        }
    }

    size_t unsupported = facts.getUnsupported().size();
    if (unsupported > 0) {
        complexity.score += static_cast<int>(std::min<size_t>(unsupported, Constants::MAX_UNSUPPORTED_WEIGHT));
        complexity.reasons.push_back(std::format("{} unsupported shapes", unsupported));
    }

    complexity.recommendedTier = complexity.score >= Constants::ESSENTIAL_TIER_SCORE_THRESHOLD
                                     ? DegradationTier::Essential
                                     : DegradationTier::Advanced;
    LOG_DEBUG("ComplexityPass: score {} -> {}", complexity.score, tierToString(complexity.recommendedTier));
    facts.add(FactSet::COMPLEXITY_KEY, std::move(complexity));
}

}  // namespace TCE
