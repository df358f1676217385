#pragma once

#include "analysis/FactSet.h"
#include "analysis/IAnalysisPass.h"
#include <memory>
#include <vector>

namespace TCE {

/**
 * @brief Runs the analysis passes over a unit and freezes the result
 *
 * Default pass order: imports, declarations, hooks, loops,
 * exception-contexts, legacy-api, complexity. Later passes may read facts of
 * earlier ones. Never throws on a parsed tree: a failing pass is recorded as
 * an unsupported fact and the remaining passes still run.
 */
class FactAnalyzer {
public:
    FactAnalyzer();

    /**
     * @brief Analyzer with a custom pass list (tests, tooling)
     */
    explicit FactAnalyzer(std::vector<std::unique_ptr<IAnalysisPass>> passes);

    static std::vector<std::unique_ptr<IAnalysisPass>> createDefaultPasses();

    /**
     * @brief Analyze a parsed module
     * @return Frozen fact set
     */
    FactSet analyze(const NodePtr &module, const TransformConfig &config) const;

    /**
     * @brief Tier from configuration, or the analyzer's recommendation when unset
     */
    static DegradationTier resolveTier(const FactSet &facts, const TransformConfig &config);

private:
    std::vector<std::unique_ptr<IAnalysisPass>> passes_;
};

}  // namespace TCE
