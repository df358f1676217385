#pragma once

#include "analysis/FactSet.h"
#include "model/TransformConfig.h"
#include "syntax/SyntaxNode.h"
#include <string>

namespace TCE {

/**
 * @brief One read-only analysis over a parsed unit
 *
 * A pass contributes one category of facts. Passes run in a fixed order and
 * may read facts contributed by earlier passes; they never touch the tree.
 */
class IAnalysisPass {
public:
    virtual ~IAnalysisPass() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Add this pass's facts for module
     *
     * Exceptions escaping a pass are recorded by the FactAnalyzer as an
     * unsupported fact; the remaining passes still run.
     */
    virtual void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) = 0;
};

}  // namespace TCE
