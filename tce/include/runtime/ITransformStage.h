#pragma once

#include "analysis/FactSet.h"
#include "model/ChangeLedger.h"
#include "model/FixtureStateContainer.h"
#include "model/TransformConfig.h"
#include "runtime/CancellationToken.h"
#include "runtime/DegradationController.h"
#include "syntax/SyntaxNode.h"
#include <string>

namespace TCE {

/**
 * @brief Everything a stage may read or append to while transforming one unit
 */
struct StageContext {
    const FactSet &facts;
    const TransformConfig &config;
    DegradationController &controller;
    FixtureStateContainer &fixtures;
    const CancellationToken *cancellation = nullptr;

    DegradationTier getTier() const {
        return controller.getTier();
    }
};

/**
 * @brief One step of the transformer pipeline
 *
 * run() maps a tree to a new tree; every individual rewrite goes through
 * context.controller, which records the ledger entries. A stage with
 * nothing to do returns the identical root pointer.
 */
class ITransformStage {
public:
    virtual ~ITransformStage() = default;

    virtual std::string getName() const = 0;

    virtual NodePtr run(const NodePtr &module, StageContext &context) = 0;
};

}  // namespace TCE
