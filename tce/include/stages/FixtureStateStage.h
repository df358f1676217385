#pragma once

#include "analysis/Facts.h"
#include "runtime/ITransformStage.h"
#include <optional>
#include <string>

namespace TCE {

/**
 * @brief TestCase classes to plain classes, unittest hooks to pytest hooks
 *
 * Records every setup/teardown hook in the fixture/state container, converts
 * the classes the analysis marked as candidates (see ClassConverter) and
 * renames setUpModule/tearDownModule. A class that received parameters in
 * the assertion stage must convert here; if it does not, the unit output
 * would call tests with missing arguments and the run fails with
 * InvariantViolation.
 */
class FixtureStateStage : public ITransformStage {
public:
    static constexpr const char *FAMILY = "fixture-state";

    std::string getName() const override {
        return "fixture-state";
    }

    NodePtr run(const NodePtr &module, StageContext &context) override;

    /**
     * @brief Why a TestCase class keeps its base, std::nullopt for candidates
     */
    static std::optional<std::string> keepReason(const ClassFact &cls, const StageContext &context);

private:
    NodePtr convertClass(const NodePtr &classDef, const std::string &qualifiedName, StageContext &context);
    NodePtr renameModuleHook(const NodePtr &module, const NodePtr &hook, StageContext &context);
};

}  // namespace TCE
