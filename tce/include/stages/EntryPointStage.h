#pragma once

#include "runtime/ITransformStage.h"

namespace TCE {

/**
 * @brief `unittest.main()` to `pytest.main()`
 *
 * Calls passing arguments (argv, verbosity, exit, ...) have no pytest
 * equivalent; they are converted in the experimental tier only, with the
 * arguments dropped.
 */
class EntryPointStage : public ITransformStage {
public:
    static constexpr const char *FAMILY = "entry-point";

    std::string getName() const override {
        return "entry-point";
    }

    NodePtr run(const NodePtr &module, StageContext &context) override;
};

}  // namespace TCE
