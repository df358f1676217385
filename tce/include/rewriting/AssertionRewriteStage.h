#pragma once

#include "runtime/ITransformStage.h"

namespace TCE {

/**
 * @brief First pipeline stage: assertion methods, assertion contexts and loops
 *
 * Rewrites that keep every signature intact (assertion statements,
 * assertRaises/assertWarns) apply directly. Rewrites that add parameters to a
 * test (assertLogs, loop lowering) only make sense once the class has lost
 * its TestCase base, since unittest calls test methods without arguments:
 * inside a TestCase class they run tentatively and are kept only if the class
 * will convert; otherwise they are recorded as skipped.
 */
class AssertionRewriteStage : public ITransformStage {
public:
    static constexpr const char *FAMILY = "assertion";

    std::string getName() const override {
        return "assertion";
    }

    NodePtr run(const NodePtr &module, StageContext &context) override;
};

}  // namespace TCE
