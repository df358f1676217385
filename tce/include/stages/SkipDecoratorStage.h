#pragma once

#include "runtime/ITransformStage.h"

namespace TCE {

/**
 * @brief unittest skip/xfail decorators to pytest marks
 *
 * | unittest                          | pytest                                  |
 * |-----------------------------------|-----------------------------------------|
 * | `@unittest.skip(r)`               | `@pytest.mark.skip(reason=r)`           |
 * | `@unittest.skipIf(c, r)`          | `@pytest.mark.skipif(c, reason=r)`      |
 * | `@unittest.skipUnless(c, r)`      | `@pytest.mark.skipif(not c, reason=r)`  |
 * | `@unittest.expectedFailure`       | `@pytest.mark.xfail`                    |
 *
 * Decorators are recognized through any alias of the unittest module and
 * through names imported with `from unittest import ...`.
 */
class SkipDecoratorStage : public ITransformStage {
public:
    static constexpr const char *FAMILY = "skip-decorator";

    std::string getName() const override {
        return "skip-decorator";
    }

    NodePtr run(const NodePtr &module, StageContext &context) override;
};

}  // namespace TCE
