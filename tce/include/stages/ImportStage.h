#pragma once

#include "runtime/ITransformStage.h"
#include <set>
#include <string>

namespace TCE {

/**
 * @brief Brings module imports in line with the rewritten code
 *
 * Runs last. Adds `import pytest` and `import re` when the tree references
 * them without importing them, after the module docstring and the leading
 * import block. Removes `import unittest` and names imported from unittest
 * that nothing references any more; `unittest.mock` and `mock` stay.
 */
class ImportStage : public ITransformStage {
public:
    static constexpr const char *FAMILY = "import";

    std::string getName() const override {
        return "import";
    }

    NodePtr run(const NodePtr &module, StageContext &context) override;

private:
    NodePtr removeUnused(const NodePtr &module, const std::set<std::string> &referenced, StageContext &context);
    NodePtr addImport(const NodePtr &module, const std::string &name, StageContext &context);
};

}  // namespace TCE
