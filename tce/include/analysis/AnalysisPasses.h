#pragma once

#include "analysis/IAnalysisPass.h"

namespace TCE {

/**
 * @brief How unittest, pytest and re are imported
 */
class ImportPass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "imports";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

/**
 * @brief Classes (bases, nesting, subclassing) and test-unit discovery
 *
 * A function is a test when its name starts with an accepted prefix, at
 * module scope or directly inside a class (nested classes included).
 */
class DeclarationPass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "declarations";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

/**
 * @brief setUp/tearDown/setUpClass/tearDownClass/setUpModule/tearDownModule hooks
 */
class HookPass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "hooks";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

/**
 * @brief Loops inside functions: assertions, iterable shape and loop-carried state
 *
 * A loop carries state when its body rebinds, augments, stores into or calls
 * a mutating method on a variable that outlives one iteration. Such loops are
 * never lowered to parametrize.
 */
class LoopStatePass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "loops";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

/**
 * @brief with-blocks using assertRaises/assertWarns/assertLogs style context managers
 */
class ExceptionContextPass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "exception-contexts";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

/**
 * @brief Per class: assertion methods used and TestCase API no rewrite family converts
 */
class LegacyApiPass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "legacy-api";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

/**
 * @brief Complexity score from custom prefixes, nested test classes and unsupported shapes
 *
 * Runs last. Scores at or above the threshold recommend the essential tier.
 */
class ComplexityPass : public IAnalysisPass {
public:
    std::string getName() const override {
        return "complexity";
    }

    void run(const NodePtr &module, const TransformConfig &config, FactSet &facts) override;
};

}  // namespace TCE
