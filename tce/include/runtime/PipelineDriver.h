#pragma once

#include "analysis/FactAnalyzer.h"
#include "model/TransformConfig.h"
#include "model/UnitResult.h"
#include "runtime/CancellationToken.h"
#include "runtime/IRewriteInterceptor.h"
#include "runtime/ITransformStage.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TCE {

/**
 * @brief Transforms one unit: parse, analyze, run the stages, render
 *
 * Default stage order: assertion, skip-decorator, fixture-state,
 * entry-point, import. After every stage that changed the tree the output
 * is rendered and re-parsed; a stage that breaks the round trip is an
 * InvariantViolation and fails the unit.
 *
 * Thread-safe for concurrent transformUnit() calls: all per-unit state
 * (tree, facts, fixtures, ledger) lives on the call stack; stages and the
 * interceptor must be stateless or synchronized.
 *
 * @code
 * PipelineDriver driver;
 * UnitResult result = driver.transformUnit(source, TransformConfig());
 * if (result.outputText) {
 *     writeFile(path, *result.outputText);
 * }
 * @endcode
 */
class PipelineDriver {
public:
    PipelineDriver();

    explicit PipelineDriver(std::vector<std::unique_ptr<ITransformStage>> stages);

    static std::vector<std::unique_ptr<ITransformStage>> createDefaultStages();

    /**
     * @brief Install an interceptor consulted before every rewrite attempt
     */
    void setInterceptor(std::shared_ptr<IRewriteInterceptor> interceptor);

    /**
     * @brief Transform one unit
     * @param source Unit text
     * @param config Run configuration
     * @param tier Explicit tier; falls back to config, then to the analyzer's recommendation
     * @param cancellation Optional token for cancellation and deadlines
     * @return Complete or partial result with output, or failed result with error
     */
    UnitResult transformUnit(const std::string &source, const TransformConfig &config,
                             std::optional<DegradationTier> tier = std::nullopt,
                             std::shared_ptr<CancellationToken> cancellation = nullptr) const;

    std::vector<std::string> getStageNames() const;

private:
    static void verifyRoundTrip(const NodePtr &tree, const std::string &stageName);

    std::vector<std::unique_ptr<ITransformStage>> stages_;
    std::shared_ptr<IRewriteInterceptor> interceptor_;
    FactAnalyzer analyzer_;
};

}  // namespace TCE
