#pragma once

#include "model/TransformConfig.h"
#include "model/UnitResult.h"
#include "runtime/CancellationToken.h"
#include "runtime/IOutputSink.h"
#include "runtime/PipelineDriver.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TCE {

/**
 * @brief One input of a batch
 */
struct BatchUnit {
    std::string name;
    std::string source;
    std::string outputPath;  // empty: result is not written
};

struct BatchOutcome {
    std::string name;
    UnitResult result;
    std::optional<std::string> writeError;  // set when the sink rejected the output
};

/**
 * @brief Transforms independent units in parallel
 *
 * Every unit gets its own pipeline run and cancellation token; only the
 * driver, the configuration and the output sink are shared. Outcomes are
 * returned in input order whatever order the units finish in.
 */
class BatchTransformer {
public:
    BatchTransformer(const PipelineDriver &driver, const TransformConfig &config,
                     std::shared_ptr<IOutputSink> sink = nullptr);

    void setTier(std::optional<DegradationTier> tier) {
        tier_ = tier;
    }

    /**
     * @brief Upper bound on units transformed at the same time (at least 1)
     */
    void setMaxParallel(size_t maxParallel);

    std::vector<BatchOutcome> run(const std::vector<BatchUnit> &units);

    /**
     * @brief Cancel running units and every unit not yet started
     *
     * Callable from any thread while run() is in progress.
     */
    void cancelAll();

private:
    BatchOutcome transformOne(const BatchUnit &unit);

    const PipelineDriver &driver_;
    const TransformConfig &config_;
    std::shared_ptr<IOutputSink> sink_;
    std::optional<DegradationTier> tier_;
    size_t maxParallel_;

    std::atomic<bool> cancelled_{false};
    std::mutex tokensMutex_;
    std::vector<std::shared_ptr<CancellationToken>> activeTokens_;
};

}  // namespace TCE
