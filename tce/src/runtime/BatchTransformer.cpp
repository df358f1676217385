#include "runtime/BatchTransformer.h"
#include "common/Logger.h"
#include <algorithm>
#include <future>
#include <thread>

namespace TCE {

BatchTransformer::BatchTransformer(const PipelineDriver &driver, const TransformConfig &config,
                                   std::shared_ptr<IOutputSink> sink)
    : driver_(driver), config_(config), sink_(std::move(sink)),
      maxParallel_(std::max(1u, std::thread::hardware_concurrency())) {}

void BatchTransformer::setMaxParallel(size_t maxParallel) {
    maxParallel_ = std::max<size_t>(1, maxParallel);
}

void BatchTransformer::cancelAll() {
    cancelled_.store(true);
    std::lock_guard<std::mutex> lock(tokensMutex_);
    for (const auto &token : activeTokens_) {
        token->cancel();
    }
    LOG_INFO("BatchTransformer: cancelling {} running unit(s)", activeTokens_.size());
}

BatchOutcome BatchTransformer::transformOne(const BatchUnit &unit) {
    Logger::UnitScope scope(unit.name);
    auto token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(tokensMutex_);
        activeTokens_.push_back(token);
    }
    if (cancelled_.load()) {
        token->cancel();
    }

    BatchOutcome outcome{unit.name, driver_.transformUnit(unit.source, config_, tier_, token), std::nullopt};

    {
        std::lock_guard<std::mutex> lock(tokensMutex_);
        activeTokens_.erase(std::remove(activeTokens_.begin(), activeTokens_.end(), token), activeTokens_.end());
    }

    if (outcome.result.outputText && sink_ && !unit.outputPath.empty()) {
        try {
            sink_->write(unit.outputPath, *outcome.result.outputText);
        } catch (const std::exception &e) {
            LOG_ERROR("BatchTransformer: unit '{}' not written: {}", unit.name, e.what());
            outcome.writeError = e.what();
        }
    }
    return outcome;
}

std::vector<BatchOutcome> BatchTransformer::run(const std::vector<BatchUnit> &units) {
    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(units.size());
    LOG_DEBUG("BatchTransformer: {} unit(s), up to {} in parallel", units.size(), maxParallel_);

    for (size_t begin = 0; begin < units.size(); begin += maxParallel_) {
        size_t end = std::min(units.size(), begin + maxParallel_);
        std::vector<std::future<BatchOutcome>> running;
        for (size_t i = begin; i < end; ++i) {
            running.push_back(std::async(std::launch::async, [this, &unit = units[i]]() { return transformOne(unit); }));
        }
        for (auto &future : running) {
            outcomes.push_back(future.get());
        }
    }

    size_t failed = std::count_if(outcomes.begin(), outcomes.end(),
                                  [](const BatchOutcome &outcome) { return !outcome.result.isSuccess(); });
    LOG_INFO("BatchTransformer: {} unit(s) done, {} failed", outcomes.size(), failed);
    return outcomes;
}

}  // namespace TCE
