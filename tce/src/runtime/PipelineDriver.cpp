#include "runtime/PipelineDriver.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "rewriting/AssertionRewriteStage.h"
#include "stages/EntryPointStage.h"
#include "stages/FixtureStateStage.h"
#include "stages/ImportStage.h"
#include "stages/SkipDecoratorStage.h"
#include "syntax/Parser.h"

namespace TCE {

namespace {

UnitResult failedResult(UnitResult result, UnitError::Kind kind, const std::string &message,
                        SourcePosition position = {}) {
    result.status = UnitStatus::Failed;
    result.outputText.reset();
    result.error = UnitError{kind, message, position};
    return result;
}

}  // namespace

PipelineDriver::PipelineDriver() : stages_(createDefaultStages()) {}

PipelineDriver::PipelineDriver(std::vector<std::unique_ptr<ITransformStage>> stages) : stages_(std::move(stages)) {}

std::vector<std::unique_ptr<ITransformStage>> PipelineDriver::createDefaultStages() {
    std::vector<std::unique_ptr<ITransformStage>> stages;
    stages.push_back(std::make_unique<AssertionRewriteStage>());
    stages.push_back(std::make_unique<SkipDecoratorStage>());
    stages.push_back(std::make_unique<FixtureStateStage>());
    stages.push_back(std::make_unique<EntryPointStage>());
    stages.push_back(std::make_unique<ImportStage>());
    return stages;
}

void PipelineDriver::setInterceptor(std::shared_ptr<IRewriteInterceptor> interceptor) {
    interceptor_ = std::move(interceptor);
}

std::vector<std::string> PipelineDriver::getStageNames() const {
    std::vector<std::string> names;
    for (const auto &stage : stages_) {
        names.push_back(stage->getName());
    }
    return names;
}

UnitResult PipelineDriver::transformUnit(const std::string &source, const TransformConfig &config,
                                         std::optional<DegradationTier> tier,
                                         std::shared_ptr<CancellationToken> cancellation) const {
    UnitResult result;
    if (!cancellation) {
        cancellation = std::make_shared<CancellationToken>();
    }
    if (config.getStageDeadline()) {
        cancellation->setBudget(*config.getStageDeadline());
    }

    NodePtr tree;
    try {
        cancellation->throwIfCancelled("before parsing");
        tree = Parser::parse(source);
    } catch (const ParseError &e) {
        LOG_ERROR("PipelineDriver: parse failed: {}", e.what());
        return failedResult(std::move(result), UnitError::Kind::Parse, e.what(), e.getPosition());
    } catch (const UnitCancelled &e) {
        LOG_ERROR("PipelineDriver: {}", e.what());
        return failedResult(std::move(result),
                            e.isDeadlineExpired() ? UnitError::Kind::Deadline : UnitError::Kind::Cancelled, e.what());
    }

    FactSet facts = analyzer_.analyze(tree, config);
    result.tier = tier ? *tier : FactAnalyzer::resolveTier(facts, config);
    LOG_DEBUG("PipelineDriver: transforming unit ({} bytes) at {} tier", source.size(), tierToString(result.tier));

    FixtureStateContainer fixtures;
    DegradationController controller(result.tier, result.ledger, interceptor_.get(), cancellation.get());
    StageContext context{facts, config, controller, fixtures, cancellation.get()};

    try {
        for (const auto &stage : stages_) {
            cancellation->throwIfCancelled("before stage '" + stage->getName() + "'");
            size_t entriesBefore = result.ledger.size();
            NodePtr next = stage->run(tree, context);
            if (next != tree) {
                verifyRoundTrip(next, stage->getName());
                tree = next;
            }
            LOG_DEBUG("PipelineDriver: stage '{}' done, {} ledger entries", stage->getName(),
                      result.ledger.size() - entriesBefore);
        }
    } catch (const InvariantViolation &e) {
        LOG_ERROR("PipelineDriver: invariant violated: {}", e.what());
        return failedResult(std::move(result), UnitError::Kind::Invariant, e.what());
    } catch (const UnitCancelled &e) {
        LOG_ERROR("PipelineDriver: {}", e.what());
        return failedResult(std::move(result),
                            e.isDeadlineExpired() ? UnitError::Kind::Deadline : UnitError::Kind::Cancelled, e.what());
    } catch (const std::exception &e) {
        // Stages route every rewrite through the controller; anything escaping is a contract breach
        LOG_ERROR("PipelineDriver: stage raised outside the controller: {}", e.what());
        return failedResult(std::move(result), UnitError::Kind::Invariant,
                            std::string("unguarded stage failure: ") + e.what());
    }

    result.outputText = tree->render();
    result.fixtures = fixtures.toJson();
    result.status = result.ledger.allApplied() ? UnitStatus::Complete : UnitStatus::Partial;
    LOG_INFO("PipelineDriver: unit {} ({} applied, {} skipped, {} fell back)", statusToString(result.status),
             result.ledger.count(LedgerOutcome::Applied), result.ledger.count(LedgerOutcome::SkippedAmbiguous),
             result.ledger.count(LedgerOutcome::FellBackError));
    return result;
}

void PipelineDriver::verifyRoundTrip(const NodePtr &tree, const std::string &stageName) {
    std::string text = tree->render();
    NodePtr reparsed;
    try {
        reparsed = Parser::parse(text);
    } catch (const ParseError &e) {
        throw InvariantViolation("stage '" + stageName + "' produced output that does not parse: " + e.what());
    }
    if (reparsed->render() != text) {
        throw InvariantViolation("stage '" + stageName + "' output does not round-trip");
    }
}

}  // namespace TCE
