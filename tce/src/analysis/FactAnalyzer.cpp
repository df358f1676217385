#include "analysis/FactAnalyzer.h"
#include "analysis/AnalysisPasses.h"
#include "common/Logger.h"

namespace TCE {

FactAnalyzer::FactAnalyzer() : passes_(createDefaultPasses()) {}

FactAnalyzer::FactAnalyzer(std::vector<std::unique_ptr<IAnalysisPass>> passes) : passes_(std::move(passes)) {}

std::vector<std::unique_ptr<IAnalysisPass>> FactAnalyzer::createDefaultPasses() {
    std::vector<std::unique_ptr<IAnalysisPass>> passes;
    passes.push_back(std::make_unique<ImportPass>());
    passes.push_back(std::make_unique<DeclarationPass>());
    passes.push_back(std::make_unique<HookPass>());
    passes.push_back(std::make_unique<LoopStatePass>());
    passes.push_back(std::make_unique<ExceptionContextPass>());
    passes.push_back(std::make_unique<LegacyApiPass>());
    passes.push_back(std::make_unique<ComplexityPass>());
    return passes;
}

FactSet FactAnalyzer::analyze(const NodePtr &module, const TransformConfig &config) const {
    FactSet facts;
    for (const auto &pass : passes_) {
        try {
            pass->run(module, config, facts);
        } catch (const std::exception &e) {
            LOG_WARN("FactAnalyzer: pass '{}' failed: {}", pass->getName(), e.what());
            facts.addUnsupported(pass->getName(), e.what());
        }
    }
    facts.freeze();
    LOG_DEBUG("FactAnalyzer: {} facts from {} passes", facts.size(), passes_.size());
    return facts;
}

DegradationTier FactAnalyzer::resolveTier(const FactSet &facts, const TransformConfig &config) {
    if (config.getTier()) {
        return *config.getTier();
    }
    auto complexity = facts.getComplexity();
    return complexity ? complexity->recommendedTier : DegradationTier::Advanced;
}

}  // namespace TCE
