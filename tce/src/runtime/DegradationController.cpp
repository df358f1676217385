#include "runtime/DegradationController.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/TreeEditor.h"
#include <optional>
#include <format>

namespace TCE {

namespace {

struct Failure {
    std::string category;
    std::string message;

    std::string describe() const {
        return category + ": " + message;
    }
};

}  // namespace

DegradationController::DegradationController(DegradationTier tier, ChangeLedger &ledger,
                                             IRewriteInterceptor *interceptor, const CancellationToken *cancellation)
    : tier_(tier), ledger_(ledger), interceptor_(interceptor), cancellation_(cancellation) {}

DegradationController DegradationController::fork(ChangeLedger &ledger) const {
    return DegradationController(tier_, ledger, interceptor_, cancellation_);
}

void DegradationController::absorb(const ChangeLedger &tentative) {
    for (const auto &entry : tentative.getEntries()) {
        ledger_.record(entry);
    }
}

void DegradationController::reject(const ChangeLedger &tentative, const std::string &reason) {
    for (const auto &entry : tentative.getEntries()) {
        if (entry.outcome != LedgerOutcome::Applied) {
            ledger_.record(entry);
            continue;
        }
        LOG_DEBUG("DegradationController: {} at {} discarded: {}", entry.family, entry.range.toString(), reason);
        ledger_.record(entry.range, entry.family, LedgerOutcome::SkippedAmbiguous, reason);
    }
}

AttemptResult DegradationController::attempt(const RewriteRequest &request, const NodePtr &original,
                                             const RewriteFunction &rewrite, const RewriteFunction &repair) {
    if (cancellation_) {
        cancellation_->throwIfCancelled("before " + request.family + " rewrite at " + request.range.toString());
    }

    if (!allows(request.requiredTier)) {
        finish(request, LedgerOutcome::SkippedAmbiguous,
               "requires " + tierToString(request.requiredTier) + " tier: " + request.description);
        return AttemptResult{original, LedgerOutcome::SkippedAmbiguous};
    }

    if (interceptor_) {
        try {
            interceptor_->beforeAttempt(request);
        } catch (const InvariantViolation &) {
            throw;
        } catch (const UnitCancelled &) {
            throw;
        } catch (const std::exception &e) {
            finish(request, LedgerOutcome::FellBackError, std::string("interceptor: ") + e.what());
            return AttemptResult{original, LedgerOutcome::FellBackError};
        }
    }

    auto run = [&](const RewriteFunction &strategy, std::optional<Failure> &failure) -> NodePtr {
        try {
            NodePtr result = strategy(original);
            validate(request, original, result);
            return result;
        } catch (const InvariantViolation &) {
            throw;
        } catch (const UnitCancelled &) {
            throw;
        } catch (const RewriteError &e) {
            failure = Failure{"rewrite", e.what()};
        } catch (const ParseError &e) {
            failure = Failure{"invalid-output", e.what()};
        } catch (const std::exception &e) {
            failure = Failure{"internal", e.what()};
        }
        return nullptr;
    };

    std::optional<Failure> failure;
    if (NodePtr result = run(rewrite, failure)) {
        finish(request, LedgerOutcome::Applied, request.description);
        return AttemptResult{result, LedgerOutcome::Applied};
    }

    if (repair && tier_ == DegradationTier::Experimental) {
        std::optional<Failure> repairFailure;
        if (NodePtr repaired = run(repair, repairFailure)) {
            LOG_DEBUG("DegradationController: {} at {} repaired after {}", request.family, request.range.toString(),
                      failure->describe());
            finish(request, LedgerOutcome::Applied, request.description + " (textual repair)");
            return AttemptResult{repaired, LedgerOutcome::Applied};
        }
        failure->message += "; repair failed: " + repairFailure->describe();
    }

    LOG_WARN("DegradationController: {} rewrite at {} fell back: {}", request.family, request.range.toString(),
             failure->describe());
    finish(request, LedgerOutcome::FellBackError, failure->describe());
    return AttemptResult{original, LedgerOutcome::FellBackError};
}

void DegradationController::skip(const RewriteRequest &request, const std::string &reason) {
    LOG_DEBUG("DegradationController: {} at {} skipped: {}", request.family, request.range.toString(), reason);
    finish(request, LedgerOutcome::SkippedAmbiguous, reason);
}

void DegradationController::validate(const RewriteRequest &request, const NodePtr &original,
                                     const NodePtr &result) const {
    if (!result) {
        throw RewriteError("rewrite produced no node");
    }
    if (result == original) {
        throw RewriteError("rewrite made no change");
    }
    if (isStatementKind(result->getKind())) {
        SyntaxFactory::checkParses(result);
    }
    if (request.preserveComments) {
        size_t before = TreeEditor::countComments(original);
        size_t after = TreeEditor::countComments(result);
        if (after < before) {
            throw RewriteError(std::format("rewrite would drop {} comment(s)", before - after));
        }
    }
}

void DegradationController::finish(const RewriteRequest &request, LedgerOutcome outcome, const std::string &reason) {
    ledger_.record(request.range, request.family, outcome, reason);
    if (!interceptor_) {
        return;
    }
    try {
        interceptor_->afterAttempt(request, outcome);
    } catch (const InvariantViolation &) {
        throw;
    } catch (const UnitCancelled &) {
        throw;
    } catch (const std::exception &e) {
        LOG_WARN("DegradationController: interceptor afterAttempt failed: {}", e.what());
    }
}

}  // namespace TCE
