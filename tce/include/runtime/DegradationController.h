#pragma once

#include "model/ChangeLedger.h"
#include "model/DegradationTier.h"
#include "runtime/CancellationToken.h"
#include "runtime/IRewriteInterceptor.h"
#include "syntax/SyntaxNode.h"
#include <functional>
#include <string>

namespace TCE {

using RewriteFunction = std::function<NodePtr(const NodePtr &original)>;

/**
 * @brief Result of one guarded attempt
 */
struct AttemptResult {
    NodePtr node;  // replacement when applied, otherwise the original
    LedgerOutcome outcome = LedgerOutcome::Applied;

    bool applied() const {
        return outcome == LedgerOutcome::Applied;
    }
};

/**
 * @brief Guards every individual rewrite with the run's degradation tier
 *
 * For each attempt:
 * - a family above the run's tier is recorded as skipped-ambiguous;
 * - the rewrite runs on the original subtree; its result must re-parse and
 *   keep every comment (unless the request allows dropping them);
 * - any failure discards the partial result, records fell-back-error with
 *   the failure category and hands back the original subtree;
 * - in the experimental tier an optional repair strategy gets one more try.
 *
 * InvariantViolation and UnitCancelled always propagate. The controller
 * never changes tier on its own.
 */
class DegradationController {
public:
    DegradationController(DegradationTier tier, ChangeLedger &ledger, IRewriteInterceptor *interceptor = nullptr,
                          const CancellationToken *cancellation = nullptr);

    DegradationTier getTier() const {
        return tier_;
    }

    bool allows(DegradationTier required) const {
        return tierAllows(tier_, required);
    }

    /**
     * @brief Run one rewrite attempt under the tier policy
     * @param request Family, location and tier requirement of the attempt
     * @param original Subtree being rewritten (a statement)
     * @param rewrite Structural rewrite; throws RewriteError when it cannot proceed
     * @param repair Optional textual repair, used only in the experimental tier
     * @throws InvariantViolation, UnitCancelled
     */
    AttemptResult attempt(const RewriteRequest &request, const NodePtr &original, const RewriteFunction &rewrite,
                          const RewriteFunction &repair = nullptr);

    /**
     * @brief Record a construct left untouched because it is ambiguous
     */
    void skip(const RewriteRequest &request, const std::string &reason);

    /**
     * @brief Controller with the same tier, interceptor and cancellation writing to another ledger
     */
    DegradationController fork(ChangeLedger &ledger) const;

    /**
     * @brief Append the entries of a forked controller's ledger unchanged
     */
    void absorb(const ChangeLedger &tentative);

    /**
     * @brief Append the entries of a forked controller's ledger, turning applied ones into skips
     *
     * Used when the tree produced under the fork is thrown away.
     */
    void reject(const ChangeLedger &tentative, const std::string &reason);

private:
    void validate(const RewriteRequest &request, const NodePtr &original, const NodePtr &result) const;
    void finish(const RewriteRequest &request, LedgerOutcome outcome, const std::string &reason);

    DegradationTier tier_;
    ChangeLedger &ledger_;
    IRewriteInterceptor *interceptor_;
    const CancellationToken *cancellation_;
};

}  // namespace TCE
