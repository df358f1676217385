#pragma once

#include "common/SourceLocation.h"
#include "model/ChangeLedger.h"
#include "model/DegradationTier.h"
#include <string>

namespace TCE {

/**
 * @brief Description of one rewrite attempt
 */
struct RewriteRequest {
    std::string family;
    SourceRange range;                                        // location of the construct in the input
    DegradationTier requiredTier = DegradationTier::Essential;  // lowest tier allowed to run it
    std::string description;                                  // recorded in the ledger when applied
    bool preserveComments = true;  // reject results holding fewer comments than the original
};

/**
 * @brief Hook consulted around every rewrite attempt
 *
 * Used for tracing and for fault injection in tests: an exception thrown by
 * beforeAttempt() is handled exactly like a failure of the rewrite itself.
 */
class IRewriteInterceptor {
public:
    virtual ~IRewriteInterceptor() = default;

    virtual void beforeAttempt(const RewriteRequest &request) = 0;

    virtual void afterAttempt(const RewriteRequest &request, LedgerOutcome outcome) {
        (void)request;
        (void)outcome;
    }
};

}  // namespace TCE
