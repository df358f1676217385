#pragma once

#include "common/JsonUtils.h"
#include "common/SourceLocation.h"
#include <string>
#include <vector>

namespace TCE {

enum class LedgerOutcome { Applied, SkippedAmbiguous, FellBackError };

std::string outcomeToString(LedgerOutcome outcome);

/**
 * @brief One rewrite decision
 *
 * Family ids name the rewrite family ("assertion", "exception-context",
 * "log-capture", "loop-parametrize", "skip-decorator", "fixture-state",
 * "entry-point", "import").
 */
struct LedgerEntry {
    SourceRange range;
    std::string family;
    LedgerOutcome outcome = LedgerOutcome::Applied;
    std::string reason;

    json toJson() const;
};

/**
 * @brief Ordered record of every rewrite decision made for one unit
 *
 * Appended to by stages in pipeline order; read by the driver to decide the
 * unit status and by reporting. Not shared between units.
 */
class ChangeLedger {
public:
    void record(LedgerEntry entry);

    void record(const SourceRange &range, const std::string &family, LedgerOutcome outcome,
                const std::string &reason);

    const std::vector<LedgerEntry> &getEntries() const {
        return entries_;
    }

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    size_t count(LedgerOutcome outcome) const;

    size_t countFamily(const std::string &family, LedgerOutcome outcome) const;

    /**
     * @brief True when every entry is Applied (also for an empty ledger)
     */
    bool allApplied() const;

    json toJson() const;

private:
    std::vector<LedgerEntry> entries_;
};

}  // namespace TCE
