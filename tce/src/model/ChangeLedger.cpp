#include "model/ChangeLedger.h"
#include <algorithm>

namespace TCE {

std::string outcomeToString(LedgerOutcome outcome) {
    switch (outcome) {
    case LedgerOutcome::Applied:
        return "applied";
    case LedgerOutcome::SkippedAmbiguous:
        return "skipped-ambiguous";
    case LedgerOutcome::FellBackError:
        return "fell-back-error";
    }
    return "unknown";
}

json LedgerEntry::toJson() const {
    json entry;
    entry["family"] = family;
    entry["outcome"] = outcomeToString(outcome);
    entry["reason"] = reason;
    if (range.isValid()) {
        entry["start"] = {{"line", range.start.line}, {"column", range.start.column}};
        entry["end"] = {{"line", range.end.line}, {"column", range.end.column}};
    } else {
        entry["start"] = nullptr;
        entry["end"] = nullptr;
    }
    return entry;
}

void ChangeLedger::record(LedgerEntry entry) {
    entries_.push_back(std::move(entry));
}

void ChangeLedger::record(const SourceRange &range, const std::string &family, LedgerOutcome outcome,
                          const std::string &reason) {
    entries_.push_back(LedgerEntry{range, family, outcome, reason});
}

size_t ChangeLedger::count(LedgerOutcome outcome) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [outcome](const LedgerEntry &e) { return e.outcome == outcome; }));
}

size_t ChangeLedger::countFamily(const std::string &family, LedgerOutcome outcome) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const LedgerEntry &e) {
        return e.family == family && e.outcome == outcome;
    }));
}

bool ChangeLedger::allApplied() const {
    return count(LedgerOutcome::Applied) == entries_.size();
}

json ChangeLedger::toJson() const {
    json entries = json::array();
    for (const auto &entry : entries_) {
        entries.push_back(entry.toJson());
    }
    return entries;
}

}  // namespace TCE
