#include "model/UnitResult.h"

namespace TCE {

std::string statusToString(UnitStatus status) {
    switch (status) {
    case UnitStatus::Complete:
        return "complete";
    case UnitStatus::Partial:
        return "partial";
    case UnitStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::string UnitError::kindName() const {
    switch (kind) {
    case Kind::Parse:
        return "parse";
    case Kind::Invariant:
        return "invariant";
    case Kind::Cancelled:
        return "cancelled";
    case Kind::Deadline:
        return "deadline";
    }
    return "unknown";
}

json UnitResult::toJson() const {
    json result;
    result["status"] = statusToString(status);
    result["tier"] = tierToString(tier);
    result["ledger"] = ledger.toJson();
    result["summary"] = {{"applied", ledger.count(LedgerOutcome::Applied)},
                         {"skippedAmbiguous", ledger.count(LedgerOutcome::SkippedAmbiguous)},
                         {"fellBackError", ledger.count(LedgerOutcome::FellBackError)}};
    result["fixtures"] = fixtures;
    if (error) {
        json errorJson;
        errorJson["kind"] = error->kindName();
        errorJson["message"] = error->message;
        if (error->position.isValid()) {
            errorJson["line"] = error->position.line;
            errorJson["column"] = error->position.column;
        }
        result["error"] = errorJson;
    } else {
        result["error"] = nullptr;
    }
    return result;
}

}  // namespace TCE
