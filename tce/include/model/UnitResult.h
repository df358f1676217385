#pragma once

#include "common/JsonUtils.h"
#include "common/SourceLocation.h"
#include "model/ChangeLedger.h"
#include "model/DegradationTier.h"
#include <optional>
#include <string>

namespace TCE {

enum class UnitStatus { Complete, Partial, Failed };

std::string statusToString(UnitStatus status);

/**
 * @brief Why a unit failed
 */
struct UnitError {
    enum class Kind { Parse, Invariant, Cancelled, Deadline };

    Kind kind = Kind::Parse;
    std::string message;
    SourcePosition position;  // valid for parse errors

    std::string kindName() const;
};

/**
 * @brief Outcome of transforming one unit
 *
 * outputText is present for Complete and Partial, absent for Failed.
 * error is present only for Failed.
 */
struct UnitResult {
    UnitStatus status = UnitStatus::Failed;
    std::optional<std::string> outputText;
    ChangeLedger ledger;
    std::optional<UnitError> error;
    DegradationTier tier = DegradationTier::Advanced;
    json fixtures = json::array();  // FixtureStateContainer summary

    bool isSuccess() const {
        return status != UnitStatus::Failed;
    }

    json toJson() const;
};

}  // namespace TCE
