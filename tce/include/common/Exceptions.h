#pragma once

#include "common/SourceLocation.h"
#include <format>
#include <stdexcept>
#include <string>

namespace TCE {

/**
 * @brief Input text is not syntactically valid
 *
 * Fatal for the unit: no rewrite is attempted and no output is produced.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string &detail, SourcePosition position)
        : std::runtime_error(std::format("{} at line {}, column {}", detail, position.line, position.column)),
          detail_(detail), position_(position) {}

    const std::string &getDetail() const {
        return detail_;
    }

    const SourcePosition &getPosition() const {
        return position_;
    }

private:
    std::string detail_;
    SourcePosition position_;
};

/**
 * @brief A single rewrite attempt could not be completed
 *
 * Always recovered by the DegradationController, which restores the original
 * subtree and records the failure in the ledger.
 */
class RewriteError : public std::runtime_error {
public:
    explicit RewriteError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief An internal contract was broken (for example a stage produced a tree
 * that does not re-parse)
 *
 * Never swallowed; terminates the unit as failed.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string &message) : std::logic_error(message) {}
};

/**
 * @brief Invalid configuration value, raised before any unit is processed
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief The unit run was cancelled or exceeded its wall-clock budget
 */
class UnitCancelled : public std::runtime_error {
public:
    UnitCancelled(const std::string &message, bool deadlineExpired)
        : std::runtime_error(message), deadlineExpired_(deadlineExpired) {}

    bool isDeadlineExpired() const {
        return deadlineExpired_;
    }

private:
    bool deadlineExpired_;
};

}  // namespace TCE
