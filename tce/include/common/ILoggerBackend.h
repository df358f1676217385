#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace TCE {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/**
 * @brief Parse a level name as accepted by SPDLOG_LEVEL and --log-level
 *
 * Case-insensitive; "warning" and "err" are accepted as aliases.
 */
std::optional<LogLevel> logLevelFromString(std::string_view name);

std::string_view logLevelToString(LogLevel level);

/**
 * @brief One diagnostic emitted by the engine
 *
 * unit names the source being converted on the emitting thread, empty
 * outside of any Logger::UnitScope.
 */
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string message;
    std::string unit;
    std::string function;  // unqualified caller name, "Parser::parseBlock"
    std::source_location location;
};

/**
 * @brief Destination of LogRecords
 *
 * SpdlogBackend is installed unless a caller injects another backend
 * through Logger::setBackend(). Implementations are called under the
 * Logger's lock and need no locking of their own.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    virtual void write(const LogRecord &record) = 0;

    /**
     * @brief Records below level are dropped by the Logger before formatting
     */
    virtual void setLevel(LogLevel level) = 0;
    virtual LogLevel getLevel() const = 0;

    virtual void flush() = 0;
};

}  // namespace TCE
