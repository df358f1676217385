#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace TCE {

/**
 * @brief Process-wide logging facade
 *
 * Every library component logs through the LOG_* macros below. The first
 * record lazily installs a console SpdlogBackend; tools and tests replace it
 * with setBackend().
 *
 * @code
 * TCE::Logger::setBackend(std::make_unique<TCE::SpdlogBackend>("logs", true));
 * TCE::Logger::UnitScope scope("tests/test_calc.py");
 * LOG_INFO("{} stage(s)", count);  // [tests/test_calc.py] PipelineDriver::transformUnit() - 5 stage(s)
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Tags every record emitted on this thread with a unit name
     *
     * Scopes nest; the previous name is restored on destruction.
     */
    class UnitScope {
    public:
        explicit UnitScope(std::string unit);
        ~UnitScope();

        UnitScope(const UnitScope &) = delete;
        UnitScope &operator=(const UnitScope &) = delete;

    private:
        std::string previous_;
    };

    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    static void setLevel(LogLevel level);
    static bool isEnabled(LogLevel level);

    static void log(LogLevel level, std::string message,
                    const std::source_location &location = std::source_location::current());

    static void flush();

    /**
     * @brief Drop the installed backend (the next record re-creates the default one)
     */
    static void reset();

    static const std::string &currentUnit();

    /**
     * @brief "Class::method" from a compiler-provided function signature
     */
    static std::string shortFunctionName(std::string_view signature);
};

}  // namespace TCE

#define TCE_LOG(level, ...)                                                                                           \
    do {                                                                                                               \
        if (TCE::Logger::isEnabled(level)) {                                                                           \
            TCE::Logger::log(level, std::format(__VA_ARGS__), std::source_location::current());                       \
        }                                                                                                              \
    } while (0)

#define LOG_TRACE(...) TCE_LOG(TCE::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) TCE_LOG(TCE::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) TCE_LOG(TCE::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) TCE_LOG(TCE::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) TCE_LOG(TCE::LogLevel::Error, __VA_ARGS__)
