#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace TCE {

/**
 * @brief Logger backend writing through spdlog
 *
 * Console output goes to stderr so converted modules written to stdout stay
 * clean. With a log directory, records are also appended to tce.log there.
 * The initial level is Info, overridden by the SPDLOG_LEVEL environment
 * variable when it names a known level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void write(const LogRecord &record) override;
    void setLevel(LogLevel level) override;
    LogLevel getLevel() const override;
    void flush() override;

private:
    static spdlog::level::level_enum toSpdlog(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    LogLevel level_ = LogLevel::Info;
};

}  // namespace TCE
