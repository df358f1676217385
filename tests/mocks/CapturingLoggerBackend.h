#pragma once

#include "common/ILoggerBackend.h"
#include <algorithm>
#include <string>
#include <vector>

namespace TCE {
namespace Test {

/**
 * @brief Logger backend keeping every record in memory
 *
 * Install with Logger::setBackend(); the test keeps a raw pointer for
 * inspection while the Logger owns the backend. The Logger serializes
 * calls, so reads must happen once logging threads are done.
 */
class CapturingLoggerBackend : public ILoggerBackend {
public:
    void write(const LogRecord &record) override {
        records_.push_back(record);
    }

    void setLevel(LogLevel level) override {
        level_ = level;
    }

    LogLevel getLevel() const override {
        return level_;
    }

    void flush() override {}

    const std::vector<LogRecord> &getRecords() const {
        return records_;
    }

    bool contains(LogLevel level, const std::string &fragment) const {
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord &record) {
            return record.level == level && record.message.find(fragment) != std::string::npos;
        });
    }

private:
    LogLevel level_ = LogLevel::Trace;
    std::vector<LogRecord> records_;
};

}  // namespace Test
}  // namespace TCE
