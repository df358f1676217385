#include "backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace TCE {

namespace {

constexpr const char *LOGGER_NAME = "tce";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    // Replacing the backend re-creates the logger under the same name
    spdlog::drop(LOGGER_NAME);

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%^%l%$] %v");
    sinks.push_back(console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / "tce.log").string(), false);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);

    if (const char *envLevel = std::getenv("SPDLOG_LEVEL")) {
        level_ = logLevelFromString(envLevel).value_or(level_);
    }
    logger_->set_level(toSpdlog(level_));
}

void SpdlogBackend::write(const LogRecord &record) {
    if (record.unit.empty()) {
        logger_->log(toSpdlog(record.level), "{}() - {}", record.function, record.message);
    } else {
        logger_->log(toSpdlog(record.level), "[{}] {}() - {}", record.unit, record.function, record.message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    level_ = level;
    logger_->set_level(toSpdlog(level));
}

LogLevel SpdlogBackend::getLevel() const {
    return level_;
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::toSpdlog(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace TCE
