#include "common/Logger.h"
#include "backends/SpdlogBackend.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>

namespace TCE {

namespace {

std::mutex backendMutex;
std::unique_ptr<ILoggerBackend> backend;

thread_local std::string threadUnit;

// Caller must hold backendMutex
ILoggerBackend &installedBackend() {
    if (!backend) {
        backend = std::make_unique<SpdlogBackend>();
    }
    return *backend;
}

constexpr std::array<std::string_view, 6> LEVEL_NAMES = {"trace", "debug", "info", "warn", "error", "off"};

}  // namespace

std::optional<LogLevel> logLevelFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (LEVEL_NAMES[i] == lower) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

std::string_view logLevelToString(LogLevel level) {
    return LEVEL_NAMES.at(static_cast<size_t>(level));
}

Logger::UnitScope::UnitScope(std::string unit) : previous_(std::move(threadUnit)) {
    threadUnit = std::move(unit);
}

Logger::UnitScope::~UnitScope() {
    threadUnit = std::move(previous_);
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> newBackend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend = std::move(newBackend);
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(backendMutex);
    installedBackend().setLevel(level);
}

bool Logger::isEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(backendMutex);
    LogLevel threshold = installedBackend().getLevel();
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::log(LogLevel level, std::string message, const std::source_location &location) {
    LogRecord record{level, std::move(message), threadUnit, shortFunctionName(location.function_name()), location};
    std::lock_guard<std::mutex> lock(backendMutex);
    installedBackend().write(record);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (backend) {
        backend->flush();
    }
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend.reset();
}

const std::string &Logger::currentUnit() {
    return threadUnit;
}

std::string Logger::shortFunctionName(std::string_view signature) {
    size_t open = signature.find('(');
    if (open == std::string_view::npos) {
        return std::string(signature);
    }

    // The name starts after the last space outside template brackets (skips the return type)
    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < open; ++i) {
        if (signature[i] == '<') {
            ++depth;
        } else if (signature[i] == '>') {
            --depth;
        } else if (signature[i] == ' ' && depth == 0) {
            start = i + 1;
        }
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < open; ++i) {
        char c = signature[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c != '*' && c != '&') {
            name += c;
        }
    }
    if (name.starts_with("TCE::")) {
        name.erase(0, 5);
    }
    return name;
}

}  // namespace TCE
