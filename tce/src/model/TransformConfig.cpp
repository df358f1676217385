#include "model/TransformConfig.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/StringUtils.h"
#include <algorithm>
#include <format>

namespace TCE {

namespace {

bool isValidPrefix(const std::string &prefix) {
    if (prefix.empty()) {
        return false;
    }
    return std::all_of(prefix.begin(), prefix.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

}  // namespace

TransformConfig::TransformConfig() : testPrefixes_{"test"}, defaultDecimalPlaces_(Constants::DEFAULT_DECIMAL_PLACES) {}

bool TransformConfig::isTestName(const std::string &name) const {
    return std::any_of(testPrefixes_.begin(), testPrefixes_.end(),
                       [&name](const std::string &prefix) { return startsWith(name, prefix); });
}

bool TransformConfig::hasCustomPrefixes() const {
    return std::any_of(testPrefixes_.begin(), testPrefixes_.end(),
                       [](const std::string &prefix) { return prefix != "test"; });
}

TransformConfig::Builder::Builder() = default;

TransformConfig::Builder &TransformConfig::Builder::setTestPrefixes(std::vector<std::string> prefixes) {
    config_.testPrefixes_ = std::move(prefixes);
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::addTestPrefix(const std::string &prefix) {
    if (std::find(config_.testPrefixes_.begin(), config_.testPrefixes_.end(), prefix) == config_.testPrefixes_.end()) {
        config_.testPrefixes_.push_back(prefix);
    }
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setLoopParametrize(bool enabled) {
    config_.enableLoopParametrize_ = enabled;
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setKeepLegacyClassStructure(bool keep) {
    config_.keepLegacyClassStructure_ = keep;
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setTier(DegradationTier tier) {
    config_.tier_ = tier;
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setDefaultDecimalPlaces(int places) {
    config_.defaultDecimalPlaces_ = places;
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setParametrizeIds(bool enabled) {
    config_.parametrizeIds_ = enabled;
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setParametrizeAnnotations(bool enabled) {
    config_.parametrizeAnnotations_ = enabled;
    return *this;
}

TransformConfig::Builder &TransformConfig::Builder::setStageDeadline(std::chrono::milliseconds deadline) {
    config_.stageDeadline_ = deadline;
    return *this;
}

TransformConfig TransformConfig::Builder::build() const {
    if (config_.testPrefixes_.empty()) {
        throw ConfigurationError("at least one test prefix is required");
    }
    for (const auto &prefix : config_.testPrefixes_) {
        if (!isValidPrefix(prefix)) {
            throw ConfigurationError(std::format("invalid test prefix '{}': use letters, digits, '_' or '-'", prefix));
        }
    }
    if (config_.defaultDecimalPlaces_ < 0) {
        throw ConfigurationError(
            std::format("defaultDecimalPlaces must not be negative (got {})", config_.defaultDecimalPlaces_));
    }
    if (config_.stageDeadline_ && config_.stageDeadline_->count() <= 0) {
        throw ConfigurationError("stage deadline must be positive");
    }
    return config_;
}

}  // namespace TCE
