#include "model/ConfigFile.h"
#include "common/Exceptions.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <chrono>
#include <set>

namespace TCE {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "testPrefixes",         "tier",           "enableLoopParametrize",  "keepLegacyClassStructure",
    "defaultDecimalPlaces", "parametrizeIds", "parametrizeAnnotations", "stageDeadlineMs"};

}  // namespace

void ConfigFile::apply(const std::string &jsonText, TransformConfig::Builder &builder) {
    json config = JsonUtils::parseObject(jsonText, "config file");
    for (const auto &[key, value] : config.items()) {
        if (!KNOWN_KEYS.count(key)) {
            throw ConfigurationError("unknown config key '" + key + "'");
        }
    }

    if (auto prefixes = JsonUtils::getStringArray(config, "testPrefixes")) {
        builder.setTestPrefixes(*prefixes);
    }
    if (auto name = JsonUtils::get<std::string>(config, "tier")) {
        auto tier = tierFromString(*name);
        if (!tier) {
            throw ConfigurationError("unknown tier '" + *name + "'");
        }
        builder.setTier(*tier);
    }
    if (auto enabled = JsonUtils::get<bool>(config, "enableLoopParametrize")) {
        builder.setLoopParametrize(*enabled);
    }
    if (auto keep = JsonUtils::get<bool>(config, "keepLegacyClassStructure")) {
        builder.setKeepLegacyClassStructure(*keep);
    }
    if (auto places = JsonUtils::get<int>(config, "defaultDecimalPlaces")) {
        builder.setDefaultDecimalPlaces(*places);
    }
    if (auto ids = JsonUtils::get<bool>(config, "parametrizeIds")) {
        builder.setParametrizeIds(*ids);
    }
    if (auto annotations = JsonUtils::get<bool>(config, "parametrizeAnnotations")) {
        builder.setParametrizeAnnotations(*annotations);
    }
    if (auto deadline = JsonUtils::get<long long>(config, "stageDeadlineMs")) {
        builder.setStageDeadline(std::chrono::milliseconds(*deadline));
    }
    LOG_DEBUG("ConfigFile: applied {} setting(s)", config.size());
}

}  // namespace TCE
