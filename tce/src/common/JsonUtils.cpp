#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace TCE {

json JsonUtils::parseObject(const std::string &text, const std::string &origin) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error &e) {
        LOG_DEBUG("{}: {}", origin, e.what());
        throw ConfigurationError("invalid " + origin + ": " + e.what());
    }
    if (!document.is_object()) {
        throw ConfigurationError(origin + " must hold a JSON object");
    }
    return document;
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

std::optional<std::vector<std::string>> JsonUtils::getStringArray(const json &object, const std::string &key) {
    if (!hasKey(object, key)) {
        return std::nullopt;
    }
    const json &value = object[key];
    requireType(key, value, value.is_array(), "an array of strings");
    std::vector<std::string> result;
    for (const auto &item : value) {
        requireType(key, value, item.is_string(), "an array of strings");
        result.push_back(item.get<std::string>());
    }
    return result;
}

void JsonUtils::requireType(const std::string &key, const json &value, bool matches, const char *expected) {
    if (!matches) {
        throw ConfigurationError("config key '" + key + "' must be " + expected + ", got " + value.dump());
    }
}

}  // namespace TCE
