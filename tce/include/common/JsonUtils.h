#pragma once

#include "common/Exceptions.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace TCE {

using json = nlohmann::json;

/**
 * @brief Typed access to configuration documents and report serialization
 *
 * Readers treat an absent or null key as "not set" and raise
 * ConfigurationError when a key holds a value of the wrong type.
 */
class JsonUtils {
public:
    /**
     * @brief Parse text that must hold a JSON object
     * @param origin Name used in error messages ("config file", a path, ...)
     * @throws ConfigurationError on malformed JSON or a non-object document
     */
    static json parseObject(const std::string &text, const std::string &origin);

    static std::string toPrettyString(const json &value);

    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Value of key as T (bool, int, long long or std::string)
     */
    template <typename T> static std::optional<T> get(const json &object, const std::string &key) {
        if (!hasKey(object, key)) {
            return std::nullopt;
        }
        const json &value = object[key];
        if constexpr (std::is_same_v<T, bool>) {
            requireType(key, value, value.is_boolean(), "a boolean");
        } else if constexpr (std::is_integral_v<T>) {
            requireType(key, value, value.is_number_integer(), "an integer");
        } else {
            static_assert(std::is_same_v<T, std::string>, "unsupported JSON value type");
            requireType(key, value, value.is_string(), "a string");
        }
        return value.get<T>();
    }

    static std::optional<std::vector<std::string>> getStringArray(const json &object, const std::string &key);

private:
    static void requireType(const std::string &key, const json &value, bool matches, const char *expected);
};

}  // namespace TCE
