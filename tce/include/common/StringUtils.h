#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace TCE {

inline bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

inline bool isHorizontalSpace(char c) {
    return c == ' ' || c == '\t' || c == '\f';
}

inline std::string join(const std::vector<std::string> &parts, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

/**
 * @brief Render text as a double-quoted Python string literal
 */
inline std::string quotePython(std::string_view text) {
    std::string result = "\"";
    for (char c : text) {
        if (c == '\\' || c == '"') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

inline bool isIdentifierChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

}  // namespace TCE
