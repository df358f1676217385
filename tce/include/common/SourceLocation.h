#pragma once

#include <compare>
#include <format>
#include <string>

namespace TCE {

/**
 * @brief Position inside a unit's source text (1-based line and column)
 *
 * Line 0 marks a position that does not exist in the original text, which is
 * the case for every token synthesized by a rewrite.
 */
struct SourcePosition {
    int line = 0;
    int column = 0;

    bool isValid() const {
        return line > 0;
    }

    auto operator<=>(const SourcePosition &) const = default;

    std::string toString() const {
        return std::format("{}:{}", line, column);
    }
};

/**
 * @brief Half-open range [start, end) of source positions
 */
struct SourceRange {
    SourcePosition start;
    SourcePosition end;

    bool isValid() const {
        return start.isValid();
    }

    bool contains(const SourcePosition &pos) const {
        return isValid() && start <= pos && pos < end;
    }

    bool operator==(const SourceRange &) const = default;

    std::string toString() const {
        if (!isValid()) {
            return "<synthesized>";
        }
        return std::format("{}-{}", start.toString(), end.toString());
    }
};

}  // namespace TCE
