#pragma once

#include "common/SourceLocation.h"
#include <string>
#include <string_view>

namespace TCE {

enum class TokenKind { Name, Number, String, Operator, Newline, Indent, Dedent, EndOfFile };

/**
 * @brief Lexical token with the verbatim trivia that precedes it
 *
 * Trivia holds everything the tokenizer skipped before the token: indentation,
 * inter-token spaces, comments, blank lines, backslash continuations and
 * line breaks inside brackets. Concatenating trivia + text over every token of
 * a unit reproduces the unit exactly.
 *
 * Indent, Dedent and EndOfFile carry no text; Newline carries the line break
 * ("\n", "\r\n", "\r" or "" at end of input without a final line break).
 */
struct Token {
    TokenKind kind = TokenKind::Operator;
    std::string text;
    std::string leadingTrivia;
    SourceRange range;

    bool isName(std::string_view value) const {
        return kind == TokenKind::Name && text == value;
    }

    bool isOperator(std::string_view value) const {
        return kind == TokenKind::Operator && text == value;
    }
};

/**
 * @brief Python hard keywords (soft keywords like match/case are plain names)
 */
bool isKeyword(std::string_view name);

std::string tokenKindToString(TokenKind kind);

}  // namespace TCE
