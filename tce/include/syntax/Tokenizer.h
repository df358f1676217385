#pragma once

#include "syntax/Token.h"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TCE {

/**
 * @brief Lossless Python tokenizer
 *
 * Produces a token stream whose trivia + text concatenation reproduces the
 * input byte for byte. Indentation changes are reported as zero-width
 * Indent/Dedent tokens; blank and comment-only lines never produce tokens and
 * are attached as trivia to the next token.
 *
 * @throws ParseError on unterminated strings, unbalanced or mismatched
 *         brackets, inconsistent dedents and invalid characters
 */
class Tokenizer {
public:
    explicit Tokenizer(std::string_view source);

    std::vector<Token> tokenize();

private:
    std::string_view source_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    std::string trivia_;
    std::vector<Token> tokens_;
    std::vector<std::string> indentStack_;
    std::vector<std::pair<char, SourcePosition>> brackets_;

    bool atEnd(size_t offset = 0) const;
    char charAt(size_t offset) const;
    size_t lineBreakLength(size_t offset) const;
    SourcePosition position() const;

    void advance(size_t count);
    void consumeIntoTrivia(size_t count);
    void emit(TokenKind kind, size_t length);
    void emitZeroWidth(TokenKind kind);

    bool processLineStart();
    void applyIndentation(const std::string &indent);
    void scanToken();
    size_t scanString(size_t quoteOffset);
    size_t scanNumber(size_t start);
    void trackBracket(char c);
    void finish();
};

}  // namespace TCE
