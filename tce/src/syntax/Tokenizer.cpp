#include "syntax/Tokenizer.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace TCE {

namespace {

constexpr std::array<std::string_view, 35> KEYWORDS = {
    "False",  "None",   "True",    "and",      "as",       "assert", "async", "await",    "break",
    "class",  "continue", "def",   "del",      "elif",     "else",   "except", "finally", "for",
    "from",   "global", "if",      "import",   "in",       "is",     "lambda", "nonlocal", "not",
    "or",     "pass",   "raise",   "return",   "try",      "while",  "with",  "yield"};

constexpr std::array<std::string_view, 4> THREE_CHAR_OPERATORS = {"**=", "//=", ">>=", "<<="};

constexpr std::array<std::string_view, 19> TWO_CHAR_OPERATORS = {"**", "//", "<<", ">>", "<=", ">=", "==",
                                                                 "!=", "->", ":=", "+=", "-=", "*=", "/=",
                                                                 "%=", "&=", "|=", "^=", "@="};

constexpr std::string_view SINGLE_CHAR_OPERATORS = "+-*/%@&|^~<>()[]{},:;.=";

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isStringPrefix(std::string_view word) {
    if (word.empty() || word.size() > 2) {
        return false;
    }
    std::string lower;
    for (char c : word) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "t" || lower == "br" ||
           lower == "rb" || lower == "fr" || lower == "rf" || lower == "tr" || lower == "rt";
}

char closingFor(char open) {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    default:
        return '}';
    }
}

}  // namespace

bool isKeyword(std::string_view name) {
    return std::find(KEYWORDS.begin(), KEYWORDS.end(), name) != KEYWORDS.end();
}

std::string tokenKindToString(TokenKind kind) {
    switch (kind) {
    case TokenKind::Name:
        return "name";
    case TokenKind::Number:
        return "number";
    case TokenKind::String:
        return "string";
    case TokenKind::Operator:
        return "operator";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Indent:
        return "indent";
    case TokenKind::Dedent:
        return "dedent";
    case TokenKind::EndOfFile:
        return "end of file";
    }
    return "unknown";
}

Tokenizer::Tokenizer(std::string_view source) : source_(source) {}

bool Tokenizer::atEnd(size_t offset) const {
    return pos_ + offset >= source_.size();
}

char Tokenizer::charAt(size_t offset) const {
    return offset < source_.size() ? source_[offset] : '\0';
}

size_t Tokenizer::lineBreakLength(size_t offset) const {
    if (offset >= source_.size()) {
        return 0;
    }
    if (source_[offset] == '\n') {
        return 1;
    }
    if (source_[offset] == '\r') {
        return charAt(offset + 1) == '\n' ? 2 : 1;
    }
    return 0;
}

SourcePosition Tokenizer::position() const {
    return SourcePosition{line_, column_};
}

void Tokenizer::advance(size_t count) {
    for (size_t i = 0; i < count && pos_ < source_.size(); ++i) {
        char c = source_[pos_];
        if (c == '\n' || (c == '\r' && charAt(pos_ + 1) != '\n')) {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }
}

void Tokenizer::consumeIntoTrivia(size_t count) {
    trivia_.append(source_.substr(pos_, count));
    advance(count);
}

void Tokenizer::emit(TokenKind kind, size_t length) {
    Token token;
    token.kind = kind;
    token.text = std::string(source_.substr(pos_, length));
    token.leadingTrivia = std::move(trivia_);
    trivia_.clear();
    token.range.start = position();
    advance(length);
    token.range.end = position();
    tokens_.push_back(std::move(token));
}

void Tokenizer::emitZeroWidth(TokenKind kind) {
    Token token;
    token.kind = kind;
    token.range.start = position();
    token.range.end = position();
    tokens_.push_back(std::move(token));
}

std::vector<Token> Tokenizer::tokenize() {
    tokens_.clear();
    trivia_.clear();
    indentStack_ = {""};
    brackets_.clear();
    pos_ = 0;
    line_ = 1;
    column_ = 1;

    bool lineStart = true;
    while (true) {
        if (lineStart && brackets_.empty()) {
            if (!processLineStart()) {
                break;
            }
            lineStart = false;
        }
        if (atEnd()) {
            break;
        }

        char c = source_[pos_];
        if (isHorizontalSpace(c)) {
            consumeIntoTrivia(1);
            continue;
        }
        if (c == '#') {
            size_t length = 0;
            while (!atEnd(length) && lineBreakLength(pos_ + length) == 0) {
                ++length;
            }
            consumeIntoTrivia(length);
            continue;
        }
        if (c == '\\') {
            size_t breakLength = lineBreakLength(pos_ + 1);
            if (breakLength == 0) {
                if (atEnd(1)) {
                    throw ParseError("unexpected end of input after line continuation", position());
                }
                throw ParseError("unexpected character after line continuation character", position());
            }
            consumeIntoTrivia(1 + breakLength);
            continue;
        }
        size_t breakLength = lineBreakLength(pos_);
        if (breakLength > 0) {
            if (!brackets_.empty()) {
                consumeIntoTrivia(breakLength);
                continue;
            }
            emit(TokenKind::Newline, breakLength);
            lineStart = true;
            continue;
        }
        scanToken();
    }

    finish();
    LOG_TRACE("Tokenized {} bytes into {} tokens", source_.size(), tokens_.size());
    return std::move(tokens_);
}

bool Tokenizer::processLineStart() {
    while (true) {
        size_t indentLength = 0;
        while (!atEnd(indentLength) && isHorizontalSpace(source_[pos_ + indentLength])) {
            ++indentLength;
        }
        if (atEnd(indentLength)) {
            consumeIntoTrivia(indentLength);
            return false;
        }

        size_t after = pos_ + indentLength;
        if (source_[after] == '#') {
            size_t length = indentLength;
            while (!atEnd(length) && lineBreakLength(pos_ + length) == 0) {
                ++length;
            }
            size_t breakLength = lineBreakLength(pos_ + length);
            consumeIntoTrivia(length + breakLength);
            if (breakLength == 0) {
                return false;
            }
            continue;
        }

        size_t breakLength = lineBreakLength(after);
        if (breakLength > 0) {
            consumeIntoTrivia(indentLength + breakLength);
            continue;
        }

        std::string indent(source_.substr(pos_, indentLength));
        consumeIntoTrivia(indentLength);
        applyIndentation(indent);
        return true;
    }
}

void Tokenizer::applyIndentation(const std::string &indent) {
    const std::string &top = indentStack_.back();
    if (indent == top) {
        return;
    }
    if (startsWith(indent, top)) {
        if (tokens_.empty()) {
            throw ParseError("unexpected indent", position());
        }
        indentStack_.push_back(indent);
        emitZeroWidth(TokenKind::Indent);
        return;
    }
    while (indentStack_.size() > 1 && indentStack_.back() != indent && !startsWith(indent, indentStack_.back())) {
        indentStack_.pop_back();
        emitZeroWidth(TokenKind::Dedent);
    }
    if (indentStack_.back() != indent) {
        throw ParseError("unindent does not match any outer indentation level", position());
    }
}

void Tokenizer::scanToken() {
    char c = source_[pos_];

    if (isIdentifierStart(c)) {
        size_t length = 1;
        while (!atEnd(length) && isIdentifierChar(source_[pos_ + length])) {
            ++length;
        }
        char next = charAt(pos_ + length);
        if ((next == '\'' || next == '"') && isStringPrefix(source_.substr(pos_, length))) {
            emit(TokenKind::String, scanString(pos_ + length) - pos_);
            return;
        }
        emit(TokenKind::Name, length);
        return;
    }

    if (isDigit(c) || (c == '.' && isDigit(charAt(pos_ + 1)))) {
        emit(TokenKind::Number, scanNumber(pos_) - pos_);
        return;
    }

    if (c == '\'' || c == '"') {
        emit(TokenKind::String, scanString(pos_) - pos_);
        return;
    }

    if (source_.substr(pos_, 3) == "...") {
        emit(TokenKind::Operator, 3);
        return;
    }
    for (std::string_view op : THREE_CHAR_OPERATORS) {
        if (source_.substr(pos_, 3) == op) {
            emit(TokenKind::Operator, 3);
            return;
        }
    }
    for (std::string_view op : TWO_CHAR_OPERATORS) {
        if (source_.substr(pos_, 2) == op) {
            emit(TokenKind::Operator, 2);
            return;
        }
    }
    if (SINGLE_CHAR_OPERATORS.find(c) != std::string_view::npos) {
        trackBracket(c);
        emit(TokenKind::Operator, 1);
        return;
    }

    throw ParseError(std::format("invalid character '{}'", c), position());
}

void Tokenizer::trackBracket(char c) {
    if (c == '(' || c == '[' || c == '{') {
        brackets_.emplace_back(c, position());
        return;
    }
    if (c != ')' && c != ']' && c != '}') {
        return;
    }
    if (brackets_.empty()) {
        throw ParseError(std::format("unmatched '{}'", c), position());
    }
    char open = brackets_.back().first;
    if (closingFor(open) != c) {
        throw ParseError(std::format("closing parenthesis '{}' does not match opening parenthesis '{}'", c, open),
                         position());
    }
    brackets_.pop_back();
}

size_t Tokenizer::scanString(size_t quoteOffset) {
    char quote = source_[quoteOffset];
    bool triple = charAt(quoteOffset + 1) == quote && charAt(quoteOffset + 2) == quote;
    size_t p = quoteOffset + (triple ? 3 : 1);

    SourcePosition startPosition = position();

    while (true) {
        if (p >= source_.size()) {
            throw ParseError(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                             startPosition);
        }
        char c = source_[p];
        if (c == '\\') {
            p += 2;
            if (p < source_.size() && source_[p - 1] == '\r' && source_[p] == '\n') {
                ++p;
            }
            continue;
        }
        if (triple) {
            if (c == quote && charAt(p + 1) == quote && charAt(p + 2) == quote) {
                return p + 3;
            }
        } else {
            if (c == quote) {
                return p + 1;
            }
            if (c == '\n' || c == '\r') {
                throw ParseError("unterminated string literal", startPosition);
            }
        }
        ++p;
    }
}

size_t Tokenizer::scanNumber(size_t start) {
    size_t p = start;
    auto isNumberChar = [](char c) { return isDigit(c) || c == '_'; };

    if (source_[p] == '0' && (charAt(p + 1) == 'x' || charAt(p + 1) == 'X' || charAt(p + 1) == 'o' ||
                              charAt(p + 1) == 'O' || charAt(p + 1) == 'b' || charAt(p + 1) == 'B')) {
        p += 2;
        while (p < source_.size() && (std::isxdigit(static_cast<unsigned char>(source_[p])) || source_[p] == '_')) {
            ++p;
        }
        return p;
    }

    while (p < source_.size() && isNumberChar(source_[p])) {
        ++p;
    }
    if (charAt(p) == '.') {
        ++p;
        while (p < source_.size() && isNumberChar(source_[p])) {
            ++p;
        }
    }
    if (charAt(p) == 'e' || charAt(p) == 'E') {
        size_t q = p + 1;
        if (charAt(q) == '+' || charAt(q) == '-') {
            ++q;
        }
        if (isDigit(charAt(q))) {
            p = q;
            while (p < source_.size() && isNumberChar(source_[p])) {
                ++p;
            }
        }
    }
    if (charAt(p) == 'j' || charAt(p) == 'J') {
        ++p;
    }
    return p;
}

void Tokenizer::finish() {
    if (!brackets_.empty()) {
        throw ParseError(std::format("'{}' was never closed", brackets_.back().first), brackets_.back().second);
    }
    if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline) {
        emit(TokenKind::Newline, 0);
    }
    while (indentStack_.size() > 1) {
        indentStack_.pop_back();
        emitZeroWidth(TokenKind::Dedent);
    }
    emit(TokenKind::EndOfFile, 0);
}

}  // namespace TCE
