#include "syntax/Parser.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "syntax/Tokenizer.h"
#include <format>

namespace TCE {

namespace {

bool isAugAssignOperator(const Token &token) {
    static const std::vector<std::string> ops = {"+=", "-=", "*=",  "/=",  "//=", "%=", "@=",
                                                 "&=", "|=", "^=", ">>=", "<<=", "**="};
    if (token.kind != TokenKind::Operator) {
        return false;
    }
    for (const auto &op : ops) {
        if (token.text == op) {
            return true;
        }
    }
    return false;
}

}  // namespace

Parser::Parser(std::string_view source) {
    Tokenizer tokenizer(source);
    tokens_ = tokenizer.tokenize();
}

NodePtr Parser::parse(std::string_view source) {
    Parser parser(source);
    return parser.parseModule();
}

// ---------------------------------------------------------------------------
// Token access

const Token &Parser::peek(size_t ahead) const {
    size_t index = pos_ + ahead;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

bool Parser::checkName(std::string_view name, size_t ahead) const {
    return peek(ahead).isName(name);
}

bool Parser::checkOp(std::string_view op, size_t ahead) const {
    return peek(ahead).isOperator(op);
}

bool Parser::atStatementEnd() const {
    return peek().kind == TokenKind::Newline || checkOp(";");
}

NodePtr Parser::take() {
    NodePtr leaf = SyntaxNode::createToken(peek());
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
    return leaf;
}

NodePtr Parser::expectOp(std::string_view op) {
    if (!checkOp(op)) {
        fail(std::format("expected '{}'", op));
    }
    return take();
}

NodePtr Parser::expectKeyword(std::string_view keyword) {
    if (!checkName(keyword)) {
        fail(std::format("expected '{}'", keyword));
    }
    return take();
}

NodePtr Parser::expectIdentifier() {
    const Token &token = peek();
    if (token.kind != TokenKind::Name || isKeyword(token.text)) {
        fail("expected an identifier");
    }
    return take();
}

NodePtr Parser::expectNewline() {
    if (peek().kind != TokenKind::Newline) {
        failUnexpected();
    }
    return take();
}

void Parser::fail(const std::string &message) const {
    const Token &token = peek();
    throw ParseError(message, token.range.start);
}

void Parser::failUnexpected() const {
    const Token &token = peek();
    switch (token.kind) {
    case TokenKind::Newline:
        fail("invalid syntax: unexpected end of line");
    case TokenKind::Indent:
        fail("unexpected indent");
    case TokenKind::Dedent:
        fail("unexpected dedent");
    case TokenKind::EndOfFile:
        fail("unexpected end of input");
    default:
        fail(std::format("invalid syntax: unexpected {} '{}'", tokenKindToString(token.kind), token.text));
    }
}

// ---------------------------------------------------------------------------
// Statements

NodePtr Parser::parseModule() {
    NodeList children;
    while (peek().kind != TokenKind::EndOfFile) {
        children.push_back(parseStatement());
    }
    children.push_back(take());
    LOG_TRACE("Parsed module with {} top-level statements", children.size() - 1);
    return SyntaxNode::create(SyntaxKind::Module, std::move(children));
}

NodePtr Parser::parseStatement() {
    const Token &token = peek();
    if (token.kind == TokenKind::Indent || token.kind == TokenKind::Dedent) {
        failUnexpected();
    }
    if (token.isOperator("@")) {
        return parseDecorated();
    }
    if (token.kind == TokenKind::Name) {
        if (token.text == "def") {
            return parseFunctionDef({});
        }
        if (token.text == "class") {
            return parseClassDef({});
        }
        if (token.text == "if") {
            return parseIf();
        }
        if (token.text == "while") {
            return parseWhile();
        }
        if (token.text == "for") {
            return parseFor();
        }
        if (token.text == "try") {
            return parseTry();
        }
        if (token.text == "with") {
            return parseWith();
        }
        if (token.text == "async") {
            if (checkName("def", 1)) {
                return parseFunctionDef({});
            }
            if (checkName("for", 1)) {
                return parseFor();
            }
            if (checkName("with", 1)) {
                return parseWith();
            }
            failUnexpected();
        }
        if ((token.text == "match" || token.text == "case") && isGenericCompoundHeader()) {
            return parseGenericCompound();
        }
    }
    return parseSimpleStatement();
}

NodePtr Parser::parseSimpleStatement() {
    NodeList children;
    children.push_back(parseSmallStatement());
    while (checkOp(";")) {
        children.push_back(take());
        if (peek().kind == TokenKind::Newline) {
            break;
        }
        children.push_back(parseSmallStatement());
    }
    children.push_back(expectNewline());
    return SyntaxNode::create(SyntaxKind::SimpleStatement, std::move(children));
}

NodePtr Parser::parseSmallStatement() {
    const Token &token = peek();
    if (token.kind != TokenKind::Name) {
        return parseExpressionStatement();
    }

    const std::string &word = token.text;
    if (word == "pass" || word == "break" || word == "continue") {
        return SyntaxNode::create(SyntaxKind::KeywordStatement, {take()});
    }
    if (word == "return") {
        NodeList children{take()};
        if (!atStatementEnd()) {
            children.push_back(parseTestListStarExpr());
        }
        return SyntaxNode::create(SyntaxKind::KeywordStatement, std::move(children));
    }
    if (word == "raise") {
        NodeList children{take()};
        if (!atStatementEnd()) {
            children.push_back(parseTest());
            if (checkName("from")) {
                children.push_back(take());
                children.push_back(parseTest());
            }
        }
        return SyntaxNode::create(SyntaxKind::KeywordStatement, std::move(children));
    }
    if (word == "global" || word == "nonlocal") {
        NodeList children{take()};
        children.push_back(expectIdentifier());
        while (checkOp(",")) {
            children.push_back(take());
            children.push_back(expectIdentifier());
        }
        return SyntaxNode::create(SyntaxKind::KeywordStatement, std::move(children));
    }
    if (word == "del") {
        NodeList children{take()};
        children.push_back(parseTestListStarExpr());
        return SyntaxNode::create(SyntaxKind::KeywordStatement, std::move(children));
    }
    if (word == "assert") {
        NodeList children{take()};
        children.push_back(parseTest());
        if (checkOp(",")) {
            children.push_back(take());
            children.push_back(parseTest());
        }
        return SyntaxNode::create(SyntaxKind::Assert, std::move(children));
    }
    if (word == "import") {
        return parseImport();
    }
    if (word == "from") {
        return parseImportFrom();
    }
    return parseExpressionStatement();
}

NodePtr Parser::parseExpressionStatement() {
    NodePtr first = checkName("yield") ? parseYield() : parseTestListStarExpr();

    if (checkOp("=")) {
        NodeList children{first};
        while (checkOp("=")) {
            children.push_back(take());
            children.push_back(checkName("yield") ? parseYield() : parseTestListStarExpr());
        }
        return SyntaxNode::create(SyntaxKind::Assign, std::move(children));
    }
    if (isAugAssignOperator(peek())) {
        NodeList children{first, take()};
        children.push_back(checkName("yield") ? parseYield() : parseTestListStarExpr());
        return SyntaxNode::create(SyntaxKind::AugAssign, std::move(children));
    }
    if (checkOp(":")) {
        NodeList children{first, take()};
        children.push_back(parseTest());
        if (checkOp("=")) {
            children.push_back(take());
            children.push_back(checkName("yield") ? parseYield() : parseTestListStarExpr());
        }
        return SyntaxNode::create(SyntaxKind::AnnAssign, std::move(children));
    }
    return SyntaxNode::create(SyntaxKind::ExprStatement, {first});
}

NodePtr Parser::parseDottedName() {
    NodeList children{expectIdentifier()};
    while (checkOp(".")) {
        children.push_back(take());
        children.push_back(expectIdentifier());
    }
    return SyntaxNode::create(SyntaxKind::DottedName, std::move(children));
}

NodePtr Parser::parseImport() {
    NodeList children{take()};
    while (true) {
        NodeList alias{parseDottedName()};
        if (checkName("as")) {
            alias.push_back(take());
            alias.push_back(expectIdentifier());
        }
        children.push_back(SyntaxNode::create(SyntaxKind::ImportAlias, std::move(alias)));
        if (!checkOp(",")) {
            break;
        }
        children.push_back(take());
    }
    return SyntaxNode::create(SyntaxKind::Import, std::move(children));
}

NodePtr Parser::parseImportFrom() {
    NodeList children{take()};
    bool hasRelativeDots = false;
    while (checkOp(".") || checkOp("...")) {
        children.push_back(take());
        hasRelativeDots = true;
    }
    if (!checkName("import")) {
        children.push_back(parseDottedName());
    } else if (!hasRelativeDots) {
        fail("expected module name");
    }
    children.push_back(expectKeyword("import"));

    if (checkOp("*")) {
        children.push_back(take());
        return SyntaxNode::create(SyntaxKind::ImportFrom, std::move(children));
    }

    bool parenthesized = checkOp("(");
    if (parenthesized) {
        children.push_back(take());
    }
    while (true) {
        NodeList alias;
        alias.push_back(SyntaxNode::create(SyntaxKind::DottedName, {expectIdentifier()}));
        if (checkName("as")) {
            alias.push_back(take());
            alias.push_back(expectIdentifier());
        }
        children.push_back(SyntaxNode::create(SyntaxKind::ImportAlias, std::move(alias)));
        if (!checkOp(",")) {
            break;
        }
        children.push_back(take());
        if (parenthesized && checkOp(")")) {
            break;
        }
    }
    if (parenthesized) {
        children.push_back(expectOp(")"));
    }
    return SyntaxNode::create(SyntaxKind::ImportFrom, std::move(children));
}

NodePtr Parser::parseBlock() {
    if (peek().kind != TokenKind::Newline) {
        return SyntaxNode::create(SyntaxKind::Block, {parseSimpleStatement()});
    }

    NodeList children{take()};
    if (peek().kind != TokenKind::Indent) {
        fail("expected an indented block");
    }
    children.push_back(take());
    while (peek().kind != TokenKind::Dedent && peek().kind != TokenKind::EndOfFile) {
        children.push_back(parseStatement());
    }
    if (peek().kind != TokenKind::Dedent) {
        failUnexpected();
    }
    children.push_back(take());
    return SyntaxNode::create(SyntaxKind::Block, std::move(children));
}

NodePtr Parser::parseDecorated() {
    NodeList children;
    while (checkOp("@")) {
        NodeList decorator{take()};
        decorator.push_back(parseNamedExpr());
        decorator.push_back(expectNewline());
        children.push_back(SyntaxNode::create(SyntaxKind::Decorator, std::move(decorator)));
    }
    if (checkName("def") || (checkName("async") && checkName("def", 1))) {
        return parseFunctionDef(std::move(children));
    }
    if (checkName("class")) {
        return parseClassDef(std::move(children));
    }
    fail("expected function or class definition after decorator");
}

void Parser::takeTypeParameters(NodeList &children) {
    if (!checkOp("[")) {
        return;
    }
    // PEP 695 type parameters are kept verbatim
    int depth = 0;
    do {
        if (checkOp("[")) {
            ++depth;
        } else if (checkOp("]")) {
            --depth;
        } else if (peek().kind == TokenKind::EndOfFile) {
            failUnexpected();
        }
        children.push_back(take());
    } while (depth > 0);
}

NodePtr Parser::parseFunctionDef(NodeList children) {
    if (checkName("async")) {
        children.push_back(take());
    }
    children.push_back(expectKeyword("def"));
    children.push_back(expectIdentifier());
    takeTypeParameters(children);
    children.push_back(parseParameters(true));
    if (checkOp("->")) {
        children.push_back(take());
        children.push_back(parseTest());
    }
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    return SyntaxNode::create(SyntaxKind::FunctionDef, std::move(children));
}

NodePtr Parser::parseClassDef(NodeList children) {
    children.push_back(expectKeyword("class"));
    children.push_back(expectIdentifier());
    takeTypeParameters(children);
    if (checkOp("(")) {
        children.push_back(parseArgumentList());
    }
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    return SyntaxNode::create(SyntaxKind::ClassDef, std::move(children));
}

NodePtr Parser::parseParameters(bool parenthesized) {
    NodeList children;
    if (parenthesized) {
        children.push_back(expectOp("("));
    }
    auto atEnd = [&]() { return parenthesized ? checkOp(")") : checkOp(":"); };

    while (!atEnd()) {
        NodeList param;
        if (checkOp("/")) {
            param.push_back(take());
        } else if (checkOp("*") || checkOp("**")) {
            param.push_back(take());
            if (peek().kind == TokenKind::Name) {
                param.push_back(expectIdentifier());
                if (parenthesized && checkOp(":")) {
                    param.push_back(take());
                    param.push_back(checkOp("*") ? parseTestOrStar() : parseTest());
                }
            }
        } else {
            param.push_back(expectIdentifier());
            if (parenthesized && checkOp(":")) {
                param.push_back(take());
                param.push_back(parseTest());
            }
            if (checkOp("=")) {
                param.push_back(take());
                param.push_back(parseTest());
            }
        }
        children.push_back(SyntaxNode::create(SyntaxKind::Param, std::move(param)));
        if (!checkOp(",")) {
            break;
        }
        children.push_back(take());
    }
    if (parenthesized) {
        children.push_back(expectOp(")"));
    }
    if (children.empty()) {
        return nullptr;
    }
    return SyntaxNode::create(SyntaxKind::Parameters, std::move(children));
}

NodePtr Parser::parseElseClause() {
    NodeList children{take()};
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    return SyntaxNode::create(SyntaxKind::ElseClause, std::move(children));
}

NodePtr Parser::parseIf() {
    NodeList children{take()};
    children.push_back(parseNamedExpr());
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    while (checkName("elif")) {
        NodeList clause{take()};
        clause.push_back(parseNamedExpr());
        clause.push_back(expectOp(":"));
        clause.push_back(parseBlock());
        children.push_back(SyntaxNode::create(SyntaxKind::ElifClause, std::move(clause)));
    }
    if (checkName("else")) {
        children.push_back(parseElseClause());
    }
    return SyntaxNode::create(SyntaxKind::If, std::move(children));
}

NodePtr Parser::parseWhile() {
    NodeList children{take()};
    children.push_back(parseNamedExpr());
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    if (checkName("else")) {
        children.push_back(parseElseClause());
    }
    return SyntaxNode::create(SyntaxKind::While, std::move(children));
}

NodePtr Parser::parseFor() {
    NodeList children;
    if (checkName("async")) {
        children.push_back(take());
    }
    children.push_back(expectKeyword("for"));
    children.push_back(parseTargetList());
    children.push_back(expectKeyword("in"));
    children.push_back(parseTestListStarExpr());
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    if (checkName("else")) {
        children.push_back(parseElseClause());
    }
    return SyntaxNode::create(SyntaxKind::For, std::move(children));
}

NodePtr Parser::parseWith() {
    NodeList children;
    if (checkName("async")) {
        children.push_back(take());
    }
    children.push_back(expectKeyword("with"));

    auto parseItem = [this]() {
        NodeList item{parseTest()};
        if (checkName("as")) {
            item.push_back(take());
            item.push_back(parseTargetItem());
        }
        return SyntaxNode::create(SyntaxKind::WithItem, std::move(item));
    };

    bool parsedParenthesized = false;
    if (checkOp("(")) {
        // Parenthesized items (3.9+) are tried first; a plain parenthesized
        // expression such as `with (yield x):` falls back to the item form.
        size_t saved = pos_;
        try {
            NodeList items{take()};
            while (!checkOp(")")) {
                items.push_back(parseItem());
                if (!checkOp(",")) {
                    break;
                }
                items.push_back(take());
            }
            items.push_back(expectOp(")"));
            if (!checkOp(":")) {
                fail("expected ':'");
            }
            for (auto &item : items) {
                children.push_back(std::move(item));
            }
            parsedParenthesized = true;
        } catch (const ParseError &) {
            pos_ = saved;
        }
    }

    if (!parsedParenthesized) {
        children.push_back(parseItem());
        while (checkOp(",")) {
            children.push_back(take());
            children.push_back(parseItem());
        }
    }
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());
    return SyntaxNode::create(SyntaxKind::With, std::move(children));
}

NodePtr Parser::parseTry() {
    NodeList children{take()};
    children.push_back(expectOp(":"));
    children.push_back(parseBlock());

    bool hasHandler = false;
    while (checkName("except")) {
        NodeList clause{take()};
        if (checkOp("*")) {
            clause.push_back(take());
        }
        if (!checkOp(":")) {
            clause.push_back(parseTest());
            if (checkName("as")) {
                clause.push_back(take());
                clause.push_back(expectIdentifier());
            } else if (checkOp(",")) {
                // 3.14 allows unparenthesized exception groups
                while (checkOp(",")) {
                    clause.push_back(take());
                    clause.push_back(parseTest());
                }
            }
        }
        clause.push_back(expectOp(":"));
        clause.push_back(parseBlock());
        children.push_back(SyntaxNode::create(SyntaxKind::ExceptClause, std::move(clause)));
        hasHandler = true;
    }
    if (hasHandler && checkName("else")) {
        children.push_back(parseElseClause());
    }
    if (checkName("finally")) {
        NodeList clause{take()};
        clause.push_back(expectOp(":"));
        clause.push_back(parseBlock());
        children.push_back(SyntaxNode::create(SyntaxKind::FinallyClause, std::move(clause)));
        hasHandler = true;
    }
    if (!hasHandler) {
        fail("expected 'except' or 'finally' block");
    }
    return SyntaxNode::create(SyntaxKind::Try, std::move(children));
}

bool Parser::isGenericCompoundHeader() const {
    if (checkOp(":", 1) || checkOp("=", 1) || checkOp(".", 1) || isAugAssignOperator(peek(1)) ||
        peek(1).kind == TokenKind::Newline) {
        return false;
    }
    size_t ahead = 1;
    while (peek(ahead).kind != TokenKind::Newline && peek(ahead).kind != TokenKind::EndOfFile) {
        ++ahead;
    }
    return peek(ahead).kind == TokenKind::Newline && checkOp(":", ahead - 1) &&
           peek(ahead + 1).kind == TokenKind::Indent;
}

NodePtr Parser::parseGenericCompound() {
    NodeList children;
    while (!(checkOp(":") && peek(1).kind == TokenKind::Newline)) {
        children.push_back(take());
    }
    children.push_back(take());
    children.push_back(parseBlock());
    return SyntaxNode::create(SyntaxKind::GenericCompound, std::move(children));
}

}  // namespace TCE
