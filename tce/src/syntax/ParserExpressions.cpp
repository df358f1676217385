#include "common/Exceptions.h"
#include "syntax/Parser.h"

#include <array>

namespace TCE {

namespace {

// Binary operator levels from loosest to tightest binding
const std::array<std::vector<std::string>, 6> BINARY_LEVELS = {{
    {"|"},
    {"^"},
    {"&"},
    {"<<", ">>"},
    {"+", "-"},
    {"*", "/", "//", "%", "@"},
}};

bool isComparisonOperator(const Token &token) {
    if (token.kind != TokenKind::Operator) {
        return false;
    }
    const std::string &t = token.text;
    return t == "<" || t == ">" || t == "==" || t == ">=" || t == "<=" || t == "!=";
}

}  // namespace

NodePtr Parser::parseExpressionOnly() {
    NodePtr expression = parseTestListStarExpr();
    if (peek().kind == TokenKind::Newline) {
        take();
    }
    if (peek().kind != TokenKind::EndOfFile) {
        failUnexpected();
    }
    return expression;
}

bool Parser::canStartExpression(const Token &token) const {
    switch (token.kind) {
    case TokenKind::Name:
        return !isKeyword(token.text) || token.text == "True" || token.text == "False" || token.text == "None" ||
               token.text == "not" || token.text == "lambda" || token.text == "await";
    case TokenKind::Number:
    case TokenKind::String:
        return true;
    case TokenKind::Operator:
        return token.text == "(" || token.text == "[" || token.text == "{" || token.text == "-" ||
               token.text == "+" || token.text == "~" || token.text == "*" || token.text == "...";
    default:
        return false;
    }
}

NodePtr Parser::parseTestListStarExpr() {
    NodePtr first = parseTestOrStar();
    if (!checkOp(",")) {
        return first;
    }
    NodeList children{first};
    while (checkOp(",")) {
        children.push_back(take());
        if (!canStartExpression(peek())) {
            break;
        }
        children.push_back(parseTestOrStar());
    }
    return SyntaxNode::create(SyntaxKind::Tuple, std::move(children));
}

NodePtr Parser::parseTestOrStar() {
    if (checkOp("*")) {
        NodeList children{take()};
        children.push_back(parseBinaryLevel(0));
        return SyntaxNode::create(SyntaxKind::Starred, std::move(children));
    }
    return parseTest();
}

NodePtr Parser::parseStarOrNamed() {
    if (checkOp("*")) {
        NodeList children{take()};
        children.push_back(parseBinaryLevel(0));
        return SyntaxNode::create(SyntaxKind::Starred, std::move(children));
    }
    return parseNamedExpr();
}

NodePtr Parser::parseNamedExpr() {
    if (peek().kind == TokenKind::Name && !isKeyword(peek().text) && checkOp(":=", 1)) {
        NodeList children{SyntaxNode::create(SyntaxKind::Name, {take()})};
        children.push_back(take());
        children.push_back(parseTest());
        return SyntaxNode::create(SyntaxKind::NamedExpr, std::move(children));
    }
    return parseTest();
}

NodePtr Parser::parseTest() {
    if (checkName("lambda")) {
        return parseLambda();
    }
    NodePtr condition = parseOrTest();
    if (!checkName("if")) {
        return condition;
    }
    NodeList children{condition, take()};
    children.push_back(parseOrTest());
    children.push_back(expectKeyword("else"));
    children.push_back(parseTest());
    return SyntaxNode::create(SyntaxKind::IfExp, std::move(children));
}

NodePtr Parser::parseLambda() {
    NodeList children{take()};
    if (NodePtr params = parseParameters(false)) {
        children.push_back(params);
    }
    children.push_back(expectOp(":"));
    children.push_back(parseTest());
    return SyntaxNode::create(SyntaxKind::Lambda, std::move(children));
}

NodePtr Parser::parseOrTest() {
    NodePtr left = parseAndTest();
    if (!checkName("or")) {
        return left;
    }
    NodeList children{left};
    while (checkName("or")) {
        children.push_back(take());
        children.push_back(parseAndTest());
    }
    return SyntaxNode::create(SyntaxKind::BoolOp, std::move(children));
}

NodePtr Parser::parseAndTest() {
    NodePtr left = parseNotTest();
    if (!checkName("and")) {
        return left;
    }
    NodeList children{left};
    while (checkName("and")) {
        children.push_back(take());
        children.push_back(parseNotTest());
    }
    return SyntaxNode::create(SyntaxKind::BoolOp, std::move(children));
}

NodePtr Parser::parseNotTest() {
    if (checkName("not")) {
        NodeList children{take()};
        children.push_back(parseNotTest());
        return SyntaxNode::create(SyntaxKind::UnaryOp, std::move(children));
    }
    return parseComparison();
}

NodePtr Parser::parseComparison() {
    NodePtr left = parseBinaryLevel(0);
    NodeList children{left};
    while (true) {
        if (isComparisonOperator(peek()) || checkName("in")) {
            children.push_back(take());
        } else if (checkName("not") && checkName("in", 1)) {
            children.push_back(take());
            children.push_back(take());
        } else if (checkName("is")) {
            children.push_back(take());
            if (checkName("not")) {
                children.push_back(take());
            }
        } else {
            break;
        }
        children.push_back(parseBinaryLevel(0));
    }
    if (children.size() == 1) {
        return left;
    }
    return SyntaxNode::create(SyntaxKind::Comparison, std::move(children));
}

NodePtr Parser::parseBinaryLevel(size_t level) {
    if (level >= BINARY_LEVELS.size()) {
        return parseFactor();
    }
    auto matches = [&]() {
        if (peek().kind != TokenKind::Operator) {
            return false;
        }
        for (const auto &op : BINARY_LEVELS[level]) {
            if (peek().text == op) {
                return true;
            }
        }
        return false;
    };

    NodePtr left = parseBinaryLevel(level + 1);
    while (matches()) {
        NodeList children{left, take()};
        children.push_back(parseBinaryLevel(level + 1));
        left = SyntaxNode::create(SyntaxKind::BinaryOp, std::move(children));
    }
    return left;
}

NodePtr Parser::parseFactor() {
    if (checkOp("+") || checkOp("-") || checkOp("~")) {
        NodeList children{take()};
        children.push_back(parseFactor());
        return SyntaxNode::create(SyntaxKind::UnaryOp, std::move(children));
    }
    return parsePower();
}

NodePtr Parser::parsePower() {
    NodePtr base = parseAwaitPrimary();
    if (!checkOp("**")) {
        return base;
    }
    NodeList children{base, take()};
    children.push_back(parseFactor());
    return SyntaxNode::create(SyntaxKind::BinaryOp, std::move(children));
}

NodePtr Parser::parseAwaitPrimary() {
    if (checkName("await")) {
        NodeList children{take()};
        children.push_back(parsePrimary());
        return SyntaxNode::create(SyntaxKind::Await, std::move(children));
    }
    return parsePrimary();
}

NodePtr Parser::parsePrimary() {
    NodePtr node = parseAtom();
    while (true) {
        if (checkOp(".")) {
            NodeList children{node, take()};
            if (peek().kind != TokenKind::Name) {
                fail("expected attribute name");
            }
            children.push_back(take());
            node = SyntaxNode::create(SyntaxKind::Attribute, std::move(children));
        } else if (checkOp("(")) {
            NodeList children{node, parseArgumentList()};
            node = SyntaxNode::create(SyntaxKind::Call, std::move(children));
        } else if (checkOp("[")) {
            node = parseSubscript(node);
        } else {
            return node;
        }
    }
}

NodePtr Parser::parseAtom() {
    const Token &token = peek();
    switch (token.kind) {
    case TokenKind::Name:
        if (isKeyword(token.text) && token.text != "True" && token.text != "False" && token.text != "None") {
            failUnexpected();
        }
        return SyntaxNode::create(SyntaxKind::Name, {take()});
    case TokenKind::Number:
        return SyntaxNode::create(SyntaxKind::Literal, {take()});
    case TokenKind::String: {
        NodeList children;
        while (peek().kind == TokenKind::String) {
            children.push_back(take());
        }
        return SyntaxNode::create(SyntaxKind::String, std::move(children));
    }
    case TokenKind::Operator:
        if (token.text == "...") {
            return SyntaxNode::create(SyntaxKind::Literal, {take()});
        }
        if (token.text == "(") {
            return parseParenthesized();
        }
        if (token.text == "[") {
            return parseListDisplay();
        }
        if (token.text == "{") {
            return parseBraceDisplay();
        }
        failUnexpected();
    default:
        failUnexpected();
    }
}

bool Parser::atComprehensionFor() const {
    return checkName("for") || (checkName("async") && checkName("for", 1));
}

void Parser::parseComprehensionClauses(NodeList &children) {
    while (true) {
        if (atComprehensionFor()) {
            NodeList clause;
            if (checkName("async")) {
                clause.push_back(take());
            }
            clause.push_back(take());
            clause.push_back(parseTargetList());
            clause.push_back(expectKeyword("in"));
            clause.push_back(parseOrTest());
            children.push_back(SyntaxNode::create(SyntaxKind::CompFor, std::move(clause)));
        } else if (checkName("if")) {
            NodeList clause{take()};
            clause.push_back(parseOrTest());
            children.push_back(SyntaxNode::create(SyntaxKind::CompIf, std::move(clause)));
        } else {
            return;
        }
    }
}

NodePtr Parser::parseParenthesized() {
    NodeList children{take()};
    if (checkOp(")")) {
        children.push_back(take());
        return SyntaxNode::create(SyntaxKind::Tuple, std::move(children));
    }
    if (checkName("yield")) {
        children.push_back(parseYield());
        children.push_back(expectOp(")"));
        return SyntaxNode::create(SyntaxKind::Paren, std::move(children));
    }

    children.push_back(parseStarOrNamed());
    if (atComprehensionFor()) {
        parseComprehensionClauses(children);
        children.push_back(expectOp(")"));
        return SyntaxNode::create(SyntaxKind::GeneratorExp, std::move(children));
    }
    if (checkOp(")")) {
        children.push_back(take());
        return SyntaxNode::create(SyntaxKind::Paren, std::move(children));
    }
    while (checkOp(",")) {
        children.push_back(take());
        if (checkOp(")")) {
            break;
        }
        children.push_back(parseStarOrNamed());
    }
    children.push_back(expectOp(")"));
    return SyntaxNode::create(SyntaxKind::Tuple, std::move(children));
}

NodePtr Parser::parseListDisplay() {
    NodeList children{take()};
    if (checkOp("]")) {
        children.push_back(take());
        return SyntaxNode::create(SyntaxKind::List, std::move(children));
    }
    children.push_back(parseStarOrNamed());
    if (atComprehensionFor()) {
        parseComprehensionClauses(children);
        children.push_back(expectOp("]"));
        return SyntaxNode::create(SyntaxKind::ListComp, std::move(children));
    }
    while (checkOp(",")) {
        children.push_back(take());
        if (checkOp("]")) {
            break;
        }
        children.push_back(parseStarOrNamed());
    }
    children.push_back(expectOp("]"));
    return SyntaxNode::create(SyntaxKind::List, std::move(children));
}

NodePtr Parser::parseBraceDisplay() {
    NodeList children{take()};
    if (checkOp("}")) {
        children.push_back(take());
        return SyntaxNode::create(SyntaxKind::Dict, std::move(children));
    }

    auto parseDictItem = [this]() {
        if (checkOp("**")) {
            NodeList item{take()};
            item.push_back(parseBinaryLevel(0));
            return SyntaxNode::create(SyntaxKind::DictItem, std::move(item));
        }
        NodeList item{parseTest()};
        item.push_back(expectOp(":"));
        item.push_back(parseTest());
        return SyntaxNode::create(SyntaxKind::DictItem, std::move(item));
    };

    bool isDict = checkOp("**");
    if (isDict) {
        children.push_back(parseDictItem());
    } else {
        NodePtr first = parseStarOrNamed();
        if (checkOp(":")) {
            isDict = true;
            NodeList item{first, take()};
            item.push_back(parseTest());
            children.push_back(SyntaxNode::create(SyntaxKind::DictItem, std::move(item)));
        } else {
            children.push_back(first);
        }
    }

    if (atComprehensionFor()) {
        parseComprehensionClauses(children);
        children.push_back(expectOp("}"));
        return SyntaxNode::create(isDict ? SyntaxKind::DictComp : SyntaxKind::SetComp, std::move(children));
    }
    while (checkOp(",")) {
        children.push_back(take());
        if (checkOp("}")) {
            break;
        }
        children.push_back(isDict ? parseDictItem() : parseStarOrNamed());
    }
    children.push_back(expectOp("}"));
    return SyntaxNode::create(isDict ? SyntaxKind::Dict : SyntaxKind::Set, std::move(children));
}

NodePtr Parser::parseArgumentList() {
    NodeList children{expectOp("(")};
    while (!checkOp(")")) {
        children.push_back(parseArgument());
        if (!checkOp(",")) {
            break;
        }
        children.push_back(take());
    }
    children.push_back(expectOp(")"));
    return SyntaxNode::create(SyntaxKind::ArgumentList, std::move(children));
}

NodePtr Parser::parseArgument() {
    NodeList children;
    if (checkOp("*") || checkOp("**")) {
        children.push_back(take());
        children.push_back(parseTest());
        return SyntaxNode::create(SyntaxKind::Argument, std::move(children));
    }
    if (peek().kind == TokenKind::Name && !isKeyword(peek().text) && checkOp("=", 1)) {
        children.push_back(take());
        children.push_back(take());
        children.push_back(parseTest());
        return SyntaxNode::create(SyntaxKind::Argument, std::move(children));
    }
    children.push_back(parseNamedExpr());
    if (atComprehensionFor()) {
        parseComprehensionClauses(children);
    }
    return SyntaxNode::create(SyntaxKind::Argument, std::move(children));
}

NodePtr Parser::parseSubscript(NodePtr value) {
    NodeList children{std::move(value), take()};
    children.push_back(parseSliceItem());
    while (checkOp(",")) {
        children.push_back(take());
        if (checkOp("]")) {
            break;
        }
        children.push_back(parseSliceItem());
    }
    children.push_back(expectOp("]"));
    return SyntaxNode::create(SyntaxKind::Subscript, std::move(children));
}

NodePtr Parser::parseSliceItem() {
    NodeList parts;
    if (!checkOp(":")) {
        NodePtr lower = parseStarOrNamed();
        if (!checkOp(":")) {
            return lower;
        }
        parts.push_back(lower);
    }
    parts.push_back(take());
    if (canStartExpression(peek()) && !checkOp("*")) {
        parts.push_back(parseTest());
    }
    if (checkOp(":")) {
        parts.push_back(take());
        if (canStartExpression(peek()) && !checkOp("*")) {
            parts.push_back(parseTest());
        }
    }
    return SyntaxNode::create(SyntaxKind::Slice, std::move(parts));
}

NodePtr Parser::parseTargetItem() {
    if (checkOp("*")) {
        NodeList children{take()};
        children.push_back(parseBinaryLevel(0));
        return SyntaxNode::create(SyntaxKind::Starred, std::move(children));
    }
    return parseBinaryLevel(0);
}

NodePtr Parser::parseTargetList() {
    NodePtr first = parseTargetItem();
    if (!checkOp(",")) {
        return first;
    }
    NodeList children{first};
    while (checkOp(",")) {
        children.push_back(take());
        if (!canStartExpression(peek()) || checkName("in")) {
            break;
        }
        children.push_back(parseTargetItem());
    }
    return SyntaxNode::create(SyntaxKind::Tuple, std::move(children));
}

NodePtr Parser::parseYield() {
    NodeList children{take()};
    if (checkName("from")) {
        children.push_back(take());
        children.push_back(parseTest());
    } else if (canStartExpression(peek())) {
        children.push_back(parseTestListStarExpr());
    }
    return SyntaxNode::create(SyntaxKind::Yield, std::move(children));
}

}  // namespace TCE
