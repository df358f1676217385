#pragma once

#include "syntax/SyntaxNode.h"
#include "syntax/Token.h"
#include <string>
#include <string_view>
#include <vector>

namespace TCE {

/**
 * @brief Recursive descent parser building a lossless syntax tree
 *
 * Statements are parsed by indentation-aware descent over the Tokenizer's
 * Indent/Dedent stream; expressions by precedence climbing. Every token of the
 * input ends up as exactly one leaf, so render(parse(text)) == text.
 *
 * @code
 * NodePtr module = Parser::parse(source);
 * assert(module->render() == source);
 * @endcode
 */
class Parser {
public:
    explicit Parser(std::string_view source);

    /**
     * @brief Parse the whole source as a module
     * @throws ParseError with the location of the first syntax error
     */
    NodePtr parseModule();

    /**
     * @brief Parse a single expression (surrounding whitespace allowed)
     * @throws ParseError if the text is not exactly one expression
     */
    NodePtr parseExpressionOnly();

    static NodePtr parse(std::string_view source);

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    // Token access
    const Token &peek(size_t ahead = 0) const;
    bool checkName(std::string_view name, size_t ahead = 0) const;
    bool checkOp(std::string_view op, size_t ahead = 0) const;
    bool atStatementEnd() const;
    bool canStartExpression(const Token &token) const;
    NodePtr take();
    NodePtr expectOp(std::string_view op);
    NodePtr expectKeyword(std::string_view keyword);
    NodePtr expectIdentifier();
    NodePtr expectNewline();
    [[noreturn]] void fail(const std::string &message) const;
    [[noreturn]] void failUnexpected() const;

    // Statements
    NodePtr parseStatement();
    NodePtr parseSimpleStatement();
    NodePtr parseSmallStatement();
    NodePtr parseExpressionStatement();
    NodePtr parseImport();
    NodePtr parseImportFrom();
    NodePtr parseDottedName();
    NodePtr parseBlock();
    NodePtr parseDecorated();
    NodePtr parseFunctionDef(NodeList children);
    NodePtr parseClassDef(NodeList children);
    NodePtr parseParameters(bool parenthesized);
    NodePtr parseIf();
    NodePtr parseWhile();
    NodePtr parseFor();
    NodePtr parseWith();
    NodePtr parseTry();
    NodePtr parseElseClause();
    NodePtr parseGenericCompound();
    bool isGenericCompoundHeader() const;
    void takeTypeParameters(NodeList &children);

    // Expressions
    NodePtr parseTestListStarExpr();
    NodePtr parseTestOrStar();
    NodePtr parseNamedExpr();
    NodePtr parseTest();
    NodePtr parseLambda();
    NodePtr parseOrTest();
    NodePtr parseAndTest();
    NodePtr parseNotTest();
    NodePtr parseComparison();
    NodePtr parseBinaryLevel(size_t level);
    NodePtr parseFactor();
    NodePtr parsePower();
    NodePtr parseAwaitPrimary();
    NodePtr parsePrimary();
    NodePtr parseAtom();
    NodePtr parseParenthesized();
    NodePtr parseListDisplay();
    NodePtr parseBraceDisplay();
    NodePtr parseArgumentList();
    NodePtr parseArgument();
    NodePtr parseSubscript(NodePtr value);
    NodePtr parseSliceItem();
    NodePtr parseStarOrNamed();
    NodePtr parseTargetList();
    NodePtr parseTargetItem();
    NodePtr parseYield();
    void parseComprehensionClauses(NodeList &children);
    bool atComprehensionFor() const;
};

}  // namespace TCE
