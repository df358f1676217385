#pragma once

#include "syntax/SyntaxNode.h"
#include <string>

namespace TCE {

/**
 * @brief Builds new syntax from Python text
 *
 * Synthesized code goes through the same Parser as the input so it is
 * well-formed by construction. Results are detached: their tokens carry no
 * source range, which is how later passes tell new code from original code.
 */
class SyntaxFactory {
public:
    /**
     * @brief Parse a single expression
     * @throws ParseError if text is not one expression
     */
    static NodePtr parseExpression(const std::string &text);

    /**
     * @brief Parse statements written at column 0 and indent them
     * @param text One or more complete statements, each line ending in a newline
     * @param indent Indentation of the destination block
     * @throws ParseError on malformed text
     */
    static NodeList parseStatements(const std::string &text, const std::string &indent);

    /**
     * @brief Parse exactly one statement
     * @throws ParseError if text holds zero or several statements
     */
    static NodePtr parseStatement(const std::string &text, const std::string &indent);

    /**
     * @brief Parse the small statement of a one-line simple statement (no newline)
     */
    static NodePtr parseSmallStatement(const std::string &text);

    /**
     * @brief Decorator line `@<expression>` at the given indentation
     */
    static NodePtr makeDecorator(const std::string &expression, const std::string &indent);

    /**
     * @brief Function parameter, optionally annotated
     */
    static NodePtr makeParam(const std::string &name, const std::string &annotation = "");

    static NodePtr makeToken(TokenKind kind, const std::string &text, const std::string &trivia = "");

    /**
     * @brief Check that a statement still parses on its own
     *
     * The statement is shifted to column 0 and parsed as a module.
     * @throws ParseError with the location inside the shifted text
     */
    static void checkParses(const NodePtr &statement);
};

}  // namespace TCE
