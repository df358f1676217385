#pragma once

#include "syntax/SyntaxNode.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TCE::SyntaxHelper {

// Binding strength of expression kinds, loosest first
constexpr int PRECEDENCE_LOWEST = -1;
constexpr int PRECEDENCE_LAMBDA = 0;
constexpr int PRECEDENCE_IF_EXP = 1;
constexpr int PRECEDENCE_OR = 2;
constexpr int PRECEDENCE_AND = 3;
constexpr int PRECEDENCE_NOT = 4;
constexpr int PRECEDENCE_COMPARISON = 5;
constexpr int PRECEDENCE_BIT_OR = 6;
constexpr int PRECEDENCE_BIT_XOR = 7;
constexpr int PRECEDENCE_BIT_AND = 8;
constexpr int PRECEDENCE_SHIFT = 9;
constexpr int PRECEDENCE_ARITH = 10;
constexpr int PRECEDENCE_TERM = 11;
constexpr int PRECEDENCE_UNARY = 12;
constexpr int PRECEDENCE_POWER = 13;
constexpr int PRECEDENCE_AWAIT = 14;
constexpr int PRECEDENCE_ATOM = 15;

/**
 * @brief One argument of a call, classified
 */
struct CallArgument {
    enum class Kind { Positional, Keyword, Star, DoubleStar, Generator };

    Kind kind = Kind::Positional;
    NodePtr argument;     // Argument node
    NodePtr value;        // expression (nullptr for Generator)
    std::string keyword;  // set for Keyword
};

/**
 * @brief Binding strength of an expression (higher binds tighter)
 *
 * Bare tuples, named expressions, starred items and yields report
 * PRECEDENCE_LOWEST because they need parentheses in every operand position.
 */
int precedenceOf(const NodePtr &expression);

/**
 * @brief Source text of an expression, parenthesized if it binds looser than minPrecedence
 */
std::string operandText(const NodePtr &expression, int minPrecedence);

/**
 * @brief Statements of a Block (indented or inline)
 */
NodeList statementsOf(const NodePtr &block);

/**
 * @brief Copy of block holding the given statements
 * @throws RewriteError when an inline suite would need more than one statement
 */
NodePtr withStatements(const NodePtr &block, NodeList statements);

/**
 * @brief Index of the body Block inside a compound statement, or npos
 */
size_t bodyIndexOf(const NodePtr &compound);

NodePtr bodyOf(const NodePtr &compound);

/**
 * @brief Declared name of a FunctionDef or ClassDef
 */
std::string definitionName(const NodePtr &definition);

NodeList decoratorsOf(const NodePtr &definition);

/**
 * @brief Parameter names of a FunctionDef, in order, without '*' or '/' markers
 */
std::vector<std::string> parameterNames(const NodePtr &function);

bool isAsync(const NodePtr &compound);

/**
 * @brief Dotted text of a Name/Attribute chain ("unittest.TestCase"), empty otherwise
 */
std::string dottedName(const NodePtr &expression);

/**
 * @brief Method name when call is `self.<name>(...)`
 */
std::optional<std::string> selfMethodName(const NodePtr &call);

/**
 * @brief Expression of the single small statement of a SimpleStatement, if it is an expression statement
 */
NodePtr expressionOfStatement(const NodePtr &statement);

std::vector<CallArgument> argumentsOf(const NodePtr &call);

/**
 * @brief True for constants and displays built only from constants
 */
bool isLiteral(const NodePtr &expression);

/**
 * @brief Identifiers of every Name node below node
 */
void collectNames(const NodePtr &node, std::set<std::string> &names);

bool referencesName(const NodePtr &node, const std::string &name);

/**
 * @brief Names bound by an assignment target (Name, Tuple, List, Starred, Paren)
 */
void collectTargetNames(const NodePtr &target, std::set<std::string> &names);

/**
 * @brief True if any `self.<prefix>*(...)` call with one of the prefixes appears below node
 */
bool containsSelfCall(const NodePtr &node, const std::vector<std::string> &methodPrefixes);

}  // namespace TCE::SyntaxHelper
