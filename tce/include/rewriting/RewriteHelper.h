#pragma once

#include "analysis/Facts.h"
#include "runtime/ITransformStage.h"
#include "syntax/SyntaxNode.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TCE::RewriteHelper {

/**
 * @brief Replacement text for the attributes of a bound context alias
 *
 * alias is the bound expression ("cm" or "self.cm"); attributes maps an
 * attribute of the alias to the expression that replaces the whole
 * `<alias>.<attribute>` access.
 */
struct AliasMapping {
    std::string alias;
    std::map<std::string, std::string> attributes;
};

/**
 * @brief Append a parameter to a function signature
 * @throws RewriteError when the signature has defaults, star parameters or a '/' marker
 */
NodePtr addParameter(const NodePtr &function, const std::string &name, const std::string &annotation = "");

/**
 * @brief Insert `@expression` directly above the def/class line
 */
NodePtr addDecorator(const NodePtr &definition, const std::string &expression);

/**
 * @brief True if some decorator's text contains fragment
 */
bool hasDecorator(const NodePtr &definition, const std::string &fragment);

/**
 * @brief First node of the given kind below root that starts at position
 */
NodePtr findNodeAt(const NodePtr &root, SyntaxKind kind, const SourcePosition &position);

/**
 * @brief Rewrite `<alias>.<attribute>` accesses located in [from, until)
 *
 * Synthesized nodes count as located where their closest original ancestor starts.
 * @throws RewriteError when the alias is used in a way the mapping does not cover
 */
NodePtr rewriteAliasUses(const NodePtr &root, const AliasMapping &mapping, const SourcePosition &from,
                         const std::optional<SourcePosition> &until);

/**
 * @brief Comments of original that result no longer holds (multiset difference)
 */
std::vector<std::string> lostComments(const NodePtr &original, const NodePtr &result);

/**
 * @brief Place comments on their own lines above a statement, at its indentation
 */
NodePtr prependComments(const NodePtr &statement, const std::vector<std::string> &comments);

/**
 * @brief unittest.TestCase members a class still reaches through self or super()
 *
 * Members the class defines itself, and `super().<hook>()` calls inside the
 * matching hook, are not counted.
 */
std::set<std::string> residualTestCaseMembers(const NodePtr &classDef);

/**
 * @brief Whether a TestCase class is expected to lose its base in the fixture-state stage
 *
 * Decided from facts and configuration only; the fixture-state stage confirms
 * on the rewritten tree with residualTestCaseMembers().
 */
bool isConversionCandidate(const ClassFact &cls, const StageContext &context);

/**
 * @brief Names of the functions defined directly in a class body
 */
std::set<std::string> definedMethodNames(const NodePtr &classDef);

}  // namespace TCE::RewriteHelper
