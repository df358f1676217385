#pragma once

#include "syntax/SyntaxNode.h"
#include <optional>
#include <string>
#include <vector>

namespace TCE {

using NodePath = std::vector<size_t>;

/**
 * @brief Structural edits over immutable syntax trees
 *
 * Every edit returns a new root. Only the nodes on the path from the root to
 * the edited node are rebuilt; all other subtrees are shared with the input.
 * Callers holding the old root keep a fully valid tree.
 */
class TreeEditor {
public:
    /**
     * @brief Copy of parent with children[index] replaced
     */
    static NodePtr replaceChild(const NodePtr &parent, size_t index, NodePtr replacement);

    /**
     * @brief Copy of node with a new children list (kind preserved)
     */
    static NodePtr withChildren(const NodePtr &node, NodeList children);

    /**
     * @brief Locate target (by identity) below root
     * @return Child index path, or std::nullopt if target is not in the tree
     */
    static std::optional<NodePath> findPath(const NodePtr &root, const SyntaxNode *target);

    /**
     * @brief Replace the node at path, rebuilding its ancestors
     */
    static NodePtr replaceAtPath(const NodePtr &root, const NodePath &path, NodePtr replacement);

    /**
     * @brief Replace target (by identity) below root
     * @throws InvariantViolation if target is not part of the tree
     */
    static NodePtr replaceNode(const NodePtr &root, const SyntaxNode *target, NodePtr replacement);

    /**
     * @brief Copy of node whose first token carries the given trivia
     */
    static NodePtr withLeadingTrivia(const NodePtr &node, const std::string &trivia);

    /**
     * @brief Copy of a token leaf with different text (trivia and range kept)
     */
    static NodePtr withTokenText(const NodePtr &leaf, const std::string &text);

    /**
     * @brief Indentation of a statement: its first token's trivia after the last line break
     */
    static std::string indentationOf(const NodePtr &statement);

    /**
     * @brief Leading trivia of a statement without its indentation (comment and blank lines)
     */
    static std::string leadingLinesOf(const NodePtr &statement);

    /**
     * @brief Shift every line of node starting with `from` to start with `to`
     *
     * Only trivia at line starts is rewritten; blank lines, lines indented less
     * than `from` and the contents of string tokens are left alone. The first
     * token of node is treated as starting a line.
     */
    static NodePtr reindent(const NodePtr &node, const std::string &from, const std::string &to);

    /**
     * @brief Number of `#` comments in the trivia of node
     */
    static size_t countComments(const NodePtr &node);

    /**
     * @brief Text of every `#` comment in the trivia of node, in source order
     */
    static std::vector<std::string> collectComments(const NodePtr &node);

    /**
     * @brief Comments found in a single trivia string
     */
    static std::vector<std::string> commentsInTrivia(const std::string &trivia);

    /**
     * @brief Copy of node with every token range cleared (marks synthesized code)
     */
    static NodePtr detach(const NodePtr &node);
};

}  // namespace TCE
