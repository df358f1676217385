#pragma once

#include "syntax/SyntaxKind.h"
#include "syntax/Token.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TCE {

class SyntaxNode;
using NodePtr = std::shared_ptr<const SyntaxNode>;
using NodeList = std::vector<NodePtr>;

/**
 * @brief Immutable, format-preserving syntax tree node
 *
 * A node is either a token leaf or an interior node whose children appear in
 * source order. Rendering concatenates the trivia and text of every leaf, so an
 * unmodified subtree always re-renders to its original text. Nodes are never
 * mutated; rewrites build new nodes and reuse unchanged subtrees by reference.
 */
class SyntaxNode {
public:
    SyntaxNode(SyntaxKind kind, NodeList children);
    explicit SyntaxNode(Token token);

    static NodePtr create(SyntaxKind kind, NodeList children);
    static NodePtr createToken(Token token);

    SyntaxKind getKind() const {
        return kind_;
    }

    bool is(SyntaxKind kind) const {
        return kind_ == kind;
    }

    bool isToken() const {
        return kind_ == SyntaxKind::Token;
    }

    /**
     * @brief True for a name or operator leaf with the given text
     */
    bool isToken(std::string_view text) const;

    /**
     * @brief Leaf token (only valid when isToken())
     */
    const Token &getToken() const;

    const NodeList &getChildren() const {
        return children_;
    }

    size_t getChildCount() const {
        return children_.size();
    }

    const NodePtr &getChild(size_t index) const {
        return children_.at(index);
    }

    /**
     * @brief Interior children, skipping token leaves
     */
    NodeList getNodeChildren() const;

    /**
     * @brief First interior child of the given kind, or nullptr
     */
    NodePtr findChild(SyntaxKind kind) const;

    /**
     * @brief Index of the first token child with the given text at or after from
     * @return Index or std::string::npos
     */
    size_t findTokenIndex(std::string_view text, size_t from = 0) const;

    /**
     * @brief Range spanned by the located tokens of this subtree
     *
     * Invalid when every token of the subtree was synthesized.
     */
    const SourceRange &getRange() const {
        return range_;
    }

    const Token *getFirstToken() const;
    const Token *getLastToken() const;

    std::string render() const;
    void renderTo(std::string &out) const;

    /**
     * @brief Trivia in front of the first token
     */
    std::string getLeadingTrivia() const;

    /**
     * @brief Rendered text without the leading trivia of the first token
     */
    std::string getSourceText() const;

private:
    SyntaxKind kind_;
    NodeList children_;
    std::optional<Token> token_;
    SourceRange range_;
};

}  // namespace TCE
