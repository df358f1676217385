#pragma once

#include "syntax/SyntaxNode.h"

namespace TCE {

/**
 * @brief Read-only depth-first traversal over interior nodes
 *
 * Token leaves are not visited; subclasses inspect them through getChildren().
 */
class SyntaxWalker {
public:
    virtual ~SyntaxWalker() = default;

    void walk(const NodePtr &root);

protected:
    /**
     * @brief Called before the children of node
     * @return false to skip the subtree
     */
    virtual bool enter(const NodePtr &node) {
        (void)node;
        return true;
    }

    virtual void leave(const NodePtr &node) {
        (void)node;
    }

    /**
     * @brief Interior nodes from the root down to the parent of the current node
     */
    const NodeList &getAncestors() const {
        return ancestors_;
    }

private:
    void visit(const NodePtr &node);

    NodeList ancestors_;
};

/**
 * @brief Post-order rebuilding traversal
 *
 * leave() receives the original node and a version whose children have
 * already been rewritten. A node is only rebuilt when one of its children
 * changed, so an untouched tree comes back as the identical root pointer.
 */
class SyntaxRewriter {
public:
    virtual ~SyntaxRewriter() = default;

    NodePtr rewrite(const NodePtr &root);

protected:
    virtual bool shouldVisitChildren(const NodePtr &node) {
        (void)node;
        return true;
    }

    virtual NodePtr leave(const NodePtr &original, const NodePtr &updated) {
        (void)original;
        return updated;
    }

    const NodeList &getAncestors() const {
        return ancestors_;
    }

private:
    NodePtr visit(const NodePtr &node);

    NodeList ancestors_;
};

}  // namespace TCE
