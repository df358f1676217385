#include "syntax/SyntaxVisitor.h"

namespace TCE {

void SyntaxWalker::walk(const NodePtr &root) {
    ancestors_.clear();
    visit(root);
}

void SyntaxWalker::visit(const NodePtr &node) {
    if (!enter(node)) {
        return;
    }
    ancestors_.push_back(node);
    for (const auto &child : node->getChildren()) {
        if (!child->isToken()) {
            visit(child);
        }
    }
    ancestors_.pop_back();
    leave(node);
}

NodePtr SyntaxRewriter::rewrite(const NodePtr &root) {
    ancestors_.clear();
    return visit(root);
}

NodePtr SyntaxRewriter::visit(const NodePtr &node) {
    if (node->isToken()) {
        return node;
    }

    NodePtr updated = node;
    if (shouldVisitChildren(node)) {
        ancestors_.push_back(node);
        NodeList children;
        children.reserve(node->getChildCount());
        bool changed = false;
        for (const auto &child : node->getChildren()) {
            NodePtr rewritten = visit(child);
            changed = changed || rewritten != child;
            children.push_back(std::move(rewritten));
        }
        ancestors_.pop_back();
        if (changed) {
            updated = SyntaxNode::create(node->getKind(), std::move(children));
        }
    }
    return leave(node, updated);
}

}  // namespace TCE
