#pragma once

#include "analysis/Facts.h"
#include "syntax/SyntaxVisitor.h"
#include <string>
#include <vector>

namespace TCE {

/**
 * @brief SyntaxWalker that tracks the enclosing class and function
 *
 * onEnter() sees the scope a node appears in; a ClassDef or FunctionDef only
 * becomes the current scope for its children.
 */
class ScopedWalker : public SyntaxWalker {
protected:
    virtual bool onEnter(const NodePtr &node) {
        (void)node;
        return true;
    }

    virtual void onLeave(const NodePtr &node) {
        (void)node;
    }

    /**
     * @brief Qualified name of the innermost class ("Outer.Inner") or MODULE_SCOPE
     */
    std::string currentClass() const;

    /**
     * @brief Qualified name of the function being walked, empty outside functions
     *
     * Functions nested in a method report the method; this is the unit of
     * rewriting for every function-level rewrite.
     */
    std::string currentFunction() const;

    bool inFunction() const;

    /**
     * @brief True when the current scope is directly a class body
     */
    bool inClassBody() const;

    size_t classDepth() const;

private:
    bool enter(const NodePtr &node) final;
    void leave(const NodePtr &node) final;

    struct Frame {
        bool isClass = false;
        std::string name;
        const SyntaxNode *node = nullptr;
    };

    std::vector<Frame> frames_;
};

}  // namespace TCE
