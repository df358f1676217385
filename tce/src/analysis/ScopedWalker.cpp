#include "analysis/ScopedWalker.h"
#include "syntax/SyntaxHelper.h"

namespace TCE {

bool ScopedWalker::enter(const NodePtr &node) {
    if (!onEnter(node)) {
        return false;
    }
    if (node->is(SyntaxKind::ClassDef) || node->is(SyntaxKind::FunctionDef)) {
        frames_.push_back(Frame{node->is(SyntaxKind::ClassDef), SyntaxHelper::definitionName(node), node.get()});
    }
    return true;
}

void ScopedWalker::leave(const NodePtr &node) {
    if (!frames_.empty() && frames_.back().node == node.get()) {
        frames_.pop_back();
    }
    onLeave(node);
}

std::string ScopedWalker::currentClass() const {
    std::string qualified;
    for (const auto &frame : frames_) {
        if (!frame.isClass) {
            continue;
        }
        qualified += qualified.empty() ? frame.name : "." + frame.name;
    }
    return qualified.empty() ? MODULE_SCOPE : qualified;
}

std::string ScopedWalker::currentFunction() const {
    size_t lastClass = frames_.size();
    for (size_t i = frames_.size(); i-- > 0;) {
        if (frames_[i].isClass) {
            lastClass = i;
            break;
        }
    }
    size_t first = lastClass == frames_.size() ? 0 : lastClass + 1;
    if (first >= frames_.size()) {
        return "";
    }
    std::string scope = currentClass();
    return scope == MODULE_SCOPE ? frames_[first].name : scope + "." + frames_[first].name;
}

bool ScopedWalker::inFunction() const {
    return !currentFunction().empty();
}

bool ScopedWalker::inClassBody() const {
    return !frames_.empty() && frames_.back().isClass;
}

size_t ScopedWalker::classDepth() const {
    size_t depth = 0;
    for (const auto &frame : frames_) {
        if (frame.isClass) {
            ++depth;
        }
    }
    return depth;
}

}  // namespace TCE
