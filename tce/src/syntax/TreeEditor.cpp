#include "syntax/TreeEditor.h"
#include "common/Exceptions.h"
#include "common/StringUtils.h"

namespace TCE {

namespace {

bool findPathImpl(const NodePtr &node, const SyntaxNode *target, NodePath &path) {
    if (node.get() == target) {
        return true;
    }
    const NodeList &children = node->getChildren();
    for (size_t i = 0; i < children.size(); ++i) {
        path.push_back(i);
        if (findPathImpl(children[i], target, path)) {
            return true;
        }
        path.pop_back();
    }
    return false;
}

NodePtr replaceAtPathImpl(const NodePtr &node, const NodePath &path, size_t depth, NodePtr replacement) {
    if (depth == path.size()) {
        return replacement;
    }
    size_t index = path[depth];
    if (index >= node->getChildCount()) {
        throw InvariantViolation("tree path out of range");
    }
    NodePtr child = replaceAtPathImpl(node->getChild(index), path, depth + 1, std::move(replacement));
    return TreeEditor::replaceChild(node, index, std::move(child));
}

// Rewrites one trivia string; atLineStart carries across tokens
std::string reindentTrivia(const std::string &trivia, const std::string &from, const std::string &to,
                           bool &atLineStart) {
    std::string out;
    size_t i = 0;
    while (i <= trivia.size()) {
        if (atLineStart) {
            size_t spaceEnd = i;
            while (spaceEnd < trivia.size() && isHorizontalSpace(trivia[spaceEnd])) {
                ++spaceEnd;
            }
            bool blank = spaceEnd < trivia.size() && (trivia[spaceEnd] == '\n' || trivia[spaceEnd] == '\r');
            std::string_view space(trivia.data() + i, spaceEnd - i);
            if (!blank && startsWith(space, from)) {
                out += to;
                out.append(space.substr(from.size()));
            } else {
                out.append(space);
            }
            i = spaceEnd;
            atLineStart = false;
        }
        if (i >= trivia.size()) {
            break;
        }
        char c = trivia[i];
        out += c;
        ++i;
        if (c == '\n') {
            atLineStart = true;
        } else if (c == '\r' && (i >= trivia.size() || trivia[i] != '\n')) {
            atLineStart = true;
        }
    }
    return out;
}

NodePtr reindentImpl(const NodePtr &node, const std::string &from, const std::string &to, bool &atLineStart) {
    if (node->isToken()) {
        const Token &token = node->getToken();
        if (token.kind == TokenKind::Indent || token.kind == TokenKind::Dedent) {
            return node;
        }
        Token updated = token;
        if (!token.leadingTrivia.empty() || atLineStart) {
            updated.leadingTrivia = reindentTrivia(token.leadingTrivia, from, to, atLineStart);
        }
        if (!token.text.empty()) {
            atLineStart = token.kind == TokenKind::Newline;
        }
        if (updated.leadingTrivia == token.leadingTrivia) {
            return node;
        }
        return SyntaxNode::createToken(std::move(updated));
    }

    NodeList children;
    children.reserve(node->getChildCount());
    bool changed = false;
    for (const auto &child : node->getChildren()) {
        NodePtr updated = reindentImpl(child, from, to, atLineStart);
        changed = changed || updated != child;
        children.push_back(std::move(updated));
    }
    return changed ? SyntaxNode::create(node->getKind(), std::move(children)) : node;
}

void collectCommentsImpl(const NodePtr &node, std::vector<std::string> &out) {
    if (node->isToken()) {
        for (auto &comment : TreeEditor::commentsInTrivia(node->getToken().leadingTrivia)) {
            out.push_back(std::move(comment));
        }
        return;
    }
    for (const auto &child : node->getChildren()) {
        collectCommentsImpl(child, out);
    }
}

}  // namespace

NodePtr TreeEditor::replaceChild(const NodePtr &parent, size_t index, NodePtr replacement) {
    if (index >= parent->getChildCount()) {
        throw InvariantViolation("child index out of range in " + syntaxKindToString(parent->getKind()));
    }
    if (parent->getChild(index) == replacement) {
        return parent;
    }
    NodeList children = parent->getChildren();
    children[index] = std::move(replacement);
    return SyntaxNode::create(parent->getKind(), std::move(children));
}

NodePtr TreeEditor::withChildren(const NodePtr &node, NodeList children) {
    if (children == node->getChildren()) {
        return node;
    }
    return SyntaxNode::create(node->getKind(), std::move(children));
}

std::optional<NodePath> TreeEditor::findPath(const NodePtr &root, const SyntaxNode *target) {
    NodePath path;
    if (findPathImpl(root, target, path)) {
        return path;
    }
    return std::nullopt;
}

NodePtr TreeEditor::replaceAtPath(const NodePtr &root, const NodePath &path, NodePtr replacement) {
    return replaceAtPathImpl(root, path, 0, std::move(replacement));
}

NodePtr TreeEditor::replaceNode(const NodePtr &root, const SyntaxNode *target, NodePtr replacement) {
    auto path = findPath(root, target);
    if (!path) {
        throw InvariantViolation("node to replace is not part of the tree");
    }
    return replaceAtPath(root, *path, std::move(replacement));
}

NodePtr TreeEditor::withLeadingTrivia(const NodePtr &node, const std::string &trivia) {
    if (node->isToken()) {
        if (node->getToken().leadingTrivia == trivia) {
            return node;
        }
        Token token = node->getToken();
        token.leadingTrivia = trivia;
        return SyntaxNode::createToken(std::move(token));
    }
    const NodeList &children = node->getChildren();
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i]->getFirstToken()) {
            return replaceChild(node, i, withLeadingTrivia(children[i], trivia));
        }
    }
    return node;
}

NodePtr TreeEditor::withTokenText(const NodePtr &leaf, const std::string &text) {
    Token token = leaf->getToken();
    token.text = text;
    return SyntaxNode::createToken(std::move(token));
}

std::string TreeEditor::indentationOf(const NodePtr &statement) {
    std::string trivia = statement->getLeadingTrivia();
    size_t lineBreak = trivia.find_last_of("\r\n");
    std::string tail = lineBreak == std::string::npos ? trivia : trivia.substr(lineBreak + 1);
    size_t end = 0;
    while (end < tail.size() && isHorizontalSpace(tail[end])) {
        ++end;
    }
    return tail.substr(0, end);
}

std::string TreeEditor::leadingLinesOf(const NodePtr &statement) {
    std::string trivia = statement->getLeadingTrivia();
    size_t lineBreak = trivia.find_last_of("\r\n");
    return lineBreak == std::string::npos ? std::string() : trivia.substr(0, lineBreak + 1);
}

NodePtr TreeEditor::reindent(const NodePtr &node, const std::string &from, const std::string &to) {
    if (from == to) {
        return node;
    }
    bool atLineStart = true;
    return reindentImpl(node, from, to, atLineStart);
}

size_t TreeEditor::countComments(const NodePtr &node) {
    return collectComments(node).size();
}

std::vector<std::string> TreeEditor::collectComments(const NodePtr &node) {
    std::vector<std::string> comments;
    collectCommentsImpl(node, comments);
    return comments;
}

std::vector<std::string> TreeEditor::commentsInTrivia(const std::string &trivia) {
    // Trivia never contains string literals, so every '#' starts a comment
    std::vector<std::string> comments;
    size_t pos = trivia.find('#');
    while (pos != std::string::npos) {
        size_t end = trivia.find_first_of("\r\n", pos);
        if (end == std::string::npos) {
            end = trivia.size();
        }
        comments.push_back(trivia.substr(pos, end - pos));
        pos = trivia.find('#', end);
    }
    return comments;
}

NodePtr TreeEditor::detach(const NodePtr &node) {
    if (node->isToken()) {
        Token token = node->getToken();
        token.range = SourceRange{};
        return SyntaxNode::createToken(std::move(token));
    }
    NodeList children;
    children.reserve(node->getChildCount());
    for (const auto &child : node->getChildren()) {
        children.push_back(detach(child));
    }
    return SyntaxNode::create(node->getKind(), std::move(children));
}

}  // namespace TCE
