#include "rewriting/RewriteHelper.h"
#include "analysis/TestCaseApi.h"
#include "common/Exceptions.h"
#include "common/StringUtils.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/SyntaxVisitor.h"
#include "syntax/TreeEditor.h"
#include <algorithm>
#include <format>

namespace TCE::RewriteHelper {

namespace {

bool isAliasNode(const NodePtr &node, const std::string &alias) {
    if (!node->is(SyntaxKind::Name) && !node->is(SyntaxKind::Attribute)) {
        return false;
    }
    return SyntaxHelper::dottedName(node) == alias;
}

bool inRegion(const std::optional<SourcePosition> &position, const SourcePosition &from,
              const std::optional<SourcePosition> &until) {
    if (!position || *position < from) {
        return false;
    }
    return !until || *position < *until;
}

// Synthesized nodes take the position of their closest positioned ancestor
NodePtr rewriteAliasImpl(const NodePtr &node, const AliasMapping &mapping, const SourcePosition &from,
                         const std::optional<SourcePosition> &until, std::optional<SourcePosition> position) {
    if (node->isToken()) {
        return node;
    }
    if (node->getRange().isValid()) {
        position = node->getRange().start;
    }
    if (node->is(SyntaxKind::Attribute) && isAliasNode(node->getChild(0), mapping.alias) &&
        inRegion(position, from, until)) {
        const std::string &attribute = node->getChild(2)->getToken().text;
        auto it = mapping.attributes.find(attribute);
        if (it == mapping.attributes.end()) {
            throw RewriteError(std::format("'{}.{}' has no pytest counterpart", mapping.alias, attribute));
        }
        NodePtr replacement = SyntaxFactory::parseExpression(it->second);
        return TreeEditor::withLeadingTrivia(replacement, node->getLeadingTrivia());
    }
    if (isAliasNode(node, mapping.alias) && inRegion(position, from, until)) {
        throw RewriteError(std::format("'{}' is used directly at {}", mapping.alias, position->toString()));
    }

    NodeList children;
    children.reserve(node->getChildCount());
    for (const auto &child : node->getChildren()) {
        children.push_back(rewriteAliasImpl(child, mapping, from, until, position));
    }
    return TreeEditor::withChildren(node, std::move(children));
}

bool isSuperCall(const NodePtr &expression) {
    return expression->is(SyntaxKind::Call) && SyntaxHelper::dottedName(expression->getChild(0)) == "super";
}

class MemberUseScanner : public SyntaxWalker {
public:
    explicit MemberUseScanner(const std::set<std::string> &ownNames) : ownNames_(ownNames) {}

    std::set<std::string> members;

protected:
    bool enter(const NodePtr &node) override {
        if (node->is(SyntaxKind::FunctionDef)) {
            hooks_.push_back(SyntaxHelper::definitionName(node));
        }
        if (!node->is(SyntaxKind::Attribute)) {
            return true;
        }
        const NodePtr &receiver = node->getChild(0);
        const std::string &member = node->getChild(2)->getToken().text;
        if (!TestCaseApi::isTestCaseMember(member) || ownNames_.count(member) > 0) {
            return true;
        }
        if (SyntaxHelper::dottedName(receiver) == "self") {
            members.insert(member);
        } else if (isSuperCall(receiver)) {
            bool insideSameHook = !hooks_.empty() && hooks_.back() == member && TestCaseApi::isClassHookName(member);
            if (!insideSameHook) {
                members.insert("super()." + member);
            }
        }
        return true;
    }

    void leave(const NodePtr &node) override {
        if (node->is(SyntaxKind::FunctionDef) && !hooks_.empty()) {
            hooks_.pop_back();
        }
    }

private:
    const std::set<std::string> &ownNames_;
    std::vector<std::string> hooks_;
};

class SelfAssignmentCollector : public SyntaxWalker {
public:
    std::set<std::string> attributes;

protected:
    bool enter(const NodePtr &node) override {
        if (node->is(SyntaxKind::Assign) || node->is(SyntaxKind::AnnAssign) || node->is(SyntaxKind::AugAssign)) {
            const NodePtr &target = node->getChild(0);
            if (target->is(SyntaxKind::Attribute) && SyntaxHelper::dottedName(target->getChild(0)) == "self") {
                attributes.insert(target->getChild(2)->getToken().text);
            }
        }
        return true;
    }
};

void checkExtensibleSignature(const NodePtr &parameters) {
    for (const auto &param : parameters->getNodeChildren()) {
        const NodePtr &first = param->getChild(0);
        if (first->isToken("*") || first->isToken("**") || first->isToken("/")) {
            throw RewriteError("signature has star parameters or a positional-only marker");
        }
        if (param->findTokenIndex("=") != std::string::npos) {
            throw RewriteError("signature has default values");
        }
    }
}

}  // namespace

NodePtr addParameter(const NodePtr &function, const std::string &name, const std::string &annotation) {
    NodePtr parameters = function->findChild(SyntaxKind::Parameters);
    if (!parameters) {
        throw RewriteError("function has no parameter list");
    }
    checkExtensibleSignature(parameters);

    NodeList children = parameters->getChildren();
    size_t close = children.size() - 1;
    if (!children[close]->isToken(")")) {
        throw RewriteError("unexpected parameter list shape");
    }
    NodePtr param = SyntaxFactory::makeParam(name, annotation);
    const NodePtr &previous = children[close - 1];
    if (previous->isToken("(")) {
        children.insert(children.begin() + close, param);
    } else if (previous->isToken(",")) {
        children.insert(children.begin() + close, {TreeEditor::withLeadingTrivia(param, " "),
                                                   SyntaxFactory::makeToken(TokenKind::Operator, ",")});
    } else {
        children.insert(children.begin() + close, {SyntaxFactory::makeToken(TokenKind::Operator, ","),
                                                   TreeEditor::withLeadingTrivia(param, " ")});
    }
    NodePtr updated = TreeEditor::withChildren(parameters, std::move(children));
    const NodeList &functionChildren = function->getChildren();
    size_t index = std::find(functionChildren.begin(), functionChildren.end(), parameters) - functionChildren.begin();
    return TreeEditor::replaceChild(function, index, updated);
}

NodePtr addDecorator(const NodePtr &definition, const std::string &expression) {
    const NodeList &children = definition->getChildren();
    size_t index = 0;
    while (index < children.size() && children[index]->is(SyntaxKind::Decorator)) {
        ++index;
    }
    std::string indent = TreeEditor::indentationOf(definition);
    NodePtr decorator = SyntaxFactory::makeDecorator(expression, indent);

    NodeList updated = children;
    if (index == 0) {
        decorator = TreeEditor::withLeadingTrivia(decorator, definition->getLeadingTrivia());
        updated[0] = TreeEditor::withLeadingTrivia(updated[0], indent);
    }
    updated.insert(updated.begin() + index, decorator);
    return TreeEditor::withChildren(definition, std::move(updated));
}

bool hasDecorator(const NodePtr &definition, const std::string &fragment) {
    for (const auto &decorator : SyntaxHelper::decoratorsOf(definition)) {
        if (decorator->getSourceText().find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

NodePtr findNodeAt(const NodePtr &root, SyntaxKind kind, const SourcePosition &position) {
    if (root->isToken()) {
        return nullptr;
    }
    if (root->is(kind) && root->getRange().start == position) {
        return root;
    }
    const SourceRange &range = root->getRange();
    if (range.isValid() && (position < range.start || !(position < range.end))) {
        return nullptr;
    }
    for (const auto &child : root->getChildren()) {
        if (NodePtr found = findNodeAt(child, kind, position)) {
            return found;
        }
    }
    return nullptr;
}

NodePtr rewriteAliasUses(const NodePtr &root, const AliasMapping &mapping, const SourcePosition &from,
                         const std::optional<SourcePosition> &until) {
    return rewriteAliasImpl(root, mapping, from, until, std::nullopt);
}

std::vector<std::string> lostComments(const NodePtr &original, const NodePtr &result) {
    std::vector<std::string> remaining = TreeEditor::collectComments(result);
    std::vector<std::string> lost;
    for (const auto &comment : TreeEditor::collectComments(original)) {
        auto it = std::find(remaining.begin(), remaining.end(), comment);
        if (it == remaining.end()) {
            lost.push_back(comment);
        } else {
            remaining.erase(it);
        }
    }
    return lost;
}

NodePtr prependComments(const NodePtr &statement, const std::vector<std::string> &comments) {
    if (comments.empty()) {
        return statement;
    }
    std::string indent = TreeEditor::indentationOf(statement);
    std::string trivia = TreeEditor::leadingLinesOf(statement);
    for (const auto &comment : comments) {
        trivia += indent + comment + "\n";
    }
    trivia += indent;
    return TreeEditor::withLeadingTrivia(statement, trivia);
}

std::set<std::string> definedMethodNames(const NodePtr &classDef) {
    std::set<std::string> names;
    for (const auto &statement : SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(classDef))) {
        if (statement->is(SyntaxKind::FunctionDef)) {
            names.insert(SyntaxHelper::definitionName(statement));
        }
    }
    return names;
}

std::set<std::string> residualTestCaseMembers(const NodePtr &classDef) {
    SelfAssignmentCollector assignments;
    assignments.walk(classDef);
    std::set<std::string> ownNames = definedMethodNames(classDef);
    ownNames.insert(assignments.attributes.begin(), assignments.attributes.end());
    for (const auto &hook : {"setUp", "tearDown", "setUpClass", "tearDownClass", "asyncSetUp", "asyncTearDown"}) {
        ownNames.erase(hook);
    }

    MemberUseScanner scanner(ownNames);
    scanner.walk(SyntaxHelper::bodyOf(classDef));
    return scanner.members;
}

bool isConversionCandidate(const ClassFact &cls, const StageContext &context) {
    if (!cls.hasSoleTestCaseBase() || cls.subclassedInModule || cls.isNested) {
        return false;
    }
    if (context.config.keepsLegacyClassStructure() || !context.controller.allows(DegradationTier::Advanced)) {
        return false;
    }
    // pytest only collects plain classes named Test* that have no __init__
    if (!startsWith(cls.name, "Test") || context.facts.findFunction(cls.qualifiedName + ".__init__")) {
        return false;
    }
    return context.facts.getLegacyApis(cls.qualifiedName).empty();
}

}  // namespace TCE::RewriteHelper
