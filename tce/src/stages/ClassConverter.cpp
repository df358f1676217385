#include "stages/ClassConverter.h"
#include "common/Exceptions.h"
#include "common/StringUtils.h"
#include "rewriting/RewriteHelper.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/SyntaxVisitor.h"
#include "syntax/TreeEditor.h"
#include <algorithm>
#include <format>

namespace TCE {

namespace {

// return/yield of the function itself (nested scopes are not entered)
class ControlFlowScanner : public SyntaxWalker {
public:
    bool hasReturn = false;
    bool hasYield = false;

protected:
    bool enter(const NodePtr &node) override {
        if (getAncestors().size() > 0 &&
            (node->is(SyntaxKind::FunctionDef) || node->is(SyntaxKind::ClassDef) || node->is(SyntaxKind::Lambda))) {
            return false;
        }
        if (node->is(SyntaxKind::KeywordStatement) && node->getChild(0)->isToken("return")) {
            hasReturn = true;
        }
        if (node->is(SyntaxKind::Yield)) {
            hasYield = true;
        }
        return true;
    }
};

bool isSuperHookCall(const NodePtr &statement, const std::string &hook) {
    NodePtr call = SyntaxHelper::expressionOfStatement(statement);
    if (!call || !call->is(SyntaxKind::Call) || !call->getChild(0)->is(SyntaxKind::Attribute)) {
        return false;
    }
    const NodePtr &attribute = call->getChild(0);
    const NodePtr &receiver = attribute->getChild(0);
    return receiver->is(SyntaxKind::Call) && SyntaxHelper::dottedName(receiver->getChild(0)) == "super" &&
           attribute->getChild(2)->getToken().text == hook && SyntaxHelper::argumentsOf(call).empty();
}

/**
 * @brief Hook body without `super().<hook>()` statements
 *
 * Comment lines above a dropped statement move to the next kept one; comments
 * left over at the end are returned through pendingLines.
 */
NodeList bodyWithoutSuperCall(const NodePtr &hook, std::string &pendingLines) {
    const std::string name = SyntaxHelper::definitionName(hook);
    NodeList kept;
    for (const auto &statement : SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(hook))) {
        if (isSuperHookCall(statement, name)) {
            pendingLines += TreeEditor::leadingLinesOf(statement);
            continue;
        }
        if (!pendingLines.empty()) {
            kept.push_back(TreeEditor::withLeadingTrivia(statement, pendingLines + statement->getLeadingTrivia()));
            pendingLines.clear();
        } else {
            kept.push_back(statement);
        }
    }
    return kept;
}

void checkHookShape(const NodePtr &hook, bool classHook) {
    const std::string name = SyntaxHelper::definitionName(hook);
    if (SyntaxHelper::isAsync(hook)) {
        throw RewriteError(std::format("{} is async", name));
    }
    NodeList decorators = SyntaxHelper::decoratorsOf(hook);
    if (classHook) {
        if (decorators.size() != 1 || SyntaxHelper::dottedName(decorators[0]->getChild(1)) != "classmethod") {
            throw RewriteError(std::format("{} is not a plain classmethod", name));
        }
    } else if (!decorators.empty()) {
        throw RewriteError(std::format("{} is decorated", name));
    }
    if (SyntaxHelper::parameterNames(hook).size() != 1) {
        throw RewriteError(std::format("{} takes extra parameters", name));
    }
    ControlFlowScanner scanner;
    scanner.walk(hook);
    if (scanner.hasYield) {
        throw RewriteError(std::format("{} is a generator", name));
    }
    if (scanner.hasReturn && !classHook) {
        throw RewriteError(std::format("{} returns early", name));
    }
}

NodePtr renamed(const NodePtr &definition, const std::string &name) {
    size_t index = definition->findTokenIndex(SyntaxHelper::definitionName(definition));
    if (index == std::string::npos) {
        throw RewriteError("definition name not found");
    }
    return TreeEditor::replaceChild(definition, index,
                                    TreeEditor::withTokenText(definition->getChild(index), name));
}

NodePtr withBody(const NodePtr &definition, NodeList statements, const std::string &pendingLines) {
    NodePtr body = SyntaxHelper::bodyOf(definition);
    if (statements.empty()) {
        std::string indent = TreeEditor::indentationOf(SyntaxHelper::statementsOf(body).front());
        NodePtr pass = SyntaxFactory::parseStatement("pass\n", indent);
        statements.push_back(TreeEditor::withLeadingTrivia(pass, pendingLines + indent));
    } else if (!pendingLines.empty()) {
        // trailing comments of a dropped last statement stay inside the block
        throw RewriteError("comment after a super() call cannot be kept");
    }
    return TreeEditor::replaceChild(definition, SyntaxHelper::bodyIndexOf(definition),
                                    SyntaxHelper::withStatements(body, std::move(statements)));
}

NodePtr classHookToPytest(const NodePtr &hook) {
    checkHookShape(hook, true);
    std::string pendingLines;
    NodeList statements = bodyWithoutSuperCall(hook, pendingLines);
    NodePtr result = withBody(hook, std::move(statements), pendingLines);
    return renamed(result, ClassConverter::pytestHookName(SyntaxHelper::definitionName(hook)));
}

/**
 * @brief setUp and/or tearDown merged into the autouse setup_method fixture
 * @param setUp may be nullptr
 * @param tearDown may be nullptr
 */
NodePtr mergedFixture(const NodePtr &setUp, const NodePtr &tearDown) {
    const NodePtr &base = setUp ? setUp : tearDown;
    std::string indent = TreeEditor::indentationOf(SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(base)).front());

    NodeList statements;
    std::string pendingLines;
    if (setUp) {
        checkHookShape(setUp, false);
        statements = bodyWithoutSuperCall(setUp, pendingLines);
    }
    NodePtr yield = SyntaxFactory::parseStatement("yield\n", indent);
    statements.push_back(TreeEditor::withLeadingTrivia(yield, pendingLines + indent));
    pendingLines.clear();

    if (tearDown) {
        checkHookShape(tearDown, false);
        std::string from =
            TreeEditor::indentationOf(SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(tearDown)).front());
        // Comments above the removed def move with its body
        pendingLines = tearDown == base ? "" : TreeEditor::leadingLinesOf(tearDown);
        pendingLines.erase(0, pendingLines.find_first_not_of("\r\n"));
        NodeList teardown = bodyWithoutSuperCall(tearDown, pendingLines);
        for (size_t i = 0; i < teardown.size(); ++i) {
            statements.push_back(TreeEditor::reindent(teardown[i], from, indent));
        }
        if (!pendingLines.empty()) {
            throw RewriteError("comment after a super() call cannot be kept");
        }
    }

    NodePtr fixture = renamed(base, ClassConverter::SETUP_METHOD);
    fixture = TreeEditor::replaceChild(fixture, SyntaxHelper::bodyIndexOf(fixture),
                                       SyntaxHelper::withStatements(SyntaxHelper::bodyOf(fixture), statements));
    return RewriteHelper::addDecorator(fixture, ClassConverter::FIXTURE_DECORATOR);
}

}  // namespace

std::string ClassConverter::pytestHookName(const std::string &hook) {
    if (hook == "setUpClass") {
        return "setup_class";
    }
    if (hook == "tearDownClass") {
        return "teardown_class";
    }
    if (hook == "setUpModule") {
        return "setup_module";
    }
    if (hook == "tearDownModule") {
        return "teardown_module";
    }
    if (hook == "setUp" || hook == "tearDown") {
        return SETUP_METHOD;
    }
    return "";
}

NodePtr ClassConverter::convert(const NodePtr &classDef) {
    std::set<std::string> residual = RewriteHelper::residualTestCaseMembers(classDef);
    if (!residual.empty()) {
        throw RewriteError("class still uses TestCase members: " +
                           join(std::vector<std::string>(residual.begin(), residual.end()), ", "));
    }

    std::set<std::string> defined = RewriteHelper::definedMethodNames(classDef);
    for (const char *name : {"setup_method", "teardown_method", "setup_class", "teardown_class"}) {
        if (defined.count(name)) {
            throw RewriteError(std::format("class already defines {}", name));
        }
    }
    for (const char *name : {"asyncSetUp", "asyncTearDown"}) {
        if (defined.count(name)) {
            throw RewriteError(std::format("{} has no pytest counterpart", name));
        }
    }

    NodePtr body = SyntaxHelper::bodyOf(classDef);
    NodePtr setUp;
    NodePtr tearDown;
    NodeList statements;
    for (const auto &statement : SyntaxHelper::statementsOf(body)) {
        if (!statement->is(SyntaxKind::FunctionDef)) {
            statements.push_back(statement);
            continue;
        }
        const std::string name = SyntaxHelper::definitionName(statement);
        if (name == "setUpClass" || name == "tearDownClass") {
            statements.push_back(classHookToPytest(statement));
        } else if (name == "setUp") {
            setUp = statement;
            statements.push_back(statement);
        } else if (name == "tearDown") {
            tearDown = statement;
            if (!setUp) {
                statements.push_back(statement);
            }
        } else {
            statements.push_back(statement);
        }
    }

    if (setUp || tearDown) {
        NodePtr anchor = setUp ? setUp : tearDown;
        auto it = std::find(statements.begin(), statements.end(), anchor);
        *it = mergedFixture(setUp, tearDown);
        if (setUp && tearDown) {
            // a tearDown defined before setUp is still in the list
            statements.erase(std::remove(statements.begin(), statements.end(), tearDown), statements.end());
        }
    }

    NodePtr result = TreeEditor::replaceChild(classDef, SyntaxHelper::bodyIndexOf(classDef),
                                              SyntaxHelper::withStatements(body, std::move(statements)));
    NodeList children = result->getChildren();
    auto bases = std::find_if(children.begin(), children.end(),
                              [](const NodePtr &child) { return child->is(SyntaxKind::ArgumentList); });
    if (bases != children.end()) {
        children.erase(bases);
    }
    return TreeEditor::withChildren(result, std::move(children));
}

}  // namespace TCE
