#include "stages/ImportStage.h"
#include "common/Exceptions.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/TreeEditor.h"
#include <algorithm>

namespace TCE {

namespace {

bool isImportStatement(const NodePtr &statement) {
    if (!statement->is(SyntaxKind::SimpleStatement)) {
        return false;
    }
    for (size_t i = 0; i + 1 < statement->getChildCount(); i += 2) {
        const NodePtr &small = statement->getChild(i);
        if (!small->is(SyntaxKind::Import) && !small->is(SyntaxKind::ImportFrom)) {
            return false;
        }
    }
    return true;
}

bool isDocstring(const NodePtr &statement) {
    NodePtr expression = SyntaxHelper::expressionOfStatement(statement);
    return expression && expression->is(SyntaxKind::String);
}

std::string boundName(const NodePtr &alias, const std::string &defaultName) {
    size_t asIndex = alias->findTokenIndex("as");
    if (asIndex != std::string::npos && asIndex + 1 < alias->getChildCount()) {
        return alias->getChild(asIndex + 1)->getToken().text;
    }
    return defaultName;
}

bool isFromUnittest(const NodePtr &importFrom) {
    const NodePtr &module = importFrom->getChild(1);
    return module->is(SyntaxKind::DottedName) && module->getSourceText() == "unittest";
}

// Aliases of an import that bind unittest names nothing references
std::vector<NodePtr> unusedAliases(const NodePtr &small, const std::set<std::string> &referenced) {
    std::vector<NodePtr> unused;
    bool fromImport = small->is(SyntaxKind::ImportFrom);
    if (fromImport && !isFromUnittest(small)) {
        return unused;
    }
    for (const auto &alias : small->getNodeChildren()) {
        if (!alias->is(SyntaxKind::ImportAlias)) {
            continue;
        }
        std::string imported = alias->getChild(0)->getSourceText();
        if (fromImport ? imported == "mock" : imported != "unittest") {
            continue;
        }
        if (!referenced.count(boundName(alias, imported))) {
            unused.push_back(alias);
        }
    }
    return unused;
}

size_t aliasCount(const NodePtr &small) {
    const NodeList children = small->getNodeChildren();
    return std::count_if(children.begin(), children.end(),
                         [](const NodePtr &child) { return child->is(SyntaxKind::ImportAlias); });
}

// Import without the given aliases and the commas separating them
NodePtr withoutAliases(const NodePtr &small, const std::vector<NodePtr> &removed) {
    NodeList children;
    const NodeList &original = small->getChildren();
    for (size_t i = 0; i < original.size(); ++i) {
        if (std::find(removed.begin(), removed.end(), original[i]) == removed.end()) {
            children.push_back(original[i]);
            continue;
        }
        if (i + 1 < original.size() && original[i + 1]->isToken(",")) {
            ++i;
        } else if (!children.empty() && children.back()->isToken(",")) {
            children.pop_back();
        }
    }
    // the first remaining alias follows the keyword directly
    for (auto &child : children) {
        if (child->is(SyntaxKind::ImportAlias)) {
            if (child->getLeadingTrivia().empty()) {
                child = TreeEditor::withLeadingTrivia(child, " ");
            }
            break;
        }
    }
    return TreeEditor::withChildren(small, std::move(children));
}

std::string withoutLeadingBlankLines(const std::string &trivia) {
    size_t content = trivia.find_first_not_of(" \t\r\n");
    size_t lineBreak = trivia.find_last_of("\r\n", content);
    return lineBreak == std::string::npos ? trivia : trivia.substr(lineBreak + 1);
}

}  // namespace

NodePtr ImportStage::run(const NodePtr &module, StageContext &context) {
    std::set<std::string> referenced;
    SyntaxHelper::collectNames(module, referenced);

    NodePtr result = removeUnused(module, referenced, context);
    ImportFact imports = context.facts.getImports();
    if (referenced.count("pytest") && !imports.importsPytest) {
        result = addImport(result, "pytest", context);
    }
    if (referenced.count("re") && !imports.importsRe) {
        result = addImport(result, "re", context);
    }
    return result;
}

NodePtr ImportStage::removeUnused(const NodePtr &module, const std::set<std::string> &referenced,
                                  StageContext &context) {
    NodePtr result = module;
    for (const auto &statement : module->getNodeChildren()) {
        if (!statement->is(SyntaxKind::SimpleStatement) || statement->getChildCount() != 2) {
            continue;
        }
        const NodePtr &small = statement->getChild(0);
        if (!small->is(SyntaxKind::Import) && !small->is(SyntaxKind::ImportFrom)) {
            continue;
        }
        std::vector<NodePtr> unused = unusedAliases(small, referenced);
        if (unused.empty()) {
            continue;
        }

        RewriteRequest request;
        request.family = FAMILY;
        request.range = statement->getRange();
        request.requiredTier = DegradationTier::Essential;
        request.description = "unused import removed: " + small->getSourceText();

        auto rewrite = [&statement, &small, &unused](const NodePtr &original) {
            NodeList children = original->getChildren();
            auto it = std::find(children.begin(), children.end(), statement);
            if (it == children.end()) {
                throw RewriteError("import statement not found");
            }
            if (unused.size() < aliasCount(small)) {
                *it = TreeEditor::replaceChild(statement, 0, withoutAliases(small, unused));
                return TreeEditor::withChildren(original, std::move(children));
            }
            // Comment lines above the import move to the next statement
            bool first = it == children.begin();
            std::string leadingLines = TreeEditor::leadingLinesOf(statement);
            it = children.erase(it);
            std::string trivia = (*it)->getLeadingTrivia();
            *it = TreeEditor::withLeadingTrivia(*it, leadingLines + (first ? withoutLeadingBlankLines(trivia) : trivia));
            return TreeEditor::withChildren(original, std::move(children));
        };
        result = context.controller.attempt(request, result, rewrite).node;
    }
    return result;
}

NodePtr ImportStage::addImport(const NodePtr &module, const std::string &name, StageContext &context) {
    auto insertionIndex = [](const NodeList &children) {
        size_t index = 0;
        if (!children.empty() && isDocstring(children[0])) {
            ++index;
        }
        while (index < children.size() && isImportStatement(children[index])) {
            ++index;
        }
        return index;
    };

    const NodeList &current = module->getChildren();
    size_t at = insertionIndex(current);
    RewriteRequest request;
    request.family = FAMILY;
    if (at < current.size()) {
        request.range = SourceRange{current[at]->getRange().start, current[at]->getRange().start};
    }
    request.requiredTier = DegradationTier::Essential;
    request.description = "import " + name + " added";

    auto rewrite = [&name, &insertionIndex](const NodePtr &original) {
        NodeList children = original->getChildren();
        size_t index = insertionIndex(children);
        NodePtr statement = SyntaxFactory::parseStatement("import " + name + "\n", "");
        if (index == 0) {
            // file header comments stay on top
            statement = TreeEditor::withLeadingTrivia(statement, children[0]->getLeadingTrivia());
            bool definition = children[0]->is(SyntaxKind::ClassDef) || children[0]->is(SyntaxKind::FunctionDef);
            children[0] = TreeEditor::withLeadingTrivia(children[0], definition ? "\n\n" : "\n");
        } else if (!isImportStatement(children[index - 1])) {
            statement = TreeEditor::withLeadingTrivia(statement, "\n");
        }
        children.insert(children.begin() + index, statement);
        return TreeEditor::withChildren(original, std::move(children));
    };
    return context.controller.attempt(request, module, rewrite).node;
}

}  // namespace TCE
