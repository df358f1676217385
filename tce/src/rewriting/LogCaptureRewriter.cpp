#include "rewriting/LogCaptureRewriter.h"
#include "common/Exceptions.h"
#include "rewriting/RewriteHelper.h"
#include "rewriting/TextualRepair.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/TreeEditor.h"
#include <algorithm>

namespace TCE {

namespace {

using ArgKind = SyntaxHelper::CallArgument::Kind;

bool isNoneLiteral(const NodePtr &expression) {
    return expression->is(SyntaxKind::Name) && expression->getChild(0)->isToken("None");
}

std::string atLevelCall(const NodePtr &call) {
    NodePtr logger;
    NodePtr level;
    size_t position = 0;
    for (const auto &argument : SyntaxHelper::argumentsOf(call)) {
        if (argument.kind == ArgKind::Positional && position == 0) {
            logger = argument.value;
            ++position;
        } else if (argument.kind == ArgKind::Positional && position == 1) {
            level = argument.value;
            ++position;
        } else if (argument.kind == ArgKind::Keyword && argument.keyword == "logger") {
            logger = argument.value;
        } else if (argument.kind == ArgKind::Keyword && argument.keyword == "level") {
            level = argument.value;
        } else {
            throw RewriteError("unsupported argument to " + SyntaxHelper::dottedName(call->getChild(0)));
        }
    }
    if (logger && isNoneLiteral(logger)) {
        logger = nullptr;
    }
    if (level && isNoneLiteral(level)) {
        level = nullptr;
    }
    if (logger && !logger->is(SyntaxKind::String)) {
        throw RewriteError("logger '" + logger->getSourceText() + "' is not a string literal");
    }

    std::string text = "caplog.at_level(";
    text += level ? SyntaxHelper::operandText(level, SyntaxHelper::PRECEDENCE_LAMBDA) : "\"INFO\"";
    if (logger) {
        text += ", logger=" + logger->getSourceText();
    }
    return text + ")";
}

NodePtr nodeAtPath(const NodePtr &root, const NodePath &path) {
    NodePtr node = root;
    for (size_t index : path) {
        node = node->getChild(index);
    }
    return node;
}

// assertLogs output entries read "LEVEL:logger:message"
constexpr const char *OUTPUT_LINES = "[f\"{r.levelname}:{r.name}:{r.getMessage()}\" for r in caplog.records]";

// Adds the record check right after the with-block
NodePtr appendRecordsCheck(const NodePtr &function, const NodePtr &with, const std::string &check) {
    auto path = TreeEditor::findPath(function, with.get());
    if (!path || path->empty()) {
        throw RewriteError("with-block not found");
    }
    NodePath parentPath(path->begin(), path->end() - 1);
    NodePtr block = nodeAtPath(function, parentPath);
    if (!block->is(SyntaxKind::Block)) {
        throw RewriteError("with-block is not inside a statement block");
    }
    NodeList statements = SyntaxHelper::statementsOf(block);
    auto it = std::find(statements.begin(), statements.end(), with);
    if (it == statements.end()) {
        throw RewriteError("with-block not found in its block");
    }
    statements.insert(it + 1, SyntaxFactory::parseStatement(check, TreeEditor::indentationOf(with)));
    return TreeEditor::replaceAtPath(function, parentPath, SyntaxHelper::withStatements(block, std::move(statements)));
}

}  // namespace

bool LogCaptureRewriter::handles(const std::string &method) {
    return method == "assertLogs" || method == "assertNoLogs";
}

AttemptResult LogCaptureRewriter::rewriteWith(const NodePtr &function, const ExceptionContextFact &fact,
                                              const std::optional<SourcePosition> &until,
                                              DegradationController &controller) {
    bool noLogs = fact.method == "assertNoLogs";
    NodePtr located = RewriteHelper::findNodeAt(function, SyntaxKind::With, fact.position);
    RewriteRequest request;
    request.family = FAMILY;
    request.range = located ? located->getRange() : SourceRange{fact.position, fact.position};
    request.requiredTier = noLogs ? DegradationTier::Experimental : DegradationTier::Advanced;
    request.description = fact.method + " -> caplog.at_level";

    auto rewrite = [&fact, &until, noLogs](const NodePtr &original) {
        if (fact.itemCount > 1) {
            throw RewriteError("with-statement has several context managers");
        }
        if (fact.nestingDepth > 0) {
            throw RewriteError("nested inside another assertion context");
        }
        NodePtr with = RewriteHelper::findNodeAt(original, SyntaxKind::With, fact.position);
        if (!with) {
            throw RewriteError("with-block not found");
        }
        NodePtr item = with->findChild(SyntaxKind::WithItem);
        const NodePtr &call = item->getChild(0);

        NodePtr replacement = SyntaxFactory::parseExpression(atLevelCall(call));
        replacement = TreeEditor::withLeadingTrivia(replacement, call->getLeadingTrivia());
        NodePtr updatedWith = TreeEditor::replaceNode(with, item.get(), TreeEditor::withChildren(item, {replacement}));
        NodePtr result = TreeEditor::replaceNode(original, with.get(), updatedWith);

        result = appendRecordsCheck(result, updatedWith,
                                    noLogs ? "assert not caplog.records\n" : "assert caplog.records\n");
        if (!fact.alias.empty()) {
            RewriteHelper::AliasMapping mapping{fact.alias, {{"output", OUTPUT_LINES}, {"records", "caplog.records"}}};
            result = RewriteHelper::rewriteAliasUses(result, mapping, SyntaxHelper::bodyOf(with)->getRange().start,
                                                     until);
        }

        auto parameters = SyntaxHelper::parameterNames(result);
        if (std::find(parameters.begin(), parameters.end(), FIXTURE) == parameters.end()) {
            result = RewriteHelper::addParameter(result, FIXTURE);
        }
        return result;
    };

    return controller.attempt(request, function, rewrite, TextualRepair::relocatingComments(rewrite));
}

}  // namespace TCE
