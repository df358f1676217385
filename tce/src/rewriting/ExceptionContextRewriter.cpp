#include "rewriting/ExceptionContextRewriter.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/StringUtils.h"
#include "rewriting/RewriteHelper.h"
#include "rewriting/TextualRepair.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/TreeEditor.h"

namespace TCE {

namespace {

using ArgKind = SyntaxHelper::CallArgument::Kind;

bool isRegexVariant(const std::string &method) {
    return method == "assertRaisesRegex" || method == "assertRaisesRegexp" || method == "assertWarnsRegex";
}

bool isWarns(const std::string &method) {
    return startsWith(method, "assertWarns");
}

std::string pytestFunction(const std::string &method) {
    return isWarns(method) ? "pytest.warns" : "pytest.raises";
}

std::string argumentText(const NodePtr &expression) {
    return SyntaxHelper::operandText(expression, SyntaxHelper::PRECEDENCE_LAMBDA);
}

// "E" or "E, match=rx" for the context-manager form
std::string contextArguments(const NodePtr &call, const std::string &method) {
    NodePtr expected;
    NodePtr regex;
    size_t position = 0;
    for (const auto &argument : SyntaxHelper::argumentsOf(call)) {
        if (argument.kind == ArgKind::Positional) {
            if (position == 0) {
                expected = argument.value;
            } else if (position == 1 && isRegexVariant(method)) {
                regex = argument.value;
            } else {
                throw RewriteError("unexpected positional argument in context form");
            }
            ++position;
        } else if (argument.kind == ArgKind::Keyword) {
            if (argument.keyword == "expected_exception" || argument.keyword == "expected_warning") {
                expected = argument.value;
            } else if (argument.keyword == "expected_regex" && isRegexVariant(method)) {
                regex = argument.value;
            } else {
                throw RewriteError("keyword '" + argument.keyword + "' has no pytest counterpart");
            }
        } else {
            throw RewriteError("star arguments in context form");
        }
    }
    if (!expected || (isRegexVariant(method) && !regex)) {
        throw RewriteError("missing expected type or pattern");
    }
    return argumentText(expected) + (regex ? ", match=" + argumentText(regex) : "");
}

RewriteHelper::AliasMapping aliasMapping(const ExceptionContextFact &fact) {
    RewriteHelper::AliasMapping mapping;
    mapping.alias = fact.alias;
    if (isWarns(fact.method)) {
        mapping.attributes["warning"] = fact.alias + "[0].message";
        mapping.attributes["warnings"] = fact.alias + ".list";
        mapping.attributes["filename"] = fact.alias + "[0].filename";
        mapping.attributes["lineno"] = fact.alias + "[0].lineno";
    } else {
        mapping.attributes["exception"] = fact.alias + ".value";
    }
    return mapping;
}

}  // namespace

bool ExceptionContextRewriter::handles(const std::string &method) {
    return startsWith(method, "assertRaises") || startsWith(method, "assertWarns");
}

NodePtr ExceptionContextRewriter::rewriteWith(const NodePtr &function, const ExceptionContextFact &fact,
                                              const std::optional<SourcePosition> &until) {
    NodePtr located = RewriteHelper::findNodeAt(function, SyntaxKind::With, fact.position);
    RewriteRequest request;
    request.family = FAMILY;
    request.range = located ? located->getRange() : SourceRange{fact.position, fact.position};
    request.requiredTier = DegradationTier::Advanced;
    request.description = fact.method + " -> " + pytestFunction(fact.method);

    auto rewrite = [&fact, &until](const NodePtr &original) {
        if (fact.itemCount > 1) {
            throw RewriteError("with-statement has several context managers");
        }
        if (fact.nestingDepth > 0) {
            throw RewriteError("nested inside another assertion context");
        }
        if (fact.hasMsgKeyword) {
            throw RewriteError("msg= has no pytest counterpart");
        }
        if (fact.aliasIsAttribute) {
            throw RewriteError("context bound to attribute '" + fact.alias + "'");
        }
        NodePtr with = RewriteHelper::findNodeAt(original, SyntaxKind::With, fact.position);
        if (!with) {
            throw RewriteError("with-block not found");
        }
        NodePtr item = with->findChild(SyntaxKind::WithItem);
        const NodePtr &call = item->getChild(0);

        NodePtr replacement =
            SyntaxFactory::parseExpression(pytestFunction(fact.method) + "(" + contextArguments(call, fact.method) + ")");
        replacement = TreeEditor::withLeadingTrivia(replacement, call->getLeadingTrivia());
        NodePtr updatedWith = TreeEditor::replaceNode(with, item.get(), TreeEditor::replaceChild(item, 0, replacement));
        NodePtr result = TreeEditor::replaceNode(original, with.get(), updatedWith);

        if (!fact.alias.empty()) {
            SourcePosition bodyStart = SyntaxHelper::bodyOf(with)->getRange().start;
            result = RewriteHelper::rewriteAliasUses(result, aliasMapping(fact), bodyStart, until);
        }
        return result;
    };

    return context_.controller.attempt(request, function, rewrite, TextualRepair::relocatingComments(rewrite)).node;
}

NodePtr ExceptionContextRewriter::rewriteCallable(const NodePtr &statement, const std::string &method) {
    RewriteRequest request;
    request.family = FAMILY;
    request.range = statement->getChild(0)->getRange();
    request.requiredTier = isRegexVariant(method) ? DegradationTier::Experimental : DegradationTier::Advanced;
    request.description = method + "(callable) -> " + pytestFunction(method);

    auto rewrite = [&method](const NodePtr &original) {
        NodePtr call = SyntaxHelper::expressionOfStatement(original);
        if (!call || !call->is(SyntaxKind::Call)) {
            throw RewriteError("not a call statement");
        }
        auto arguments = SyntaxHelper::argumentsOf(call);
        size_t leading = isRegexVariant(method) ? 3 : 2;
        if (arguments.size() < leading) {
            throw RewriteError("context form used without a with-statement");
        }
        for (size_t i = 0; i < leading; ++i) {
            if (arguments[i].kind != ArgKind::Positional) {
                throw RewriteError("expected type and callable must be positional");
            }
        }

        if (!isRegexVariant(method)) {
            const NodePtr &callee = call->getChild(0);
            NodePtr replacement = SyntaxFactory::parseExpression(pytestFunction(method));
            replacement = TreeEditor::withLeadingTrivia(replacement, callee->getLeadingTrivia());
            return TreeEditor::replaceNode(original, call.get(), TreeEditor::replaceChild(call, 0, replacement));
        }

        // pytest.raises(E, f, match=...) is not supported; wrap the call instead
        std::vector<std::string> rest;
        for (size_t i = leading; i < arguments.size(); ++i) {
            rest.push_back(arguments[i].argument->getSourceText());
        }
        std::string text = "with " + pytestFunction(method) + "(" + argumentText(arguments[0].value) +
                           ", match=" + argumentText(arguments[1].value) + "):\n" + Constants::DEFAULT_INDENT +
                           SyntaxHelper::operandText(arguments[2].value, SyntaxHelper::PRECEDENCE_ATOM) + "(" +
                           join(rest, ", ") + ")\n";
        NodePtr wrapped = SyntaxFactory::parseStatement(text, TreeEditor::indentationOf(original));
        return TreeEditor::withLeadingTrivia(wrapped, original->getLeadingTrivia());
    };

    return context_.controller.attempt(request, statement, rewrite, TextualRepair::relocatingComments(rewrite)).node;
}

}  // namespace TCE
