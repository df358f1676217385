#include "stages/SkipDecoratorStage.h"
#include "analysis/TestCaseApi.h"
#include "common/Exceptions.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/SyntaxVisitor.h"
#include "syntax/TreeEditor.h"

namespace TCE {

namespace {

using ArgKind = SyntaxHelper::CallArgument::Kind;

std::string argumentText(const NodePtr &expression) {
    return SyntaxHelper::operandText(expression, SyntaxHelper::PRECEDENCE_LAMBDA);
}

/**
 * @brief Arguments of a skip decorator call bound to (condition, reason)
 */
void bindArguments(const NodePtr &call, bool takesCondition, NodePtr &condition, NodePtr &reason) {
    size_t position = takesCondition ? 0 : 1;
    for (const auto &argument : SyntaxHelper::argumentsOf(call)) {
        if (argument.kind == ArgKind::Positional && position == 0) {
            condition = argument.value;
            ++position;
        } else if (argument.kind == ArgKind::Positional && position == 1) {
            reason = argument.value;
            ++position;
        } else if (argument.kind == ArgKind::Keyword && argument.keyword == "condition" && takesCondition) {
            condition = argument.value;
        } else if (argument.kind == ArgKind::Keyword && argument.keyword == "reason") {
            reason = argument.value;
        } else {
            throw RewriteError("unexpected decorator argument '" + argument.argument->getSourceText() + "'");
        }
    }
    if ((takesCondition && !condition) || !reason) {
        throw RewriteError("decorator is missing its condition or reason");
    }
}

std::string markFor(const std::string &member, const NodePtr &expression) {
    bool called = expression->is(SyntaxKind::Call);
    if (member == "expectedFailure") {
        if (called) {
            throw RewriteError("expectedFailure takes no arguments");
        }
        return "pytest.mark.xfail";
    }
    if (member == "skip" && !called) {
        return "pytest.mark.skip";
    }
    if (!called) {
        throw RewriteError(member + " used without arguments");
    }

    NodePtr condition;
    NodePtr reason;
    bindArguments(expression, member != "skip", condition, reason);
    if (member == "skip") {
        return "pytest.mark.skip(reason=" + argumentText(reason) + ")";
    }
    std::string test = member == "skipIf" ? argumentText(condition)
                                          : "not " + SyntaxHelper::operandText(condition, SyntaxHelper::PRECEDENCE_NOT);
    return "pytest.mark.skipif(" + test + ", reason=" + argumentText(reason) + ")";
}

class DecoratorRewriter : public SyntaxRewriter {
public:
    explicit DecoratorRewriter(StageContext &context) : context_(context), imports_(context.facts.getImports()) {}

protected:
    NodePtr leave(const NodePtr &original, const NodePtr &updated) override {
        (void)original;
        if (!updated->is(SyntaxKind::FunctionDef) && !updated->is(SyntaxKind::ClassDef)) {
            return updated;
        }
        NodePtr result = updated;
        for (size_t index = 0; index < result->getChildCount() && result->getChild(index)->is(SyntaxKind::Decorator);
             ++index) {
            const NodePtr &expression = result->getChild(index)->getChild(1);
            const NodePtr &callee = expression->is(SyntaxKind::Call) ? expression->getChild(0) : expression;
            std::string member = TestCaseApi::unittestMember(SyntaxHelper::dottedName(callee), imports_);
            if (member != "skip" && member != "skipIf" && member != "skipUnless" && member != "expectedFailure") {
                continue;
            }
            result = rewriteDecorator(result, index, member);
        }
        return result;
    }

private:
    NodePtr rewriteDecorator(const NodePtr &definition, size_t index, const std::string &member) {
        const NodePtr &decorator = definition->getChild(index);
        RewriteRequest request;
        request.family = SkipDecoratorStage::FAMILY;
        request.range = decorator->getRange();
        request.requiredTier = DegradationTier::Advanced;
        request.description = "unittest." + member + " -> pytest.mark";

        auto rewrite = [index, &member](const NodePtr &original) {
            const NodePtr &target = original->getChild(index);
            const NodePtr &expression = target->getChild(1);
            NodePtr mark = SyntaxFactory::parseExpression(markFor(member, expression));
            mark = TreeEditor::withLeadingTrivia(mark, expression->getLeadingTrivia());
            return TreeEditor::replaceChild(original, index, TreeEditor::replaceChild(target, 1, mark));
        };
        return context_.controller.attempt(request, definition, rewrite).node;
    }

    StageContext &context_;
    ImportFact imports_;
};

}  // namespace

NodePtr SkipDecoratorStage::run(const NodePtr &module, StageContext &context) {
    DecoratorRewriter rewriter(context);
    return rewriter.rewrite(module);
}

}  // namespace TCE
