#include "stages/EntryPointStage.h"
#include "analysis/TestCaseApi.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/SyntaxVisitor.h"
#include "syntax/TreeEditor.h"

namespace TCE {

namespace {

class MainCallRewriter : public SyntaxRewriter {
public:
    explicit MainCallRewriter(StageContext &context) : context_(context), imports_(context.facts.getImports()) {}

protected:
    bool shouldVisitChildren(const NodePtr &node) override {
        return !node->is(SyntaxKind::SimpleStatement);
    }

    NodePtr leave(const NodePtr &original, const NodePtr &updated) override {
        if (!original->is(SyntaxKind::SimpleStatement)) {
            return updated;
        }
        NodePtr result = updated;
        for (size_t index = 0; index < original->getChildCount(); index += 2) {
            const NodePtr &small = original->getChild(index);
            if (!small->is(SyntaxKind::ExprStatement) || !small->getChild(0)->is(SyntaxKind::Call)) {
                continue;
            }
            const NodePtr &call = small->getChild(0);
            if (TestCaseApi::unittestMember(SyntaxHelper::dottedName(call->getChild(0)), imports_) == "main") {
                result = rewriteCall(result, index, !SyntaxHelper::argumentsOf(call).empty());
            }
        }
        return result;
    }

private:
    NodePtr rewriteCall(const NodePtr &statement, size_t index, bool hasArguments) {
        RewriteRequest request;
        request.family = EntryPointStage::FAMILY;
        request.range = statement->getChild(index)->getRange();
        request.requiredTier = hasArguments ? DegradationTier::Experimental : DegradationTier::Advanced;
        request.description = hasArguments ? "unittest.main(...) -> pytest.main(), arguments dropped"
                                           : "unittest.main() -> pytest.main()";

        auto rewrite = [index](const NodePtr &original) {
            const NodePtr &small = original->getChild(index);
            NodePtr call = SyntaxFactory::parseExpression("pytest.main()");
            call = TreeEditor::withLeadingTrivia(call, small->getLeadingTrivia());
            return TreeEditor::replaceChild(original, index, TreeEditor::replaceChild(small, 0, call));
        };
        return context_.controller.attempt(request, statement, rewrite).node;
    }

    StageContext &context_;
    ImportFact imports_;
};

}  // namespace

NodePtr EntryPointStage::run(const NodePtr &module, StageContext &context) {
    MainCallRewriter rewriter(context);
    return rewriter.rewrite(module);
}

}  // namespace TCE
