#include "analysis/AnalysisPasses.h"
#include "analysis/ScopedWalker.h"
#include "analysis/TestCaseApi.h"
#include "common/Logger.h"
#include "syntax/SyntaxHelper.h"
#include <format>

namespace TCE {

namespace {

class ContextCollector : public ScopedWalker {
public:
    explicit ContextCollector(FactSet &facts) : facts_(facts) {}

    size_t count = 0;

protected:
    bool onEnter(const NodePtr &node) override {
        if (node->is(SyntaxKind::With) && inFunction()) {
            if (collect(node)) {
                depthStack_.push_back(node.get());
            }
        }
        return isStatementKind(node->getKind()) || node->is(SyntaxKind::Module) || node->is(SyntaxKind::Block) ||
               node->is(SyntaxKind::ElifClause) || node->is(SyntaxKind::ElseClause) ||
               node->is(SyntaxKind::ExceptClause) || node->is(SyntaxKind::FinallyClause);
    }

    void onLeave(const NodePtr &node) override {
        if (!depthStack_.empty() && depthStack_.back() == node.get()) {
            depthStack_.pop_back();
        }
    }

private:
    bool collect(const NodePtr &with) {
        NodeList items;
        for (const auto &child : with->getChildren()) {
            if (child->is(SyntaxKind::WithItem)) {
                items.push_back(child);
            }
        }

        for (const auto &item : items) {
            const NodePtr &expression = item->getChild(0);
            auto method = SyntaxHelper::selfMethodName(expression);
            if (!method || !TestCaseApi::isContextMethod(*method)) {
                continue;
            }

            ExceptionContextFact fact;
            fact.position = with->getRange().start;
            fact.function = currentFunction();
            fact.method = *method;
            fact.nestingDepth = static_cast<int>(depthStack_.size());
            fact.itemCount = items.size();
            for (const auto &argument : SyntaxHelper::argumentsOf(expression)) {
                if (argument.kind == SyntaxHelper::CallArgument::Kind::Keyword && argument.keyword == "msg") {
                    fact.hasMsgKeyword = true;
                }
            }
            if (item->getChildCount() == 3) {
                const NodePtr &target = item->getChild(2);
                fact.aliasIsAttribute = target->is(SyntaxKind::Attribute);
                fact.alias = SyntaxHelper::dottedName(target);
                if (fact.alias.empty()) {
                    facts_.addUnsupported("exception-contexts", std::format("context target '{}' at {}",
                                                                            target->getSourceText(),
                                                                            fact.position.toString()));
                }
            }

            LOG_TRACE("ExceptionContextPass: {} at {} (alias '{}', depth {})", fact.method, fact.position.toString(),
                      fact.alias, fact.nestingDepth);
            facts_.add(FactSet::contextKey(fact.position), std::move(fact));
            ++count;
            return true;
        }
        return false;
    }

    FactSet &facts_;
    std::vector<const SyntaxNode *> depthStack_;
};

}  // namespace

void ExceptionContextPass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    (void)config;
    ContextCollector collector(facts);
    collector.walk(module);
    LOG_DEBUG("ExceptionContextPass: {} context-manager assertions", collector.count);
}

}  // namespace TCE
