#include "analysis/AnalysisPasses.h"
#include "analysis/ScopedWalker.h"
#include "analysis/TestCaseApi.h"
#include "common/Logger.h"
#include "syntax/SyntaxHelper.h"

namespace TCE {

namespace {

// Attributes assigned through `receiver.<attr> = ...` anywhere below node
class AttributeStoreCollector : public SyntaxWalker {
public:
    explicit AttributeStoreCollector(std::string receiver) : receiver_(std::move(receiver)) {}

    std::set<std::string> attributes;
    bool callsSuper = false;

protected:
    bool enter(const NodePtr &node) override {
        if (node->is(SyntaxKind::Assign)) {
            const NodeList &children = node->getChildren();
            for (size_t i = 0; i + 1 < children.size(); i += 2) {
                collectTarget(children[i]);
            }
        } else if (node->is(SyntaxKind::AugAssign) || node->is(SyntaxKind::AnnAssign)) {
            collectTarget(node->getChild(0));
        } else if (node->is(SyntaxKind::Call)) {
            const NodePtr &callee = node->getChild(0);
            if (callee->is(SyntaxKind::Attribute) && callee->getChild(0)->is(SyntaxKind::Call) &&
                SyntaxHelper::dottedName(callee->getChild(0)->getChild(0)) == "super") {
                callsSuper = true;
            }
        }
        return !node->is(SyntaxKind::FunctionDef) && !node->is(SyntaxKind::ClassDef) &&
               !node->is(SyntaxKind::Lambda);
    }

private:
    void collectTarget(const NodePtr &target) {
        if (target->is(SyntaxKind::Attribute) && SyntaxHelper::dottedName(target->getChild(0)) == receiver_) {
            attributes.insert(target->getChild(2)->getToken().text);
            return;
        }
        if (target->is(SyntaxKind::Tuple) || target->is(SyntaxKind::List) || target->is(SyntaxKind::Paren)) {
            for (const auto &element : target->getNodeChildren()) {
                collectTarget(element);
            }
        }
    }

    std::string receiver_;
};

class HookCollector : public ScopedWalker {
public:
    explicit HookCollector(FactSet &facts) : facts_(facts) {}

    size_t count = 0;

protected:
    bool onEnter(const NodePtr &node) override {
        if (node->is(SyntaxKind::FunctionDef) && !inFunction()) {
            collectHook(node);
        }
        return isStatementKind(node->getKind()) || node->is(SyntaxKind::Module) || node->is(SyntaxKind::Block) ||
               node->is(SyntaxKind::ElifClause) || node->is(SyntaxKind::ElseClause) ||
               node->is(SyntaxKind::ExceptClause) || node->is(SyntaxKind::FinallyClause);
    }

private:
    void collectHook(const NodePtr &node) {
        std::string name = SyntaxHelper::definitionName(node);
        bool classScope = inClassBody();
        bool matches = classScope ? TestCaseApi::isClassHookName(name)
                                  : (TestCaseApi::isModuleHookName(name) && classDepth() == 0);
        if (!matches) {
            return;
        }

        std::vector<std::string> parameters = SyntaxHelper::parameterNames(node);
        std::string receiver = parameters.empty() ? "self" : parameters.front();
        AttributeStoreCollector stores(receiver);
        stores.walk(SyntaxHelper::bodyOf(node));

        HookFact fact;
        fact.name = name;
        fact.scope = currentClass();
        fact.isClassScope = classScope;
        fact.callsSuper = stores.callsSuper;
        fact.assignedAttributes = std::move(stores.attributes);
        fact.range = node->getRange();

        std::string key = FactSet::hookKey(fact.scope, name);
        if (facts_.has(key)) {
            facts_.addUnsupported("hooks", "hook " + fact.scope + "." + name + " is defined more than once");
            return;
        }
        facts_.add(key, std::move(fact));
        ++count;
    }

    FactSet &facts_;
};

}  // namespace

void HookPass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    (void)config;
    HookCollector collector(facts);
    collector.walk(module);
    LOG_DEBUG("HookPass: {} setup/teardown hooks", collector.count);
}

}  // namespace TCE
