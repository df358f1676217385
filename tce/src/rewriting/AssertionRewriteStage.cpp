#include "rewriting/AssertionRewriteStage.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "rewriting/AssertionTable.h"
#include "rewriting/ExceptionContextRewriter.h"
#include "rewriting/LogCaptureRewriter.h"
#include "rewriting/LoopParametrizeRewriter.h"
#include "rewriting/RewriteHelper.h"
#include "rewriting/TextualRepair.h"
#include "stages/ClassConverter.h"
#include "syntax/SyntaxFactory.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/TreeEditor.h"
#include <algorithm>

namespace TCE {

namespace {

constexpr const char *KEEPS_BASE = "class keeps unittest.TestCase base";

using AddedParameters = std::vector<std::pair<std::string, std::vector<std::string>>>;

bool recursesInto(const NodePtr &node) {
    if (node->is(SyntaxKind::ClassDef)) {
        return false;
    }
    return node->is(SyntaxKind::Block) || node->is(SyntaxKind::ElifClause) || node->is(SyntaxKind::ElseClause) ||
           node->is(SyntaxKind::ExceptClause) || node->is(SyntaxKind::FinallyClause) ||
           isCompoundStatementKind(node->getKind());
}

std::string pytestForm(const AssertionShape &shape) {
    switch (shape.kind) {
    case AssertionShape::Kind::Fail:
        return "pytest.fail";
    case AssertionShape::Kind::Skip:
        return "pytest.skip";
    default:
        return "assert";
    }
}

// Start of the next context in the same function rebinding the same alias
std::optional<SourcePosition> regionEnd(const std::vector<const ExceptionContextFact *> &contexts, size_t index) {
    const ExceptionContextFact &current = *contexts[index];
    if (current.alias.empty()) {
        return std::nullopt;
    }
    for (size_t next = index + 1; next < contexts.size(); ++next) {
        if (contexts[next]->alias == current.alias) {
            return contexts[next]->position;
        }
    }
    return std::nullopt;
}

/**
 * @brief Rewrites of one unit, module → class → function → statement
 */
class UnitRewriter {
public:
    UnitRewriter(const NodePtr &module, StageContext &context)
        : module_(module), context_(context), exceptions_(context), loops_(module, context.config) {}

    NodePtr run() {
        NodeList children = module_->getChildren();
        for (auto &child : children) {
            if (child->is(SyntaxKind::FunctionDef)) {
                child = rewriteModuleFunction(child);
            } else if (child->is(SyntaxKind::ClassDef)) {
                child = rewriteClass(child, SyntaxHelper::definitionName(child));
            }
        }
        return TreeEditor::withChildren(module_, std::move(children));
    }

private:
    NodePtr rewriteModuleFunction(const NodePtr &function) {
        const std::string name = SyntaxHelper::definitionName(function);
        NodePtr result = rewriteSignatureKeeping(function, name, {});
        const FunctionFact *fact = context_.facts.findFunction(name);
        if (!fact || !fact->isTest) {
            return result;
        }
        std::vector<std::string> added;
        result = rewriteSignatureChanging(result, *fact, context_.controller, added);
        for (const auto &parameter : added) {
            context_.fixtures.addScopedParameter(MODULE_SCOPE, ScopeKind::Module, name, parameter);
        }
        return result;
    }

    NodePtr rewriteClass(const NodePtr &classDef, const std::string &qualifiedName) {
        const std::set<std::string> methods = RewriteHelper::definedMethodNames(classDef);
        NodePtr body = SyntaxHelper::bodyOf(classDef);
        NodeList statements = SyntaxHelper::statementsOf(body);
        for (auto &statement : statements) {
            if (statement->is(SyntaxKind::FunctionDef)) {
                statement = rewriteSignatureKeeping(
                    statement, qualifiedName + "." + SyntaxHelper::definitionName(statement), methods);
            } else if (statement->is(SyntaxKind::ClassDef)) {
                statement = rewriteClass(statement, qualifiedName + "." + SyntaxHelper::definitionName(statement));
            }
        }
        NodePtr phaseOne = TreeEditor::replaceChild(classDef, SyntaxHelper::bodyIndexOf(classDef),
                                                    SyntaxHelper::withStatements(body, statements));

        const ClassFact *cls = context_.facts.findClass(qualifiedName);
        if (!cls || !cls->derivesFromTestCase) {
            AddedParameters added;
            NodePtr result = rewriteTests(phaseOne, qualifiedName, context_.controller, added);
            recordParameters(qualifiedName, added);
            return result;
        }
        if (!RewriteHelper::isConversionCandidate(*cls, context_)) {
            skipTests(phaseOne, qualifiedName, KEEPS_BASE);
            return phaseOne;
        }

        ChangeLedger tentative;
        DegradationController controller = context_.controller.fork(tentative);
        AddedParameters added;
        NodePtr converted = rewriteTests(phaseOne, qualifiedName, controller, added);
        if (tentative.count(LedgerOutcome::Applied) > 0) {
            try {
                ClassConverter::convert(converted);
            } catch (const RewriteError &e) {
                LOG_DEBUG("AssertionRewriteStage: class {} will not convert, dropping parameter rewrites: {}",
                          qualifiedName, e.what());
                context_.controller.reject(tentative, e.what());
                return phaseOne;
            }
        }
        context_.controller.absorb(tentative);
        recordParameters(qualifiedName, added);
        return converted;
    }

    void recordParameters(const std::string &scope, const AddedParameters &added) {
        for (const auto &[function, parameters] : added) {
            for (const auto &parameter : parameters) {
                context_.fixtures.addScopedParameter(scope, ScopeKind::Class, function, parameter);
            }
        }
    }

    // Test methods of a class through rewriteSignatureChanging
    NodePtr rewriteTests(const NodePtr &classDef, const std::string &qualifiedName, DegradationController &controller,
                         AddedParameters &added) {
        NodePtr body = SyntaxHelper::bodyOf(classDef);
        NodeList statements = SyntaxHelper::statementsOf(body);
        for (auto &statement : statements) {
            if (!statement->is(SyntaxKind::FunctionDef)) {
                continue;
            }
            const std::string name = SyntaxHelper::definitionName(statement);
            const FunctionFact *fact = context_.facts.findFunction(qualifiedName + "." + name);
            if (!fact || !fact->isTest) {
                continue;
            }
            std::vector<std::string> parameters;
            statement = rewriteSignatureChanging(statement, *fact, controller, parameters);
            if (!parameters.empty()) {
                added.emplace_back(name, std::move(parameters));
            }
        }
        return TreeEditor::replaceChild(classDef, SyntaxHelper::bodyIndexOf(classDef),
                                        SyntaxHelper::withStatements(body, statements));
    }

    void skipTests(const NodePtr &classDef, const std::string &qualifiedName, const std::string &reason) {
        for (const auto &statement : SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(classDef))) {
            if (!statement->is(SyntaxKind::FunctionDef)) {
                continue;
            }
            const FunctionFact *fact =
                context_.facts.findFunction(qualifiedName + "." + SyntaxHelper::definitionName(statement));
            if (!fact || !fact->isTest) {
                continue;
            }
            for (const auto *logContext : logContextsOf(*fact)) {
                context_.controller.skip(siteRequest(statement, SyntaxKind::With, logContext->position,
                                                     LogCaptureRewriter::FAMILY, logContext->method + " -> caplog"),
                                         reason);
            }
            for (const auto *loop : loopsOf(*fact)) {
                NodePtr node = RewriteHelper::findNodeAt(statement, SyntaxKind::For, loop->position);
                auto ambiguity = node ? loops_.ambiguity(statement, node, *loop) : std::nullopt;
                context_.controller.skip(siteRequest(statement, SyntaxKind::For, loop->position,
                                                     LoopParametrizeRewriter::FAMILY, "loop -> pytest.mark.parametrize"),
                                         ambiguity ? *ambiguity : reason);
            }
        }
    }

    RewriteRequest siteRequest(const NodePtr &function, SyntaxKind kind, const SourcePosition &position,
                               const std::string &family, const std::string &description) const {
        NodePtr node = RewriteHelper::findNodeAt(function, kind, position);
        RewriteRequest request;
        request.family = family;
        request.range = node ? node->getRange() : SourceRange{position, position};
        request.requiredTier = DegradationTier::Advanced;
        request.description = description;
        return request;
    }

    std::vector<const ExceptionContextFact *> contextsOf(const std::string &qualifiedName) const {
        std::vector<const ExceptionContextFact *> contexts;
        for (const auto *fact : context_.facts.getContexts()) {
            if (fact->function == qualifiedName) {
                contexts.push_back(fact);
            }
        }
        return contexts;
    }

    std::vector<const ExceptionContextFact *> logContextsOf(const FunctionFact &function) const {
        std::vector<const ExceptionContextFact *> contexts;
        for (const auto *fact : contextsOf(function.qualifiedName())) {
            if (LogCaptureRewriter::handles(fact->method)) {
                contexts.push_back(fact);
            }
        }
        return contexts;
    }

    std::vector<const LoopFact *> loopsOf(const FunctionFact &function) const {
        std::vector<const LoopFact *> loops;
        if (!context_.config.isLoopParametrizeEnabled()) {
            return loops;
        }
        for (const auto *fact : context_.facts.getLoops()) {
            if (fact->function == function.qualifiedName() && LoopParametrizeRewriter::matches(*fact)) {
                loops.push_back(fact);
            }
        }
        return loops;
    }

    /**
     * @brief Assertion statements and raises/warns contexts of one function
     */
    NodePtr rewriteSignatureKeeping(const NodePtr &function, const std::string &qualifiedName,
                                    const std::set<std::string> &classMethods) {
        NodePtr result = function;
        std::vector<const ExceptionContextFact *> contexts = contextsOf(qualifiedName);
        for (size_t i = 0; i < contexts.size(); ++i) {
            if (ExceptionContextRewriter::handles(contexts[i]->method) && !classMethods.count(contexts[i]->method)) {
                result = exceptions_.rewriteWith(result, *contexts[i], regionEnd(contexts, i));
            }
        }
        return rewriteStatements(result, classMethods);
    }

    /**
     * @brief Log-capture contexts and loop lowering of one test function
     * @param added Receives the parameters the function gained
     */
    NodePtr rewriteSignatureChanging(const NodePtr &function, const FunctionFact &fact,
                                     DegradationController &controller, std::vector<std::string> &added) {
        NodePtr result = function;
        std::vector<const ExceptionContextFact *> contexts = contextsOf(fact.qualifiedName());
        for (size_t i = 0; i < contexts.size(); ++i) {
            if (!LogCaptureRewriter::handles(contexts[i]->method)) {
                continue;
            }
            AttemptResult attempt = LogCaptureRewriter::rewriteWith(result, *contexts[i], regionEnd(contexts, i),
                                                                    controller);
            if (!attempt.applied()) {
                continue;
            }
            result = attempt.node;
            bool declared = std::find(fact.parameters.begin(), fact.parameters.end(), LogCaptureRewriter::FIXTURE) !=
                            fact.parameters.end();
            if (!declared && std::find(added.begin(), added.end(), LogCaptureRewriter::FIXTURE) == added.end()) {
                added.push_back(LogCaptureRewriter::FIXTURE);
            }
        }

        for (const auto *loopFact : loopsOf(fact)) {
            NodePtr loop = RewriteHelper::findNodeAt(result, SyntaxKind::For, loopFact->position);
            if (!loop) {
                continue;
            }
            if (auto reason = loops_.ambiguity(result, loop, *loopFact)) {
                controller.skip(siteRequest(result, SyntaxKind::For, loopFact->position,
                                            LoopParametrizeRewriter::FAMILY, "loop -> pytest.mark.parametrize"),
                                *reason);
                continue;
            }
            AttemptResult attempt = loops_.lower(result, *loopFact, controller);
            if (attempt.applied()) {
                std::vector<std::string> targets = LoopParametrizeRewriter::targetNames(loop);
                added.insert(added.end(), targets.begin(), targets.end());
                result = attempt.node;
            }
        }
        return result;
    }

    NodePtr rewriteStatements(const NodePtr &node, const std::set<std::string> &classMethods) {
        if (node->is(SyntaxKind::SimpleStatement)) {
            return rewriteSimpleStatement(node, classMethods);
        }
        NodeList children = node->getChildren();
        for (auto &child : children) {
            if (!child->isToken() && (recursesInto(child) || child->is(SyntaxKind::SimpleStatement))) {
                child = rewriteStatements(child, classMethods);
            }
        }
        return TreeEditor::withChildren(node, std::move(children));
    }

    NodePtr rewriteSimpleStatement(const NodePtr &statement, const std::set<std::string> &classMethods) {
        if (statement->getChildCount() == 2) {
            NodePtr call = SyntaxHelper::expressionOfStatement(statement);
            auto method = call ? SyntaxHelper::selfMethodName(call) : std::nullopt;
            if (method && ExceptionContextRewriter::handles(*method) && !classMethods.count(*method)) {
                return exceptions_.rewriteCallable(statement, *method);
            }
        }

        NodePtr result = statement;
        for (size_t index = 0; index < statement->getChildCount(); index += 2) {
            const NodePtr &small = statement->getChild(index);
            if (!small->is(SyntaxKind::ExprStatement) || !small->getChild(0)->is(SyntaxKind::Call)) {
                continue;
            }
            auto method = SyntaxHelper::selfMethodName(small->getChild(0));
            if (!method || classMethods.count(*method)) {
                continue;
            }
            if (const AssertionShape *shape = AssertionTable::find(*method)) {
                result = rewriteAssertion(result, index, *method, *shape);
            }
        }
        return result;
    }

    NodePtr rewriteAssertion(const NodePtr &statement, size_t index, const std::string &method,
                             const AssertionShape &shape) {
        const NodePtr &small = statement->getChild(index);
        RewriteRequest request;
        request.family = AssertionRewriteStage::FAMILY;
        request.range = small->getRange();
        request.requiredTier = AssertionTable::requiredTier(shape, SyntaxHelper::argumentsOf(small->getChild(0)));
        request.description = method + " -> " + pytestForm(shape);

        const TransformConfig &config = context_.config;
        auto rewrite = [index, &shape, &config](const NodePtr &original) {
            const NodePtr &call = original->getChild(index)->getChild(0);
            BoundAssertion bound = AssertionTable::bind(shape, SyntaxHelper::argumentsOf(call));
            NodePtr replacement = SyntaxFactory::parseSmallStatement(AssertionTable::render(bound, config));
            replacement = TreeEditor::withLeadingTrivia(replacement, original->getChild(index)->getLeadingTrivia());
            return TreeEditor::replaceChild(original, index, replacement);
        };
        return context_.controller.attempt(request, statement, rewrite, TextualRepair::relocatingComments(rewrite))
            .node;
    }

    NodePtr module_;
    StageContext &context_;
    ExceptionContextRewriter exceptions_;
    LoopParametrizeRewriter loops_;
};

}  // namespace

NodePtr AssertionRewriteStage::run(const NodePtr &module, StageContext &context) {
    UnitRewriter rewriter(module, context);
    return rewriter.run();
}

}  // namespace TCE
