#include "analysis/AnalysisPasses.h"
#include "analysis/ScopedWalker.h"
#include "analysis/TestCaseApi.h"
#include "common/Logger.h"
#include "syntax/SyntaxHelper.h"
#include <format>

namespace TCE {

namespace {

class DeclarationCollector : public ScopedWalker {
public:
    DeclarationCollector(const TransformConfig &config, const ImportFact &imports, FactSet &facts)
        : config_(config), imports_(imports), facts_(facts) {}

    std::vector<ClassFact> classes;
    std::vector<FunctionFact> functions;

protected:
    bool onEnter(const NodePtr &node) override {
        if (node->is(SyntaxKind::ClassDef)) {
            collectClass(node);
        } else if (node->is(SyntaxKind::FunctionDef) && !inFunction()) {
            collectFunction(node);
        }
        return isStatementKind(node->getKind()) || node->is(SyntaxKind::Module) || node->is(SyntaxKind::Block) ||
               node->is(SyntaxKind::ElifClause) || node->is(SyntaxKind::ElseClause) ||
               node->is(SyntaxKind::ExceptClause) || node->is(SyntaxKind::FinallyClause);
    }

private:
    void collectClass(const NodePtr &node) {
        ClassFact fact;
        fact.name = SyntaxHelper::definitionName(node);
        std::string scope = currentClass();
        fact.qualifiedName = scope == MODULE_SCOPE ? fact.name : scope + "." + fact.name;
        fact.isNested = classDepth() > 0 || inFunction();
        fact.range = node->getRange();

        NodePtr arguments = node->findChild(SyntaxKind::ArgumentList);
        if (arguments) {
            for (const auto &argument : arguments->getNodeChildren()) {
                if (argument->getChildCount() != 1) {
                    fact.hasKeywords = true;
                    continue;
                }
                std::string base = SyntaxHelper::dottedName(argument->getChild(0));
                if (base.empty()) {
                    base = argument->getChild(0)->getSourceText();
                    facts_.addUnsupported("declarations",
                                          std::format("class {} has computed base '{}'", fact.qualifiedName, base));
                }
                fact.derivesFromTestCase = fact.derivesFromTestCase || TestCaseApi::isTestCaseBase(base, imports_);
                fact.bases.push_back(base);
            }
        }
        classes.push_back(std::move(fact));
    }

    void collectFunction(const NodePtr &node) {
        FunctionFact fact;
        fact.name = SyntaxHelper::definitionName(node);
        fact.scope = currentClass();
        fact.isTest = config_.isTestName(fact.name);
        fact.hasCustomPrefix = fact.isTest && !fact.name.starts_with("test");
        fact.isAsync = SyntaxHelper::isAsync(node);
        fact.parameters = SyntaxHelper::parameterNames(node);
        fact.range = node->getRange();
        functions.push_back(std::move(fact));
    }

    const TransformConfig &config_;
    const ImportFact &imports_;
    FactSet &facts_;
};

}  // namespace

void DeclarationPass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    ImportFact imports = facts.getImports();
    DeclarationCollector collector(config, imports, facts);
    collector.walk(module);

    for (auto &cls : collector.classes) {
        for (const auto &other : collector.classes) {
            for (const auto &base : other.bases) {
                if (base == cls.name || base == cls.qualifiedName) {
                    cls.subclassedInModule = true;
                }
            }
        }
        if (facts.has(FactSet::classKey(cls.qualifiedName))) {
            facts.addUnsupported("declarations", "class " + cls.qualifiedName + " is defined more than once");
            continue;
        }
        facts.add(FactSet::classKey(cls.qualifiedName), cls);
    }

    size_t tests = 0;
    for (auto &function : collector.functions) {
        std::string key = FactSet::functionKey(function.qualifiedName());
        if (facts.has(key)) {
            facts.addUnsupported("declarations", "function " + function.qualifiedName() + " is defined more than once");
            continue;
        }
        tests += function.isTest ? 1 : 0;
        facts.add(key, function);
    }
    LOG_DEBUG("DeclarationPass: {} classes, {} functions, {} tests", collector.classes.size(),
              collector.functions.size(), tests);
}

}  // namespace TCE
