#include "analysis/AnalysisPasses.h"
#include "common/Logger.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/SyntaxVisitor.h"

namespace TCE {

namespace {

class ImportCollector : public SyntaxWalker {
public:
    ImportFact imports;

protected:
    bool enter(const NodePtr &node) override {
        if (node->is(SyntaxKind::Import)) {
            collectImport(node);
            return false;
        }
        if (node->is(SyntaxKind::ImportFrom)) {
            collectImportFrom(node);
            return false;
        }
        return isStatementKind(node->getKind()) || node->is(SyntaxKind::Module) || node->is(SyntaxKind::Block) ||
               node->is(SyntaxKind::ElifClause) || node->is(SyntaxKind::ElseClause) ||
               node->is(SyntaxKind::ExceptClause) || node->is(SyntaxKind::FinallyClause);
    }

private:
    static std::string boundName(const NodePtr &alias, const std::string &defaultName) {
        size_t asIndex = alias->findTokenIndex("as");
        if (asIndex != std::string::npos && asIndex + 1 < alias->getChildCount()) {
            return alias->getChild(asIndex + 1)->getToken().text;
        }
        return defaultName;
    }

    void collectImport(const NodePtr &node) {
        for (const auto &alias : node->getNodeChildren()) {
            std::string module = SyntaxHelper::dottedName(alias->getChild(0));
            if (module.empty()) {
                module = alias->getChild(0)->getSourceText();
            }
            bool aliased = alias->findTokenIndex("as") != std::string::npos;
            if (module == "unittest") {
                imports.importsUnittest = true;
                imports.unittestAliases.insert(boundName(alias, "unittest"));
            } else if (module.starts_with("unittest.") && !aliased) {
                imports.unittestAliases.insert("unittest");
            } else if (module == "pytest") {
                imports.importsPytest = true;
            } else if (module == "re") {
                imports.importsRe = true;
            }
        }
    }

    void collectImportFrom(const NodePtr &node) {
        // Relative imports have dots before the module name
        const NodePtr &moduleNode = node->getChild(1);
        if (!moduleNode->is(SyntaxKind::DottedName)) {
            return;
        }
        std::string module = moduleNode->getSourceText();
        if (module != "unittest") {
            return;
        }
        for (const auto &alias : node->getNodeChildren()) {
            if (!alias->is(SyntaxKind::ImportAlias)) {
                continue;
            }
            std::string imported = alias->getChild(0)->getSourceText();
            imports.fromUnittestNames[boundName(alias, imported)] = imported;
        }
    }
};

}  // namespace

void ImportPass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    (void)config;
    ImportCollector collector;
    collector.walk(module);
    LOG_DEBUG("ImportPass: unittest={}, pytest={}, re={}, {} names from unittest",
              collector.imports.importsUnittest, collector.imports.importsPytest, collector.imports.importsRe,
              collector.imports.fromUnittestNames.size());
    facts.add(FactSet::IMPORTS_KEY, collector.imports);
}

}  // namespace TCE
