#include "analysis/AnalysisPasses.h"
#include "analysis/ScopedWalker.h"
#include "analysis/TestCaseApi.h"
#include "common/Logger.h"
#include "syntax/SyntaxHelper.h"
#include <map>

namespace TCE {

namespace {

class MemberUseCollector : public ScopedWalker {
public:
    std::map<std::string, std::set<std::string>> legacy;
    std::map<std::string, std::set<std::string>> assertions;

protected:
    bool onEnter(const NodePtr &node) override {
        if (!node->is(SyntaxKind::Attribute) || currentClass() == MODULE_SCOPE) {
            return true;
        }
        if (SyntaxHelper::dottedName(node->getChild(0)) != "self") {
            return true;
        }
        const std::string &member = node->getChild(2)->getToken().text;
        if (!TestCaseApi::isTestCaseMember(member)) {
            return true;
        }
        if (TestCaseApi::isAssertionMethod(member)) {
            assertions[currentClass()].insert(member);
        }
        if (!TestCaseApi::isConvertedMember(member)) {
            legacy[currentClass()].insert(member);
        }
        return true;
    }
};

}  // namespace

void LegacyApiPass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    (void)config;
    MemberUseCollector collector;
    collector.walk(module);

    for (const auto *cls : facts.getClasses()) {
        auto legacy = collector.legacy.find(cls->qualifiedName);
        if (legacy != collector.legacy.end()) {
            LOG_DEBUG("LegacyApiPass: class {} uses {} unconverted TestCase members", cls->qualifiedName,
                      legacy->second.size());
            facts.add(FactSet::legacyApiKey(cls->qualifiedName), legacy->second);
        }
        auto assertions = collector.assertions.find(cls->qualifiedName);
        if (assertions != collector.assertions.end()) {
            facts.add(FactSet::assertionMethodsKey(cls->qualifiedName), assertions->second);
        }
    }
}

}  // namespace TCE
