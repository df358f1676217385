#include "stages/FixtureStateStage.h"
#include "analysis/TestCaseApi.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "rewriting/RewriteHelper.h"
#include "stages/ClassConverter.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/TreeEditor.h"

namespace TCE {

namespace {

void recordHooks(const StageContext &context, FixtureStateContainer &fixtures) {
    for (const auto *hook : context.facts.getHooks()) {
        fixtures.recordHook(hook->scope, hook->isClassScope ? ScopeKind::Class : ScopeKind::Module, hook->name,
                            hook->assignedAttributes);
    }
}

bool hasScopedParameters(const FixtureStateContainer &fixtures, const std::string &scope) {
    const ScopeState *state = fixtures.findScope(scope);
    return state && !state->scopedParameters.empty();
}

}  // namespace

std::optional<std::string> FixtureStateStage::keepReason(const ClassFact &cls, const StageContext &context) {
    if (RewriteHelper::isConversionCandidate(cls, context)) {
        return std::nullopt;
    }
    if (context.config.keepsLegacyClassStructure()) {
        return std::string("legacy class structure kept by configuration");
    }
    if (!cls.hasSoleTestCaseBase()) {
        return "custom base list: " + join(cls.bases, ", ");
    }
    if (cls.isNested) {
        return std::string("nested test class");
    }
    if (cls.subclassedInModule) {
        return std::string("class is subclassed in this module");
    }
    if (!context.controller.allows(DegradationTier::Advanced)) {
        return "requires " + tierToString(DegradationTier::Advanced) + " tier";
    }
    if (!startsWith(cls.name, "Test")) {
        return std::string("pytest only collects plain classes named Test*");
    }
    if (context.facts.findFunction(cls.qualifiedName + ".__init__")) {
        return std::string("class defines __init__");
    }
    std::set<std::string> legacy = context.facts.getLegacyApis(cls.qualifiedName);
    return "uses unittest.TestCase API: " + join(std::vector<std::string>(legacy.begin(), legacy.end()), ", ");
}

NodePtr FixtureStateStage::run(const NodePtr &module, StageContext &context) {
    recordHooks(context, context.fixtures);

    NodeList children = module->getChildren();
    for (auto &child : children) {
        if (child->is(SyntaxKind::ClassDef)) {
            child = convertClass(child, SyntaxHelper::definitionName(child), context);
        } else if (child->is(SyntaxKind::FunctionDef) &&
                   TestCaseApi::isModuleHookName(SyntaxHelper::definitionName(child))) {
            child = renameModuleHook(module, child, context);
        }
    }
    return TreeEditor::withChildren(module, std::move(children));
}

NodePtr FixtureStateStage::convertClass(const NodePtr &classDef, const std::string &qualifiedName,
                                        StageContext &context) {
    const ClassFact *cls = context.facts.findClass(qualifiedName);
    if (!cls || !cls->derivesFromTestCase) {
        return classDef;
    }

    RewriteRequest request;
    request.family = FAMILY;
    request.range = classDef->getRange();
    request.requiredTier = DegradationTier::Advanced;
    request.description = "unittest.TestCase class " + qualifiedName + " -> plain test class";

    auto reason = keepReason(*cls, context);
    if (reason) {
        if (!context.config.keepsLegacyClassStructure()) {
            context.controller.skip(request, *reason);
        }
        return classDef;
    }

    AttemptResult result = context.controller.attempt(request, classDef, ClassConverter::convert);
    if (!result.applied() && hasScopedParameters(context.fixtures, qualifiedName)) {
        throw InvariantViolation("class " + qualifiedName + " gained test parameters but kept its TestCase base");
    }
    if (result.applied()) {
        const ScopeState *state = context.fixtures.findScope(qualifiedName);
        LOG_DEBUG("FixtureStateStage: {} converted, {} hook attribute(s) now set up by fixtures", qualifiedName,
                  state ? state->hookAttributes.size() : 0);
    }
    return result.node;
}

NodePtr FixtureStateStage::renameModuleHook(const NodePtr &module, const NodePtr &hook, StageContext &context) {
    const std::string name = SyntaxHelper::definitionName(hook);
    const std::string pytestName = ClassConverter::pytestHookName(name);

    RewriteRequest request;
    request.family = FAMILY;
    request.range = hook->getRange();
    request.requiredTier = DegradationTier::Advanced;
    request.description = name + " -> " + pytestName;

    auto rewrite = [&module, &name, &pytestName](const NodePtr &original) {
        for (const auto &statement : module->getNodeChildren()) {
            if (statement->is(SyntaxKind::FunctionDef) && SyntaxHelper::definitionName(statement) == pytestName) {
                throw RewriteError("module already defines " + pytestName);
            }
        }
        if (!SyntaxHelper::parameterNames(original).empty()) {
            throw RewriteError(name + " takes parameters");
        }
        size_t index = original->findTokenIndex(name);
        return TreeEditor::replaceChild(original, index,
                                        TreeEditor::withTokenText(original->getChild(index), pytestName));
    };
    return context.controller.attempt(request, hook, rewrite).node;
}

}  // namespace TCE
