#include "analysis/FactSet.h"
#include "common/Exceptions.h"
#include <format>

namespace TCE {

const std::string FactSet::IMPORTS_KEY = "imports";
const std::string FactSet::COMPLEXITY_KEY = "complexity";

void FactSet::add(const std::string &key, FactValue value) {
    if (frozen_) {
        throw InvariantViolation("fact set is frozen; cannot add '" + key + "'");
    }
    if (!facts_.emplace(key, std::move(value)).second) {
        throw InvariantViolation("duplicate fact key '" + key + "'");
    }
    insertionOrder_.push_back(key);
}

bool FactSet::has(const std::string &key) const {
    return facts_.count(key) > 0;
}

const FunctionFact *FactSet::findFunction(const std::string &qualifiedName) const {
    return get<FunctionFact>(functionKey(qualifiedName));
}

const ClassFact *FactSet::findClass(const std::string &qualifiedName) const {
    return get<ClassFact>(classKey(qualifiedName));
}

const LoopFact *FactSet::findLoop(const SourcePosition &position) const {
    return get<LoopFact>(loopKey(position));
}

const ExceptionContextFact *FactSet::findContext(const SourcePosition &position) const {
    return get<ExceptionContextFact>(contextKey(position));
}

std::vector<const FunctionFact *> FactSet::getFunctions() const {
    return collect<FunctionFact>("function:");
}

std::vector<const ClassFact *> FactSet::getClasses() const {
    return collect<ClassFact>("class:");
}

std::vector<const HookFact *> FactSet::getHooks() const {
    return collect<HookFact>("hook:");
}

std::vector<const LoopFact *> FactSet::getLoops() const {
    return collect<LoopFact>("loop:");
}

std::vector<const ExceptionContextFact *> FactSet::getContexts() const {
    return collect<ExceptionContextFact>("context:");
}

std::vector<const UnsupportedFact *> FactSet::getUnsupported() const {
    return collect<UnsupportedFact>("unsupported:");
}

std::set<std::string> FactSet::getLegacyApis(const std::string &classQualifiedName) const {
    const auto *apis = get<std::set<std::string>>(legacyApiKey(classQualifiedName));
    return apis ? *apis : std::set<std::string>{};
}

std::set<std::string> FactSet::getAssertionMethods(const std::string &classQualifiedName) const {
    const auto *methods = get<std::set<std::string>>(assertionMethodsKey(classQualifiedName));
    return methods ? *methods : std::set<std::string>{};
}

void FactSet::addUnsupported(const std::string &pass, const std::string &detail) {
    add(unsupportedKey(pass, getUnsupported().size()), UnsupportedFact{pass, detail});
}

ImportFact FactSet::getImports() const {
    const ImportFact *imports = get<ImportFact>(IMPORTS_KEY);
    return imports ? *imports : ImportFact{};
}

std::optional<ComplexityFact> FactSet::getComplexity() const {
    const ComplexityFact *complexity = get<ComplexityFact>(COMPLEXITY_KEY);
    if (!complexity) {
        return std::nullopt;
    }
    return *complexity;
}

std::string FactSet::functionKey(const std::string &qualifiedName) {
    return "function:" + qualifiedName;
}

std::string FactSet::classKey(const std::string &qualifiedName) {
    return "class:" + qualifiedName;
}

std::string FactSet::hookKey(const std::string &scope, const std::string &name) {
    return "hook:" + scope + "." + name;
}

std::string FactSet::loopKey(const SourcePosition &position) {
    return std::format("loop:{}:{}", position.line, position.column);
}

std::string FactSet::contextKey(const SourcePosition &position) {
    return std::format("context:{}:{}", position.line, position.column);
}

std::string FactSet::unsupportedKey(const std::string &pass, size_t index) {
    return std::format("unsupported:{}:{}", pass, index);
}

std::string FactSet::legacyApiKey(const std::string &classQualifiedName) {
    return "legacy:" + classQualifiedName;
}

std::string FactSet::assertionMethodsKey(const std::string &classQualifiedName) {
    return "assertions:" + classQualifiedName;
}

}  // namespace TCE
