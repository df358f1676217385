#pragma once

#include "analysis/Facts.h"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace TCE {

using FactValue = std::variant<bool, std::set<std::string>, FunctionFact, HookFact, LoopFact, ExceptionContextFact,
                               ClassFact, ImportFact, ComplexityFact, UnsupportedFact>;

/**
 * @brief Append-only map of analysis facts for one unit
 *
 * Filled by the FactAnalyzer passes and frozen before the first rewrite;
 * stages only read it. Keys are namespaced by category ("class:TestFoo",
 * "loop:12:5"), typed accessors hide the key scheme from callers.
 */
class FactSet {
public:
    /**
     * @brief Add a fact under a new key
     * @throws InvariantViolation if the set is frozen or the key exists
     */
    void add(const std::string &key, FactValue value);

    bool has(const std::string &key) const;

    template <typename T> const T *get(const std::string &key) const {
        auto it = facts_.find(key);
        if (it == facts_.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    void freeze() {
        frozen_ = true;
    }

    bool isFrozen() const {
        return frozen_;
    }

    size_t size() const {
        return facts_.size();
    }

    // Typed views
    const FunctionFact *findFunction(const std::string &qualifiedName) const;
    const ClassFact *findClass(const std::string &qualifiedName) const;
    const LoopFact *findLoop(const SourcePosition &position) const;
    const ExceptionContextFact *findContext(const SourcePosition &position) const;

    std::vector<const FunctionFact *> getFunctions() const;
    std::vector<const ClassFact *> getClasses() const;
    std::vector<const HookFact *> getHooks() const;
    std::vector<const LoopFact *> getLoops() const;
    std::vector<const ExceptionContextFact *> getContexts() const;
    std::vector<const UnsupportedFact *> getUnsupported() const;

    /**
     * @brief self.<member> uses of unittest.TestCase API no rewrite family converts
     */
    std::set<std::string> getLegacyApis(const std::string &classQualifiedName) const;

    /**
     * @brief self.assert* / self.fail* methods used inside a class
     */
    std::set<std::string> getAssertionMethods(const std::string &classQualifiedName) const;

    /**
     * @brief Record a shape a pass could not classify (key chosen automatically)
     */
    void addUnsupported(const std::string &pass, const std::string &detail);

    /**
     * @brief Import facts (default-constructed record when the pass did not run)
     */
    ImportFact getImports() const;

    std::optional<ComplexityFact> getComplexity() const;

    // Key scheme
    static std::string functionKey(const std::string &qualifiedName);
    static std::string classKey(const std::string &qualifiedName);
    static std::string hookKey(const std::string &scope, const std::string &name);
    static std::string loopKey(const SourcePosition &position);
    static std::string contextKey(const SourcePosition &position);
    static std::string unsupportedKey(const std::string &pass, size_t index);
    static std::string legacyApiKey(const std::string &classQualifiedName);
    static std::string assertionMethodsKey(const std::string &classQualifiedName);
    static const std::string IMPORTS_KEY;
    static const std::string COMPLEXITY_KEY;

private:
    template <typename T> std::vector<const T *> collect(const std::string &prefix) const {
        std::vector<const T *> result;
        for (const auto &key : insertionOrder_) {
            if (!key.starts_with(prefix)) {
                continue;
            }
            if (const T *value = std::get_if<T>(&facts_.at(key))) {
                result.push_back(value);
            }
        }
        return result;
    }

    std::map<std::string, FactValue> facts_;
    std::vector<std::string> insertionOrder_;  // keys in analysis (source) order
    bool frozen_ = false;
};

}  // namespace TCE
