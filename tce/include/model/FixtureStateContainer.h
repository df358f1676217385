#pragma once

#include "common/JsonUtils.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace TCE {

enum class ScopeKind { Module, Class };

/**
 * @brief Fixture and state bookkeeping for one scope (the module or one class)
 */
struct ScopeState {
    std::string name;
    ScopeKind kind = ScopeKind::Module;
    std::set<std::string> hooks;                                          // setUp, tearDownClass, ...
    std::set<std::string> hookAttributes;                                 // self.<attr> assigned by hooks
    std::map<std::string, std::vector<std::string>> scopedParameters;    // function -> added parameters
};

/**
 * @brief Per-unit record of setup/teardown state and of parameters introduced by rewrites
 *
 * Tests written against unittest share state through attributes set in hooks
 * (`self.x`); converted tests receive some state through parameters instead
 * (`caplog`, parametrized loop targets). During a run both forms coexist, so
 * the container answers both questions: is an attribute hook-initialized
 * (legacy read) and which parameters has a function gained (scoped read).
 *
 * A scope is created when its first hook or scoped parameter is observed and
 * lives as long as the unit run.
 */
class FixtureStateContainer {
public:
    /**
     * @brief Record a setup/teardown hook and the attributes it assigns
     */
    void recordHook(const std::string &scope, ScopeKind kind, const std::string &hook,
                    const std::set<std::string> &attributes = {});

    /**
     * @brief Record a parameter introduced into a function by a rewrite
     * @return false if the function already had that parameter recorded
     */
    bool addScopedParameter(const std::string &scope, ScopeKind kind, const std::string &function,
                            const std::string &parameter);

    const ScopeState *findScope(const std::string &scope) const;

    bool hasHook(const std::string &scope, const std::string &hook) const;

    /**
     * @brief Legacy accessor: attribute initialized by a hook and read as self.<attribute>
     */
    bool isLegacyAttribute(const std::string &scope, const std::string &attribute) const;

    /**
     * @brief Scoped accessor: parameters a function received from rewrites
     */
    std::vector<std::string> getScopedParameters(const std::string &scope, const std::string &function) const;

    bool hasScopedParameter(const std::string &scope, const std::string &function,
                            const std::string &parameter) const;

    size_t getScopeCount() const {
        return scopes_.size();
    }

    json toJson() const;

private:
    ScopeState &scopeFor(const std::string &scope, ScopeKind kind);

    std::map<std::string, ScopeState> scopes_;
};

}  // namespace TCE
