#include "model/FixtureStateContainer.h"
#include "common/Logger.h"
#include <algorithm>

namespace TCE {

ScopeState &FixtureStateContainer::scopeFor(const std::string &scope, ScopeKind kind) {
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        LOG_TRACE("FixtureStateContainer: new {} scope '{}'", kind == ScopeKind::Module ? "module" : "class", scope);
        ScopeState state;
        state.name = scope;
        state.kind = kind;
        it = scopes_.emplace(scope, std::move(state)).first;
    }
    return it->second;
}

void FixtureStateContainer::recordHook(const std::string &scope, ScopeKind kind, const std::string &hook,
                                       const std::set<std::string> &attributes) {
    ScopeState &state = scopeFor(scope, kind);
    state.hooks.insert(hook);
    state.hookAttributes.insert(attributes.begin(), attributes.end());
}

bool FixtureStateContainer::addScopedParameter(const std::string &scope, ScopeKind kind, const std::string &function,
                                               const std::string &parameter) {
    auto &parameters = scopeFor(scope, kind).scopedParameters[function];
    if (std::find(parameters.begin(), parameters.end(), parameter) != parameters.end()) {
        return false;
    }
    parameters.push_back(parameter);
    return true;
}

const ScopeState *FixtureStateContainer::findScope(const std::string &scope) const {
    auto it = scopes_.find(scope);
    return it == scopes_.end() ? nullptr : &it->second;
}

bool FixtureStateContainer::hasHook(const std::string &scope, const std::string &hook) const {
    const ScopeState *state = findScope(scope);
    return state && state->hooks.count(hook) > 0;
}

bool FixtureStateContainer::isLegacyAttribute(const std::string &scope, const std::string &attribute) const {
    const ScopeState *state = findScope(scope);
    return state && state->hookAttributes.count(attribute) > 0;
}

std::vector<std::string> FixtureStateContainer::getScopedParameters(const std::string &scope,
                                                                    const std::string &function) const {
    const ScopeState *state = findScope(scope);
    if (!state) {
        return {};
    }
    auto it = state->scopedParameters.find(function);
    return it == state->scopedParameters.end() ? std::vector<std::string>{} : it->second;
}

bool FixtureStateContainer::hasScopedParameter(const std::string &scope, const std::string &function,
                                               const std::string &parameter) const {
    auto parameters = getScopedParameters(scope, function);
    return std::find(parameters.begin(), parameters.end(), parameter) != parameters.end();
}

json FixtureStateContainer::toJson() const {
    json result = json::array();
    for (const auto &[name, state] : scopes_) {
        json scope;
        scope["name"] = name;
        scope["kind"] = state.kind == ScopeKind::Module ? "module" : "class";
        scope["hooks"] = state.hooks;
        scope["hookAttributes"] = state.hookAttributes;
        scope["scopedParameters"] = state.scopedParameters;
        result.push_back(std::move(scope));
    }
    return result;
}

}  // namespace TCE
