#include "EngineContext.h"

#include "../core/Logger.h"

namespace Cadence::Dispatch {

bool EngineContext::registerProvider(std::unique_ptr<RuleProvider> provider) {
    if (!provider) return false;
    const RoleId role = provider->roleId();
    if (role == kNoRole) {
        logWarn("Provider '" + provider->name() + "' ignored: role id 0 is reserved");
        return false;
    }
    if (providers_.count(role) != 0) {
        logWarn("Provider '" + provider->name() + "' ignored: role " + std::to_string(role) + " already registered");
        return false;
    }
    logInfo("Registered rule provider '" + provider->name() + "' for role " + std::to_string(role));
    providers_.emplace(role, std::move(provider));
    version_.bump();
    return true;
}

const RuleProvider* EngineContext::provider(RoleId role) const {
    auto it = providers_.find(role);
    return it == providers_.end() ? nullptr : it->second.get();
}

std::vector<RoleId> EngineContext::registeredRoles() const {
    std::vector<RoleId> out;
    out.reserve(providers_.size());
    for (const auto& kv : providers_) out.push_back(kv.first);
    return out;
}

void EngineContext::forEachProvider(const std::function<void(const RuleProvider&)>& fn) const {
    for (const auto& kv : providers_) fn(*kv.second);
}

void EngineContext::setRuleEnabled(RoleId role, const std::string& ruleName, bool enabled) {
    const auto key = std::make_pair(role, ruleName);
    const bool changed = enabled ? disabledRules_.erase(key) != 0 : disabledRules_.insert(key).second;
    if (changed) version_.bump();
}

bool EngineContext::isRuleEnabled(RoleId role, const std::string& ruleName) const {
    return disabledRules_.count(std::make_pair(role, ruleName)) == 0;
}

void EngineContext::setSmartTargetingEnabled(RoleId role, bool enabled) {
    const bool changed = enabled ? smartTargetingOff_.erase(role) != 0 : smartTargetingOff_.insert(role).second;
    if (changed) version_.bump();
}

bool EngineContext::isSmartTargetingEnabled(RoleId role) const { return smartTargetingOff_.count(role) == 0; }

}  // namespace Cadence::Dispatch
