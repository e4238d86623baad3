// Configuration version, rule toggles and the provider table shared by one engine instance.
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../core/ConfigVersion.h"
#include "../core/Ids.h"
#include "RuleProvider.h"

namespace Cadence::Dispatch {

class EngineContext {
public:
    EngineContext() = default;
    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    // One provider per role; a duplicate role is refused.
    bool registerProvider(std::unique_ptr<RuleProvider> provider);
    const RuleProvider* provider(RoleId role) const;
    std::vector<RoleId> registeredRoles() const;
    void forEachProvider(const std::function<void(const RuleProvider&)>& fn) const;

    ConfigVersion& configVersion() { return version_; }
    const ConfigVersion& configVersion() const { return version_; }
    std::uint32_t currentVersion() const { return version_.current(); }

    // Toggles bump the configuration version only when they change something.
    void setRuleEnabled(RoleId role, const std::string& ruleName, bool enabled);
    bool isRuleEnabled(RoleId role, const std::string& ruleName) const;

    // Smart targeting is on for every role unless switched off here.
    void setSmartTargetingEnabled(RoleId role, bool enabled);
    bool isSmartTargetingEnabled(RoleId role) const;

private:
    ConfigVersion version_{};
    std::map<RoleId, std::unique_ptr<RuleProvider>> providers_;
    std::set<std::pair<RoleId, std::string>> disabledRules_;
    std::set<RoleId> smartTargetingOff_;
};

}  // namespace Cadence::Dispatch
