// Abilities that get an automatically chosen recipient.
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/Ids.h"

namespace Cadence::Targeting {

enum class TargetingMode {
    SmartAbility,
    GroundTarget,
    GroundTargetSpecial,  // ground placement, then a follow-up ability while a buff is up
    Cleanse
};

struct TargetRule {
    AbilityId abilityId{kNoAbility};
    TargetingMode mode{TargetingMode::SmartAbility};
    AbilityId secondaryAbilityId{kNoAbility};
    EffectId requiredBuffId{0};
    std::string displayName;
};

std::optional<TargetingMode> parseTargetingMode(const std::string& key);
const char* targetingModeName(TargetingMode mode);

class TargetRuleTable {
public:
    // Later rules for the same ability replace earlier ones. A follow-up id finds its parent rule.
    void add(const TargetRule& rule);
    void clear();

    const TargetRule* find(AbilityId abilityId) const;
    bool empty() const { return rules_.empty(); }
    std::size_t size() const { return rules_.size(); }
    const std::vector<TargetRule>& all() const { return rules_; }

private:
    std::vector<TargetRule> rules_;
    std::unordered_map<AbilityId, std::size_t> index_;
};

}  // namespace Cadence::Targeting
