#include "TargetRules.h"

namespace Cadence::Targeting {

std::optional<TargetingMode> parseTargetingMode(const std::string& key) {
    if (key == "SmartAbility") return TargetingMode::SmartAbility;
    if (key == "GroundTarget") return TargetingMode::GroundTarget;
    if (key == "GroundTargetSpecial") return TargetingMode::GroundTargetSpecial;
    if (key == "Cleanse") return TargetingMode::Cleanse;
    return std::nullopt;
}

const char* targetingModeName(TargetingMode mode) {
    switch (mode) {
        case TargetingMode::SmartAbility:
            return "SmartAbility";
        case TargetingMode::GroundTarget:
            return "GroundTarget";
        case TargetingMode::GroundTargetSpecial:
            return "GroundTargetSpecial";
        case TargetingMode::Cleanse:
        default:
            return "Cleanse";
    }
}

void TargetRuleTable::add(const TargetRule& rule) {
    std::size_t slot = rules_.size();
    auto it = index_.find(rule.abilityId);
    if (it != index_.end()) {
        slot = it->second;
        rules_[slot] = rule;
    } else {
        rules_.push_back(rule);
    }
    index_[rule.abilityId] = slot;
    if (rule.secondaryAbilityId != kNoAbility) index_[rule.secondaryAbilityId] = slot;
}

void TargetRuleTable::clear() {
    rules_.clear();
    index_.clear();
}

const TargetRule* TargetRuleTable::find(AbilityId abilityId) const {
    auto it = index_.find(abilityId);
    if (it == index_.end()) return nullptr;
    return &rules_[it->second];
}

}  // namespace Cadence::Targeting
