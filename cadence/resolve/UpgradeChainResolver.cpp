#include "UpgradeChainResolver.h"

#include <unordered_set>

#include "../core/Logger.h"

namespace Cadence::Resolve {

namespace {
bool validateChain(const UpgradeChain& chain, std::string& why) {
    if (chain.tiers.empty()) {
        why = "no tiers";
        return false;
    }
    std::unordered_set<AbilityId> seen;
    std::uint32_t prevLevel = 0;
    for (const auto& t : chain.tiers) {
        if (t.abilityId == kNoAbility) {
            why = "tier with ability id 0";
            return false;
        }
        if (t.minLevel < prevLevel) {
            why = "tiers not ascending by level";
            return false;
        }
        if (!seen.insert(t.abilityId).second) {
            why = "ability " + std::to_string(t.abilityId) + " listed twice";
            return false;
        }
        prevLevel = t.minLevel;
    }
    return true;
}
}  // namespace

bool UpgradeChainResolver::addChain(const UpgradeChain& chain) {
    std::string why;
    if (!validateChain(chain, why)) {
        logError("Upgrade chain '" + chain.name + "' rejected: " + why);
        return false;
    }
    for (const auto& t : chain.tiers) {
        if (owner_.count(t.abilityId) != 0) {
            logError("Upgrade chain '" + chain.name + "' rejected: ability " + std::to_string(t.abilityId) +
                     " already belongs to '" + chains_[owner_[t.abilityId]].name + "'");
            return false;
        }
    }

    const std::size_t index = chains_.size();
    chains_.push_back(chain);
    for (const auto& t : chain.tiers) {
        owner_[t.abilityId] = index;
    }
    return true;
}

std::size_t UpgradeChainResolver::addChains(const std::vector<UpgradeChain>& chains) {
    std::size_t added = 0;
    for (const auto& c : chains) {
        if (addChain(c)) ++added;
    }
    return added;
}

AbilityId UpgradeChainResolver::resolve(AbilityId abilityId, std::uint32_t level) const {
    const UpgradeChain* chain = chainFor(abilityId);
    if (!chain) return abilityId;

    AbilityId result = abilityId;
    for (const auto& t : chain->tiers) {
        if (t.minLevel > level) break;
        result = t.abilityId;
    }
    return result;
}

bool UpgradeChainResolver::chainContains(AbilityId abilityId, AbilityId baseAbilityId) const {
    const UpgradeChain* chain = chainFor(baseAbilityId);
    if (!chain) return abilityId == baseAbilityId;
    for (const auto& t : chain->tiers) {
        if (t.abilityId == abilityId) return true;
    }
    return false;
}

const UpgradeChain* UpgradeChainResolver::chainFor(AbilityId abilityId) const {
    auto it = owner_.find(abilityId);
    if (it == owner_.end()) return nullptr;
    return &chains_[it->second];
}

void UpgradeChainResolver::clear() {
    chains_.clear();
    owner_.clear();
}

}  // namespace Cadence::Resolve
