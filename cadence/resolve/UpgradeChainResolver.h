// Level-gated ability upgrade chains.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/Ids.h"

namespace Cadence::Resolve {

struct UpgradeTier {
    std::uint32_t minLevel{0};
    AbilityId abilityId{kNoAbility};
};

struct UpgradeChain {
    std::string name;
    std::vector<UpgradeTier> tiers;  // ascending by minLevel
};

class UpgradeChainResolver {
public:
    // Rejects unsorted chains, duplicate ids, and ids already owned by another chain.
    bool addChain(const UpgradeChain& chain);
    std::size_t addChains(const std::vector<UpgradeChain>& chains);

    // Highest tier unlocked at level; ids without a chain pass through.
    AbilityId resolve(AbilityId abilityId, std::uint32_t level) const;
    bool chainContains(AbilityId abilityId, AbilityId baseAbilityId) const;

    const UpgradeChain* chainFor(AbilityId abilityId) const;
    std::size_t chainCount() const { return chains_.size(); }
    void clear();

private:
    std::vector<UpgradeChain> chains_;
    std::unordered_map<AbilityId, std::size_t> owner_;
};

}  // namespace Cadence::Resolve
