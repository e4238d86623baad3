// Built-in healer rotation, secondaries and smart-target abilities.
#pragma once

#include <string>
#include <vector>

#include "../cadence/dispatch/RuleProvider.h"

namespace Roles {

// Upgrade chains for the healer's damage spells, in tier order.
const std::vector<Cadence::Resolve::UpgradeChain>& healerUpgradeChains();

namespace HealerGauge {
int healingLilies(const Cadence::State::StateSnapshot& s);
int bloodLilies(const Cadence::State::StateSnapshot& s);
std::uint32_t lilyTimerMs(const Cadence::State::StateSnapshot& s);
bool overcapRisk(const Cadence::State::StateSnapshot& s);
}  // namespace HealerGauge

class HealerProvider : public Cadence::Dispatch::RuleProvider {
public:
    Cadence::RoleId roleId() const override;
    std::string name() const override { return "White Mage"; }

    std::vector<Cadence::Dispatch::RotationGrid> rotationGrids() const override;
    std::vector<Cadence::Resolve::WeaveRule> weaveRules() const override;
    std::vector<Cadence::Targeting::TargetRule> targetRules() const override;
    std::vector<Cadence::Resolve::UpgradeChain> upgradeChains() const override { return healerUpgradeChains(); }
    Cadence::State::TrackingSet tracking() const override;
};

}  // namespace Roles
