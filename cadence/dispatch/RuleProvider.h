// Role-specific rule content consumed by the dispatch specializer.
#pragma once

#include <string>
#include <vector>

#include "../core/Ids.h"
#include "../resolve/UpgradeChainResolver.h"
#include "../resolve/WeaveEvaluator.h"
#include "../state/StateSnapshot.h"
#include "../targeting/TargetRules.h"
#include "RotationGrid.h"

namespace Cadence::Dispatch {

class RuleProvider {
public:
    virtual ~RuleProvider() = default;

    virtual RoleId roleId() const = 0;
    virtual std::string name() const = 0;

    virtual std::vector<RotationGrid> rotationGrids() const = 0;
    virtual std::vector<Resolve::WeaveRule> weaveRules() const { return {}; }
    virtual Resolve::WeaveOrder weaveOrder() const { return Resolve::WeaveOrder::Priority; }
    virtual std::vector<Targeting::TargetRule> targetRules() const { return {}; }
    virtual std::vector<Resolve::UpgradeChain> upgradeChains() const { return {}; }
    // Buffs, debuffs and cooldowns the rules read.
    virtual State::TrackingSet tracking() const { return {}; }
};

}  // namespace Cadence::Dispatch
