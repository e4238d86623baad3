// Compiles one role's providers into a single decision function, rebuilt per (role, config version).
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "../core/Ids.h"
#include "../resolve/UpgradeChainResolver.h"
#include "../resolve/WeaveEvaluator.h"
#include "../state/StateSnapshot.h"
#include "../targeting/TargetPriorityEngine.h"
#include "../targeting/TargetRules.h"
#include "EngineContext.h"
#include "RotationGrid.h"

namespace Cadence::Dispatch {

enum class DispatchState { Stale, Specialized };

enum class Topology {
    Identity,
    SingleGrid,
    SingleGridWithWeaves,
    MultiGrid,
    MultiGridWithWeaves
};

const char* topologyName(Topology topology);

struct WeaveTiming {
    float perAbilityLock{Resolve::kDefaultPerAbilityLock};
    float safetyMargin{Resolve::kDefaultSafetyMargin};
};

class DispatchSpecializer {
public:
    using DispatchFn = std::function<AbilityId(AbilityId, const State::StateSnapshot&)>;

    DispatchSpecializer(const EngineContext& context, const Resolve::UpgradeChainResolver& upgrades,
                        Targeting::TargetPriorityEngine& targeting, WeaveTiming timing = {});
    DispatchSpecializer(const DispatchSpecializer&) = delete;
    DispatchSpecializer& operator=(const DispatchSpecializer&) = delete;

    // Never throws; faults inside rule callbacks answer with abilityId.
    AbilityId resolve(AbilityId abilityId, const State::StateSnapshot& snapshot);

    // Secondaries that fit the current lock window, best first.
    int suggestWeaves(const State::StateSnapshot& snapshot, Resolve::WeavePick& out);

    // Whether any grid or target rule of the active role reacts to abilityId.
    bool touches(AbilityId abilityId, const State::StateSnapshot& snapshot);
    bool supportsWeaving(const State::StateSnapshot& snapshot);
    // Target rule for abilityId when smart targeting is on for the active role.
    const Targeting::TargetRule* targetRuleFor(AbilityId abilityId, const State::StateSnapshot& snapshot);

    void setWeaveTiming(const WeaveTiming& timing);
    const WeaveTiming& weaveTiming() const { return timing_; }

    DispatchState state(const State::StateSnapshot& snapshot) const;
    Topology topology() const { return current_ ? current_->topology : Topology::Identity; }
    bool degraded() const { return current_ && current_->degraded; }
    std::uint64_t rebuildCount() const { return rebuilds_; }
    void invalidate() { current_.reset(); }

private:
    struct Specialized {
        RoleId role{kNoRole};
        std::uint32_t version{0};
        Topology topology{Topology::Identity};
        bool degraded{false};
        bool smartTargeting{false};
        std::vector<RotationGrid> grids;
        Resolve::WeaveRuleSet weaves;
        Resolve::WeaveOrder weaveOrder{Resolve::WeaveOrder::Priority};
        Targeting::TargetRuleTable targets;
        DispatchFn fn;
    };

    Specialized& ensure(const State::StateSnapshot& snapshot);
    void build(RoleId role, std::uint32_t version);
    void compile(Specialized& entry);
    void degrade(Specialized& entry);
    int pickWeaves(const Specialized& entry, const State::StateSnapshot& s, int slots, Resolve::WeavePick& out) const;

    bool replaceForTarget(const Specialized& entry, AbilityId id, const State::StateSnapshot& s, AbilityId& out) const;
    bool replaceFromGrid(const RotationGrid& grid, AbilityId id, const State::StateSnapshot& s, AbilityId& out) const;
    bool replaceWithWeave(const Specialized& entry, const State::StateSnapshot& s, AbilityId& out) const;

    const EngineContext& context_;
    const Resolve::UpgradeChainResolver& upgrades_;
    Targeting::TargetPriorityEngine& targeting_;
    WeaveTiming timing_{};
    std::optional<Specialized> current_{};
    std::uint64_t rebuilds_{0};
};

}  // namespace Cadence::Dispatch
