// Top-level entry: memoized ability resolution, weave suggestions and target choice.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "../cache/ActionResolutionCache.h"
#include "../cache/ConfigVersionedCache.h"
#include "../core/Ids.h"
#include "../core/Time.h"
#include "../resolve/UpgradeChainResolver.h"
#include "../resolve/WeaveEvaluator.h"
#include "../state/StateSnapshot.h"
#include "../targeting/TargetPriorityEngine.h"
#include "DispatchSpecializer.h"
#include "EngineContext.h"

namespace Cadence::Dispatch {

struct Decision {
    AbilityId abilityId{kNoAbility};
    std::array<AbilityId, Resolve::kMaxWeaveSlots> weaves{};
    int weaveCount{0};
    ActorId targetId{kNoActor};
};

struct PipelineSettings {
    WeaveTiming weaveTiming{};
    TimeMs staleThresholdMs{State::kDefaultStaleMs};
    TimeMs configCacheTimeoutMs{Cache::ConfigVersionedCache::kDefaultTimeoutMs};
};

struct PipelineCounters {
    std::uint64_t frameCacheHits{0};
    std::uint64_t frameCacheMisses{0};
    std::uint64_t configCacheHits{0};
    std::uint64_t configCacheMisses{0};
    std::uint64_t memoHits{0};
    std::uint64_t resolutions{0};
    std::uint64_t passThroughs{0};
};

class ActionPipeline {
public:
    ActionPipeline(EngineContext& context, State::StateSnapshot& snapshot, Targeting::TargetPriorityEngine& targeting,
                   Resolve::UpgradeChainResolver& upgrades, PipelineSettings settings = {});
    ActionPipeline(const ActionPipeline&) = delete;
    ActionPipeline& operator=(const ActionPipeline&) = delete;

    // Pulls tracking ids and upgrade chains from every registered provider. Call once per session.
    void attachProviders();

    // Ability to execute for a press; the input itself whenever automation must stay out of the way.
    AbilityId resolve(AbilityId attempted);
    int suggestWeaves(Resolve::WeavePick& out);
    // 0 when the ability has no target rule or smart targeting is off for the role.
    ActorId resolveTarget(AbilityId abilityId);
    Decision decide(AbilityId attempted);

    void setSettings(const PipelineSettings& settings);
    const PipelineSettings& settings() const { return settings_; }
    void clearCaches();

    const PipelineCounters& counters() const;
    const DispatchSpecializer& specializer() const { return specializer_; }

private:
    struct MemoEntry {
        AbilityId key{kNoAbility};
        AbilityId value{kNoAbility};
    };
    static constexpr std::size_t kMemoSlots = 8;

    bool automationAllowed(AbilityId attempted) const;
    void syncKeys();
    AbilityId resolveUncached(AbilityId attempted, TimeMs now);
    bool memoLookup(AbilityId key, AbilityId& value);
    void memoStore(AbilityId key, AbilityId value);

    EngineContext& context_;
    State::StateSnapshot& snapshot_;
    Targeting::TargetPriorityEngine& targeting_;
    Resolve::UpgradeChainResolver& upgrades_;
    PipelineSettings settings_{};
    DispatchSpecializer specializer_;
    Cache::ActionResolutionCache frameCache_;
    Cache::ConfigVersionedCache passThrough_;

    RoleId lastRole_{kNoRole};
    std::uint32_t lastVersion_{ConfigVersion::kUninitialized};

    std::array<MemoEntry, kMemoSlots> memo_{};
    std::size_t memoCount_{0};
    std::uint32_t memoFrame_{0};
    bool memoValid_{false};

    mutable PipelineCounters counters_{};
};

}  // namespace Cadence::Dispatch
