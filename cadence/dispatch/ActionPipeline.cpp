#include "ActionPipeline.h"

#include <string>

#include "../core/Logger.h"

namespace Cadence::Dispatch {

ActionPipeline::ActionPipeline(EngineContext& context, State::StateSnapshot& snapshot,
                               Targeting::TargetPriorityEngine& targeting, Resolve::UpgradeChainResolver& upgrades,
                               PipelineSettings settings)
    : context_(context),
      snapshot_(snapshot),
      targeting_(targeting),
      upgrades_(upgrades),
      settings_(settings),
      specializer_(context, upgrades, targeting, settings.weaveTiming),
      passThrough_(context.configVersion(), settings.configCacheTimeoutMs) {}

void ActionPipeline::attachProviders() {
    std::size_t chains = 0;
    context_.forEachProvider([&](const RuleProvider& provider) {
        snapshot_.registerTracking(provider.tracking());
        chains += upgrades_.addChains(provider.upgradeChains());
    });
    logInfo("Attached " + std::to_string(context_.registeredRoles().size()) + " rule providers, " +
            std::to_string(chains) + " upgrade chains");
}

AbilityId ActionPipeline::resolve(AbilityId attempted) {
    if (!automationAllowed(attempted)) {
        ++counters_.passThroughs;
        return attempted;
    }
    syncKeys();

    const TimeMs now = snapshot_.clock().nowMs();
    if (const auto hit = passThrough_.lookup(attempted, now)) return *hit;
    return resolveUncached(attempted, now);
}

int ActionPipeline::suggestWeaves(Resolve::WeavePick& out) {
    out = Resolve::WeavePick{};
    if (!snapshot_.canProcess() || snapshot_.isStale(settings_.staleThresholdMs)) return 0;
    return specializer_.suggestWeaves(snapshot_, out);
}

ActorId ActionPipeline::resolveTarget(AbilityId abilityId) {
    if (!isPlausibleAbility(abilityId) || !snapshot_.initialized()) return kNoActor;
    const Targeting::TargetRule* rule = specializer_.targetRuleFor(abilityId, snapshot_);
    if (!rule) return kNoActor;
    return targeting_.targetFor(*rule, snapshot_, snapshot_.clock().nowMs());
}

Decision ActionPipeline::decide(AbilityId attempted) {
    Decision d;
    d.abilityId = resolve(attempted);
    Resolve::WeavePick pick;
    d.weaveCount = suggestWeaves(pick);
    d.weaves = pick.ids;
    d.targetId = resolveTarget(d.abilityId);
    if (d.targetId == kNoActor && d.abilityId != attempted) d.targetId = resolveTarget(attempted);
    return d;
}

void ActionPipeline::setSettings(const PipelineSettings& settings) {
    settings_ = settings;
    specializer_.setWeaveTiming(settings.weaveTiming);
    passThrough_.setTimeoutMs(settings.configCacheTimeoutMs);
    clearCaches();
}

void ActionPipeline::clearCaches() {
    frameCache_.clear();
    passThrough_.clear();
    memoCount_ = 0;
    memoValid_ = false;
}

const PipelineCounters& ActionPipeline::counters() const {
    counters_.frameCacheHits = frameCache_.hits();
    counters_.frameCacheMisses = frameCache_.misses();
    counters_.configCacheHits = passThrough_.hits();
    counters_.configCacheMisses = passThrough_.misses();
    return counters_;
}

bool ActionPipeline::automationAllowed(AbilityId attempted) const {
    if (!isPlausibleAbility(attempted)) return false;
    if (!snapshot_.canProcess()) return false;
    return !snapshot_.isStale(settings_.staleThresholdMs);
}

void ActionPipeline::syncKeys() {
    const RoleId role = snapshot_.roleId();
    const std::uint32_t version = context_.currentVersion();
    if (role == lastRole_ && version == lastVersion_) return;
    // Frame-keyed entries do not carry role or version.
    clearCaches();
    lastRole_ = role;
    lastVersion_ = version;
}

AbilityId ActionPipeline::resolveUncached(AbilityId attempted, TimeMs now) {
    const std::uint32_t frame = snapshot_.frameStamp();
    AbilityId result = attempted;

    if (specializer_.supportsWeaving(snapshot_)) {
        if (memoLookup(attempted, result)) {
            ++counters_.memoHits;
            return result;
        }
        result = specializer_.resolve(attempted, snapshot_);
        memoStore(attempted, result);
    } else {
        if (const auto hit = frameCache_.lookup(attempted, frame)) return *hit;
        result = specializer_.resolve(attempted, snapshot_);
        frameCache_.insert(attempted, result, frame, now);
    }
    ++counters_.resolutions;

    if (result == attempted && !specializer_.touches(attempted, snapshot_)) {
        passThrough_.insert(attempted, attempted, now);
    }
    return result;
}

bool ActionPipeline::memoLookup(AbilityId key, AbilityId& value) {
    const std::uint32_t frame = snapshot_.frameStamp();
    if (!memoValid_ || memoFrame_ != frame) {
        memoCount_ = 0;
        memoFrame_ = frame;
        memoValid_ = true;
        return false;
    }
    for (std::size_t i = 0; i < memoCount_; ++i) {
        if (memo_[i].key == key) {
            value = memo_[i].value;
            return true;
        }
    }
    return false;
}

void ActionPipeline::memoStore(AbilityId key, AbilityId value) {
    if (memoCount_ >= kMemoSlots) return;
    memo_[memoCount_++] = MemoEntry{key, value};
}

}  // namespace Cadence::Dispatch
