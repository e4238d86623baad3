// Per-tick picture of the player's world state with staleness helpers.
#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "../core/Ids.h"
#include "../core/Time.h"
#include "TrackedTimers.h"

namespace Cadence::State {

namespace Flags {
constexpr std::uint32_t kInCombat = 1u << 0;
constexpr std::uint32_t kHasTarget = 1u << 1;
constexpr std::uint32_t kInRestrictedArea = 1u << 2;
constexpr std::uint32_t kCanAct = 1u << 3;
constexpr std::uint32_t kIsMoving = 1u << 4;
}  // namespace Flags

constexpr float kDefaultWeaveLock = 0.8f;
constexpr float kDefaultLowMpFraction = 0.3f;
constexpr TimeMs kDefaultStaleMs = 100;

struct CoreState {
    RoleId roleId{kNoRole};
    std::uint32_t level{0};
    ActorId targetId{kNoActor};
    std::uint32_t zoneId{0};
    std::uint32_t flags{0};
    std::uint32_t gauge1{0};
    std::uint32_t gauge2{0};
};

// Flat copy of the scalar part of a snapshot, safe to hand to another thread.
struct SnapshotView {
    CoreState core{};
    float lockRemaining{0.0f};
    std::uint32_t currentMp{0};
    std::uint32_t maxMp{0};
    std::uint32_t frameStamp{0};
    TimeMs updatedAtMs{0};
};

// Ids pre-registered at session start so "not observed" differs from "absent".
struct TrackingSet {
    std::vector<EffectId> buffs;
    std::vector<EffectId> debuffs;
    std::vector<EffectId> cooldowns;
};

class StateSnapshot {
public:
    using RoleChangedCallback = std::function<void(RoleId previous, RoleId current)>;

    explicit StateSnapshot(Clock clock = Clock{});

    // Overwrites the packed state and advances the frame stamp.
    void updateCore(const CoreState& state);
    void updateScalars(float lockRemaining, std::uint32_t currentMp, std::uint32_t maxMp);
    void updateBuffs(const std::vector<TrackedUpdate>& pushed);
    void updateDebuffs(const std::vector<TrackedUpdate>& pushed);
    void updateCooldowns(const std::vector<TrackedUpdate>& pushed);
    void registerTracking(const TrackingSet& set);
    void onRoleChanged(RoleChangedCallback cb);
    void reset();

    RoleId roleId() const { return core_.roleId; }
    std::uint32_t level() const { return core_.level; }
    ActorId targetId() const { return core_.targetId; }
    std::uint32_t zoneId() const { return core_.zoneId; }
    std::uint32_t flags() const { return core_.flags; }
    std::uint32_t gauge1() const { return core_.gauge1; }
    std::uint32_t gauge2() const { return core_.gauge2; }
    bool hasFlag(std::uint32_t flag) const { return (core_.flags & flag) != 0; }
    bool inCombat() const { return hasFlag(Flags::kInCombat); }
    bool hasTarget() const { return hasFlag(Flags::kHasTarget); }
    bool inRestrictedArea() const { return hasFlag(Flags::kInRestrictedArea); }
    bool canAct() const { return hasFlag(Flags::kCanAct); }
    bool isMoving() const { return hasFlag(Flags::kIsMoving); }

    float lockRemaining() const { return lockRemaining_; }
    std::uint32_t currentMp() const { return currentMp_; }
    std::uint32_t maxMp() const { return maxMp_; }
    std::uint32_t frameStamp() const { return frameStamp_; }
    TimeMs lastUpdateMs() const { return lastUpdateMs_; }
    bool initialized() const { return initialized_; }
    const Clock& clock() const { return clock_; }

    float buffRemaining(EffectId id) const;
    float debuffRemaining(EffectId id) const;
    float cooldownRemaining(EffectId id) const;

    bool hasBuff(EffectId id) const;
    bool targetHasDebuff(EffectId id) const;
    // Unobserved cooldowns are never ready.
    bool isActionReady(AbilityId id) const;
    bool isSecondaryReady(AbilityId id) const;
    bool canProcess() const { return inCombat() && canAct(); }

    float mpFraction() const;
    bool isMpLow(float threshold = kDefaultLowMpFraction) const;
    bool hasMpFor(std::uint32_t cost) const { return currentMp_ >= cost; }

    TimeMs timeSinceUpdateMs() const;
    bool isStale(TimeMs thresholdMs = kDefaultStaleMs) const;

    // True between primary actions or while enough lock is left for n secondaries.
    bool canWeave(int count = 1, float perAbilityLock = kDefaultWeaveLock) const;

    SnapshotView view() const;

private:
    Clock clock_{};
    CoreState core_{};
    float lockRemaining_{0.0f};
    std::uint32_t currentMp_{0};
    std::uint32_t maxMp_{0};
    std::uint32_t frameStamp_{0};
    TimeMs lastUpdateMs_{0};
    bool initialized_{false};

    TrackedTimers buffs_;
    TrackedTimers debuffs_;
    TrackedTimers cooldowns_;
    std::vector<RoleChangedCallback> roleListeners_;
};

}  // namespace Cadence::State
