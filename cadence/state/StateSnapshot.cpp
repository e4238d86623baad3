#include "StateSnapshot.h"

#include <exception>
#include <string>

#include "../core/Logger.h"

namespace Cadence::State {

StateSnapshot::StateSnapshot(Clock clock) : clock_(std::move(clock)) {}

void StateSnapshot::updateCore(const CoreState& state) {
    const RoleId previous = core_.roleId;
    const bool hadState = initialized_;

    core_ = state;
    lastUpdateMs_ = clock_.nowMs();
    ++frameStamp_;
    initialized_ = true;

    if (!hadState || previous == state.roleId) return;
    for (auto& cb : roleListeners_) {
        try {
            cb(previous, state.roleId);
        } catch (const std::exception& e) {
            logError(std::string("Role change listener failed: ") + e.what());
        }
    }
}

void StateSnapshot::updateScalars(float lockRemaining, std::uint32_t currentMp, std::uint32_t maxMp) {
    lockRemaining_ = lockRemaining;
    currentMp_ = currentMp;
    maxMp_ = maxMp;
}

void StateSnapshot::updateBuffs(const std::vector<TrackedUpdate>& pushed) {
    buffs_.apply(pushed, clock_.nowMs());
}

void StateSnapshot::updateDebuffs(const std::vector<TrackedUpdate>& pushed) {
    debuffs_.apply(pushed, clock_.nowMs());
}

void StateSnapshot::updateCooldowns(const std::vector<TrackedUpdate>& pushed) {
    cooldowns_.apply(pushed, clock_.nowMs());
}

void StateSnapshot::registerTracking(const TrackingSet& set) {
    buffs_.registerKeys(set.buffs);
    debuffs_.registerKeys(set.debuffs);
    cooldowns_.registerKeys(set.cooldowns);
}

void StateSnapshot::onRoleChanged(RoleChangedCallback cb) {
    if (cb) roleListeners_.push_back(std::move(cb));
}

void StateSnapshot::reset() {
    core_ = CoreState{};
    lockRemaining_ = 0.0f;
    currentMp_ = 0;
    maxMp_ = 0;
    frameStamp_ = 0;
    lastUpdateMs_ = 0;
    initialized_ = false;
    buffs_.clear();
    debuffs_.clear();
    cooldowns_.clear();
}

float StateSnapshot::buffRemaining(EffectId id) const { return buffs_.remaining(id, clock_.nowMs()); }

float StateSnapshot::debuffRemaining(EffectId id) const { return debuffs_.remaining(id, clock_.nowMs()); }

float StateSnapshot::cooldownRemaining(EffectId id) const { return cooldowns_.remaining(id, clock_.nowMs()); }

bool StateSnapshot::hasBuff(EffectId id) const { return buffRemaining(id) > 0.0f; }

bool StateSnapshot::targetHasDebuff(EffectId id) const { return debuffRemaining(id) > 0.0f; }

bool StateSnapshot::isActionReady(AbilityId id) const {
    const float cd = cooldownRemaining(id);
    if (cd == kUnobserved) return false;
    return cd <= 0.0f;
}

bool StateSnapshot::isSecondaryReady(AbilityId id) const {
    if (!canProcess()) return false;
    return isActionReady(id);
}

float StateSnapshot::mpFraction() const {
    if (maxMp_ == 0) return 0.0f;
    return static_cast<float>(currentMp_) / static_cast<float>(maxMp_);
}

bool StateSnapshot::isMpLow(float threshold) const { return mpFraction() < threshold; }

TimeMs StateSnapshot::timeSinceUpdateMs() const {
    if (!initialized_) return 0;
    return clock_.nowMs() - lastUpdateMs_;
}

bool StateSnapshot::isStale(TimeMs thresholdMs) const {
    if (!initialized_) return true;
    return timeSinceUpdateMs() > thresholdMs;
}

bool StateSnapshot::canWeave(int count, float perAbilityLock) const {
    if (lockRemaining_ <= 0.0f) return true;
    return lockRemaining_ >= static_cast<float>(count) * perAbilityLock;
}

SnapshotView StateSnapshot::view() const {
    SnapshotView v;
    v.core = core_;
    v.lockRemaining = lockRemaining_;
    v.currentMp = currentMp_;
    v.maxMp = maxMp_;
    v.frameStamp = frameStamp_;
    v.updatedAtMs = lastUpdateMs_;
    return v;
}

}  // namespace Cadence::State
