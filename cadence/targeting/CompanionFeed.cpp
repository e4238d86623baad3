#include "CompanionFeed.h"

namespace Cadence::Targeting {

void CompanionFeed::setSystemState(bool enabled, bool inRestrictedArea) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
    inRestrictedArea_ = inRestrictedArea;
    if (!enabled || inRestrictedArea) resetLocked();
}

void CompanionFeed::push(ActorId id, float hp, bool valid, TimeMs now, bool cleansable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_ || inRestrictedArea_) {
        resetLocked();
        return;
    }
    sample_.id = id;
    sample_.hp = hp;
    sample_.valid = valid;
    sample_.cleansable = cleansable;
    sample_.sampledAtMs = now;
}

void CompanionFeed::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
}

std::optional<CompanionSample> CompanionFeed::fresh(TimeMs now, TimeMs windowMs) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_ || inRestrictedArea_) return std::nullopt;
    if (!sample_.valid || sample_.id == kNoActor) return std::nullopt;
    if (now - sample_.sampledAtMs > windowMs) return std::nullopt;
    return sample_;
}

bool CompanionFeed::needsScan(TimeMs now, TimeMs windowMs) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_ || inRestrictedArea_) return false;
    return sample_.sampledAtMs == 0 || now - sample_.sampledAtMs >= windowMs;
}

bool CompanionFeed::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_ && !inRestrictedArea_;
}

void CompanionFeed::resetLocked() {
    sample_ = CompanionSample{};
}

}  // namespace Cadence::Targeting
