#include "TrackedTimers.h"

#include <algorithm>

namespace Cadence::State {

void TrackedTimers::registerKeys(const std::vector<EffectId>& ids) {
    for (EffectId id : ids) {
        entries_.emplace(id, Entry{});
    }
}

void TrackedTimers::apply(const std::vector<TrackedUpdate>& pushed, TimeMs now) {
    ++pushSerial_;
    if (pushSerial_ == 0) {
        // Serial 0 is the "never pushed" value of a fresh entry.
        for (auto& kv : entries_) kv.second.pushSerial = 0;
        pushSerial_ = 1;
    }

    for (const auto& u : pushed) {
        auto& e = entries_[u.id];
        const float secs = std::max(0.0f, u.remainingSeconds);
        e.expiresAtMs = now + static_cast<TimeMs>(secs * 1000.0f);
        e.observed = true;
        e.pushSerial = pushSerial_;
    }

    for (auto& kv : entries_) {
        auto& e = kv.second;
        if (e.pushSerial == pushSerial_ || !e.observed) continue;
        e.expiresAtMs = now;
    }
}

float TrackedTimers::remaining(EffectId id, TimeMs now) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return 0.0f;
    if (!it->second.observed) return kUnobserved;
    const TimeMs left = it->second.expiresAtMs - now;
    if (left <= 0) return 0.0f;
    return static_cast<float>(left) / 1000.0f;
}

bool TrackedTimers::isObserved(EffectId id) const {
    auto it = entries_.find(id);
    return it != entries_.end() && it->second.observed;
}

void TrackedTimers::clear() {
    entries_.clear();
    pushSerial_ = 0;
}

}  // namespace Cadence::State
