// Remaining-time table for buffs, debuffs, or cooldowns keyed by id.
#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "../core/Ids.h"
#include "../core/Time.h"

namespace Cadence::State {

// Returned for keys that are registered but have not appeared in any push yet.
constexpr float kUnobserved = -999.0f;

struct TrackedUpdate {
    EffectId id{0};
    float remainingSeconds{0.0f};
};

class TrackedTimers {
public:
    // Registered keys start unobserved. Already-known keys are left alone.
    void registerKeys(const std::vector<EffectId>& ids);

    // Keys in the push are refreshed; observed keys missing from it decay to 0.
    void apply(const std::vector<TrackedUpdate>& pushed, TimeMs now);

    // 0 for unknown keys, kUnobserved for never-seen keys, otherwise seconds left (never negative).
    float remaining(EffectId id, TimeMs now) const;

    bool isTracked(EffectId id) const { return entries_.count(id) != 0; }
    bool isObserved(EffectId id) const;
    std::size_t size() const { return entries_.size(); }
    void clear();

private:
    struct Entry {
        TimeMs expiresAtMs{0};
        bool observed{false};
        std::uint32_t pushSerial{0};
    };

    std::unordered_map<EffectId, Entry> entries_;
    std::uint32_t pushSerial_{0};
};

}  // namespace Cadence::State
