#include "ActionResolutionCache.h"

#include <utility>

namespace Cadence::Cache {

std::optional<AbilityId> ActionResolutionCache::lookup(AbilityId key, std::uint32_t frame) {
    auto& set = sets_[setIndex(key)];
    for (std::size_t way = 0; way < kWays; ++way) {
        auto& slot = set[way];
        if (!slot.used || slot.key != key) continue;
        if (slot.frame != frame) {
            slot.used = false;
            break;
        }
        const AbilityId value = slot.value;
        if (way != 0) std::swap(set[0], set[way]);
        ++hits_;
        return value;
    }
    ++misses_;
    return std::nullopt;
}

void ActionResolutionCache::insert(AbilityId key, AbilityId value, std::uint32_t frame, TimeMs now) {
    auto& set = sets_[setIndex(key)];
    const Slot fresh{key, value, now, frame, true};

    for (std::size_t way = 0; way < kWays; ++way) {
        if (set[way].used && set[way].key == key) {
            set[way] = fresh;
            if (way != 0) std::swap(set[0], set[way]);
            return;
        }
    }

    if (!set[0].used) {
        set[0] = fresh;
        return;
    }
    if (!set[1].used) {
        set[1] = set[0];
        set[0] = fresh;
        return;
    }

    // Evict the older insertion; the newcomer always lands in way 0.
    const std::size_t victim = set[0].insertedAtMs <= set[1].insertedAtMs ? 0 : 1;
    set[victim] = fresh;
    if (victim != 0) std::swap(set[0], set[victim]);
}

void ActionResolutionCache::clear() {
    for (auto& set : sets_) {
        for (auto& slot : set) slot.used = false;
    }
}

std::size_t ActionResolutionCache::occupied() const {
    std::size_t n = 0;
    for (const auto& set : sets_) {
        for (const auto& slot : set) {
            if (slot.used) ++n;
        }
    }
    return n;
}

}  // namespace Cadence::Cache
