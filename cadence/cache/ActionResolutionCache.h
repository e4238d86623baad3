// Two-way set-associative memo of ability resolutions, valid for one frame.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "../core/Ids.h"
#include "../core/Time.h"

namespace Cadence::Cache {

class ActionResolutionCache {
public:
    static constexpr std::size_t kSets = 32;
    static constexpr std::size_t kWays = 2;
    static constexpr std::size_t kCapacity = kSets * kWays;

    // Hit only if the entry was stored under the same frame; stale entries are evicted.
    std::optional<AbilityId> lookup(AbilityId key, std::uint32_t frame);
    void insert(AbilityId key, AbilityId value, std::uint32_t frame, TimeMs now);
    void clear();

    std::size_t occupied() const;
    std::uint64_t hits() const { return hits_; }
    std::uint64_t misses() const { return misses_; }

    static std::size_t setIndex(AbilityId key) { return (key ^ (key >> 16)) & (kSets - 1); }

private:
    struct Slot {
        AbilityId key{0};
        AbilityId value{0};
        TimeMs insertedAtMs{0};
        std::uint32_t frame{0};
        bool used{false};
    };
    using Set = std::array<Slot, kWays>;

    std::array<Set, kSets> sets_{};
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
};

}  // namespace Cadence::Cache
