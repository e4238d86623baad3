// Fixed-size party roster stored as parallel arrays, rewritten wholesale per refresh.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../core/Ids.h"
#include "../core/Time.h"

namespace Cadence::Targeting {

constexpr std::size_t kMaxPartySize = 8;

namespace MemberFlags {
constexpr std::uint32_t kAlive = 1u << 0;
constexpr std::uint32_t kInRange = 1u << 1;
constexpr std::uint32_t kInLos = 1u << 2;
constexpr std::uint32_t kTargetable = 1u << 3;
constexpr std::uint32_t kSelf = 1u << 4;
constexpr std::uint32_t kHardTarget = 1u << 5;
constexpr std::uint32_t kTank = 1u << 6;
constexpr std::uint32_t kHealer = 1u << 7;
constexpr std::uint32_t kMelee = 1u << 8;
constexpr std::uint32_t kRanged = 1u << 9;
constexpr std::uint32_t kAlly = 1u << 10;
constexpr std::uint32_t kCleansable = 1u << 11;  // carries a debuff a cleanse can remove

constexpr std::uint32_t kValidAbilityTarget = kAlive | kInRange | kInLos | kTargetable;
}  // namespace MemberFlags

struct PartyMember {
    ActorId id{kNoActor};
    float hp{1.0f};  // 0..1
    std::uint32_t flags{0};
};

class PartyRoster {
public:
    // Returns false when the push matched the stored roster (only freshness moves).
    bool update(const std::vector<PartyMember>& members, TimeMs now);
    void clear();

    // Stable insertion sort by need; skipped inside refreshMs of the previous sort.
    bool ensureSorted(TimeMs now, TimeMs refreshMs);
    void markUnsorted() { sortDirty_ = true; }

    std::size_t count() const { return count_; }
    bool empty() const { return count_ == 0; }
    int selfIndex() const { return selfIndex_; }
    ActorId selfId() const;
    TimeMs updatedAtMs() const { return updatedAtMs_; }
    TimeMs sortedAtMs() const { return sortedAtMs_; }

    ActorId idAt(std::size_t i) const { return ids_[i]; }
    float hpAt(std::size_t i) const { return hp_[i]; }
    std::uint32_t flagsAt(std::size_t i) const { return flags_[i]; }
    std::size_t sortedAt(std::size_t rank) const { return sorted_[rank]; }

    // -1 when id is 0 or not on the roster.
    int indexOf(ActorId id) const;
    bool hasFlags(std::size_t i, std::uint32_t mask) const { return (flags_[i] & mask) == mask; }
    bool isAlly(ActorId id) const;
    bool isTank(ActorId id) const;
    float hpOf(ActorId id) const;

private:
    bool sameAs(const std::vector<PartyMember>& members, std::size_t n) const;

    alignas(16) std::array<ActorId, kMaxPartySize> ids_{};
    std::array<float, kMaxPartySize> hp_{};
    std::array<std::uint32_t, kMaxPartySize> flags_{};
    std::array<std::uint8_t, kMaxPartySize> sorted_{};
    std::size_t count_{0};
    int selfIndex_{-1};
    TimeMs updatedAtMs_{0};
    TimeMs sortedAtMs_{0};
    bool sortDirty_{true};
};

}  // namespace Cadence::Targeting
