#include "PartyRoster.h"

#include <algorithm>
#include <cmath>

#if defined(CADENCE_ENABLE_SIMD) && (defined(__SSE2__) || defined(_M_X64))
#include <emmintrin.h>
#define CADENCE_ROSTER_SSE2 1
#endif

namespace Cadence::Targeting {

namespace {
constexpr float kHpEpsilon = 1e-4f;

// Dead members sink; lower HP first among the living.
bool needsBefore(float hpA, bool aliveA, float hpB, bool aliveB) {
    if (aliveA != aliveB) return aliveA;
    return hpA < hpB;
}
}  // namespace

bool PartyRoster::update(const std::vector<PartyMember>& members, TimeMs now) {
    const std::size_t n = std::min(members.size(), kMaxPartySize);
    updatedAtMs_ = now;
    if (n == count_ && n > 0 && sameAs(members, n)) return false;

    count_ = n;
    selfIndex_ = -1;
    for (std::size_t i = 0; i < kMaxPartySize; ++i) {
        if (i < n) {
            ids_[i] = members[i].id;
            hp_[i] = std::clamp(members[i].hp, 0.0f, 1.0f);
            flags_[i] = members[i].flags;
            if (selfIndex_ < 0 && (flags_[i] & MemberFlags::kSelf) != 0) selfIndex_ = static_cast<int>(i);
        } else {
            ids_[i] = kNoActor;
            hp_[i] = 0.0f;
            flags_[i] = 0;
        }
        sorted_[i] = static_cast<std::uint8_t>(i);
    }
    sortDirty_ = true;
    return true;
}

void PartyRoster::clear() {
    ids_.fill(kNoActor);
    hp_.fill(0.0f);
    flags_.fill(0);
    for (std::size_t i = 0; i < kMaxPartySize; ++i) sorted_[i] = static_cast<std::uint8_t>(i);
    count_ = 0;
    selfIndex_ = -1;
    sortDirty_ = true;
}

bool PartyRoster::ensureSorted(TimeMs now, TimeMs refreshMs) {
    if (!sortDirty_ && now - sortedAtMs_ < refreshMs) return false;

    for (std::size_t i = 0; i < count_; ++i) sorted_[i] = static_cast<std::uint8_t>(i);
    for (std::size_t i = 1; i < count_; ++i) {
        const std::uint8_t key = sorted_[i];
        const bool keyAlive = (flags_[key] & MemberFlags::kAlive) != 0;
        std::size_t j = i;
        while (j > 0) {
            const std::uint8_t prev = sorted_[j - 1];
            const bool prevAlive = (flags_[prev] & MemberFlags::kAlive) != 0;
            if (!needsBefore(hp_[key], keyAlive, hp_[prev], prevAlive)) break;
            sorted_[j] = prev;
            --j;
        }
        sorted_[j] = key;
    }
    sortedAtMs_ = now;
    sortDirty_ = false;
    return true;
}

ActorId PartyRoster::selfId() const {
    if (selfIndex_ < 0) return kNoActor;
    return ids_[static_cast<std::size_t>(selfIndex_)];
}

int PartyRoster::indexOf(ActorId id) const {
    if (id == kNoActor) return -1;
#if defined(CADENCE_ROSTER_SSE2)
    static_assert(kMaxPartySize == 8, "SSE2 roster search assumes two 4-lane loads");
    const __m128i needle = _mm_set1_epi32(static_cast<int>(id));
    const __m128i lo = _mm_load_si128(reinterpret_cast<const __m128i*>(ids_.data()));
    const __m128i hi = _mm_load_si128(reinterpret_cast<const __m128i*>(ids_.data() + 4));
    const int maskLo = _mm_movemask_ps(_mm_castsi128_ps(_mm_cmpeq_epi32(lo, needle)));
    const int maskHi = _mm_movemask_ps(_mm_castsi128_ps(_mm_cmpeq_epi32(hi, needle)));
    unsigned mask = static_cast<unsigned>(maskLo | (maskHi << 4));
    mask &= (1u << count_) - 1u;
    for (std::size_t i = 0; i < count_; ++i) {
        if (mask & (1u << i)) return static_cast<int>(i);
    }
    return -1;
#else
    for (std::size_t i = 0; i < count_; ++i) {
        if (ids_[i] == id) return static_cast<int>(i);
    }
    return -1;
#endif
}

bool PartyRoster::isAlly(ActorId id) const {
    const int i = indexOf(id);
    return i >= 0 && (flags_[static_cast<std::size_t>(i)] & MemberFlags::kAlly) != 0;
}

bool PartyRoster::isTank(ActorId id) const {
    const int i = indexOf(id);
    return i >= 0 && (flags_[static_cast<std::size_t>(i)] & MemberFlags::kTank) != 0;
}

float PartyRoster::hpOf(ActorId id) const {
    const int i = indexOf(id);
    return i >= 0 ? hp_[static_cast<std::size_t>(i)] : 0.0f;
}

bool PartyRoster::sameAs(const std::vector<PartyMember>& members, std::size_t n) const {
    for (std::size_t i = 0; i < n; ++i) {
        if (ids_[i] != members[i].id || flags_[i] != members[i].flags) return false;
        if (std::fabs(hp_[i] - std::clamp(members[i].hp, 0.0f, 1.0f)) > kHpEpsilon) return false;
    }
    return true;
}

}  // namespace Cadence::Targeting
