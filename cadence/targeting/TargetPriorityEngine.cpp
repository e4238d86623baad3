#include "TargetPriorityEngine.h"

#include <algorithm>

namespace Cadence::Targeting {

namespace {
constexpr std::uint32_t kHealable = MemberFlags::kValidAbilityTarget | MemberFlags::kAlly;

bool eligible(std::uint32_t flags, float hp, float threshold) {
    return (flags & kHealable) == kHealable && hp > 0.0f && hp < threshold;
}
}  // namespace

TargetPriorityEngine::TargetPriorityEngine(TargetingConfig config) { setConfig(config); }

void TargetPriorityEngine::setConfig(const TargetingConfig& config) {
    config_ = config;
    config_.rosterRefreshMs = std::clamp(config.rosterRefreshMs, kMinRosterRefreshMs, kMaxRosterRefreshMs);
    config_.companionRefreshMs =
        std::clamp(config.companionRefreshMs, kMinCompanionRefreshMs, kMaxCompanionRefreshMs);
    roster_.markUnsorted();
}

bool TargetPriorityEngine::updateParty(const std::vector<PartyMember>& members, TimeMs now) {
    return roster_.update(members, now);
}

void TargetPriorityEngine::setHardTarget(ActorId id, bool valid) {
    pushedHardTarget_ = id;
    pushedHardTargetValid_ = valid;
}

ActorId TargetPriorityEngine::smartTarget(TimeMs now, float hpThreshold) {
    if (!ready()) return kNoActor;

    const ActorId hard = hardTarget();
    if (hard != kNoActor) return hard;

    if (selfNeedsHealingMost(hpThreshold)) return roster_.selfId();

    roster_.ensureSorted(now, config_.rosterRefreshMs);
    float memberHp = 1.0f;
    const ActorId member = bestPartyMember(hpThreshold, memberHp);
    if (member != kNoActor) {
        if (config_.companionOverrideDelta) {
            const auto comp = companionInNeed(now, hpThreshold);
            if (comp && comp->hp + *config_.companionOverrideDelta < memberHp) return comp->id;
        }
        return member;
    }

    if (const auto comp = companionInNeed(now, hpThreshold)) return comp->id;

    return roster_.selfId();
}

ActorId TargetPriorityEngine::cleanseTarget(TimeMs now) {
    if (!ready()) return kNoActor;

    const ActorId hard = hardTarget();
    if (hard != kNoActor) {
        const int i = roster_.indexOf(hard);
        if (i >= 0 && roster_.hasFlags(static_cast<std::size_t>(i), kHealable | MemberFlags::kCleansable)) return hard;
    }

    // Self is not special-cased here; it takes its place in the sorted scan.
    roster_.ensureSorted(now, config_.rosterRefreshMs);
    for (std::size_t rank = 0; rank < roster_.count(); ++rank) {
        const std::size_t i = roster_.sortedAt(rank);
        if (roster_.idAt(i) == kNoActor || roster_.hpAt(i) <= 0.0f) continue;
        if (!roster_.hasFlags(i, kHealable | MemberFlags::kCleansable)) continue;
        if (config_.companionOverrideDelta) {
            const auto comp = cleansableCompanion(now);
            if (comp && comp->hp + *config_.companionOverrideDelta < roster_.hpAt(i)) return comp->id;
        }
        return roster_.idAt(i);
    }

    if (const auto comp = cleansableCompanion(now)) return comp->id;
    return kNoActor;
}

ActorId TargetPriorityEngine::groundTarget(const State::StateSnapshot& snapshot) const {
    const ActorId current = snapshot.targetId();
    if (current != kNoActor && snapshot.hasTarget() && !isValidTarget(current)) return current;

    for (std::size_t i = 0; i < roster_.count(); ++i) {
        const ActorId id = roster_.idAt(i);
        if (id != kNoActor && roster_.hasFlags(i, MemberFlags::kTank) && isValidTarget(id)) return id;
    }
    return selfOrFirstAlly();
}

ActorId TargetPriorityEngine::targetFor(const TargetRule& rule, const State::StateSnapshot& snapshot, TimeMs now) {
    switch (rule.mode) {
        case TargetingMode::GroundTarget:
            return groundTarget(snapshot);
        case TargetingMode::GroundTargetSpecial:
            if (rule.secondaryAbilityId != kNoAbility && rule.requiredBuffId != 0 &&
                snapshot.hasBuff(rule.requiredBuffId)) {
                return smartTarget(now);
            }
            return groundTarget(snapshot);
        case TargetingMode::Cleanse:
            return cleanseTarget(now);
        case TargetingMode::SmartAbility:
        default:
            return smartTarget(now);
    }
}

AbilityId TargetPriorityEngine::resolvedAbilityFor(const TargetRule& rule, const State::StateSnapshot& snapshot) const {
    if (rule.mode == TargetingMode::GroundTargetSpecial && rule.secondaryAbilityId != kNoAbility &&
        rule.requiredBuffId != 0 && snapshot.hasBuff(rule.requiredBuffId)) {
        return rule.secondaryAbilityId;
    }
    return rule.abilityId;
}

bool TargetPriorityEngine::isValidTarget(ActorId id) const {
    const int i = roster_.indexOf(id);
    return i >= 0 && roster_.hasFlags(static_cast<std::size_t>(i), kHealable);
}

bool TargetPriorityEngine::needsHealing(ActorId id, float threshold) const {
    const int i = roster_.indexOf(id);
    return i >= 0 && roster_.hpAt(static_cast<std::size_t>(i)) < threshold;
}

ActorId TargetPriorityEngine::hardTarget() const {
    if (pushedHardTargetValid_ && pushedHardTarget_ != kNoActor) return pushedHardTarget_;
    for (std::size_t i = 0; i < roster_.count(); ++i) {
        if (roster_.hasFlags(i, MemberFlags::kHardTarget) && roster_.idAt(i) != kNoActor) return roster_.idAt(i);
    }
    return kNoActor;
}

bool TargetPriorityEngine::selfNeedsHealingMost(float hpThreshold) const {
    const int self = roster_.selfIndex();
    if (self < 0) return false;
    const auto s = static_cast<std::size_t>(self);
    const float selfHp = roster_.hpAt(s);
    if (!eligible(roster_.flagsAt(s), selfHp, hpThreshold)) return false;

    // Shortcut only when nobody healable is strictly lower, so skipping the sort never changes the answer.
    for (std::size_t i = 0; i < roster_.count(); ++i) {
        if (i == s) continue;
        if (!eligible(roster_.flagsAt(i), roster_.hpAt(i), hpThreshold)) continue;
        const float hp = roster_.hpAt(i);
        if (hp < selfHp || (hp == selfHp && i < s)) return false;
    }
    return true;
}

ActorId TargetPriorityEngine::bestPartyMember(float hpThreshold, float& hpOut) const {
    for (std::size_t rank = 0; rank < roster_.count(); ++rank) {
        const std::size_t i = roster_.sortedAt(rank);
        if (eligible(roster_.flagsAt(i), roster_.hpAt(i), hpThreshold)) {
            hpOut = roster_.hpAt(i);
            return roster_.idAt(i);
        }
    }
    return kNoActor;
}

std::optional<CompanionSample> TargetPriorityEngine::companionInNeed(TimeMs now, float hpThreshold) const {
    auto sample = companion_.fresh(now, config_.companionRefreshMs);
    if (!sample || sample->hp <= 0.0f || sample->hp >= hpThreshold) return std::nullopt;
    return sample;
}

std::optional<CompanionSample> TargetPriorityEngine::cleansableCompanion(TimeMs now) const {
    auto sample = companion_.fresh(now, config_.companionRefreshMs);
    if (!sample || !sample->cleansable || sample->hp <= 0.0f) return std::nullopt;
    return sample;
}

ActorId TargetPriorityEngine::selfOrFirstAlly() const {
    const ActorId self = roster_.selfId();
    if (self != kNoActor) return self;
    for (std::size_t i = 0; i < roster_.count(); ++i) {
        if (isValidTarget(roster_.idAt(i))) return roster_.idAt(i);
    }
    return kNoActor;
}

}  // namespace Cadence::Targeting
