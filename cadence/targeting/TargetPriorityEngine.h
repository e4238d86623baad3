// Picks the recipient of a support ability from the party roster.
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Ids.h"
#include "../core/Time.h"
#include "../state/StateSnapshot.h"
#include "CompanionFeed.h"
#include "PartyRoster.h"
#include "TargetRules.h"

namespace Cadence::Targeting {

constexpr TimeMs kDefaultRosterRefreshMs = 30;
constexpr TimeMs kMinRosterRefreshMs = 25;
constexpr TimeMs kMaxRosterRefreshMs = 100;
constexpr TimeMs kDefaultCompanionRefreshMs = 100;
constexpr TimeMs kMinCompanionRefreshMs = 50;
constexpr TimeMs kMaxCompanionRefreshMs = 250;

struct TargetingConfig {
    float hpThreshold{1.0f};
    TimeMs rosterRefreshMs{kDefaultRosterRefreshMs};
    TimeMs companionRefreshMs{kDefaultCompanionRefreshMs};
    // When set, a companion beats the chosen party member if its HP + delta is still lower.
    std::optional<float> companionOverrideDelta{};
};

class TargetPriorityEngine {
public:
    explicit TargetPriorityEngine(TargetingConfig config = {});

    // Refresh intervals are clamped to their supported ranges.
    void setConfig(const TargetingConfig& config);
    const TargetingConfig& config() const { return config_; }

    bool updateParty(const std::vector<PartyMember>& members, TimeMs now);
    void setHardTarget(ActorId id, bool valid);
    void clearHardTarget() { setHardTarget(kNoActor, false); }

    CompanionFeed& companion() { return companion_; }
    const CompanionFeed& companion() const { return companion_; }
    const PartyRoster& roster() const { return roster_; }

    bool ready() const { return !roster_.empty(); }
    bool isFresh(TimeMs now) const { return ready() && now - roster_.updatedAtMs() < config_.rosterRefreshMs; }

    // Hard target, self-need, neediest ally, companion, then self. 0 when the roster is empty.
    ActorId smartTarget(TimeMs now) { return smartTarget(now, config_.hpThreshold); }
    ActorId smartTarget(TimeMs now, float hpThreshold);

    // Same cascade restricted to actors carrying a cleansable debuff. 0 when nobody qualifies.
    ActorId cleanseTarget(TimeMs now);

    // Enemy target under the cursor, else a tank, else self.
    ActorId groundTarget(const State::StateSnapshot& snapshot) const;

    ActorId targetFor(const TargetRule& rule, const State::StateSnapshot& snapshot, TimeMs now);
    // Follow-up ability for GroundTargetSpecial rules whose buff is active.
    AbilityId resolvedAbilityFor(const TargetRule& rule, const State::StateSnapshot& snapshot) const;

    bool isValidTarget(ActorId id) const;
    bool needsHealing(ActorId id, float threshold = 1.0f) const;

private:
    ActorId hardTarget() const;
    bool selfNeedsHealingMost(float hpThreshold) const;
    ActorId bestPartyMember(float hpThreshold, float& hpOut) const;
    std::optional<CompanionSample> companionInNeed(TimeMs now, float hpThreshold) const;
    std::optional<CompanionSample> cleansableCompanion(TimeMs now) const;
    ActorId selfOrFirstAlly() const;

    TargetingConfig config_{};
    PartyRoster roster_;
    CompanionFeed companion_;
    ActorId pushedHardTarget_{kNoActor};
    bool pushedHardTargetValid_{false};
};

}  // namespace Cadence::Targeting
