#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "../cadence/core/Time.h"
#include "../cadence/state/StateSnapshot.h"
#include "../cadence/targeting/CompanionFeed.h"
#include "../cadence/targeting/PartyRoster.h"
#include "../cadence/targeting/TargetPriorityEngine.h"
#include "../cadence/targeting/TargetRules.h"

namespace {
using namespace Cadence::Targeting;
using Cadence::ActorId;

constexpr std::uint32_t kHealable = MemberFlags::kValidAbilityTarget | MemberFlags::kAlly;
constexpr std::uint32_t kSelfFlags = kHealable | MemberFlags::kSelf;

PartyMember member(ActorId id, float hp, std::uint32_t flags = kHealable) { return PartyMember{id, hp, flags}; }
}  // namespace

int main() {
    using namespace Cadence;
    using namespace Cadence::Targeting;
    {
        // Hard target wins even at 0 HP without the ally flag.
        TargetPriorityEngine engine;
        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.0f, MemberFlags::kHardTarget),
                            member(3, 0.2f)},
                           0);
        assert(engine.smartTarget(0) == 2);
    }
    {
        // Lowest eligible HP below the threshold.
        TargetPriorityEngine engine;
        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.8f), member(3, 0.6f)}, 0);
        assert(engine.smartTarget(0, 0.95f) == 3);
    }
    {
        // Everyone full: fall back to self.
        TargetPriorityEngine engine;
        engine.updateParty({member(2, 1.0f), member(1, 1.0f, kSelfFlags), member(3, 1.0f)}, 0);
        assert(engine.smartTarget(0) == 1);
        assert(!engine.needsHealing(2));
    }
    {
        // Self is picked when nobody healable is lower; ties go to the earlier slot.
        TargetPriorityEngine engine;
        engine.updateParty({member(1, 0.3f, kSelfFlags), member(2, 0.8f), member(3, 0.3f)}, 0);
        assert(engine.smartTarget(0) == 1);
        engine.updateParty({member(3, 0.3f), member(1, 0.3f, kSelfFlags), member(2, 0.8f)}, 10);
        assert(engine.smartTarget(10) == 3);
    }
    {
        // Out-of-range, dead and non-ally members are skipped.
        TargetPriorityEngine engine;
        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.1f, kHealable & ~MemberFlags::kInRange),
                            member(3, 0.0f), member(4, 0.2f, MemberFlags::kValidAbilityTarget),
                            member(5, 0.5f)},
                           0);
        assert(engine.smartTarget(0) == 5);
        assert(!engine.isValidTarget(2));
        assert(engine.isValidTarget(5));
        assert(!engine.isValidTarget(99));
    }
    {
        // A pushed hard target overrides until cleared; an empty roster has no answer.
        TargetPriorityEngine engine;
        assert(engine.smartTarget(0) == kNoActor);
        engine.updateParty({member(1, 0.5f, kSelfFlags)}, 0);
        engine.setHardTarget(77, true);
        assert(engine.smartTarget(0) == 77);
        engine.setHardTarget(77, false);
        assert(engine.smartTarget(0) == 1);
        engine.clearHardTarget();
        assert(engine.smartTarget(0) == 1);
    }
    {
        // Identical pushes only refresh freshness.
        TargetPriorityEngine engine;
        const std::vector<PartyMember> party = {member(1, 0.9f, kSelfFlags), member(2, 0.5f)};
        assert(engine.updateParty(party, 0));
        assert(!engine.updateParty(party, 20));
        assert(engine.isFresh(40));
        assert(!engine.isFresh(50));
        assert(engine.roster().updatedAtMs() == 20);
    }
    {
        // Companion only when fresh and nobody in the party needs healing first.
        TargetPriorityEngine engine;
        engine.companion().setSystemState(true, false);
        engine.updateParty({member(1, 1.0f, kSelfFlags), member(2, 1.0f)}, 0);
        engine.companion().push(50, 0.4f, true, 0);
        assert(engine.smartTarget(0) == 50);
        assert(engine.smartTarget(100) == 50);
        assert(engine.smartTarget(101) == 1);

        engine.updateParty({member(1, 1.0f, kSelfFlags), member(2, 0.7f)}, 200);
        engine.companion().push(50, 0.2f, true, 200);
        assert(engine.smartTarget(200) == 2);

        TargetingConfig cfg = engine.config();
        cfg.companionOverrideDelta = 0.3f;
        engine.setConfig(cfg);
        assert(engine.smartTarget(200) == 50);
        cfg.companionOverrideDelta = 0.6f;
        engine.setConfig(cfg);
        assert(engine.smartTarget(200) == 2);
    }
    {
        // Restricted areas and a disabled system drop the sample.
        CompanionFeed feed;
        feed.push(50, 0.5f, true, 0);
        assert(!feed.fresh(0, 100));
        feed.setSystemState(true, false);
        assert(feed.needsScan(0, 100));
        feed.push(50, 0.5f, true, 10);
        assert(feed.fresh(10, 100));
        assert(!feed.needsScan(50, 100));
        feed.setSystemState(true, true);
        assert(!feed.active());
        assert(!feed.fresh(10, 100));
        feed.setSystemState(true, false);
        assert(!feed.fresh(10, 100));
        feed.push(51, 0.5f, false, 20);
        assert(!feed.fresh(20, 100));
    }
    {
        // Refresh intervals are clamped.
        TargetingConfig cfg;
        cfg.rosterRefreshMs = 5;
        cfg.companionRefreshMs = 1000;
        TargetPriorityEngine engine(cfg);
        assert(engine.config().rosterRefreshMs == kMinRosterRefreshMs);
        assert(engine.config().companionRefreshMs == kMaxCompanionRefreshMs);
    }
    {
        // Roster keeps at most eight members, sorts dead last and keeps ties stable.
        PartyRoster roster;
        std::vector<PartyMember> big;
        for (ActorId id = 1; id <= 10; ++id) big.push_back(member(id, 0.5f));
        roster.update(big, 0);
        assert(roster.count() == kMaxPartySize);
        assert(roster.indexOf(8) == 7);
        assert(roster.indexOf(9) == -1);
        assert(roster.indexOf(kNoActor) == -1);
        assert(roster.selfIndex() == -1);
        assert(roster.selfId() == kNoActor);

        roster.update({member(1, 0.0f, 0), member(2, 0.5f), member(3, 0.2f), member(4, 0.5f), member(5, 1.5f)}, 0);
        assert(roster.hpOf(5) == 1.0f);
        assert(roster.ensureSorted(0, 30));
        assert(!roster.ensureSorted(10, 30));
        assert(roster.idAt(roster.sortedAt(0)) == 3);
        assert(roster.idAt(roster.sortedAt(1)) == 2);
        assert(roster.idAt(roster.sortedAt(2)) == 4);
        assert(roster.idAt(roster.sortedAt(3)) == 5);
        assert(roster.idAt(roster.sortedAt(4)) == 1);
    }
    {
        // Ground placement: enemy under the cursor, else tank, else self.
        ManualClock clock(0);
        State::StateSnapshot snap(clock.clock());
        TargetPriorityEngine engine;
        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.9f, kHealable | MemberFlags::kTank)}, 0);

        State::CoreState core;
        core.targetId = 9000;
        core.flags = State::Flags::kHasTarget;
        snap.updateCore(core);
        assert(engine.groundTarget(snap) == 9000);

        core.targetId = 2;
        snap.updateCore(core);
        assert(engine.groundTarget(snap) == 2);

        core.targetId = kNoActor;
        core.flags = 0;
        snap.updateCore(core);
        assert(engine.groundTarget(snap) == 2);

        engine.updateParty({member(1, 0.9f, kSelfFlags), member(3, 0.9f)}, 10);
        assert(engine.groundTarget(snap) == 1);
        engine.updateParty({member(3, 0.9f), member(4, 0.9f)}, 20);
        assert(engine.groundTarget(snap) == 3);
    }
    {
        // Ground-special swaps to its follow-up and a smart target while the buff is up.
        ManualClock clock(0);
        State::StateSnapshot snap(clock.clock());
        snap.registerTracking(State::TrackingSet{{2709}, {}, {}});
        snap.updateCore(State::CoreState{});
        TargetPriorityEngine engine;
        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.4f, kHealable | MemberFlags::kTank)}, 0);

        const TargetRule liturgy{25862, TargetingMode::GroundTargetSpecial, 28509, 2709, "Liturgy of the Bell"};
        const TargetRule asylum{3569, TargetingMode::GroundTarget, 0, 0, "Asylum"};
        assert(engine.resolvedAbilityFor(liturgy, snap) == 25862);
        assert(engine.targetFor(liturgy, snap, 0) == 2);

        snap.updateBuffs({{2709, 20.0f}});
        assert(engine.resolvedAbilityFor(liturgy, snap) == 28509);
        assert(engine.resolvedAbilityFor(asylum, snap) == 3569);

        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 1.0f, kHealable | MemberFlags::kTank),
                            member(3, 0.5f)},
                           0);
        assert(engine.targetFor(liturgy, snap, 0) == 3);
        assert(engine.targetFor(asylum, snap, 0) == 2);
    }
    {
        // Cleanse skips lower-HP members without a cleansable debuff.
        ManualClock clock(0);
        State::StateSnapshot snap(clock.clock());
        snap.updateCore(State::CoreState{});
        TargetPriorityEngine engine;
        const TargetRule esuna{7568, TargetingMode::Cleanse, 0, 0, "Esuna"};
        const TargetRule cure{120, TargetingMode::SmartAbility, 0, 0, "Cure"};

        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.3f), member(3, 0.7f)}, 0);
        assert(engine.targetFor(cure, snap, 0) == 2);
        assert(engine.targetFor(esuna, snap, 0) == kNoActor);
        assert(engine.cleanseTarget(0) == kNoActor);

        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.3f),
                            member(3, 0.7f, kHealable | MemberFlags::kCleansable),
                            member(4, 0.5f, MemberFlags::kValidAbilityTarget | MemberFlags::kCleansable)},
                           10);
        assert(engine.targetFor(esuna, snap, 10) == 3);

        // Self competes in the scan like anyone else.
        engine.updateParty({member(1, 0.6f, kSelfFlags | MemberFlags::kCleansable),
                            member(3, 0.7f, kHealable | MemberFlags::kCleansable)},
                           20);
        assert(engine.cleanseTarget(20) == 1);

        // Hard target only when it is cleansable itself.
        engine.updateParty({member(1, 0.9f, kSelfFlags), member(2, 0.8f, kHealable | MemberFlags::kHardTarget),
                            member(3, 0.7f, kHealable | MemberFlags::kCleansable)},
                           30);
        assert(engine.smartTarget(30) == 2);
        assert(engine.cleanseTarget(30) == 3);
        engine.updateParty({member(1, 0.9f, kSelfFlags),
                            member(2, 0.8f, kHealable | MemberFlags::kHardTarget | MemberFlags::kCleansable),
                            member(3, 0.7f, kHealable | MemberFlags::kCleansable)},
                           40);
        assert(engine.cleanseTarget(40) == 2);

        // Companion only when it carries the debuff, and overrides only past the delta.
        engine.companion().setSystemState(true, false);
        engine.updateParty({member(1, 0.9f, kSelfFlags)}, 50);
        engine.companion().push(50, 0.4f, true, 50);
        assert(engine.cleanseTarget(50) == kNoActor);
        engine.companion().push(50, 0.4f, true, 50, true);
        assert(engine.cleanseTarget(50) == 50);

        engine.updateParty({member(1, 0.9f, kSelfFlags), member(3, 0.8f, kHealable | MemberFlags::kCleansable)}, 60);
        engine.companion().push(50, 0.4f, true, 60, true);
        assert(engine.cleanseTarget(60) == 3);
        TargetingConfig cfg = engine.config();
        cfg.companionOverrideDelta = 0.2f;
        engine.setConfig(cfg);
        assert(engine.cleanseTarget(60) == 50);
    }
    {
        // A follow-up ability shares its parent's target rule.
        TargetRuleTable table;
        table.add(TargetRule{25862, TargetingMode::GroundTargetSpecial, 28509, 2709, "Liturgy of the Bell"});
        assert(table.size() == 1);
        assert(table.find(28509) == table.find(25862));
        assert(table.find(28509)->abilityId == 25862);
    }
    {
        // Rule table lookups and mode keys.
        TargetRuleTable table;
        table.add(TargetRule{120, TargetingMode::SmartAbility, 0, 0, "Cure"});
        table.add(TargetRule{7568, TargetingMode::Cleanse, 0, 0, "Esuna"});
        table.add(TargetRule{120, TargetingMode::GroundTarget, 0, 0, "Cure (ground)"});
        assert(table.size() == 2);
        assert(table.find(120)->mode == TargetingMode::GroundTarget);
        assert(table.find(121) == nullptr);
        assert(parseTargetingMode("GroundTargetSpecial") == TargetingMode::GroundTargetSpecial);
        assert(!parseTargetingMode("groundtarget"));
        assert(std::string(targetingModeName(TargetingMode::Cleanse)) == "Cleanse");
        table.clear();
        assert(table.empty());
    }
    return 0;
}
