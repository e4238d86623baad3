#include <cassert>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "../cadence/core/ConfigVersion.h"
#include "../cadence/core/Time.h"
#include "../cadence/state/SnapshotPublisher.h"
#include "../cadence/state/StateSnapshot.h"
#include "../cadence/state/TrackedTimers.h"

namespace {
bool near(float a, float b) { return std::fabs(a - b) < 1e-3f; }
}  // namespace

int main() {
    using namespace Cadence;
    using namespace Cadence::State;
    {
        // Registered keys read as unobserved until their first push, then decay to 0 when absent.
        TrackedTimers timers;
        timers.registerKeys({143, 1871});
        assert(timers.remaining(143, 0) == kUnobserved);
        assert(timers.remaining(999, 0) == 0.0f);
        assert(!timers.isObserved(143));

        timers.apply({{143, 10.0f}}, 1000);
        assert(near(timers.remaining(143, 1000), 10.0f));
        assert(near(timers.remaining(143, 3000), 8.0f));
        assert(timers.remaining(1871, 1000) == kUnobserved);

        timers.apply({}, 4000);
        assert(timers.remaining(143, 4000) == 0.0f);
        assert(timers.isObserved(143));
        assert(timers.remaining(1871, 4000) == kUnobserved);
    }
    {
        // Negative pushes never write the sentinel.
        TrackedTimers timers;
        timers.registerKeys({7});
        timers.apply({{7, -5.0f}}, 0);
        assert(timers.remaining(7, 0) == 0.0f);
        assert(timers.isObserved(7));
        timers.registerKeys({7});
        assert(timers.isObserved(7));
    }
    {
        // Frame stamp advances once per core push; view mirrors the scalars.
        ManualClock clock(500);
        StateSnapshot snap(clock.clock());
        assert(!snap.initialized());
        assert(snap.isStale());
        CoreState core;
        core.roleId = 24;
        core.level = 90;
        core.flags = Flags::kInCombat | Flags::kCanAct;
        snap.updateCore(core);
        snap.updateScalars(1.2f, 4000, 10000);
        assert(snap.frameStamp() == 1);
        snap.updateCore(core);
        assert(snap.frameStamp() == 2);
        assert(snap.canProcess());
        assert(near(snap.mpFraction(), 0.4f));
        assert(!snap.isMpLow());
        assert(snap.hasMpFor(4000));
        assert(!snap.hasMpFor(4001));

        const SnapshotView v = snap.view();
        assert(v.core.roleId == 24);
        assert(v.currentMp == 4000);
        assert(v.frameStamp == 2);
        assert(v.updatedAtMs == 500);
    }
    {
        // Staleness follows the injected clock.
        ManualClock clock(0);
        StateSnapshot snap(clock.clock());
        snap.updateCore(CoreState{});
        assert(!snap.isStale(100));
        clock.advance(100);
        assert(!snap.isStale(100));
        clock.advance(1);
        assert(snap.isStale(100));
        assert(snap.timeSinceUpdateMs() == 101);
    }
    {
        // Unobserved cooldowns are never ready; secondaries also need canProcess.
        ManualClock clock(0);
        StateSnapshot snap(clock.clock());
        snap.registerTracking(TrackingSet{{157}, {1871}, {136, 3571}});
        CoreState core;
        core.flags = Flags::kInCombat | Flags::kCanAct;
        snap.updateCore(core);
        assert(!snap.isActionReady(136));
        snap.updateCooldowns({{136, 0.0f}, {3571, 30.0f}});
        assert(snap.isActionReady(136));
        assert(!snap.isActionReady(3571));
        assert(snap.isSecondaryReady(136));
        core.flags = Flags::kInCombat;
        snap.updateCore(core);
        assert(!snap.isSecondaryReady(136));

        snap.updateBuffs({{157, 15.0f}});
        assert(snap.hasBuff(157));
        clock.advance(15000);
        assert(!snap.hasBuff(157));
        assert(snap.debuffRemaining(1871) == kUnobserved);
        assert(!snap.targetHasDebuff(1871));
    }
    {
        // Weave window check against the per-ability lock.
        StateSnapshot snap;
        snap.updateScalars(0.0f, 0, 0);
        assert(snap.canWeave(2));
        snap.updateScalars(1.7f, 0, 0);
        assert(snap.canWeave(2));
        assert(!snap.canWeave(3));
        snap.updateScalars(0.5f, 0, 0);
        assert(!snap.canWeave(1));
        assert(snap.mpFraction() == 0.0f);
    }
    {
        // Role changes reach every listener even when one throws.
        StateSnapshot snap;
        int calls = 0;
        RoleId seenPrev = 0;
        RoleId seenNext = 0;
        snap.onRoleChanged([](RoleId, RoleId) { throw std::runtime_error("listener fault"); });
        snap.onRoleChanged([&](RoleId prev, RoleId next) {
            ++calls;
            seenPrev = prev;
            seenNext = next;
        });
        CoreState core;
        core.roleId = 24;
        snap.updateCore(core);
        assert(calls == 0);
        snap.updateCore(core);
        assert(calls == 0);
        core.roleId = 21;
        snap.updateCore(core);
        assert(calls == 1);
        assert(seenPrev == 24);
        assert(seenNext == 21);

        snap.reset();
        assert(!snap.initialized());
        assert(snap.frameStamp() == 0);
        snap.updateCore(core);
        assert(calls == 1);
    }
    {
        // Publisher hands out whole records with a rising generation.
        SnapshotPublisher publisher;
        assert(publisher.generation() == 0);
        SnapshotView v;
        v.core.level = 80;
        v.frameStamp = 9;
        publisher.publish(v);
        assert(publisher.generation() == 1);
        assert(publisher.read().core.level == 80);
        assert(publisher.read().frameStamp == 9);
    }
    {
        // Config version starts at 1 and never returns to 0.
        ConfigVersion version;
        assert(version.current() == ConfigVersion::kInitial);
        assert(version.bump() == 2);
        assert(version.current() == 2);
    }
    return 0;
}
