#include <cassert>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../cadence/core/Time.h"
#include "../cadence/dispatch/ActionPipeline.h"
#include "../cadence/dispatch/DispatchSpecializer.h"
#include "../cadence/dispatch/EngineContext.h"
#include "../cadence/dispatch/RuleProvider.h"
#include "../cadence/session/EngineSession.h"

namespace {
using namespace Cadence;
using Dispatch::GridRule;
using Dispatch::RotationGrid;
using State::StateSnapshot;

constexpr RoleId kGridRole = 50;
constexpr RoleId kFaultyRuleRole = 51;
constexpr RoleId kFaultyBuildRole = 52;
constexpr RoleId kWeaveRole = 53;
constexpr RoleId kOddRuleFaultRole = 54;
constexpr RoleId kOddBuildFaultRole = 55;
constexpr RoleId kDeclaredWeaveRole = 56;

GridRule gridRule(std::function<bool(const StateSnapshot&)> when, AbilityId use, std::string description) {
    GridRule r;
    r.predicate = std::move(when);
    r.producer = [use](const StateSnapshot&) { return use; };
    r.description = std::move(description);
    return r;
}

class GaugeProvider : public Dispatch::RuleProvider {
public:
    RoleId roleId() const override { return kGridRole; }
    std::string name() const override { return "Gauge"; }
    std::vector<RotationGrid> rotationGrids() const override {
        return {RotationGrid("Main", {1000},
                             {gridRule([](const StateSnapshot& s) { return s.gauge1() >= 5; }, 1001, "Spend"),
                              gridRule([](const StateSnapshot&) { return true; }, 1000, "Builder")})};
    }
    std::vector<Targeting::TargetRule> targetRules() const override {
        return {{1500, Targeting::TargetingMode::SmartAbility, 0, 0, "Mend"}};
    }
    std::vector<Resolve::UpgradeChain> upgradeChains() const override {
        return {{"Spend", {{1, 1001}, {50, 1002}}}};
    }
};

class FaultyRuleProvider : public Dispatch::RuleProvider {
public:
    RoleId roleId() const override { return kFaultyRuleRole; }
    std::string name() const override { return "FaultyRule"; }
    std::vector<RotationGrid> rotationGrids() const override {
        return {RotationGrid("Main", {2000},
                             {gridRule([](const StateSnapshot&) -> bool { throw std::runtime_error("bad read"); }, 2001,
                                       "Explodes")})};
    }
};

class FaultyBuildProvider : public Dispatch::RuleProvider {
public:
    RoleId roleId() const override { return kFaultyBuildRole; }
    std::string name() const override { return "FaultyBuild"; }
    std::vector<RotationGrid> rotationGrids() const override { throw std::runtime_error("table corrupt"); }
};

class WeaveProvider : public Dispatch::RuleProvider {
public:
    RoleId roleId() const override { return kWeaveRole; }
    std::string name() const override { return "Weaver"; }
    std::vector<RotationGrid> rotationGrids() const override {
        return {RotationGrid("Main", {5000}, {gridRule([](const StateSnapshot&) { return true; }, 5000, "Filler")})};
    }
    std::vector<Resolve::WeaveRule> weaveRules() const override {
        std::vector<Resolve::WeaveRule> rules(2);
        rules[0].priority = 1;
        rules[0].name = "Minor";
        rules[0].predicate = [](const StateSnapshot&) { return true; };
        rules[0].producer = [](const StateSnapshot&) { return AbilityId{4001}; };
        rules[1].priority = 9;
        rules[1].name = "Major";
        rules[1].predicate = [](const StateSnapshot&) { return true; };
        rules[1].producer = [](const StateSnapshot&) { return AbilityId{4002}; };
        return rules;
    }
};

// Throws something that is not a std::exception.
class OddRuleFaultProvider : public Dispatch::RuleProvider {
public:
    RoleId roleId() const override { return kOddRuleFaultRole; }
    std::string name() const override { return "OddRuleFault"; }
    std::vector<RotationGrid> rotationGrids() const override {
        return {RotationGrid("Main", {2000}, {gridRule([](const StateSnapshot&) -> bool { throw 7; }, 2001, "Odd")})};
    }
    std::vector<Resolve::WeaveRule> weaveRules() const override {
        Resolve::WeaveRule rule;
        rule.name = "OddWeave";
        rule.predicate = [](const StateSnapshot&) -> bool { throw 8; };
        rule.producer = [](const StateSnapshot&) { return AbilityId{4100}; };
        return {rule};
    }
};

class OddBuildFaultProvider : public Dispatch::RuleProvider {
public:
    RoleId roleId() const override { return kOddBuildFaultRole; }
    std::string name() const override { return "OddBuildFault"; }
    std::vector<RotationGrid> rotationGrids() const override { throw 9; }
};

class DeclaredWeaveProvider : public WeaveProvider {
public:
    RoleId roleId() const override { return kDeclaredWeaveRole; }
    std::string name() const override { return "DeclaredWeaver"; }
    Resolve::WeaveOrder weaveOrder() const override { return Resolve::WeaveOrder::Declared; }
};

TickInput tick(RoleId role, std::uint32_t level, std::uint32_t gauge = 0, float lock = 0.0f) {
    TickInput in;
    in.core.roleId = role;
    in.core.level = level;
    in.core.gauge1 = gauge;
    in.core.flags = State::Flags::kInCombat | State::Flags::kCanAct;
    in.lockRemaining = lock;
    in.currentMp = 10000;
    in.maxMp = 10000;
    return in;
}

void registerAll(EngineSession& session) {
    auto& ctx = session.context();
    assert(ctx.registerProvider(std::make_unique<GaugeProvider>()));
    assert(ctx.registerProvider(std::make_unique<FaultyRuleProvider>()));
    assert(ctx.registerProvider(std::make_unique<FaultyBuildProvider>()));
    assert(ctx.registerProvider(std::make_unique<WeaveProvider>()));
    session.start();
}
}  // namespace

int main() {
    {
        // Registration refuses duplicates and role 0; every accepted provider bumps the version.
        Dispatch::EngineContext ctx;
        const auto v0 = ctx.currentVersion();
        assert(ctx.registerProvider(std::make_unique<GaugeProvider>()));
        assert(!ctx.registerProvider(std::make_unique<GaugeProvider>()));
        assert(!ctx.registerProvider(nullptr));
        assert(ctx.currentVersion() == v0 + 1);
        assert(ctx.provider(kGridRole) != nullptr);
        assert(ctx.provider(99) == nullptr);
        assert(ctx.registeredRoles().size() == 1);

        ctx.setRuleEnabled(kGridRole, "Spend", false);
        assert(ctx.currentVersion() == v0 + 2);
        ctx.setRuleEnabled(kGridRole, "Spend", false);
        assert(ctx.currentVersion() == v0 + 2);
        assert(!ctx.isRuleEnabled(kGridRole, "Spend"));
        ctx.setRuleEnabled(kGridRole, "Spend", true);
        assert(ctx.isRuleEnabled(kGridRole, "Spend"));
        ctx.setSmartTargetingEnabled(kGridRole, true);
        assert(ctx.currentVersion() == v0 + 3);
    }
    {
        // Specializer rebuilds only when role or config version moves.
        Dispatch::EngineContext ctx;
        ctx.registerProvider(std::make_unique<GaugeProvider>());
        Resolve::UpgradeChainResolver upgrades;
        upgrades.addChains(GaugeProvider().upgradeChains());
        Targeting::TargetPriorityEngine targeting;
        Dispatch::DispatchSpecializer specializer(ctx, upgrades, targeting);

        StateSnapshot snap;
        State::CoreState core;
        core.roleId = kGridRole;
        core.level = 60;
        core.gauge1 = 5;
        snap.updateCore(core);
        assert(specializer.state(snap) == Dispatch::DispatchState::Stale);
        assert(specializer.resolve(1000, snap) == 1002);
        assert(specializer.state(snap) == Dispatch::DispatchState::Specialized);
        assert(specializer.topology() == Dispatch::Topology::SingleGrid);
        assert(specializer.rebuildCount() == 1);
        assert(specializer.resolve(1000, snap) == 1002);
        assert(specializer.resolve(777, snap) == 777);
        assert(specializer.rebuildCount() == 1);

        core.level = 30;
        snap.updateCore(core);
        assert(specializer.resolve(1000, snap) == 1001);
        core.gauge1 = 0;
        snap.updateCore(core);
        assert(specializer.resolve(1000, snap) == 1000);

        core.gauge1 = 5;
        snap.updateCore(core);
        ctx.setRuleEnabled(kGridRole, "Spend", false);
        assert(specializer.state(snap) == Dispatch::DispatchState::Stale);
        assert(specializer.resolve(1000, snap) == 1000);
        assert(specializer.rebuildCount() == 2);

        core.roleId = 99;
        snap.updateCore(core);
        assert(specializer.resolve(1000, snap) == 1000);
        assert(specializer.topology() == Dispatch::Topology::Identity);
        assert(!specializer.degraded());
        assert(specializer.rebuildCount() == 3);
        assert(std::string(Dispatch::topologyName(Dispatch::Topology::MultiGridWithWeaves)) == "multi-grid+weaves");
    }
    {
        // Same frame, same press: same answer, served from the frame cache.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        registerAll(session);
        session.update(tick(kGridRole, 60, 5), 16.0);

        auto& pipeline = session.pipeline();
        const AbilityId first = pipeline.resolve(1000);
        const AbilityId second = pipeline.resolve(1000);
        assert(first == 1002);
        assert(first == second);
        assert(pipeline.counters().frameCacheHits == 1);
        assert(pipeline.counters().resolutions == 1);

        // Untouched ids land in the pass-through cache and hit across frames.
        assert(pipeline.resolve(3000) == 3000);
        clock.advance(16);
        session.update(tick(kGridRole, 60, 5), 16.0);
        assert(pipeline.resolve(3000) == 3000);
        assert(pipeline.counters().configCacheHits == 1);

        // Next frame recomputes.
        session.update(tick(kGridRole, 60, 0), 16.0);
        assert(pipeline.resolve(1000) == 1000);

        // A config bump drops cached answers.
        session.update(tick(kGridRole, 60, 5), 16.0);
        assert(pipeline.resolve(1000) == 1002);
        session.context().setRuleEnabled(kGridRole, "Spend", false);
        assert(pipeline.resolve(1000) == 1000);
        session.context().setRuleEnabled(kGridRole, "Spend", true);
        assert(pipeline.resolve(1000) == 1002);
    }
    {
        // Automation stays out of the way when it cannot act or the state is old.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        registerAll(session);
        auto& pipeline = session.pipeline();
        assert(pipeline.resolve(1000) == 1000);

        session.update(tick(kGridRole, 60, 5), 16.0);
        assert(pipeline.resolve(0) == 0);
        assert(pipeline.resolve(kMaxPlausibleAbility + 1) == kMaxPlausibleAbility + 1);

        clock.advance(101);
        assert(pipeline.resolve(1000) == 1000);
        assert(pipeline.resolveTarget(1500) == kNoActor);

        TickInput idle = tick(kGridRole, 60, 5);
        idle.core.flags = State::Flags::kCanAct;
        session.update(idle, 16.0);
        assert(pipeline.resolve(1000) == 1000);
        assert(pipeline.counters().passThroughs == 5);

        session.update(tick(kGridRole, 60, 5), 16.0);
        assert(pipeline.resolve(1000) == 1002);
    }
    {
        // A throwing rule downgrades the role to pass-through instead of escaping.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        registerAll(session);
        session.update(tick(kFaultyRuleRole, 60), 16.0);
        assert(session.pipeline().resolve(2000) == 2000);
        assert(session.pipeline().specializer().degraded());
        assert(session.pipeline().specializer().topology() == Dispatch::Topology::Identity);
        session.update(tick(kFaultyRuleRole, 60), 16.0);
        assert(session.pipeline().resolve(2000) == 2000);

        session.update(tick(kFaultyBuildRole, 60), 16.0);
        assert(session.pipeline().resolve(2000) == 2000);
        assert(session.pipeline().specializer().degraded());

        // Switching to a healthy role rebuilds cleanly.
        session.update(tick(kGridRole, 60, 5), 16.0);
        assert(session.pipeline().resolve(1000) == 1002);
        assert(!session.pipeline().specializer().degraded());
    }
    {
        // Weaves: highest priority fills the press when the grid keeps it, and only with room in the lock.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        registerAll(session);
        auto& pipeline = session.pipeline();

        session.update(tick(kWeaveRole, 60, 0, 0.0f), 16.0);
        assert(pipeline.resolve(5000) == 4002);
        assert(pipeline.resolve(5000) == 4002);
        assert(pipeline.counters().memoHits == 1);
        assert(pipeline.specializer().topology() == Dispatch::Topology::SingleGridWithWeaves);
        assert(pipeline.resolve(6000) == 6000);

        Resolve::WeavePick pick;
        assert(pipeline.suggestWeaves(pick) == 2);
        assert(pick.ids[0] == 4002);
        assert(pick.ids[1] == 4001);

        session.update(tick(kWeaveRole, 60, 0, 0.5f), 16.0);
        assert(pipeline.resolve(5000) == 5000);
        assert(pipeline.suggestWeaves(pick) == 0);

        session.update(tick(kWeaveRole, 60, 0, 1.0f), 16.0);
        assert(pipeline.suggestWeaves(pick) == 1);
        assert(pick.ids[0] == 4002);

        session.context().setRuleEnabled(kWeaveRole, "Major", false);
        assert(pipeline.resolve(5000) == 4001);
    }
    {
        // Faults that are not std::exception still degrade instead of escaping.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        assert(session.context().registerProvider(std::make_unique<OddRuleFaultProvider>()));
        assert(session.context().registerProvider(std::make_unique<OddBuildFaultProvider>()));
        session.start();
        auto& pipeline = session.pipeline();

        session.update(tick(kOddRuleFaultRole, 60), 16.0);
        assert(pipeline.resolve(2000) == 2000);
        assert(pipeline.specializer().degraded());

        // A config bump rebuilds; the weave rule then faults on its own path.
        session.context().setRuleEnabled(kOddRuleFaultRole, "Unused", false);
        session.update(tick(kOddRuleFaultRole, 60), 16.0);
        Resolve::WeavePick pick;
        assert(pipeline.suggestWeaves(pick) == 0);
        assert(pick.count == 0);
        assert(pipeline.specializer().degraded());

        session.update(tick(kOddBuildFaultRole, 60), 16.0);
        assert(pipeline.resolve(2000) == 2000);
        assert(pipeline.specializer().degraded());
        assert(pipeline.specializer().topology() == Dispatch::Topology::Identity);
    }
    {
        // Declared-order roles take the first passing weaves regardless of priority.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        assert(session.context().registerProvider(std::make_unique<DeclaredWeaveProvider>()));
        session.start();
        auto& pipeline = session.pipeline();

        session.update(tick(kDeclaredWeaveRole, 60, 0, 0.0f), 16.0);
        assert(pipeline.resolve(5000) == 4001);
        Resolve::WeavePick pick;
        assert(pipeline.suggestWeaves(pick) == 2);
        assert(pick.ids[0] == 4001);
        assert(pick.ids[1] == 4002);
    }
    {
        // Smart targeting follows the party and can be switched off per role.
        ManualClock clock(1000);
        EngineSession session(clock.clock());
        registerAll(session);

        TickInput in = tick(kGridRole, 60, 0);
        in.partyUpdated = true;
        const std::uint32_t healable = Targeting::MemberFlags::kValidAbilityTarget | Targeting::MemberFlags::kAlly;
        in.party = {{1, 0.9f, healable | Targeting::MemberFlags::kSelf}, {2, 0.8f, healable}, {3, 0.6f, healable}};
        session.update(in, 16.0);

        const auto d = session.decide(1500);
        assert(d.abilityId == 1500);
        assert(d.targetId == 3);
        assert(d.weaveCount == 0);

        in.partyUpdated = false;
        session.update(in, 16.0);
        session.context().setSmartTargetingEnabled(kGridRole, false);
        assert(session.decide(1500).targetId == kNoActor);
        assert(session.pipeline().resolveTarget(0) == kNoActor);
    }
    return 0;
}
