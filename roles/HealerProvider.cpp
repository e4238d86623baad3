#include "HealerProvider.h"

#include "HealerIds.h"

namespace Roles {

using Cadence::AbilityId;
using Cadence::State::kUnobserved;
using Cadence::State::StateSnapshot;
using namespace Healer;

namespace {
EffectId dotDebuffForLevel(std::uint32_t level) {
    if (level >= 72) return kDiaDebuff;
    if (level >= 46) return kAero2Debuff;
    if (level >= 4) return kAeroDebuff;
    return 0;
}

bool needsDotRefresh(const StateSnapshot& s) {
    const EffectId debuff = dotDebuffForLevel(s.level());
    if (debuff == 0) return false;
    const float left = s.debuffRemaining(debuff);
    return left == kUnobserved || left <= kDotRefreshSeconds;
}

bool hasSacredSight(const StateSnapshot& s) { return s.hasBuff(kSacredSightBuff); }

Cadence::Dispatch::GridRule rule(bool (*when)(const StateSnapshot&), AbilityId use, const char* description) {
    Cadence::Dispatch::GridRule r;
    r.predicate = when;
    r.producer = [use](const StateSnapshot&) { return use; };
    r.description = description;
    return r;
}
}  // namespace

namespace HealerGauge {
int healingLilies(const StateSnapshot& s) { return static_cast<int>(s.gauge1() & 0xFF); }

int bloodLilies(const StateSnapshot& s) { return static_cast<int>((s.gauge1() >> 8) & 0xFF); }

std::uint32_t lilyTimerMs(const StateSnapshot& s) { return s.gauge2(); }

bool overcapRisk(const StateSnapshot& s) {
    const int lilies = healingLilies(s);
    return lilies >= 3 || (lilies >= 2 && lilyTimerMs(s) >= 10000);
}
}  // namespace HealerGauge

const std::vector<Cadence::Resolve::UpgradeChain>& healerUpgradeChains() {
    static const std::vector<Cadence::Resolve::UpgradeChain> kChains = {
        {"Stone", {{1, kStone}, {18, kStone2}, {54, kStone3}, {72, kGlare}, {82, kGlare3}}},
        {"Aero", {{4, kAero}, {46, kAero2}, {72, kDia}}},
        {"Holy", {{45, kHoly}, {82, kHoly3}}},
    };
    return kChains;
}

Cadence::RoleId HealerProvider::roleId() const { return kRoleId; }

std::vector<Cadence::Dispatch::RotationGrid> HealerProvider::rotationGrids() const {
    std::vector<Cadence::Dispatch::GridRule> single = {
        rule(HealerGauge::overcapRisk, kAfflatusRapture, "Use Afflatus Rapture (Lily Overcap)"),
        rule([](const StateSnapshot& s) { return HealerGauge::bloodLilies(s) >= 3; }, kAfflatusMisery,
             "Use Afflatus Misery (Blood Lily Ready)"),
        rule(hasSacredSight, kGlare4, "Use Glare IV"),
        rule([](const StateSnapshot& s) { return s.isMoving() && s.level() >= 4; }, kAero,
             "Use Aero/Dia while moving"),
        rule(needsDotRefresh, kAero, "Apply/Refresh Aero/Dia"),
        rule([](const StateSnapshot&) { return true; }, kStone, "Stone/Glare (default)"),
    };
    std::vector<Cadence::Dispatch::GridRule> aoe = {
        rule(HealerGauge::overcapRisk, kAfflatusRapture, "Use Afflatus Rapture (Lily Overcap)"),
        rule([](const StateSnapshot& s) { return HealerGauge::bloodLilies(s) >= 3; }, kAfflatusMisery,
             "Use Afflatus Misery (Blood Lily Ready)"),
        rule(hasSacredSight, kGlare4, "Use Glare IV"),
        rule([](const StateSnapshot&) { return true; }, kHoly, "Holy/Holy III (default)"),
    };

    return {
        Cadence::Dispatch::RotationGrid("Single Target", {kGlare3, kGlare, kStone3, kStone2, kStone}, single),
        Cadence::Dispatch::RotationGrid("AoE", {kHoly3, kHoly}, aoe),
    };
}

std::vector<Cadence::Resolve::WeaveRule> HealerProvider::weaveRules() const {
    std::vector<Cadence::Resolve::WeaveRule> rules(3);
    rules[0].priority = 1;
    rules[0].name = "Assize";
    rules[0].predicate = [](const StateSnapshot& s) { return s.isSecondaryReady(kAssize); };
    rules[0].producer = [](const StateSnapshot&) { return kAssize; };

    rules[1].priority = 2;
    rules[1].name = "Presence of Mind";
    rules[1].predicate = [](const StateSnapshot& s) {
        return !s.hasBuff(kPresenceOfMindBuff) && s.isSecondaryReady(kPresenceOfMind);
    };
    rules[1].producer = [](const StateSnapshot&) { return kPresenceOfMind; };

    rules[2].priority = 3;
    rules[2].name = "Lucid Dreaming";
    rules[2].predicate = [](const StateSnapshot& s) {
        return s.currentMp() <= kLucidMpCeiling && s.isSecondaryReady(kLucidDreaming);
    };
    rules[2].producer = [](const StateSnapshot&) { return kLucidDreaming; };
    return rules;
}

std::vector<Cadence::Targeting::TargetRule> HealerProvider::targetRules() const {
    using Cadence::Targeting::TargetingMode;
    return {
        {kCure, TargetingMode::SmartAbility, 0, 0, "Cure"},
        {kCure2, TargetingMode::SmartAbility, 0, 0, "Cure II"},
        {kCure3, TargetingMode::SmartAbility, 0, 0, "Cure III"},
        {kRegen, TargetingMode::SmartAbility, 0, 0, "Regen"},
        {kAfflatusSolace, TargetingMode::SmartAbility, 0, 0, "Afflatus Solace"},
        {kTetragrammaton, TargetingMode::SmartAbility, 0, 0, "Tetragrammaton"},
        {kDivineBenison, TargetingMode::SmartAbility, 0, 0, "Divine Benison"},
        {kAsylum, TargetingMode::GroundTarget, 0, 0, "Asylum"},
        {kAquaveil, TargetingMode::SmartAbility, 0, 0, "Aquaveil"},
        {kLiturgyOfTheBell, TargetingMode::GroundTargetSpecial, kLiturgyOfTheBellBurst, kLiturgyBuff,
         "Liturgy of the Bell"},
        {kEsuna, TargetingMode::Cleanse, 0, 0, "Esuna"},
    };
}

Cadence::State::TrackingSet HealerProvider::tracking() const {
    Cadence::State::TrackingSet set;
    set.buffs = {kPresenceOfMindBuff, kSacredSightBuff, kLiturgyBuff};
    set.debuffs = {kDiaDebuff, kAero2Debuff, kAeroDebuff};
    set.cooldowns = {kLucidDreaming, kPresenceOfMind, kAssize, kAfflatusRapture};
    return set;
}

}  // namespace Roles
