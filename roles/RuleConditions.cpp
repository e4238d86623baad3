#include "RuleConditions.h"

namespace Roles {

namespace {
std::uint32_t gaugeValue(const Condition& c, const Cadence::State::StateSnapshot& s) {
    const std::uint32_t word = c.gaugeWord == 2 ? s.gauge2() : s.gauge1();
    return (word >> c.gaugeShift) & c.gaugeMask;
}
}  // namespace

std::optional<ConditionKind> parseConditionKind(const std::string& key) {
    if (key == "always") return ConditionKind::Always;
    if (key == "inCombat") return ConditionKind::InCombat;
    if (key == "moving") return ConditionKind::Moving;
    if (key == "notMoving") return ConditionKind::NotMoving;
    if (key == "buffActive") return ConditionKind::BuffActive;
    if (key == "buffMissing") return ConditionKind::BuffMissing;
    if (key == "debuffBelow") return ConditionKind::DebuffBelow;
    if (key == "cooldownReady") return ConditionKind::CooldownReady;
    if (key == "secondaryReady") return ConditionKind::SecondaryReady;
    if (key == "mpAtMost") return ConditionKind::MpAtMost;
    if (key == "mpFractionBelow") return ConditionKind::MpFractionBelow;
    if (key == "levelAtLeast") return ConditionKind::LevelAtLeast;
    if (key == "gaugeAtLeast") return ConditionKind::GaugeAtLeast;
    if (key == "gaugeAtMost") return ConditionKind::GaugeAtMost;
    return std::nullopt;
}

bool evaluate(const Condition& c, const Cadence::State::StateSnapshot& s) {
    switch (c.kind) {
        case ConditionKind::Always:
            return true;
        case ConditionKind::InCombat:
            return s.inCombat();
        case ConditionKind::Moving:
            return s.isMoving();
        case ConditionKind::NotMoving:
            return !s.isMoving();
        case ConditionKind::BuffActive:
            return s.hasBuff(c.id);
        case ConditionKind::BuffMissing:
            return !s.hasBuff(c.id);
        case ConditionKind::DebuffBelow: {
            const float left = s.debuffRemaining(c.id);
            return left == Cadence::State::kUnobserved || left <= c.value;
        }
        case ConditionKind::CooldownReady:
            return s.isActionReady(c.id);
        case ConditionKind::SecondaryReady:
            return s.isSecondaryReady(c.id);
        case ConditionKind::MpAtMost:
            return static_cast<float>(s.currentMp()) <= c.value;
        case ConditionKind::MpFractionBelow:
            return s.mpFraction() < c.value;
        case ConditionKind::LevelAtLeast:
            return static_cast<float>(s.level()) >= c.value;
        case ConditionKind::GaugeAtLeast:
            return static_cast<float>(gaugeValue(c, s)) >= c.value;
        case ConditionKind::GaugeAtMost:
            return static_cast<float>(gaugeValue(c, s)) <= c.value;
    }
    return false;
}

std::function<bool(const Cadence::State::StateSnapshot&)> compileConditions(std::vector<Condition> conditions) {
    return [conds = std::move(conditions)](const Cadence::State::StateSnapshot& s) {
        for (const auto& c : conds) {
            if (!evaluate(c, s)) return false;
        }
        return true;
    };
}

}  // namespace Roles
