// Data-described rule conditions, compiled to snapshot predicates.
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../cadence/core/Ids.h"
#include "../cadence/state/StateSnapshot.h"

namespace Roles {

enum class ConditionKind {
    Always,
    InCombat,
    Moving,
    NotMoving,
    BuffActive,
    BuffMissing,
    DebuffBelow,    // unobserved counts as below
    CooldownReady,
    SecondaryReady,
    MpAtMost,
    MpFractionBelow,
    LevelAtLeast,
    GaugeAtLeast,
    GaugeAtMost
};

struct Condition {
    ConditionKind kind{ConditionKind::Always};
    Cadence::EffectId id{0};
    float value{0.0f};
    int gaugeWord{1};  // 1 or 2
    int gaugeShift{0};
    std::uint32_t gaugeMask{0xFFFFFFFFu};
};

std::optional<ConditionKind> parseConditionKind(const std::string& key);

bool evaluate(const Condition& c, const Cadence::State::StateSnapshot& s);

// All conditions must hold; an empty list always passes.
std::function<bool(const Cadence::State::StateSnapshot&)> compileConditions(std::vector<Condition> conditions);

}  // namespace Roles
