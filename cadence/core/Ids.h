// Identifier aliases shared by every decision component.
#pragma once

#include <cstdint>

namespace Cadence {

using AbilityId = std::uint32_t;
using ActorId = std::uint32_t;
using EffectId = std::uint32_t;
using RoleId = std::uint32_t;

constexpr AbilityId kNoAbility = 0;
constexpr ActorId kNoActor = 0;
constexpr RoleId kNoRole = 0;

// Anything above this is treated as garbage from the host and passed through untouched.
constexpr AbilityId kMaxPlausibleAbility = 100000;

inline bool isPlausibleAbility(AbilityId id) { return id != kNoAbility && id <= kMaxPlausibleAbility; }

}  // namespace Cadence
