// Ability, status and role ids used by the built-in healer rules.
#pragma once

#include "../cadence/core/Ids.h"

namespace Roles::Healer {

using Cadence::AbilityId;
using Cadence::EffectId;
using Cadence::RoleId;

constexpr RoleId kRoleId = 24;

// Damage
constexpr AbilityId kStone = 119;
constexpr AbilityId kStone2 = 127;
constexpr AbilityId kStone3 = 3568;
constexpr AbilityId kGlare = 16533;
constexpr AbilityId kGlare3 = 25859;
constexpr AbilityId kGlare4 = 37009;
constexpr AbilityId kAero = 121;
constexpr AbilityId kAero2 = 132;
constexpr AbilityId kDia = 16532;
constexpr AbilityId kHoly = 139;
constexpr AbilityId kHoly3 = 25860;
constexpr AbilityId kAfflatusMisery = 16535;
constexpr AbilityId kAfflatusRapture = 16534;

// Secondaries
constexpr AbilityId kAssize = 3571;
constexpr AbilityId kPresenceOfMind = 136;
constexpr AbilityId kLucidDreaming = 7562;

// Heals and utility
constexpr AbilityId kCure = 120;
constexpr AbilityId kCure2 = 135;
constexpr AbilityId kCure3 = 131;
constexpr AbilityId kRegen = 137;
constexpr AbilityId kAfflatusSolace = 16531;
constexpr AbilityId kTetragrammaton = 3570;
constexpr AbilityId kDivineBenison = 7432;
constexpr AbilityId kAsylum = 3569;
constexpr AbilityId kAquaveil = 25861;
constexpr AbilityId kLiturgyOfTheBell = 25862;
constexpr AbilityId kLiturgyOfTheBellBurst = 28509;
constexpr AbilityId kEsuna = 7568;

// Statuses
constexpr EffectId kAeroDebuff = 143;
constexpr EffectId kAero2Debuff = 144;
constexpr EffectId kDiaDebuff = 1871;
constexpr EffectId kPresenceOfMindBuff = 157;
constexpr EffectId kSacredSightBuff = 3879;
constexpr EffectId kLiturgyBuff = 2709;

constexpr std::uint32_t kLucidMpCeiling = 6500;
constexpr float kDotRefreshSeconds = 3.0f;

}  // namespace Roles::Healer
