#include "Scenario.h"

#include <fstream>

#include <nlohmann/json.hpp>

#include "../cadence/core/Logger.h"

namespace Replay {

using nlohmann::json;
using Cadence::State::Flags::kCanAct;
using Cadence::State::Flags::kHasTarget;
using Cadence::State::Flags::kInCombat;
using Cadence::State::Flags::kInRestrictedArea;
using Cadence::State::Flags::kIsMoving;
namespace Member = Cadence::Targeting::MemberFlags;

std::optional<std::uint32_t> parseStateFlag(const std::string& key) {
    if (key == "inCombat") return kInCombat;
    if (key == "hasTarget") return kHasTarget;
    if (key == "inRestrictedArea") return kInRestrictedArea;
    if (key == "canAct") return kCanAct;
    if (key == "moving") return kIsMoving;
    return std::nullopt;
}

std::optional<std::uint32_t> parseMemberFlag(const std::string& key) {
    if (key == "alive") return Member::kAlive;
    if (key == "inRange") return Member::kInRange;
    if (key == "inLos") return Member::kInLos;
    if (key == "targetable") return Member::kTargetable;
    if (key == "self") return Member::kSelf;
    if (key == "hardTarget") return Member::kHardTarget;
    if (key == "tank") return Member::kTank;
    if (key == "healer") return Member::kHealer;
    if (key == "melee") return Member::kMelee;
    if (key == "ranged") return Member::kRanged;
    if (key == "ally") return Member::kAlly;
    if (key == "cleansable") return Member::kCleansable;
    if (key == "valid") return Member::kValidAbilityTarget | Member::kAlly;
    return std::nullopt;
}

namespace {
template <typename Parse>
std::uint32_t readFlags(const json& arr, Parse parse) {
    std::uint32_t flags = 0;
    if (!arr.is_array()) return flags;
    for (const auto& v : arr) {
        if (!v.is_string()) continue;
        const auto bit = parse(v.get<std::string>());
        if (bit) {
            flags |= *bit;
        } else {
            Cadence::logWarn("Unknown flag '" + v.get<std::string>() + "' in scenario");
        }
    }
    return flags;
}

std::vector<Cadence::State::TrackedUpdate> readTimers(const json& obj) {
    std::vector<Cadence::State::TrackedUpdate> out;
    if (!obj.is_object()) return out;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().is_number()) continue;
        Cadence::State::TrackedUpdate u;
        u.id = static_cast<Cadence::EffectId>(std::stoul(it.key()));
        u.remainingSeconds = it.value().get<float>();
        out.push_back(u);
    }
    return out;
}

std::vector<Cadence::AbilityId> readIds(const json& arr) {
    std::vector<Cadence::AbilityId> out;
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_number_unsigned()) out.push_back(v.get<Cadence::AbilityId>());
    }
    return out;
}

ScenarioTick readTick(const json& t, const ScenarioTick& previous) {
    // Fields a tick omits carry over from the previous tick.
    ScenarioTick tick;
    tick.input = previous.input;
    tick.input.partyUpdated = false;
    tick.input.companionUpdated = false;
    tick.input.buffs.clear();
    tick.input.debuffs.clear();
    tick.input.cooldowns.clear();

    auto& core = tick.input.core;
    core.roleId = t.value("role", core.roleId);
    core.level = t.value("level", core.level);
    core.targetId = t.value("target", core.targetId);
    core.zoneId = t.value("zone", core.zoneId);
    core.gauge1 = t.value("gauge1", core.gauge1);
    core.gauge2 = t.value("gauge2", core.gauge2);
    if (t.contains("flags")) core.flags = readFlags(t["flags"], parseStateFlag);
    tick.input.lockRemaining = t.value("lock", tick.input.lockRemaining);
    tick.input.currentMp = t.value("mp", tick.input.currentMp);
    tick.input.maxMp = t.value("maxMp", tick.input.maxMp);

    // Timer pushes are full snapshots of what is active this tick.
    if (t.contains("buffs")) tick.input.buffs = readTimers(t["buffs"]);
    if (t.contains("debuffs")) tick.input.debuffs = readTimers(t["debuffs"]);
    if (t.contains("cooldowns")) tick.input.cooldowns = readTimers(t["cooldowns"]);

    if (t.contains("party") && t["party"].is_array()) {
        tick.input.partyUpdated = true;
        tick.input.party.clear();
        for (const auto& m : t["party"]) {
            Cadence::Targeting::PartyMember member;
            member.id = m.value("id", 0u);
            member.hp = m.value("hp", 1.0f);
            if (m.contains("flags")) member.flags = readFlags(m["flags"], parseMemberFlag);
            tick.input.party.push_back(member);
        }
        tick.input.hardTarget = t.value("hardTarget", 0u);
        tick.input.hardTargetValid = tick.input.hardTarget != Cadence::kNoActor;
    }

    if (t.contains("companion") && t["companion"].is_object()) {
        const auto& c = t["companion"];
        tick.input.companionUpdated = true;
        tick.input.companionId = c.value("id", 0u);
        tick.input.companionHp = c.value("hp", 1.0f);
        tick.input.companionValid = c.value("valid", true);
        tick.input.companionCleansable = c.value("cleansable", false);
    }

    if (t.contains("press")) tick.presses = readIds(t["press"]);
    if (t.contains("expect")) tick.expect = readIds(t["expect"]);
    return tick;
}

std::optional<Scenario> fromJson(const json& j) {
    if (!j.is_object() || !j.contains("ticks") || !j["ticks"].is_array()) {
        Cadence::logWarn("Scenario needs a 'ticks' array");
        return std::nullopt;
    }
    Scenario s;
    s.name = j.value("name", std::string("scenario"));
    s.frameMs = j.value("frameMs", s.frameMs);
    ScenarioTick previous;
    for (const auto& t : j["ticks"]) {
        if (!t.is_object()) continue;
        ScenarioTick tick = readTick(t, previous);
        s.ticks.push_back(tick);
        previous = std::move(tick);
    }
    return s;
}
}  // namespace

std::optional<Scenario> ScenarioLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Cadence::logError("Scenario not found: " + path);
        return std::nullopt;
    }
    json j;
    try {
        in >> j;
        return fromJson(j);
    } catch (const json::exception& e) {
        Cadence::logError("Failed to read scenario " + path + ": " + e.what());
        return std::nullopt;
    } catch (const std::logic_error& e) {
        // std::stoul on a non-numeric timer key
        Cadence::logError("Bad timer id in scenario " + path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<Scenario> ScenarioLoader::loadFromString(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        Cadence::logError(std::string("Failed to read scenario: ") + e.what());
        return std::nullopt;
    } catch (const std::logic_error& e) {
        Cadence::logError(std::string("Bad timer id in scenario: ") + e.what());
        return std::nullopt;
    }
}

}  // namespace Replay
