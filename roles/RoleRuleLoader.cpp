#include "RoleRuleLoader.h"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../cadence/core/Logger.h"

namespace Roles {

using nlohmann::json;

namespace {
std::vector<Cadence::AbilityId> readIds(const json& arr) {
    std::vector<Cadence::AbilityId> out;
    if (!arr.is_array()) return out;
    for (const auto& v : arr) {
        if (v.is_number_unsigned()) out.push_back(v.get<Cadence::AbilityId>());
    }
    return out;
}

std::optional<Condition> parseCondition(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) return std::nullopt;
    const auto kind = parseConditionKind(j["type"].get<std::string>());
    if (!kind) return std::nullopt;

    Condition c;
    c.kind = *kind;
    c.id = j.value("id", 0u);
    c.value = j.value("value", 0.0f);
    if (c.kind == ConditionKind::DebuffBelow) c.value = j.value("seconds", c.value);
    c.gaugeWord = j.value("word", 1) == 2 ? 2 : 1;
    c.gaugeShift = std::clamp(j.value("shift", 0), 0, 31);
    c.gaugeMask = j.value("mask", 0xFFFFFFFFu);
    return c;
}

// False when any condition is unreadable; the caller drops the whole rule.
bool parseConditions(const json& arr, const std::string& owner, std::vector<Condition>& out) {
    if (!arr.is_array()) return true;
    for (const auto& entry : arr) {
        auto c = parseCondition(entry);
        if (!c) {
            Cadence::logWarn("Rule '" + owner + "' dropped: unreadable condition " + entry.dump());
            return false;
        }
        out.push_back(*c);
    }
    return true;
}

Cadence::State::TrackingSet parseTracking(const json& j) {
    Cadence::State::TrackingSet t;
    if (!j.is_object()) return t;
    if (j.contains("buffs")) t.buffs = readIds(j["buffs"]);
    if (j.contains("debuffs")) t.debuffs = readIds(j["debuffs"]);
    if (j.contains("cooldowns")) t.cooldowns = readIds(j["cooldowns"]);
    return t;
}

std::vector<Cadence::Resolve::UpgradeChain> parseChains(const json& arr) {
    std::vector<Cadence::Resolve::UpgradeChain> out;
    if (!arr.is_array()) return out;
    for (const auto& c : arr) {
        if (!c.is_object() || !c.contains("tiers") || !c["tiers"].is_array()) continue;
        Cadence::Resolve::UpgradeChain chain;
        chain.name = c.value("name", std::string("unnamed"));
        for (const auto& t : c["tiers"]) {
            Cadence::Resolve::UpgradeTier tier;
            tier.minLevel = t.value("level", 0u);
            tier.abilityId = t.value("ability", 0u);
            chain.tiers.push_back(tier);
        }
        out.push_back(std::move(chain));
    }
    return out;
}

std::vector<TableGrid> parseGrids(const json& arr) {
    std::vector<TableGrid> out;
    if (!arr.is_array()) return out;
    for (const auto& g : arr) {
        if (!g.is_object()) continue;
        TableGrid grid;
        grid.name = g.value("name", std::string("grid"));
        if (g.contains("triggers")) grid.triggers = readIds(g["triggers"]);
        if (g.contains("rules") && g["rules"].is_array()) {
            for (const auto& r : g["rules"]) {
                TableGridRule rule;
                rule.description = r.value("description", std::string());
                rule.use = r.value("use", 0u);
                if (rule.use == Cadence::kNoAbility) {
                    Cadence::logWarn("Rule '" + rule.description + "' in grid '" + grid.name + "' has no ability");
                    continue;
                }
                if (r.contains("when") && !parseConditions(r["when"], rule.description, rule.when)) continue;
                grid.rules.push_back(std::move(rule));
            }
        }
        if (grid.triggers.empty()) {
            Cadence::logWarn("Grid '" + grid.name + "' has no triggers; skipped");
            continue;
        }
        out.push_back(std::move(grid));
    }
    return out;
}

std::vector<TableWeaveRule> parseWeaves(const json& arr) {
    std::vector<TableWeaveRule> out;
    if (!arr.is_array()) return out;
    for (const auto& w : arr) {
        TableWeaveRule rule;
        rule.name = w.value("name", std::string());
        rule.priority = static_cast<std::uint8_t>(std::clamp(w.value("priority", 0), 0, 255));
        rule.use = w.value("use", 0u);
        if (rule.use == Cadence::kNoAbility) continue;
        if (w.contains("when") && !parseConditions(w["when"], rule.name, rule.when)) continue;
        out.push_back(std::move(rule));
    }
    return out;
}

Cadence::Resolve::WeaveOrder parseWeaveOrder(const json& j) {
    if (j.is_string()) {
        const auto key = j.get<std::string>();
        if (key == "declared") return Cadence::Resolve::WeaveOrder::Declared;
        if (key == "priority") return Cadence::Resolve::WeaveOrder::Priority;
    }
    Cadence::logWarn("Unknown weaveOrder " + j.dump() + "; using priority");
    return Cadence::Resolve::WeaveOrder::Priority;
}

std::vector<Cadence::Targeting::TargetRule> parseTargets(const json& arr) {
    std::vector<Cadence::Targeting::TargetRule> out;
    if (!arr.is_array()) return out;
    for (const auto& t : arr) {
        Cadence::Targeting::TargetRule rule;
        rule.abilityId = t.value("ability", 0u);
        rule.displayName = t.value("name", std::string());
        const auto mode = Cadence::Targeting::parseTargetingMode(t.value("mode", std::string("SmartAbility")));
        if (!mode || rule.abilityId == Cadence::kNoAbility) {
            Cadence::logWarn("Target rule '" + rule.displayName + "' skipped");
            continue;
        }
        rule.mode = *mode;
        rule.secondaryAbilityId = t.value("secondary", 0u);
        rule.requiredBuffId = t.value("buff", 0u);
        out.push_back(rule);
    }
    return out;
}

std::optional<RoleTable> fromJson(const json& j) {
    if (!j.is_object() || !j.contains("role") || !j["role"].is_number_unsigned()) {
        Cadence::logWarn("Role table needs an unsigned 'role' id");
        return std::nullopt;
    }

    RoleTable table;
    table.role = j["role"].get<Cadence::RoleId>();
    table.name = j.value("name", "role " + std::to_string(table.role));
    if (j.contains("tracking")) table.tracking = parseTracking(j["tracking"]);
    if (j.contains("upgradeChains")) table.upgradeChains = parseChains(j["upgradeChains"]);
    if (j.contains("grids")) table.grids = parseGrids(j["grids"]);
    if (j.contains("weaves")) table.weaves = parseWeaves(j["weaves"]);
    if (j.contains("weaveOrder")) table.weaveOrder = parseWeaveOrder(j["weaveOrder"]);
    if (j.contains("targets")) table.targets = parseTargets(j["targets"]);
    return table;
}
}  // namespace

std::optional<RoleTable> RoleRuleLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Cadence::logWarn("Role table not found: " + path);
        return std::nullopt;
    }

    json j;
    try {
        in >> j;
        return fromJson(j);
    } catch (const json::exception& e) {
        Cadence::logWarn("Failed to read role table " + path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<RoleTable> RoleRuleLoader::loadFromString(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        Cadence::logWarn(std::string("Failed to read role table: ") + e.what());
        return std::nullopt;
    }
}

}  // namespace Roles
