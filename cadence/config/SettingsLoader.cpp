#include "SettingsLoader.h"

#include <fstream>

#include <nlohmann/json.hpp>

namespace Cadence::Config {

namespace {
using nlohmann::json;

std::optional<EngineSettings> fromJson(const json& j) {
    if (!j.is_object()) {
        logWarn("Settings root must be an object");
        return std::nullopt;
    }

    EngineSettings s;
    if (j.contains("logLevel") && j["logLevel"].is_string()) {
        const auto level = parseLogLevel(j["logLevel"].get<std::string>());
        if (level) {
            s.logLevel = *level;
        } else {
            logWarn("Unknown logLevel '" + j["logLevel"].get<std::string>() + "', keeping info");
        }
    }

    if (j.contains("weave") && j["weave"].is_object()) {
        const auto& w = j["weave"];
        s.perAbilityLock = w.value("perAbilityLock", s.perAbilityLock);
        s.safetyMargin = w.value("safetyMargin", s.safetyMargin);
    }

    if (j.contains("targeting") && j["targeting"].is_object()) {
        const auto& t = j["targeting"];
        s.hpThreshold = t.value("hpThreshold", s.hpThreshold);
        s.rosterRefreshMs = t.value("rosterRefreshMs", s.rosterRefreshMs);
        s.companionRefreshMs = t.value("companionRefreshMs", s.companionRefreshMs);
        s.companionEnabled = t.value("companionEnabled", s.companionEnabled);
        if (t.contains("companionOverrideDelta") && t["companionOverrideDelta"].is_number()) {
            s.companionOverrideDelta = t["companionOverrideDelta"].get<float>();
        }
    }

    s.staleThresholdMs = j.value("staleThresholdMs", s.staleThresholdMs);
    s.configCacheTimeoutMs = j.value("configCacheTimeoutMs", s.configCacheTimeoutMs);
    s.autoThrottle = j.value("autoThrottle", s.autoThrottle);

    if (j.contains("smartTargetingDisabledRoles") && j["smartTargetingDisabledRoles"].is_array()) {
        for (const auto& r : j["smartTargetingDisabledRoles"]) {
            if (r.is_number_unsigned()) s.smartTargetingDisabledRoles.push_back(r.get<RoleId>());
        }
    }

    if (j.contains("disabledRules") && j["disabledRules"].is_array()) {
        for (const auto& r : j["disabledRules"]) {
            if (!r.is_object() || !r.contains("role") || !r.contains("rule") || !r["role"].is_number_unsigned() ||
                !r["rule"].is_string()) {
                logWarn("Skipping malformed disabledRules entry " + r.dump());
                continue;
            }
            RuleToggle toggle;
            toggle.role = r["role"].get<RoleId>();
            toggle.rule = r["rule"].get<std::string>();
            s.disabledRules.push_back(toggle);
        }
    }

    return sanitize(s);
}
}  // namespace

std::optional<EngineSettings> SettingsLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        logWarn("Settings file not found: " + path);
        return std::nullopt;
    }

    json j;
    try {
        in >> j;
        return fromJson(j);
    } catch (const json::exception& e) {
        logWarn("Failed to parse settings " + path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<EngineSettings> SettingsLoader::loadFromString(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        logWarn(std::string("Failed to parse settings: ") + e.what());
        return std::nullopt;
    }
}

}  // namespace Cadence::Config
