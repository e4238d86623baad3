#include "EngineSettings.h"

#include <algorithm>

namespace Cadence::Config {

namespace {
constexpr float kMinAbilityLock = 0.3f;
constexpr float kMaxAbilityLock = 1.5f;
constexpr float kMaxSafetyMargin = 0.5f;
constexpr float kMinHpThreshold = 0.01f;
constexpr TimeMs kMinStaleMs = 16;
constexpr TimeMs kMaxStaleMs = 2000;
constexpr TimeMs kMinCacheTimeoutMs = 10;
constexpr TimeMs kMaxCacheTimeoutMs = 5000;
}  // namespace

EngineSettings sanitize(const EngineSettings& settings) {
    EngineSettings s = settings;
    s.perAbilityLock = std::clamp(s.perAbilityLock, kMinAbilityLock, kMaxAbilityLock);
    s.safetyMargin = std::clamp(s.safetyMargin, 0.0f, kMaxSafetyMargin);
    s.hpThreshold = std::clamp(s.hpThreshold, kMinHpThreshold, 1.0f);
    s.rosterRefreshMs = std::clamp(s.rosterRefreshMs, Targeting::kMinRosterRefreshMs, Targeting::kMaxRosterRefreshMs);
    s.companionRefreshMs =
        std::clamp(s.companionRefreshMs, Targeting::kMinCompanionRefreshMs, Targeting::kMaxCompanionRefreshMs);
    if (s.companionOverrideDelta) s.companionOverrideDelta = std::clamp(*s.companionOverrideDelta, 0.0f, 1.0f);
    s.staleThresholdMs = std::clamp(s.staleThresholdMs, kMinStaleMs, kMaxStaleMs);
    s.configCacheTimeoutMs = std::clamp(s.configCacheTimeoutMs, kMinCacheTimeoutMs, kMaxCacheTimeoutMs);
    return s;
}

Targeting::TargetingConfig toTargetingConfig(const EngineSettings& settings) {
    Targeting::TargetingConfig cfg;
    cfg.hpThreshold = settings.hpThreshold;
    cfg.rosterRefreshMs = settings.rosterRefreshMs;
    cfg.companionRefreshMs = settings.companionRefreshMs;
    cfg.companionOverrideDelta = settings.companionOverrideDelta;
    return cfg;
}

Dispatch::PipelineSettings toPipelineSettings(const EngineSettings& settings) {
    Dispatch::PipelineSettings p;
    p.weaveTiming.perAbilityLock = settings.perAbilityLock;
    p.weaveTiming.safetyMargin = settings.safetyMargin;
    p.staleThresholdMs = settings.staleThresholdMs;
    p.configCacheTimeoutMs = settings.configCacheTimeoutMs;
    return p;
}

void applyToggles(const EngineSettings& settings, Dispatch::EngineContext& context) {
    for (RoleId role : settings.smartTargetingDisabledRoles) {
        context.setSmartTargetingEnabled(role, false);
    }
    for (const auto& t : settings.disabledRules) {
        context.setRuleEnabled(t.role, t.rule, false);
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& key) {
    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warn" || key == "warning") return LogLevel::Warning;
    if (key == "error") return LogLevel::Error;
    return std::nullopt;
}

}  // namespace Cadence::Config
