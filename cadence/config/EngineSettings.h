// User-tunable engine settings and how they map onto the runtime components.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/Ids.h"
#include "../core/Logger.h"
#include "../core/Time.h"
#include "../dispatch/ActionPipeline.h"
#include "../dispatch/EngineContext.h"
#include "../targeting/TargetPriorityEngine.h"

namespace Cadence::Config {

struct RuleToggle {
    RoleId role{kNoRole};
    std::string rule;
};

struct EngineSettings {
    LogLevel logLevel{LogLevel::Info};

    float perAbilityLock{Resolve::kDefaultPerAbilityLock};  // seconds
    float safetyMargin{Resolve::kDefaultSafetyMargin};      // seconds

    float hpThreshold{1.0f};
    TimeMs rosterRefreshMs{Targeting::kDefaultRosterRefreshMs};
    TimeMs companionRefreshMs{Targeting::kDefaultCompanionRefreshMs};
    bool companionEnabled{true};
    std::optional<float> companionOverrideDelta{};

    TimeMs staleThresholdMs{State::kDefaultStaleMs};
    TimeMs configCacheTimeoutMs{Cache::ConfigVersionedCache::kDefaultTimeoutMs};
    bool autoThrottle{false};  // lets telemetry space out companion scans under load

    std::vector<RoleId> smartTargetingDisabledRoles;
    std::vector<RuleToggle> disabledRules;
};

// Pulls every value back into its supported range.
EngineSettings sanitize(const EngineSettings& settings);

Targeting::TargetingConfig toTargetingConfig(const EngineSettings& settings);
Dispatch::PipelineSettings toPipelineSettings(const EngineSettings& settings);
// Pushes rule and smart-targeting toggles into the context (bumps its version when anything changes).
void applyToggles(const EngineSettings& settings, Dispatch::EngineContext& context);

std::optional<LogLevel> parseLogLevel(const std::string& key);

}  // namespace Cadence::Config
