#include "EngineSession.h"

#include <chrono>
#include <string>

#include "../core/Logger.h"

namespace Cadence {

EngineSession::EngineSession(Clock clock, const Config::EngineSettings& settings)
    : settings_(Config::sanitize(settings)),
      snapshot_(std::move(clock)),
      targeting_(Config::toTargetingConfig(settings_)),
      pipeline_(context_, snapshot_, targeting_, upgrades_, Config::toPipelineSettings(settings_)) {
    Logger::setMinLevel(settings_.logLevel);
    telemetry_.setAutoThrottle(settings_.autoThrottle);
    snapshot_.onRoleChanged([](RoleId previous, RoleId current) {
        logInfo("Role changed " + std::to_string(previous) + " -> " + std::to_string(current));
    });
}

void EngineSession::start() {
    if (started_) return;
    pipeline_.attachProviders();
    Config::applyToggles(settings_, context_);
    targeting_.companion().setSystemState(settings_.companionEnabled, false);
    started_ = true;
}

void EngineSession::applySettings(const Config::EngineSettings& settings) {
    settings_ = Config::sanitize(settings);
    Logger::setMinLevel(settings_.logLevel);
    targeting_.setConfig(Config::toTargetingConfig(settings_));
    pipeline_.setSettings(Config::toPipelineSettings(settings_));
    telemetry_.setAutoThrottle(settings_.autoThrottle);
    Config::applyToggles(settings_, context_);
    targeting_.companion().setSystemState(settings_.companionEnabled, snapshot_.inRestrictedArea());
}

void EngineSession::update(const TickInput& input, double frameMs) {
    const auto begin = std::chrono::steady_clock::now();

    snapshot_.updateCore(input.core);
    snapshot_.updateScalars(input.lockRemaining, input.currentMp, input.maxMp);
    snapshot_.updateBuffs(input.buffs);
    snapshot_.updateDebuffs(input.debuffs);
    snapshot_.updateCooldowns(input.cooldowns);

    const TimeMs now = snapshot_.clock().nowMs();
    if (input.partyUpdated) {
        targeting_.updateParty(input.party, now);
        targeting_.setHardTarget(input.hardTarget, input.hardTargetValid);
    }

    auto& companion = targeting_.companion();
    companion.setSystemState(settings_.companionEnabled, snapshot_.inRestrictedArea());
    if (input.companionUpdated) {
        // An expired sample always takes the push; otherwise telemetry may space scans out.
        if (companion.needsScan(now, targeting_.config().companionRefreshMs) ||
            telemetry_.shouldRunCompanionScan(snapshot_.frameStamp())) {
            companion.push(input.companionId, input.companionHp, input.companionValid, now,
                           input.companionCleansable);
        }
    }

    publisher_.publish(snapshot_.view());

    const auto workMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - begin).count();
    telemetry_.recordUpdate(frameMs, workMs);
    telemetry_.recordCounters(pipeline_.counters());
}

}  // namespace Cadence
