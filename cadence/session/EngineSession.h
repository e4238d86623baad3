// Owns every runtime component of one engine instance and applies per-tick host pushes.
#pragma once

#include <vector>

#include "../config/EngineSettings.h"
#include "../core/Time.h"
#include "../dispatch/ActionPipeline.h"
#include "../dispatch/EngineContext.h"
#include "../resolve/UpgradeChainResolver.h"
#include "../state/SnapshotPublisher.h"
#include "../state/StateSnapshot.h"
#include "../targeting/TargetPriorityEngine.h"
#include "../telemetry/EngineTelemetry.h"

namespace Cadence {

struct TickInput {
    State::CoreState core{};
    float lockRemaining{0.0f};
    std::uint32_t currentMp{0};
    std::uint32_t maxMp{0};
    std::vector<State::TrackedUpdate> buffs;
    std::vector<State::TrackedUpdate> debuffs;
    std::vector<State::TrackedUpdate> cooldowns;

    // Roster pushes arrive on their own cadence; false leaves the roster untouched.
    bool partyUpdated{false};
    std::vector<Targeting::PartyMember> party;
    ActorId hardTarget{kNoActor};
    bool hardTargetValid{false};

    bool companionUpdated{false};
    ActorId companionId{kNoActor};
    float companionHp{1.0f};
    bool companionValid{false};
    bool companionCleansable{false};
};

class EngineSession {
public:
    explicit EngineSession(Clock clock = Clock{}, const Config::EngineSettings& settings = {});
    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;

    // Registers provider tracking and upgrade chains. Call after all providers are registered.
    void start();
    void applySettings(const Config::EngineSettings& settings);
    void update(const TickInput& input, double frameMs);

    Dispatch::Decision decide(AbilityId attempted) { return pipeline_.decide(attempted); }

    Dispatch::EngineContext& context() { return context_; }
    State::StateSnapshot& snapshot() { return snapshot_; }
    const State::SnapshotPublisher& publisher() const { return publisher_; }
    Targeting::TargetPriorityEngine& targeting() { return targeting_; }
    Resolve::UpgradeChainResolver& upgrades() { return upgrades_; }
    Dispatch::ActionPipeline& pipeline() { return pipeline_; }
    Telemetry::EngineTelemetry& telemetry() { return telemetry_; }
    const Config::EngineSettings& settings() const { return settings_; }
    bool started() const { return started_; }

private:
    Config::EngineSettings settings_{};
    Dispatch::EngineContext context_;
    State::StateSnapshot snapshot_;
    State::SnapshotPublisher publisher_;
    Targeting::TargetPriorityEngine targeting_;
    Resolve::UpgradeChainResolver upgrades_;
    Dispatch::ActionPipeline pipeline_;
    Telemetry::EngineTelemetry telemetry_;
    bool started_{false};
};

}  // namespace Cadence
