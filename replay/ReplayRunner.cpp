#include "ReplayRunner.h"

#include <string>

#include "../cadence/core/Logger.h"
#include "../cadence/core/Time.h"
#include "../cadence/session/EngineSession.h"
#include "../roles/RoleCatalog.h"

namespace Replay {

namespace {
std::string describe(const Cadence::Dispatch::Decision& d) {
    std::string out = "use " + std::to_string(d.abilityId);
    if (d.targetId != Cadence::kNoActor) out += " @" + std::to_string(d.targetId);
    for (int i = 0; i < d.weaveCount; ++i) {
        out += (i == 0 ? " weave " : ", ") + std::to_string(d.weaves[static_cast<std::size_t>(i)]);
    }
    return out;
}
}  // namespace

ReplayRunner::ReplayRunner(const Cadence::Config::EngineSettings& settings) : settings_(settings) {}

ReplayResult ReplayRunner::run(const Scenario& scenario) {
    ReplayResult result;
    Cadence::ManualClock clock(1000);
    Cadence::EngineSession session(clock.clock(), settings_);
    Roles::registerBuiltinRoles(session.context());
    if (!roleTables_.empty()) {
        Roles::registerRoleTables(session.context(), roleTables_);
    }
    session.start();

    Cadence::logInfo("Replaying '" + scenario.name + "' (" + std::to_string(scenario.ticks.size()) + " ticks)");
    const auto stepMs = static_cast<Cadence::TimeMs>(scenario.frameMs);
    for (const auto& tick : scenario.ticks) {
        clock.advance(stepMs);
        session.update(tick.input, scenario.frameMs);
        ++result.ticks;

        for (std::size_t i = 0; i < tick.presses.size(); ++i) {
            const auto press = tick.presses[i];
            const auto decision = session.decide(press);
            ++result.presses;
            result.decisions.push_back(decision);
            Cadence::logInfo("t=" + std::to_string(clock.now()) + " press " + std::to_string(press) + " -> " +
                             describe(decision));
            if (i < tick.expect.size() && tick.expect[i] != decision.abilityId) {
                ++result.mismatches;
                Cadence::logWarn("Expected " + std::to_string(tick.expect[i]) + " for press " + std::to_string(press) +
                                 ", got " + std::to_string(decision.abilityId));
            }
        }
    }

    Cadence::logInfo(session.telemetry().summary());
    return result;
}

}  // namespace Replay
