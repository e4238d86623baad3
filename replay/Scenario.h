// Recorded or hand-written tick sequence fed to the engine by the replay tool.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../cadence/session/EngineSession.h"

namespace Replay {

struct ScenarioTick {
    Cadence::TickInput input;
    std::vector<Cadence::AbilityId> presses;
    std::vector<Cadence::AbilityId> expect;  // optional expected resolutions, one per press
};

struct Scenario {
    std::string name;
    double frameMs{50.0};
    std::vector<ScenarioTick> ticks;
};

std::optional<std::uint32_t> parseStateFlag(const std::string& key);
std::optional<std::uint32_t> parseMemberFlag(const std::string& key);

class ScenarioLoader {
public:
    static std::optional<Scenario> loadFromFile(const std::string& path);
    static std::optional<Scenario> loadFromString(const std::string& text);
};

}  // namespace Replay
