// Drives an EngineSession through a scenario on a manual clock.
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "../cadence/config/EngineSettings.h"
#include "../cadence/dispatch/ActionPipeline.h"
#include "Scenario.h"

namespace Replay {

struct ReplayResult {
    std::size_t ticks{0};
    std::size_t presses{0};
    std::size_t mismatches{0};
    std::vector<Cadence::Dispatch::Decision> decisions;
};

class ReplayRunner {
public:
    explicit ReplayRunner(const Cadence::Config::EngineSettings& settings = {});

    void setRoleTables(std::vector<std::string> paths) { roleTables_ = std::move(paths); }
    ReplayResult run(const Scenario& scenario);

private:
    Cadence::Config::EngineSettings settings_{};
    std::vector<std::string> roleTables_;
};

}  // namespace Replay
