#include <string>
#include <vector>

#include "../cadence/config/SettingsLoader.h"
#include "../cadence/core/Logger.h"
#include "../replay/ReplayRunner.h"
#include "../replay/Scenario.h"

namespace {
void printUsage() {
    Cadence::logError("usage: cadence_replay <scenario.json> [--settings file] [--roles file...]");
}
}  // namespace

int main(int argc, char** argv) {
    std::string scenarioPath;
    std::string settingsPath;
    std::vector<std::string> rolePaths;

    bool readingRoles = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--settings") {
            readingRoles = false;
            if (i + 1 >= argc) {
                printUsage();
                return 2;
            }
            settingsPath = argv[++i];
        } else if (arg == "--roles") {
            readingRoles = true;
        } else if (readingRoles) {
            rolePaths.push_back(arg);
        } else if (scenarioPath.empty()) {
            scenarioPath = arg;
        } else {
            printUsage();
            return 2;
        }
    }
    if (scenarioPath.empty()) {
        printUsage();
        return 2;
    }

    Cadence::Config::EngineSettings settings{};
    if (!settingsPath.empty()) {
        auto loaded = Cadence::Config::SettingsLoader::loadFromFile(settingsPath);
        if (!loaded) {
            Cadence::logWarn("Using default settings");
        } else {
            settings = *loaded;
        }
    }

    auto scenario = Replay::ScenarioLoader::loadFromFile(scenarioPath);
    if (!scenario) {
        return 1;
    }

    Replay::ReplayRunner runner(settings);
    runner.setRoleTables(rolePaths);
    const auto result = runner.run(*scenario);
    Cadence::logInfo("Presses: " + std::to_string(result.presses) + ", mismatches: " +
                     std::to_string(result.mismatches));
    return result.mismatches == 0 ? 0 : 3;
}
