// Loads EngineSettings from JSON; missing keys keep their defaults.
#pragma once

#include <optional>
#include <string>

#include "EngineSettings.h"

namespace Cadence::Config {

class SettingsLoader {
public:
    static std::optional<EngineSettings> loadFromFile(const std::string& path);
    static std::optional<EngineSettings> loadFromString(const std::string& text);
};

}  // namespace Cadence::Config
