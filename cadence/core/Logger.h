// Minimal console logger with a level floor and a swappable sink.
#pragma once

#include <functional>
#include <string_view>

namespace Cadence {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    // Empty sink restores console output.
    static void setSink(Sink sink);
};

std::string_view logLevelLabel(LogLevel level);

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Cadence
