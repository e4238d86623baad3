#include "Logger.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Cadence {

namespace {
std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

Logger::Sink& activeSink() {
    static Logger::Sink sink;
    return sink;
}

LogLevel& floorLevel() {
    static LogLevel level = LogLevel::Info;
    return level;
}

void writeConsole(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    auto& out = level == LogLevel::Error ? std::cerr : std::cout;
    out << '[' << oss.str() << "] [" << logLevelLabel(level) << "] " << message << '\n';
}
}  // namespace

std::string_view logLevelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

void Logger::log(LogLevel level, std::string_view message) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex());
        if (level < floorLevel()) return;
        sink = activeSink();
    }
    if (sink) {
        sink(level, message);
        return;
    }
    writeConsole(level, message);
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    floorLevel() = level;
}

LogLevel Logger::minLevel() {
    std::lock_guard<std::mutex> lock(sinkMutex());
    return floorLevel();
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    activeSink() = std::move(sink);
}

}  // namespace Cadence
