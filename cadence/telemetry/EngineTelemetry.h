// Smoothed update cost and cache counters for monitoring. Never feeds back into decisions.
#pragma once

#include <cstdint>
#include <string>

#include "../dispatch/ActionPipeline.h"

namespace Cadence::Telemetry {

enum class LoadLevel { Ok, Throttle, Degraded };

const char* loadLevelName(LoadLevel level);

struct TelemetryReport {
    double avgFrameMs{0.0};
    double avgWorkMs{0.0};
    LoadLevel load{LoadLevel::Ok};
    std::uint64_t cacheHits{0};
    std::uint64_t cacheMisses{0};
    double hitRate{0.0};
    std::uint64_t samples{0};
};

class EngineTelemetry {
public:
    static constexpr double kAlpha = 0.12;
    static constexpr double kThrottleRatio = 0.25;
    static constexpr double kDegradedRatio = 0.50;
    static constexpr std::uint32_t kThrottleScanInterval = 2;
    static constexpr std::uint32_t kDegradedScanInterval = 4;

    // Off by default: every companion scan runs regardless of load.
    void setAutoThrottle(bool enabled) { autoThrottle_ = enabled; }
    bool autoThrottle() const { return autoThrottle_; }

    // frameMs is the host tick length, workMs the time spent in our update.
    void recordUpdate(double frameMs, double workMs);
    void recordCounters(const Dispatch::PipelineCounters& counters);

    LoadLevel load() const;
    // With auto-throttle on, accepted scans are spaced at least 2 frames apart under throttle and 4 when
    // degraded, counted from the last accepted scan.
    bool shouldRunCompanionScan(std::uint32_t frame);

    TelemetryReport report() const;
    std::string summary() const;
    void reset();

private:
    double avgFrameMs_{0.0};
    double avgWorkMs_{0.0};
    std::uint64_t samples_{0};
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    bool autoThrottle_{false};
    bool scanned_{false};
    std::uint32_t lastScanFrame_{0};
};

}  // namespace Cadence::Telemetry
