#include "EngineTelemetry.h"

#include <iomanip>
#include <sstream>

namespace Cadence::Telemetry {

const char* loadLevelName(LoadLevel level) {
    switch (level) {
        case LoadLevel::Throttle:
            return "throttle";
        case LoadLevel::Degraded:
            return "degraded";
        case LoadLevel::Ok:
        default:
            return "ok";
    }
}

void EngineTelemetry::recordUpdate(double frameMs, double workMs) {
    if (frameMs < 0.0 || workMs < 0.0) return;
    if (samples_ == 0) {
        avgFrameMs_ = frameMs;
        avgWorkMs_ = workMs;
    } else {
        avgFrameMs_ += kAlpha * (frameMs - avgFrameMs_);
        avgWorkMs_ += kAlpha * (workMs - avgWorkMs_);
    }
    ++samples_;
}

void EngineTelemetry::recordCounters(const Dispatch::PipelineCounters& counters) {
    hits_ = counters.frameCacheHits + counters.configCacheHits + counters.memoHits;
    misses_ = counters.frameCacheMisses + counters.configCacheMisses;
}

LoadLevel EngineTelemetry::load() const {
    if (samples_ == 0 || avgFrameMs_ <= 0.0) return LoadLevel::Ok;
    const double ratio = avgWorkMs_ / avgFrameMs_;
    if (ratio >= kDegradedRatio) return LoadLevel::Degraded;
    if (ratio >= kThrottleRatio) return LoadLevel::Throttle;
    return LoadLevel::Ok;
}

bool EngineTelemetry::shouldRunCompanionScan(std::uint32_t frame) {
    const LoadLevel level = autoThrottle_ ? load() : LoadLevel::Ok;
    if (level != LoadLevel::Ok) {
        const std::uint32_t interval = level == LoadLevel::Degraded ? kDegradedScanInterval : kThrottleScanInterval;
        if (scanned_ && frame - lastScanFrame_ < interval) return false;
    }
    scanned_ = true;
    lastScanFrame_ = frame;
    return true;
}

TelemetryReport EngineTelemetry::report() const {
    TelemetryReport r;
    r.avgFrameMs = avgFrameMs_;
    r.avgWorkMs = avgWorkMs_;
    r.load = load();
    r.cacheHits = hits_;
    r.cacheMisses = misses_;
    const auto total = hits_ + misses_;
    r.hitRate = total == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(total);
    r.samples = samples_;
    return r;
}

std::string EngineTelemetry::summary() const {
    const auto r = report();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << "frame " << r.avgFrameMs << "ms, work " << r.avgWorkMs
        << "ms, load " << loadLevelName(r.load) << ", cache " << r.cacheHits << '/' << (r.cacheHits + r.cacheMisses)
        << " hits";
    return oss.str();
}

void EngineTelemetry::reset() {
    avgFrameMs_ = 0.0;
    avgWorkMs_ = 0.0;
    samples_ = 0;
    hits_ = 0;
    misses_ = 0;
    scanned_ = false;
    lastScanFrame_ = 0;
}

}  // namespace Cadence::Telemetry
