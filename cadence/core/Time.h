// Millisecond clock used for staleness and cache expiry.
#pragma once

#include <cstdint>
#include <functional>

namespace Cadence {

using TimeMs = std::int64_t;

// Monotonic milliseconds since an arbitrary process-local epoch.
TimeMs steadyNowMs();

class Clock {
public:
    using Source = std::function<TimeMs()>;

    Clock() = default;
    explicit Clock(Source source) : source_(std::move(source)) {}

    TimeMs nowMs() const { return source_ ? source_() : steadyNowMs(); }

private:
    Source source_{};
};

// Settable clock for replays and tests.
class ManualClock {
public:
    explicit ManualClock(TimeMs start = 0) : now_(start) {}

    void set(TimeMs now) { now_ = now; }
    void advance(TimeMs deltaMs) { now_ += deltaMs; }
    TimeMs now() const { return now_; }

    Clock clock() const {
        return Clock([this]() { return now_; });
    }

private:
    TimeMs now_{0};
};

}  // namespace Cadence
