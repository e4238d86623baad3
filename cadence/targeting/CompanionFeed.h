// Lower-frequency companion sample fed from its own scan thread.
#pragma once

#include <mutex>
#include <optional>

#include "../core/Ids.h"
#include "../core/Time.h"

namespace Cadence::Targeting {

struct CompanionSample {
    ActorId id{kNoActor};
    float hp{1.0f};
    bool valid{false};
    bool cleansable{false};
    TimeMs sampledAtMs{0};
};

class CompanionFeed {
public:
    // Disabling the system or entering a restricted area drops the cached sample.
    void setSystemState(bool enabled, bool inRestrictedArea);
    void push(ActorId id, float hp, bool valid, TimeMs now, bool cleansable = false);
    void clear();

    // A valid sample no older than windowMs, if the system is active.
    std::optional<CompanionSample> fresh(TimeMs now, TimeMs windowMs) const;
    bool needsScan(TimeMs now, TimeMs windowMs) const;
    bool active() const;

private:
    void resetLocked();

    mutable std::mutex mutex_{};
    CompanionSample sample_{};
    bool enabled_{false};
    bool inRestrictedArea_{false};
};

}  // namespace Cadence::Targeting
