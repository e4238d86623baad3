// Hands the writer thread's latest snapshot to readers without torn records.
#pragma once

#include <cstdint>
#include <mutex>

#include "StateSnapshot.h"

namespace Cadence::State {

class SnapshotPublisher {
public:
    void publish(const SnapshotView& view);
    SnapshotView read() const;
    std::uint64_t generation() const;

private:
    mutable std::mutex mutex_{};
    SnapshotView current_{};
    std::uint64_t generation_{0};
};

}  // namespace Cadence::State
