#include "SnapshotPublisher.h"

namespace Cadence::State {

void SnapshotPublisher::publish(const SnapshotView& view) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = view;
    ++generation_;
}

SnapshotView SnapshotPublisher::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::uint64_t SnapshotPublisher::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace Cadence::State
