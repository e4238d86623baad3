// Monotonic configuration counter; 0 is reserved for "never set".
#pragma once

#include <atomic>
#include <cstdint>

namespace Cadence {

class ConfigVersion {
public:
    static constexpr std::uint32_t kUninitialized = 0;
    static constexpr std::uint32_t kInitial = 1;

    ConfigVersion() = default;
    ConfigVersion(const ConfigVersion&) = delete;
    ConfigVersion& operator=(const ConfigVersion&) = delete;

    std::uint32_t current() const { return value_.load(std::memory_order_acquire); }

    // Wraps past the max value straight to 1.
    std::uint32_t bump() {
        std::uint32_t expected = value_.load(std::memory_order_relaxed);
        std::uint32_t next = 0;
        do {
            next = expected + 1;
            if (next == kUninitialized) next = kInitial;
        } while (!value_.compare_exchange_weak(expected, next, std::memory_order_acq_rel));
        return next;
    }

private:
    std::atomic<std::uint32_t> value_{kInitial};
};

}  // namespace Cadence
