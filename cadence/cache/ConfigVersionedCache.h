// Linear-scan memo invalidated by age or by a configuration version bump.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "../core/ConfigVersion.h"
#include "../core/Ids.h"
#include "../core/Time.h"

namespace Cadence::Cache {

class ConfigVersionedCache {
public:
    static constexpr std::size_t kCapacity = 128;
    static constexpr TimeMs kDefaultTimeoutMs = 200;

    explicit ConfigVersionedCache(const ConfigVersion& version, TimeMs timeoutMs = kDefaultTimeoutMs);

    std::optional<AbilityId> lookup(AbilityId key, TimeMs now);
    void insert(AbilityId key, AbilityId value, TimeMs now);
    void clear() { count_ = 0; }
    void setTimeoutMs(TimeMs timeoutMs) { timeoutMs_ = timeoutMs; }

    std::size_t size() const { return count_; }
    TimeMs timeoutMs() const { return timeoutMs_; }
    std::uint64_t hits() const { return hits_; }
    std::uint64_t misses() const { return misses_; }

private:
    struct Entry {
        AbilityId key{0};
        AbilityId value{0};
        TimeMs storedAtMs{0};
        std::uint32_t version{ConfigVersion::kUninitialized};
    };

    void removeAt(std::size_t index);

    const ConfigVersion& version_;
    TimeMs timeoutMs_{kDefaultTimeoutMs};
    std::array<Entry, kCapacity> entries_{};
    std::size_t count_{0};
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
};

}  // namespace Cadence::Cache
