#include "ConfigVersionedCache.h"

namespace Cadence::Cache {

ConfigVersionedCache::ConfigVersionedCache(const ConfigVersion& version, TimeMs timeoutMs)
    : version_(version), timeoutMs_(timeoutMs) {}

std::optional<AbilityId> ConfigVersionedCache::lookup(AbilityId key, TimeMs now) {
    const std::uint32_t current = version_.current();
    for (std::size_t i = 0; i < count_; ++i) {
        const auto& e = entries_[i];
        if (e.key != key) continue;
        if (now - e.storedAtMs < timeoutMs_ && e.version == current) {
            ++hits_;
            return e.value;
        }
        removeAt(i);
        break;
    }
    ++misses_;
    return std::nullopt;
}

void ConfigVersionedCache::insert(AbilityId key, AbilityId value, TimeMs now) {
    for (std::size_t i = 0; i < count_; ++i) {
        if (entries_[i].key == key) {
            removeAt(i);
            break;
        }
    }

    if (count_ >= kCapacity) {
        std::size_t oldest = 0;
        for (std::size_t i = 1; i < count_; ++i) {
            if (entries_[i].storedAtMs < entries_[oldest].storedAtMs) oldest = i;
        }
        removeAt(oldest);
    }

    entries_[count_++] = Entry{key, value, now, version_.current()};
}

void ConfigVersionedCache::removeAt(std::size_t index) {
    for (std::size_t i = index + 1; i < count_; ++i) {
        entries_[i - 1] = entries_[i];
    }
    --count_;
}

}  // namespace Cadence::Cache
