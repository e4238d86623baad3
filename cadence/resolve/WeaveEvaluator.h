// Secondary-ability slot math and top-2 rule selection.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "../core/Ids.h"
#include "../state/StateSnapshot.h"

namespace Cadence::Resolve {

constexpr float kDefaultPerAbilityLock = 0.70f;
constexpr float kDefaultSafetyMargin = 0.05f;
constexpr int kMaxWeaveSlots = 2;
constexpr std::size_t kMaxWeaveRules = 8;

// How a role's weave rules compete: by priority byte, or first passing in declared order.
enum class WeaveOrder { Priority, Declared };

struct WeaveRule {
    std::uint8_t priority{0};  // higher wins
    std::function<bool(const State::StateSnapshot&)> predicate;
    std::function<AbilityId(const State::StateSnapshot&)> producer;
    std::string name;
};

// Fixed-capacity rule table; rules past kMaxWeaveRules are refused.
class WeaveRuleSet {
public:
    bool add(WeaveRule rule);
    void clear() { count_ = 0; }

    std::size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    const WeaveRule& operator[](std::size_t i) const { return rules_[i]; }

private:
    std::array<WeaveRule, kMaxWeaveRules> rules_{};
    std::size_t count_{0};
};

struct WeavePick {
    std::array<AbilityId, kMaxWeaveSlots> ids{};
    int count{0};
};

// 0, 1 or 2 secondaries that fit in lockRemaining seconds of primary lock.
int computeSlots(float lockRemaining, float perAbilityLock = kDefaultPerAbilityLock,
                 float safetyMargin = kDefaultSafetyMargin);

// One pass for the two best passing rules by priority, earlier rule wins ties.
// Only the winners' producers run. Returns out.count.
int selectTop2(const WeaveRuleSet& rules, const State::StateSnapshot& snapshot, int maxSlots, WeavePick& out);

// Declared-order variant: first passing rules win.
int evaluateInOrder(const WeaveRuleSet& rules, const State::StateSnapshot& snapshot, int maxSlots, WeavePick& out);

}  // namespace Cadence::Resolve
