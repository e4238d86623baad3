#include "WeaveEvaluator.h"

#include <algorithm>
#include <cassert>

#include "../core/Logger.h"

namespace Cadence::Resolve {

namespace {
int clampSlots(int maxSlots) { return std::clamp(maxSlots, 0, kMaxWeaveSlots); }

bool passes(const WeaveRule& rule, const State::StateSnapshot& s) {
    return rule.predicate && rule.producer && rule.predicate(s);
}

void emit(const WeaveRule& rule, const State::StateSnapshot& s, WeavePick& out) {
    const AbilityId id = rule.producer(s);
    if (id == kNoAbility) return;
    assert(out.count < kMaxWeaveSlots);
    out.ids[static_cast<std::size_t>(out.count++)] = id;
}
}  // namespace

bool WeaveRuleSet::add(WeaveRule rule) {
    if (count_ >= kMaxWeaveRules) {
        logWarn("Weave rule '" + rule.name + "' dropped: table full");
        return false;
    }
    rules_[count_++] = std::move(rule);
    return true;
}

int computeSlots(float lockRemaining, float perAbilityLock, float safetyMargin) {
    if (lockRemaining <= 0.0f) return 2;
    if (lockRemaining < perAbilityLock + safetyMargin) return 0;
    if (lockRemaining >= 2.0f * perAbilityLock + safetyMargin) return 2;
    return 1;
}

int selectTop2(const WeaveRuleSet& rules, const State::StateSnapshot& snapshot, int maxSlots, WeavePick& out) {
    out = WeavePick{};
    const int slots = clampSlots(maxSlots);
    if (slots == 0 || rules.empty()) return 0;

    int topIdx = -1;
    int secondIdx = -1;
    std::uint8_t topPri = 0;
    std::uint8_t secondPri = 0;

    for (std::size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        if (!passes(rule, snapshot)) continue;
        const std::uint8_t p = rule.priority;
        if (topIdx == -1 || p > topPri) {
            secondIdx = topIdx;
            secondPri = topPri;
            topIdx = static_cast<int>(i);
            topPri = p;
        } else if (secondIdx == -1 || p > secondPri) {
            secondIdx = static_cast<int>(i);
            secondPri = p;
        }
    }

    if (topIdx >= 0) emit(rules[static_cast<std::size_t>(topIdx)], snapshot, out);
    if (slots > 1 && secondIdx >= 0) emit(rules[static_cast<std::size_t>(secondIdx)], snapshot, out);
    return out.count;
}

int evaluateInOrder(const WeaveRuleSet& rules, const State::StateSnapshot& snapshot, int maxSlots, WeavePick& out) {
    out = WeavePick{};
    const int slots = clampSlots(maxSlots);
    for (std::size_t i = 0; i < rules.size() && out.count < slots; ++i) {
        if (passes(rules[i], snapshot)) emit(rules[i], snapshot, out);
    }
    return out.count;
}

}  // namespace Cadence::Resolve
