#include "RotationGrid.h"

#include <algorithm>

namespace Cadence::Dispatch {

RotationGrid::RotationGrid(std::string name, std::vector<AbilityId> triggers, std::vector<GridRule> rules)
    : name_(std::move(name)), triggers_(std::move(triggers)), rules_(std::move(rules)) {}

bool RotationGrid::handles(AbilityId abilityId) const {
    return std::find(triggers_.begin(), triggers_.end(), abilityId) != triggers_.end();
}

std::optional<AbilityId> RotationGrid::evaluate(const State::StateSnapshot& snapshot) const {
    for (const auto& rule : rules_) {
        if (!rule.predicate || !rule.producer) continue;
        if (rule.predicate(snapshot)) return rule.producer(snapshot);
    }
    return std::nullopt;
}

RotationGrid RotationGrid::filtered(const std::function<bool(const std::string&)>& keep) const {
    std::vector<GridRule> kept;
    kept.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (keep(rule.description)) kept.push_back(rule);
    }
    return RotationGrid(name_, triggers_, std::move(kept));
}

}  // namespace Cadence::Dispatch
