// Ordered replacement rules for a group of trigger abilities.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../core/Ids.h"
#include "../state/StateSnapshot.h"

namespace Cadence::Dispatch {

struct GridRule {
    std::function<bool(const State::StateSnapshot&)> predicate;
    std::function<AbilityId(const State::StateSnapshot&)> producer;
    std::string description;
};

class RotationGrid {
public:
    RotationGrid() = default;
    RotationGrid(std::string name, std::vector<AbilityId> triggers, std::vector<GridRule> rules);

    bool handles(AbilityId abilityId) const;
    // Output of the first passing rule; nullopt when nothing passes. Rule exceptions propagate.
    std::optional<AbilityId> evaluate(const State::StateSnapshot& snapshot) const;

    const std::string& name() const { return name_; }
    const std::vector<AbilityId>& triggers() const { return triggers_; }
    const std::vector<GridRule>& rules() const { return rules_; }

    // Drops rules whose description the predicate rejects.
    RotationGrid filtered(const std::function<bool(const std::string&)>& keep) const;

private:
    std::string name_;
    std::vector<AbilityId> triggers_;
    std::vector<GridRule> rules_;
};

}  // namespace Cadence::Dispatch
