#include "TableRoleProvider.h"

namespace Roles {

std::vector<Cadence::Dispatch::RotationGrid> TableRoleProvider::rotationGrids() const {
    std::vector<Cadence::Dispatch::RotationGrid> out;
    out.reserve(table_.grids.size());
    for (const auto& grid : table_.grids) {
        std::vector<Cadence::Dispatch::GridRule> rules;
        rules.reserve(grid.rules.size());
        for (const auto& r : grid.rules) {
            Cadence::Dispatch::GridRule rule;
            rule.predicate = compileConditions(r.when);
            const Cadence::AbilityId use = r.use;
            rule.producer = [use](const Cadence::State::StateSnapshot&) { return use; };
            rule.description = r.description;
            rules.push_back(std::move(rule));
        }
        out.emplace_back(grid.name, grid.triggers, std::move(rules));
    }
    return out;
}

std::vector<Cadence::Resolve::WeaveRule> TableRoleProvider::weaveRules() const {
    std::vector<Cadence::Resolve::WeaveRule> out;
    out.reserve(table_.weaves.size());
    for (const auto& w : table_.weaves) {
        Cadence::Resolve::WeaveRule rule;
        rule.priority = w.priority;
        rule.name = w.name;
        rule.predicate = compileConditions(w.when);
        const Cadence::AbilityId use = w.use;
        rule.producer = [use](const Cadence::State::StateSnapshot&) { return use; };
        out.push_back(std::move(rule));
    }
    return out;
}

}  // namespace Roles
