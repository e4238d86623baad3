// Rule provider backed by a data table (usually loaded from JSON).
#pragma once

#include <string>
#include <vector>

#include "../cadence/dispatch/RuleProvider.h"
#include "RuleConditions.h"

namespace Roles {

struct TableGridRule {
    std::string description;
    std::vector<Condition> when;
    Cadence::AbilityId use{Cadence::kNoAbility};
};

struct TableGrid {
    std::string name;
    std::vector<Cadence::AbilityId> triggers;
    std::vector<TableGridRule> rules;
};

struct TableWeaveRule {
    std::string name;
    std::uint8_t priority{0};
    std::vector<Condition> when;
    Cadence::AbilityId use{Cadence::kNoAbility};
};

struct RoleTable {
    Cadence::RoleId role{Cadence::kNoRole};
    std::string name;
    Cadence::State::TrackingSet tracking;
    std::vector<Cadence::Resolve::UpgradeChain> upgradeChains;
    std::vector<TableGrid> grids;
    std::vector<TableWeaveRule> weaves;
    Cadence::Resolve::WeaveOrder weaveOrder{Cadence::Resolve::WeaveOrder::Priority};
    std::vector<Cadence::Targeting::TargetRule> targets;
};

class TableRoleProvider : public Cadence::Dispatch::RuleProvider {
public:
    explicit TableRoleProvider(RoleTable table) : table_(std::move(table)) {}

    Cadence::RoleId roleId() const override { return table_.role; }
    std::string name() const override { return table_.name; }

    std::vector<Cadence::Dispatch::RotationGrid> rotationGrids() const override;
    std::vector<Cadence::Resolve::WeaveRule> weaveRules() const override;
    Cadence::Resolve::WeaveOrder weaveOrder() const override { return table_.weaveOrder; }
    std::vector<Cadence::Targeting::TargetRule> targetRules() const override { return table_.targets; }
    std::vector<Cadence::Resolve::UpgradeChain> upgradeChains() const override { return table_.upgradeChains; }
    Cadence::State::TrackingSet tracking() const override { return table_.tracking; }

    const RoleTable& table() const { return table_; }

private:
    RoleTable table_;
};

}  // namespace Roles
