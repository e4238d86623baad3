#include "DispatchSpecializer.h"

#include <exception>
#include <string>

#include "../core/Logger.h"

namespace Cadence::Dispatch {

namespace {
AbilityId identity(AbilityId id, const State::StateSnapshot&) { return id; }
}  // namespace

const char* topologyName(Topology topology) {
    switch (topology) {
        case Topology::SingleGrid:
            return "single-grid";
        case Topology::SingleGridWithWeaves:
            return "single-grid+weaves";
        case Topology::MultiGrid:
            return "multi-grid";
        case Topology::MultiGridWithWeaves:
            return "multi-grid+weaves";
        case Topology::Identity:
        default:
            return "identity";
    }
}

DispatchSpecializer::DispatchSpecializer(const EngineContext& context, const Resolve::UpgradeChainResolver& upgrades,
                                         Targeting::TargetPriorityEngine& targeting, WeaveTiming timing)
    : context_(context), upgrades_(upgrades), targeting_(targeting), timing_(timing) {}

AbilityId DispatchSpecializer::resolve(AbilityId abilityId, const State::StateSnapshot& snapshot) {
    Specialized& entry = ensure(snapshot);
    try {
        return entry.fn(abilityId, snapshot);
    } catch (const std::exception& e) {
        logError("Rule evaluation failed for ability " + std::to_string(abilityId) + " on role " +
                 std::to_string(entry.role) + ": " + e.what());
        degrade(entry);
        return abilityId;
    } catch (...) {
        logError("Rule evaluation failed for ability " + std::to_string(abilityId) + " on role " +
                 std::to_string(entry.role) + ": unknown fault");
        degrade(entry);
        return abilityId;
    }
}

int DispatchSpecializer::suggestWeaves(const State::StateSnapshot& snapshot, Resolve::WeavePick& out) {
    out = Resolve::WeavePick{};
    Specialized& entry = ensure(snapshot);
    if (entry.weaves.empty()) return 0;

    const int slots = Resolve::computeSlots(snapshot.lockRemaining(), timing_.perAbilityLock, timing_.safetyMargin);
    if (slots == 0) return 0;
    try {
        return pickWeaves(entry, snapshot, slots, out);
    } catch (const std::exception& e) {
        logError("Weave evaluation failed on role " + std::to_string(entry.role) + ": " + e.what());
    } catch (...) {
        logError("Weave evaluation failed on role " + std::to_string(entry.role) + ": unknown fault");
    }
    degrade(entry);
    out = Resolve::WeavePick{};
    return 0;
}

bool DispatchSpecializer::touches(AbilityId abilityId, const State::StateSnapshot& snapshot) {
    const Specialized& entry = ensure(snapshot);
    if (entry.targets.find(abilityId) != nullptr) return true;
    for (const auto& grid : entry.grids) {
        if (grid.handles(abilityId)) return true;
    }
    return false;
}

bool DispatchSpecializer::supportsWeaving(const State::StateSnapshot& snapshot) {
    return !ensure(snapshot).weaves.empty();
}

const Targeting::TargetRule* DispatchSpecializer::targetRuleFor(AbilityId abilityId,
                                                                const State::StateSnapshot& snapshot) {
    const Specialized& entry = ensure(snapshot);
    if (!entry.smartTargeting) return nullptr;
    return entry.targets.find(abilityId);
}

void DispatchSpecializer::setWeaveTiming(const WeaveTiming& timing) {
    timing_ = timing;
    current_.reset();
}

DispatchState DispatchSpecializer::state(const State::StateSnapshot& snapshot) const {
    if (current_ && current_->role == snapshot.roleId() && current_->version == context_.currentVersion()) {
        return DispatchState::Specialized;
    }
    return DispatchState::Stale;
}

DispatchSpecializer::Specialized& DispatchSpecializer::ensure(const State::StateSnapshot& snapshot) {
    const RoleId role = snapshot.roleId();
    const std::uint32_t version = context_.currentVersion();
    if (!current_ || current_->role != role || current_->version != version) {
        build(role, version);
    }
    return *current_;
}

void DispatchSpecializer::build(RoleId role, std::uint32_t version) {
    current_.emplace();
    Specialized& entry = *current_;
    entry.role = role;
    entry.version = version;
    entry.fn = identity;
    ++rebuilds_;

    const RuleProvider* provider = context_.provider(role);
    if (!provider) {
        logDebug("No rule provider for role " + std::to_string(role) + "; passing abilities through");
        return;
    }

    try {
        auto keep = [this, role](const std::string& name) { return context_.isRuleEnabled(role, name); };
        for (const auto& grid : provider->rotationGrids()) {
            entry.grids.push_back(grid.filtered(keep));
        }
        for (auto& rule : provider->weaveRules()) {
            if (keep(rule.name)) entry.weaves.add(std::move(rule));
        }
        entry.weaveOrder = provider->weaveOrder();
        entry.smartTargeting = context_.isSmartTargetingEnabled(role);
        if (entry.smartTargeting) {
            for (const auto& rule : provider->targetRules()) entry.targets.add(rule);
        }
        compile(entry);
        logInfo("Specialized role " + std::to_string(role) + " (" + provider->name() + ") at config v" +
                std::to_string(version) + " as " + topologyName(entry.topology));
    } catch (const std::exception& e) {
        logError("Provider failed to specialize role " + std::to_string(role) + ": " + e.what());
        degrade(entry);
    } catch (...) {
        logError("Provider failed to specialize role " + std::to_string(role) + ": unknown fault");
        degrade(entry);
    }
}

void DispatchSpecializer::compile(Specialized& entry) {
    const Specialized* sp = &entry;
    const bool weaves = !entry.weaves.empty();

    if (entry.grids.size() == 1) {
        const RotationGrid* grid = &entry.grids.front();
        entry.topology = weaves ? Topology::SingleGridWithWeaves : Topology::SingleGrid;
        if (weaves) {
            entry.fn = [this, sp, grid](AbilityId id, const State::StateSnapshot& s) {
                AbilityId out = id;
                if (replaceForTarget(*sp, id, s, out)) return out;
                if (!grid->handles(id)) return id;
                if (replaceFromGrid(*grid, id, s, out)) return out;
                if (replaceWithWeave(*sp, s, out)) return out;
                return id;
            };
        } else {
            entry.fn = [this, sp, grid](AbilityId id, const State::StateSnapshot& s) {
                AbilityId out = id;
                if (replaceForTarget(*sp, id, s, out)) return out;
                if (grid->handles(id) && replaceFromGrid(*grid, id, s, out)) return out;
                return id;
            };
        }
        return;
    }

    entry.topology = weaves ? Topology::MultiGridWithWeaves : Topology::MultiGrid;
    entry.fn = [this, sp, weaves](AbilityId id, const State::StateSnapshot& s) {
        AbilityId out = id;
        if (replaceForTarget(*sp, id, s, out)) return out;
        for (const auto& grid : sp->grids) {
            if (!grid.handles(id)) continue;
            if (replaceFromGrid(grid, id, s, out)) return out;
            if (weaves && replaceWithWeave(*sp, s, out)) return out;
            return id;
        }
        return id;
    };
}

void DispatchSpecializer::degrade(Specialized& entry) {
    entry.grids.clear();
    entry.weaves.clear();
    entry.targets.clear();
    entry.topology = Topology::Identity;
    entry.degraded = true;
    entry.fn = identity;
}

bool DispatchSpecializer::replaceForTarget(const Specialized& entry, AbilityId id, const State::StateSnapshot& s,
                                           AbilityId& out) const {
    if (!entry.smartTargeting) return false;
    const Targeting::TargetRule* rule = entry.targets.find(id);
    if (!rule || rule->abilityId != id) return false;
    const AbilityId replaced = targeting_.resolvedAbilityFor(*rule, s);
    if (replaced == id) return false;
    out = replaced;
    return true;
}

bool DispatchSpecializer::replaceFromGrid(const RotationGrid& grid, AbilityId id, const State::StateSnapshot& s,
                                          AbilityId& out) const {
    const auto produced = grid.evaluate(s);
    if (!produced || *produced == kNoAbility) return false;
    const AbilityId resolved = upgrades_.resolve(*produced, s.level());
    if (resolved == id) return false;
    out = resolved;
    return true;
}

bool DispatchSpecializer::replaceWithWeave(const Specialized& entry, const State::StateSnapshot& s,
                                           AbilityId& out) const {
    const int slots = Resolve::computeSlots(s.lockRemaining(), timing_.perAbilityLock, timing_.safetyMargin);
    if (slots == 0) return false;
    Resolve::WeavePick pick;
    if (pickWeaves(entry, s, slots, pick) == 0) return false;
    out = pick.ids[0];
    return true;
}

int DispatchSpecializer::pickWeaves(const Specialized& entry, const State::StateSnapshot& s, int slots,
                                    Resolve::WeavePick& out) const {
    if (entry.weaveOrder == Resolve::WeaveOrder::Declared) return Resolve::evaluateInOrder(entry.weaves, s, slots, out);
    return Resolve::selectTop2(entry.weaves, s, slots, out);
}

}  // namespace Cadence::Dispatch
