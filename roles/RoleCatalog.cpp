#include "RoleCatalog.h"

#include <memory>

#include "../cadence/core/Logger.h"
#include "HealerProvider.h"
#include "RoleRuleLoader.h"
#include "TableRoleProvider.h"

namespace Roles {

std::size_t registerBuiltinRoles(Cadence::Dispatch::EngineContext& context) {
    std::size_t added = 0;
    if (context.registerProvider(std::make_unique<HealerProvider>())) ++added;
    return added;
}

std::size_t registerRoleTables(Cadence::Dispatch::EngineContext& context, const std::vector<std::string>& paths) {
    std::size_t added = 0;
    for (const auto& path : paths) {
        auto table = RoleRuleLoader::loadFromFile(path);
        if (!table) {
            Cadence::logWarn("Skipping role table " + path);
            continue;
        }
        if (context.registerProvider(std::make_unique<TableRoleProvider>(std::move(*table)))) ++added;
    }
    return added;
}

}  // namespace Roles
