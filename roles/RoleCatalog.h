// Explicit registration of the roles this build knows about.
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../cadence/dispatch/EngineContext.h"

namespace Roles {

// Registers the compiled-in providers. Returns how many were accepted.
std::size_t registerBuiltinRoles(Cadence::Dispatch::EngineContext& context);

// Loads and registers JSON role tables; unreadable files are logged and skipped.
std::size_t registerRoleTables(Cadence::Dispatch::EngineContext& context, const std::vector<std::string>& paths);

}  // namespace Roles
