// Reads role rule tables from JSON files.
#pragma once

#include <optional>
#include <string>

#include "TableRoleProvider.h"

namespace Roles {

class RoleRuleLoader {
public:
    static std::optional<RoleTable> loadFromFile(const std::string& path);
    static std::optional<RoleTable> loadFromString(const std::string& text);
};

}  // namespace Roles
