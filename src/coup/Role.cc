#include "coup/Role.hh"

#include <ostream>

namespace Coup {

namespace {

const auto ROLE_NAMES = std::array {
    RoleToStringMap::value_type {Role::DUKE, "Duke"},
    RoleToStringMap::value_type {Role::ASSASSIN, "Assassin"},
    RoleToStringMap::value_type {Role::CAPTAIN, "Captain"},
    RoleToStringMap::value_type {Role::AMBASSADOR, "Ambassador"},
    RoleToStringMap::value_type {Role::CONTESSA, "Contessa"},
};

}

const RoleToStringMap ROLE_TO_STRING_MAP(ROLE_NAMES.begin(), ROLE_NAMES.end());

std::optional<Role> roleFromString(const std::string_view name)
{
    const auto iter = ROLE_TO_STRING_MAP.right.find(std::string {name});
    if (iter != ROLE_TO_STRING_MAP.right.end()) {
        return iter->second;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Role role)
{
    return os << ROLE_TO_STRING_MAP.left.at(role);
}

}
