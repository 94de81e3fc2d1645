/** \file
 *
 * \brief Definition of Coup::Role enum and related utilities
 */

#ifndef ROLE_HH_
#define ROLE_HH_

#include <boost/bimap/bimap.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace Coup {

/** \brief Role printed on an influence card
 *
 * Each role grants a claimable action, a blocking capability, or both.
 */
enum class Role {
    DUKE,
    ASSASSIN,
    CAPTAIN,
    AMBASSADOR,
    CONTESSA,
};

/** \brief Array containing all roles in canonical order
 */
inline constexpr std::array ROLES {
    Role::DUKE, Role::ASSASSIN, Role::CAPTAIN, Role::AMBASSADOR,
    Role::CONTESSA,
};

/** \brief Type of \ref ROLE_TO_STRING_MAP
 */
using RoleToStringMap = boost::bimaps::bimap<Role, std::string>;

/** \brief Two-way map between roles and their names
 *
 * The names are the capitalized role names used in the game log and the
 * JSON representation (“Duke”, “Assassin”, ...).
 */
extern const RoleToStringMap ROLE_TO_STRING_MAP;

/** \brief Find role by name
 *
 * \param name the name of the role
 *
 * \return the role named \p name, or none if there is no such role
 */
std::optional<Role> roleFromString(std::string_view name);

/** \brief Output a Role to stream
 *
 * \param os the output stream
 * \param role the role to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Role role);

}

#endif // ROLE_HH_
