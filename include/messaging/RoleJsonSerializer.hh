/** \file
 *
 * \brief Definition of JSON serializer for Coup::Role
 *
 * \page jsonrole Role JSON representation
 *
 * A Coup::Role is represented by a string naming the role: "Duke",
 * "Assassin", "Captain", "Ambassador" or "Contessa".
 */

#ifndef MESSAGING_ROLEJSONSERIALIZER_HH_
#define MESSAGING_ROLEJSONSERIALIZER_HH_

#include "coup/Role.hh"

#include <nlohmann/json.hpp>

namespace Coup {

/** \brief Convert Role to JSON
 */
void to_json(nlohmann::json& j, Role role);

/** \brief Convert JSON to Role
 */
void from_json(const nlohmann::json& j, Role& role);

}

#endif // MESSAGING_ROLEJSONSERIALIZER_HH_
