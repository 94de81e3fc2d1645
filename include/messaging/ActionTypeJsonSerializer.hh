/** \file
 *
 * \brief Definition of JSON serializer for Coup::ActionType
 *
 * \page jsonactiontype ActionType JSON representation
 *
 * A Coup::ActionType is represented by a string naming the action:
 * "income", "coup", "foreign_aid", "tax", "assassinate", "steal" or
 * "exchange".
 */

#ifndef MESSAGING_ACTIONTYPEJSONSERIALIZER_HH_
#define MESSAGING_ACTIONTYPEJSONSERIALIZER_HH_

#include "coup/ActionType.hh"

#include <nlohmann/json.hpp>

namespace Coup {

/** \brief Convert ActionType to JSON
 */
void to_json(nlohmann::json& j, ActionType actionType);

/** \brief Convert JSON to ActionType
 */
void from_json(const nlohmann::json& j, ActionType& actionType);

}

#endif // MESSAGING_ACTIONTYPEJSONSERIALIZER_HH_
