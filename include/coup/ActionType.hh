/** \file
 *
 * \brief Definition of Coup::ActionType enum and related utilities
 */

#ifndef ACTIONTYPE_HH_
#define ACTIONTYPE_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace Coup {

/** \brief Type of an action a player may take on their turn
 */
enum class ActionType {
    INCOME,
    COUP,
    FOREIGN_AID,
    TAX,
    ASSASSINATE,
    STEAL,
    EXCHANGE,
};

/** \brief Type of \ref ACTION_TYPE_TO_STRING_MAP
 */
using ActionTypeToStringMap = boost::bimaps::bimap<ActionType, std::string>;

/** \brief Two-way map between action types and their wire names
 *
 * The names are “income”, “coup”, “foreign_aid”, “tax”, “assassinate”,
 * “steal” and “exchange”.
 */
extern const ActionTypeToStringMap ACTION_TYPE_TO_STRING_MAP;

/** \brief Find action type by name
 *
 * \param name the name of the action type
 *
 * \return the action type named \p name, or none if there is no such type
 */
std::optional<ActionType> actionTypeFromString(std::string_view name);

/** \brief Output an ActionType to stream
 *
 * \param os the output stream
 * \param actionType the action type to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, ActionType actionType);

}

#endif // ACTIONTYPE_HH_
