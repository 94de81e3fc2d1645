/** \file
 *
 * \brief Definition of the action initiation
 */

#ifndef ENGINE_ACTIONINITIATOR_HH_
#define ENGINE_ACTIONINITIATOR_HH_

#include "coup/ActionType.hh"
#include "coup/Player.hh"
#include "engine/Outcome.hh"

#include <optional>
#include <string_view>

namespace Coup {
namespace Engine {

class GameState;

/** \brief Initiate an action
 *
 * Validates the action against the domain rules and either resolves it
 * immediately (income, or a coup opening the forced influence loss of the
 * target) or opens the first negotiation stage as the pending action.
 *
 * An actor holding \ref MANDATORY_COUP_COINS or more coins may only coup. An
 * invalid target or insufficient coins reject the action with an
 * explanatory log entry, and the actor may try again.
 *
 * The caller is responsible for checking that \p actorId has the turn and
 * that no action is pending.
 *
 * \param state the game
 * \param actorId the player initiating the action
 * \param actionType the action
 * \param targetId the target of the action, if any
 *
 * \return the outcome of the action
 */
Outcome initiateAction(
    GameState& state, const PlayerId& actorId, ActionType actionType,
    const std::optional<PlayerId>& targetId);

/** \brief Initiate an action given by name
 *
 * \copydetails initiateAction(GameState&, const PlayerId&, ActionType, const std::optional<PlayerId>&)
 *
 * An action name that is not known is rejected with an explanatory log
 * entry.
 */
Outcome initiateAction(
    GameState& state, const PlayerId& actorId, std::string_view actionType,
    const std::optional<PlayerId>& targetId);

}
}

#endif // ENGINE_ACTIONINITIATOR_HH_
