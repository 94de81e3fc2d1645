/** \file
 *
 * \brief Definition of the response resolving state machine
 */

#ifndef ENGINE_RESPONSERESOLVER_HH_
#define ENGINE_RESPONSERESOLVER_HH_

#include "coup/Player.hh"
#include "coup/Response.hh"
#include "engine/Continuation.hh"
#include "engine/Outcome.hh"
#include "engine/PendingAction.hh"

namespace Coup {
namespace Engine {

class GameState;

/** \brief Process a response to the pending action
 *
 * Applies \p response given by \p playerId to the pending action of \p
 * state. If the response is not acceptable in the current stage, the state
 * is left unchanged and the diagnostic of the returned outcome explains why.
 *
 * The log of the returned outcome is left empty. The appended log entries
 * can be read from \p state.
 *
 * \param state the game
 * \param playerId the responding player
 * \param response the response
 *
 * \return the outcome of the response
 */
Outcome resolveResponse(
    GameState& state, const PlayerId& playerId, const Response& response);

/** \brief Require a player to lose influence
 *
 * Sets the pending action to wait for \p playerId to choose the card to
 * reveal. If the player has no unrevealed cards left, or the game is already
 * over, \p continuation is run immediately instead.
 *
 * \param state the game
 * \param playerId the player losing influence
 * \param reason the reason of the loss
 * \param continuation the transition performed after the loss
 *
 * \return the outcome of the transition
 */
Outcome beginLoseInfluence(
    GameState& state, const PlayerId& playerId, LossReason reason,
    Continuation continuation);

/** \brief Resume the action after an influence loss
 *
 * \param state the game
 * \param continuation the transition to perform
 *
 * \return the outcome of the transition
 */
Outcome continueAfterLoss(GameState& state, const Continuation& continuation);

}
}

#endif // ENGINE_RESPONSERESOLVER_HH_
