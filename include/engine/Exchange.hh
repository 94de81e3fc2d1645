/** \file
 *
 * \brief Definition of the exchange sub-protocol
 */

#ifndef ENGINE_EXCHANGE_HH_
#define ENGINE_EXCHANGE_HH_

#include "coup/Player.hh"
#include "coup/Response.hh"
#include "engine/Outcome.hh"

namespace Coup {
namespace Engine {

class GameState;

/** \brief Offer the exchange options to the actor
 *
 * Draws \ref N_EXCHANGE_DRAWS cards and combines them with the unrevealed
 * roles of \p actorId. The labeled options are stored as the exchange secret
 * of the actor and delivered to the actor alone as a private message. The
 * pending action only records the number of cards to keep.
 *
 * If the actor has no unrevealed cards or the game is over, the turn ends
 * without effect.
 *
 * \param state the game
 * \param actorId the player exchanging
 *
 * \return the outcome, containing the private message to the actor
 */
Outcome startExchangeChoice(GameState& state, const PlayerId& actorId);

/** \brief Complete the exchange with the options the actor keeps
 *
 * Duplicate identifiers in \p choice collapse into one. The choice is
 * rejected unless the distinct identifiers equal the number of cards to
 * keep and each of them names a stored option. The kept roles replace the
 * unrevealed cards of the actor in the order of the options, and the rest
 * are returned to the deck.
 *
 * \param state the game
 * \param actorId the player exchanging
 * \param choice the options to keep
 *
 * \return the outcome of the choice
 */
Outcome completeExchangeChoice(
    GameState& state, const PlayerId& actorId,
    const ExchangeChoiceResponse& choice);

}
}

#endif // ENGINE_EXCHANGE_HH_
