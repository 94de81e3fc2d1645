/** \file
 *
 * \brief Definition of Coup::Engine::CoupEngine class
 */

#ifndef ENGINE_COUPENGINE_HH_
#define ENGINE_COUPENGINE_HH_

#include "coup/ActionType.hh"
#include "coup/Deck.hh"
#include "coup/Response.hh"
#include "engine/GameState.hh"
#include "engine/GameView.hh"
#include "engine/Outcome.hh"

#include <boost/core/noncopyable.hpp>

#include <optional>
#include <string_view>

namespace Coup {
namespace Engine {

/** \brief The entry point of the rules engine
 *
 * CoupEngine owns a single game and processes the requests of its players
 * one at a time. Every request either completes a transition of the game or
 * is rejected without changing the state. The engine never throws because of
 * an illegal request. The returned Outcome carries the diagnostic, the log
 * entries appended while processing the request, and the private messages
 * that must be delivered to their recipients only.
 *
 * The engine does not check whose turn it is. The collaborator transporting
 * the requests is expected to allow only the player returned by
 * getState().getCurrentPlayer() to initiate an action.
 */
class CoupEngine : private boost::noncopyable {
public:

    /** \brief Create new engine
     *
     * \param players the players in seating order
     * \param deck the deck
     * \param logRetention the number of log entries retained in views
     *
     * \throw std::invalid_argument if the players do not form a valid game
     *
     * \sa GameState::GameState()
     */
    explicit CoupEngine(
        const PlayerInfoVector& players, Deck deck = Deck {},
        int logRetention = DEFAULT_LOG_RETENTION);

    /** \brief Initiate an action
     *
     * \param actorId the player initiating the action
     * \param actionType the action
     * \param targetId the target of the action, if any
     *
     * \return the outcome of the request
     */
    Outcome initiate(
        const PlayerId& actorId, ActionType actionType,
        const std::optional<PlayerId>& targetId = std::nullopt);

    /** \brief Initiate an action given by name
     *
     * \copydetails initiate(const PlayerId&, ActionType, const std::optional<PlayerId>&)
     */
    Outcome initiate(
        const PlayerId& actorId, std::string_view actionType,
        const std::optional<PlayerId>& targetId = std::nullopt);

    /** \brief Respond to the pending action
     *
     * \param playerId the responding player
     * \param response the response
     *
     * \return the outcome of the request
     */
    Outcome respond(const PlayerId& playerId, const Response& response);

    /** \brief Project the game for a viewer
     *
     * \sa GameState::getViewFor()
     */
    GameView getViewFor(const std::optional<PlayerId>& viewerId) const;

    /** \brief Get the game state
     */
    const GameState& getState() const;

private:

    template<typename Function>
    Outcome process(const PlayerId& playerId, Function&& function);

    GameState state;
};

}
}

#endif // ENGINE_COUPENGINE_HH_
