/** \file
 *
 * \brief Definition of JSON serializer for Coup::Engine::GameView
 *
 * \page jsongameview GameView JSON representation
 *
 * A Coup::Engine::GameView is represented by the following JSON object:
 *
 * \code{.json}
 * {
 *     "players": [ <player>, ... ],
 *     "log": [ <entry>, ... ],
 *     "pendingAction": <pendingAction>,
 *     "turnPlayerId": <turnPlayerId>,
 *     "gameOver": <gameOver>,
 *     "winnerId": <winnerId>
 * }
 * \endcode
 *
 * - &lt;player&gt; is an object with keys "id", "name", "coins", "alive" and
 *   "influence". The influence is an array of two cards. A visible card is
 *   represented by an object with keys "role" (see \ref jsonrole) and
 *   "revealed". A hidden card has null role and false "revealed".
 * - &lt;entry&gt; is a string
 * - &lt;pendingAction&gt; is described in \ref jsonpendingaction, or null
 * - &lt;turnPlayerId&gt; and &lt;winnerId&gt; are player identifiers, or null
 * - &lt;gameOver&gt; is a boolean
 */

#ifndef MESSAGING_GAMEVIEWJSONSERIALIZER_HH_
#define MESSAGING_GAMEVIEWJSONSERIALIZER_HH_

#include "engine/GameView.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Coup {
namespace Engine {

/** \brief Key for GameView players
 *
 * \sa \ref jsongameview
 */
extern const std::string GAME_VIEW_PLAYERS_KEY;

/** \brief Key for GameView log
 *
 * \sa \ref jsongameview
 */
extern const std::string GAME_VIEW_LOG_KEY;

/** \brief Key for GameView pending action
 *
 * \sa \ref jsongameview
 */
extern const std::string GAME_VIEW_PENDING_ACTION_KEY;

/** \brief Key for GameView player having turn
 *
 * \sa \ref jsongameview
 */
extern const std::string GAME_VIEW_TURN_PLAYER_ID_KEY;

/** \brief Key for GameView game over flag
 *
 * \sa \ref jsongameview
 */
extern const std::string GAME_VIEW_GAME_OVER_KEY;

/** \brief Key for GameView winner
 *
 * \sa \ref jsongameview
 */
extern const std::string GAME_VIEW_WINNER_ID_KEY;

/** \brief Convert CardView to JSON
 */
void to_json(nlohmann::json& j, const CardView& card);

/** \brief Convert JSON to CardView
 */
void from_json(const nlohmann::json& j, CardView& card);

/** \brief Convert PlayerView to JSON
 */
void to_json(nlohmann::json& j, const PlayerView& player);

/** \brief Convert JSON to PlayerView
 */
void from_json(const nlohmann::json& j, PlayerView& player);

/** \brief Convert GameView to JSON
 */
void to_json(nlohmann::json& j, const GameView& view);

/** \brief Convert JSON to GameView
 */
void from_json(const nlohmann::json& j, GameView& view);

}
}

#endif // MESSAGING_GAMEVIEWJSONSERIALIZER_HH_
