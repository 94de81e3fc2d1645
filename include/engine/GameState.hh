/** \file
 *
 * \brief Definition of Coup::Engine::GameState class
 */

#ifndef ENGINE_GAMESTATE_HH_
#define ENGINE_GAMESTATE_HH_

#include "coup/CoupConstants.hh"
#include "coup/Deck.hh"
#include "coup/Player.hh"
#include "coup/Role.hh"
#include "engine/GameView.hh"
#include "engine/Outcome.hh"
#include "engine/PendingAction.hh"

#include <boost/core/noncopyable.hpp>

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Coup {

/** \brief The rules engine
 *
 * Namespace Engine contains the authoritative game state and the state
 * machine resolving actions.
 */
namespace Engine {

/** \brief Identity of a player joining a game
 */
struct PlayerInfo {
    PlayerId id;       ///< \brief Identifier of the player
    std::string name;  ///< \brief Display name of the player

    /// \brief Equality comparison
    bool operator==(const PlayerInfo&) const = default;
};

/** \brief Vector of player infos in seating order
 */
using PlayerInfoVector = std::vector<PlayerInfo>;

/** \brief The options of an ongoing exchange, known to the actor only
 */
struct ExchangeSecret {
    int keepCount;                 ///< \brief Number of options to keep
    ExchangeOptionVector options;  ///< \brief The options with their roles

    /// \brief Equality comparison
    bool operator==(const ExchangeSecret&) const = default;
};

/** \brief The authoritative state of a single game
 *
 * GameState owns the players, the deck, the in‐game log, the pending action
 * and the private information store. It is the single source of truth of the
 * game, and none of the hidden information it holds is exposed to players
 * except through getViewFor(), which applies the visibility rules.
 *
 * A GameState is a strictly sequential object. Independent games share no
 * state and may be used from different threads.
 */
class GameState : private boost::noncopyable {
public:

    /** \brief Vector of players
     */
    using PlayerVector = std::vector<Player>;

    /** \brief Create new game
     *
     * Each player receives \ref STARTING_COINS coins and two cards drawn from
     * \p deck. The seating order (and thus turn order) is the order of \p
     * players, and the first player has the first turn.
     *
     * \param players the players joining the game
     * \param deck the deck the cards are drawn from
     * \param logRetention the number of trailing log entries retained
     *
     * \throw std::invalid_argument if the number of players is not between
     * \ref MIN_PLAYERS and \ref MAX_PLAYERS, or if the player identifiers are
     * empty or not unique, or if \p logRetention is not positive
     */
    explicit GameState(
        const PlayerInfoVector& players, Deck deck = Deck {},
        int logRetention = DEFAULT_LOG_RETENTION);

    /** \brief Get the players in seating order
     */
    const PlayerVector& getPlayers() const;

    /** \brief Find player
     *
     * \return pointer to the player, or nullptr if there is no player with
     * identifier \p playerId
     */
    const Player* getPlayer(const PlayerId& playerId) const;

    /** \copydoc getPlayer(const PlayerId&) const
     */
    Player* getPlayer(const PlayerId& playerId);

    /** \brief Determine if a player exists and is alive
     */
    bool isAlive(const PlayerId& playerId) const;

    /** \brief Count the players that are still alive
     */
    int getNumberOfAlivePlayers() const;

    /** \brief Determine if a player holds an unrevealed card of given role
     *
     * \return true if the player exists and holds the role, false otherwise
     */
    bool playerHasRole(const PlayerId& playerId, Role role) const;

    /** \brief Get the player having turn
     *
     * \return pointer to the player, or nullptr if the game is over
     */
    const Player* getCurrentPlayer() const;

    /** \brief Advance the turn
     *
     * First checks whether the game has been won. If not, the turn passes to
     * the next alive player in seating order.
     */
    void nextTurn();

    /** \brief End the turn
     *
     * Clears the pending action and advances the turn.
     */
    void finishTurn();

    /** \brief End the game if only one player is alive
     */
    void checkWin();

    /** \brief Determine if the game has ended
     */
    bool isGameOver() const;

    /** \brief Get the winner
     *
     * \return the identifier of the winner, or none if the game has not ended
     */
    const std::optional<PlayerId>& getWinnerId() const;

    /** \brief Draw one card from the deck
     *
     * If the deck is empty, a brand new full deck is generated first.
     */
    Role drawOne();

    /** \brief Return cards to the deck and reshuffle it
     */
    void returnToDeck(const std::vector<Role>& roles);

    /** \brief Prove a claim by revealing a card and drawing a replacement
     *
     * Finds the first unrevealed card of \p role held by the player, returns
     * it to the deck and draws a replacement into the same slot. The
     * replacement is unrevealed.
     *
     * \return true if successful, false if the player does not exist or does
     * not hold \p role. The latter indicates a logic error of the caller.
     */
    bool revealAndRedraw(const PlayerId& playerId, Role role);

    /** \brief Reveal the card in given slot of a player
     *
     * After revealing the card the win condition is checked.
     *
     * \return true if successful, false if the player does not exist, \p
     * cardIndex is out of range, or the card is already revealed
     */
    bool loseInfluence(const PlayerId& playerId, int cardIndex);

    /** \brief Create responders consisting of every alive player except one
     *
     * \param excludedId the player not allowed to respond
     */
    Responders makeRespondersExcept(const PlayerId& excludedId) const;

    /** \brief Get the pending action
     *
     * \return pointer to the pending action, or nullptr if no action is in
     * flight
     */
    const PendingAction* getPendingAction() const;

    /** \copydoc getPendingAction() const
     */
    PendingAction* getPendingAction();

    /** \brief Replace the pending action
     */
    void setPendingAction(PendingAction pendingAction);

    /** \brief Clear the pending action
     */
    void clearPendingAction();

    /** \brief Get the exchange secret of a player
     *
     * \return pointer to the secret, or nullptr if the player has no
     * ongoing exchange
     */
    const ExchangeSecret* getExchangeSecret(const PlayerId& playerId) const;

    /** \brief Store the exchange secret of a player
     */
    void setExchangeSecret(const PlayerId& playerId, ExchangeSecret secret);

    /** \brief Delete the exchange secret of a player
     */
    void eraseExchangeSecret(const PlayerId& playerId);

    /** \brief Append entry to the in‐game log
     */
    void appendLog(std::string entry);

    /** \brief Get the retained in‐game log entries
     */
    const std::deque<std::string>& getLog() const;

    /** \brief Get the number of log entries appended since the game started
     *
     * The count includes entries no longer retained.
     */
    long getLogCount() const;

    /** \brief Get the deck
     *
     * This is hidden information and must not be exposed to players.
     */
    const Deck& getDeck() const;

    /** \brief Project the state for a viewer
     *
     * Unrevealed cards show their role only if they are held by \p viewerId.
     * Revealed cards are visible to everyone. A viewer that is not a player
     * sees every unrevealed card as hidden. Exchange secrets and the deck are
     * never included.
     *
     * \param viewerId the viewing player, or none for a public view
     *
     * \return the view
     */
    GameView getViewFor(const std::optional<PlayerId>& viewerId) const;

private:

    PlayerVector players;
    Deck deck;
    int logRetention;
    std::deque<std::string> gameLog;
    long logCount {};
    int turnIndex {};
    std::optional<PendingAction> pendingAction;
    bool gameOver {false};
    std::optional<PlayerId> winnerId;
    std::map<PlayerId, ExchangeSecret> exchangeSecrets;
};

}
}

#endif // ENGINE_GAMESTATE_HH_
