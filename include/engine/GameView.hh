/** \file
 *
 * \brief Definition of Coup::Engine::GameView struct
 */

#ifndef ENGINE_GAMEVIEW_HH_
#define ENGINE_GAMEVIEW_HH_

#include "coup/Player.hh"
#include "coup/Role.hh"
#include "engine/PendingAction.hh"

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Coup {
namespace Engine {

/** \brief A card whose role the viewer may not see
 */
struct HiddenCard {
    /// \brief Equality comparison
    bool operator==(const HiddenCard&) const = default;
};

/** \brief A card whose role the viewer may see
 *
 * A card is visible if it is revealed, or if it is held by the viewer.
 */
struct VisibleCard {
    Role role;      ///< \brief The role of the card
    bool revealed;  ///< \brief Whether the card is face up

    /// \brief Equality comparison
    bool operator==(const VisibleCard&) const = default;
};

/** \brief A card as seen by a viewer
 *
 * The concealment boundary is part of the type: a hidden card carries no
 * role at all.
 */
using CardView = std::variant<HiddenCard, VisibleCard>;

/** \brief A player as seen by a viewer
 */
struct PlayerView {
    PlayerId id;
    std::string name;
    int coins;
    bool alive;
    std::array<CardView, N_CARDS_PER_PLAYER> influence;

    /// \brief Equality comparison
    bool operator==(const PlayerView&) const = default;
};

/** \brief The state of a game as seen by a viewer
 *
 * GameView is produced by GameState::getViewFor(). It contains no hidden
 * information the viewer is not entitled to.
 */
struct GameView {
    /** \brief The players in seating order
     */
    std::vector<PlayerView> players;

    /** \brief The trailing in‐game log entries
     */
    std::vector<std::string> log;

    /** \brief The pending action, or none if no action is in flight
     */
    std::optional<PendingAction> pendingAction;

    /** \brief The player having turn, or none if the game is over
     */
    std::optional<PlayerId> turnPlayerId;

    /** \brief Whether the game has ended
     */
    bool gameOver;

    /** \brief The winner, or none if the game has not ended
     */
    std::optional<PlayerId> winnerId;

    /// \brief Equality comparison
    bool operator==(const GameView&) const = default;
};

/// \cond internal

std::ostream& operator<<(std::ostream& os, const HiddenCard&);
std::ostream& operator<<(std::ostream& os, const VisibleCard& card);

/// \endcond

/** \brief Output game view to stream
 *
 * This is a human readable summary intended for test failure messages and
 * debug logging.
 */
std::ostream& operator<<(std::ostream& os, const GameView& view);

}
}

#endif // ENGINE_GAMEVIEW_HH_
