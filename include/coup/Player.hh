/** \file
 *
 * \brief Definition of Coup::Player struct and related utilities
 */

#ifndef PLAYER_HH_
#define PLAYER_HH_

#include "coup/Card.hh"
#include "coup/CoupConstants.hh"

#include <array>
#include <iosfwd>
#include <string>
#include <vector>

namespace Coup {

/** \brief Identifier of a player
 *
 * Player identifiers are opaque strings assigned by the collaborator managing
 * the room. They are unique within a game.
 */
using PlayerId = std::string;

/** \brief The two influence slots of a player
 *
 * The slots are ordered. A slot is referred to by its index when a player
 * chooses which influence to lose.
 */
using Influence = std::array<Card, N_CARDS_PER_PLAYER>;

/** \brief A player taking part in a game
 */
struct Player {
    PlayerId id;                   ///< \brief Identifier of the player
    std::string name;              ///< \brief Display name of the player
    int coins {STARTING_COINS};    ///< \brief Coins held by the player
    Influence influence {};        ///< \brief The influence cards

    /// \brief Equality comparison
    bool operator==(const Player&) const = default;
};

/** \brief Determine if player is still in the game
 *
 * \return true if at least one card of \p player is unrevealed
 */
bool isAlive(const Player& player);

/** \brief Count the unrevealed cards of a player
 */
int countUnrevealed(const Player& player);

/** \brief Get the indices of the unrevealed slots of a player
 *
 * \return vector of slot indices in increasing order
 */
std::vector<int> getUnrevealedSlots(const Player& player);

/** \brief Determine if player holds an unrevealed card of given role
 */
bool holdsRole(const Player& player, Role role);

/** \brief Output player to stream
 *
 * Only the name of the player is written. Hidden information is never output
 * by this function.
 *
 * \param os the output stream
 * \param player the player to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Player& player);

}

#endif // PLAYER_HH_
