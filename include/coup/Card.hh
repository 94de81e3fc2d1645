/** \file
 *
 * \brief Definition of Coup::Card struct
 */

#ifndef CARD_HH_
#define CARD_HH_

#include "coup/Role.hh"

#include <iosfwd>

namespace Coup {

/** \brief An influence card held by a player
 *
 * A card starts concealed. Revealing is monotonic: once \ref revealed is set
 * the card stays face up for the rest of the game (although the slot holding
 * it may later receive a replacement card, see
 * Engine::GameState::revealAndRedraw()).
 */
struct Card {
    Role role {};           ///< \brief The role printed on the card
    bool revealed {false};  ///< \brief Whether the card is face up

    /// \brief Equality comparison
    bool operator==(const Card&) const = default;
};

/** \brief Output a Card to stream
 *
 * \param os the output stream
 * \param card the card to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Card& card);

}

#endif // CARD_HH_
