/** \file
 *
 * \brief Utilities for shuffling the deck
 */

#ifndef CARDSHUFFLE_HH_
#define CARDSHUFFLE_HH_

#include "coup/Role.hh"

#include <vector>

namespace Coup {

/** \brief Generate a full deck of randomly shuffled cards
 *
 * \return Vector containing \ref N_COPIES_PER_ROLE copies of every role in
 * random order
 */
std::vector<Role> generateShuffledDeck();

/** \brief Shuffle roles in place
 *
 * \param roles the roles to shuffle
 */
void shuffleRoles(std::vector<Role>& roles);

}

#endif // CARDSHUFFLE_HH_
