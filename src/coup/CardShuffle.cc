#include "coup/CardShuffle.hh"

#include "coup/CoupConstants.hh"
#include "coup/Random.hh"
#include "Utility.hh"

#include <algorithm>

namespace Coup {

std::vector<Role> generateShuffledDeck()
{
    auto cards = std::vector<Role> {};
    cards.reserve(N_CARDS);
    for (const auto role : ROLES) {
        cards.insert(cards.end(), N_COPIES_PER_ROLE, role);
    }
    shuffleRoles(cards);
    return cards;
}

void shuffleRoles(std::vector<Role>& roles)
{
    std::shuffle(roles.begin(), roles.end(), getRng());
}

}
