#include "coup/CoupConstants.hh"
#include "coup/Deck.hh"
#include "coup/Role.hh"
#include "engine/GameState.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Coup {

using Hand = std::array<Role, N_CARDS_PER_PLAYER>;

/** \brief Create a deck dealing predetermined cards
 *
 * The returned deck deals \p hands to the players in seating order, and then
 * yields \p nextDraws in order. The rest of the standard cards follow in
 * unspecified order. Returning cards to the deck shuffles it, after which
 * the order is no longer predetermined.
 *
 * \throw std::invalid_argument if the cards are not a subset of the
 * standard deck
 */
inline Deck makeStackedDeck(
    const std::vector<Hand>& hands, const std::vector<Role>& nextDraws = {})
{
    auto pool = std::vector<Role> {};
    for (const auto role : ROLES) {
        pool.insert(pool.end(), N_COPIES_PER_ROLE, role);
    }
    auto sequence = std::vector<Role> {};
    const auto take = [&pool, &sequence](const Role role)
    {
        const auto iter = std::ranges::find(pool, role);
        if (iter == pool.end()) {
            throw std::invalid_argument {"Too many copies of a role"};
        }
        pool.erase(iter);
        sequence.push_back(role);
    };
    for (const auto& hand : hands) {
        std::ranges::for_each(hand, take);
    }
    std::ranges::for_each(nextDraws, take);
    sequence.insert(sequence.end(), pool.begin(), pool.end());
    // Deck draws from the back
    std::ranges::reverse(sequence);
    return Deck {std::move(sequence)};
}

/** \brief Number of cards of each role
 */
using RoleCounts = std::map<Role, int>;

/** \brief Role counts of the complete standard deck
 */
inline RoleCounts getStandardRoleCounts()
{
    auto counts = RoleCounts {};
    for (const auto role : ROLES) {
        counts[role] = N_COPIES_PER_ROLE;
    }
    return counts;
}

/** \brief Count the roles in the deck and in every hand, revealed or not
 */
inline RoleCounts countRoles(const Engine::GameState& state)
{
    auto counts = RoleCounts {};
    for (const auto role : state.getDeck().getCards()) {
        ++counts[role];
    }
    for (const auto& player : state.getPlayers()) {
        for (const auto& card : player.influence) {
            ++counts[card.role];
        }
    }
    return counts;
}

}
