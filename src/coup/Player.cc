#include "coup/Player.hh"

#include "Utility.hh"

#include <algorithm>
#include <ostream>

namespace Coup {

bool isAlive(const Player& player)
{
    return std::ranges::any_of(
        player.influence, [](const auto& card) { return !card.revealed; });
}

int countUnrevealed(const Player& player)
{
    return static_cast<int>(
        std::ranges::count_if(
            player.influence,
            [](const auto& card) { return !card.revealed; }));
}

std::vector<int> getUnrevealedSlots(const Player& player)
{
    auto slots = std::vector<int> {};
    for (const auto n : to(N_CARDS_PER_PLAYER)) {
        if (!player.influence[n].revealed) {
            slots.push_back(n);
        }
    }
    return slots;
}

bool holdsRole(const Player& player, const Role role)
{
    return std::ranges::any_of(
        player.influence,
        [role](const auto& card) { return !card.revealed && card.role == role; });
}

std::ostream& operator<<(std::ostream& os, const Player& player)
{
    return os << player.name;
}

}
