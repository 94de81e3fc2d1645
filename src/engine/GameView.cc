#include "engine/GameView.hh"

#include "IoUtility.hh"

#include <ostream>

namespace Coup {
namespace Engine {

std::ostream& operator<<(std::ostream& os, const HiddenCard&)
{
    return os << "?";
}

std::ostream& operator<<(std::ostream& os, const VisibleCard& card)
{
    os << card.role;
    if (card.revealed) {
        os << "*";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const GameView& view)
{
    using Coup::operator<<;
    for (const auto& player : view.players) {
        os << player.id << " " << player.name << " coins=" << player.coins;
        for (const auto& card : player.influence) {
            os << " " << card;
        }
        os << "\n";
    }
    os << "turn: " << view.turnPlayerId << "\n";
    os << "pending: " << view.pendingAction << "\n";
    if (view.gameOver) {
        os << "winner: " << view.winnerId << "\n";
    }
    return os;
}

}
}
