#include "coup/Deck.hh"

#include "coup/CardShuffle.hh"
#include "Logging.hh"

#include <algorithm>
#include <utility>

namespace Coup {

Deck::Deck() :
    cards(generateShuffledDeck())
{
}

Deck::Deck(RoleVector cards) :
    cards(std::move(cards))
{
}

Role Deck::draw()
{
    if (cards.empty()) {
        log(LogLevel::DEBUG, "Deck exhausted, generating a fresh deck");
        cards = generateShuffledDeck();
    }
    const auto role = cards.back();
    cards.pop_back();
    return role;
}

void Deck::returnCards(const RoleVector& roles)
{
    cards.insert(cards.end(), roles.begin(), roles.end());
    shuffleRoles(cards);
}

int Deck::getNumberOfCards() const
{
    return static_cast<int>(cards.size());
}

int Deck::count(const Role role) const
{
    return static_cast<int>(std::ranges::count(cards, role));
}

const Deck::RoleVector& Deck::getCards() const
{
    return cards;
}

}
