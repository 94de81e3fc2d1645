/** \file
 *
 * \brief Definition of Coup::Deck class
 */

#ifndef DECK_HH_
#define DECK_HH_

#include "coup/Role.hh"

#include <vector>

namespace Coup {

/** \brief The shared court deck
 *
 * Deck is a replenishable multiset of roles supporting only drawing and
 * returning cards. Cards are drawn from the back of the underlying vector.
 *
 * When a card is drawn from an empty deck, a brand new full deck is
 * generated and the card is drawn from it. The new deck is not reconstructed
 * from the cards in play, so while cards are held by players the total
 * number of copies of a role in the game may temporarily exceed \ref
 * N_COPIES_PER_ROLE after a regeneration.
 */
class Deck {
public:

    /** \brief Type of the underlying container
     */
    using RoleVector = std::vector<Role>;

    /** \brief Create a full shuffled deck
     */
    Deck();

    /** \brief Create a deck with predetermined order
     *
     * No shuffling takes place. The last element of \p cards is the first
     * one to be drawn.
     *
     * \param cards the cards in the deck
     */
    explicit Deck(RoleVector cards);

    /** \brief Draw one card
     *
     * \return the role of the card drawn
     */
    Role draw();

    /** \brief Return cards to the deck
     *
     * The cards are added to the deck and the whole deck is reshuffled.
     *
     * \param roles the roles of the returned cards
     */
    void returnCards(const RoleVector& roles);

    /** \brief Get the number of cards in the deck
     */
    int getNumberOfCards() const;

    /** \brief Count the cards of given role in the deck
     */
    int count(Role role) const;

    /** \brief Get the cards currently in the deck
     *
     * This is authoritative hidden information and must not be exposed to
     * the players.
     */
    const RoleVector& getCards() const;

private:

    RoleVector cards;
};

}

#endif // DECK_HH_
