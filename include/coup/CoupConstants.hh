/** \file
 *
 * \brief Definition of fundamental game constants needed by several classes
 */

#ifndef COUPCONSTANTS_HH_
#define COUPCONSTANTS_HH_

/** \brief Top level namespace of the Coup rules engine
 *
 * The Coup namespace directly contains the domain model of the game (roles,
 * cards, players and the deck). It also contains subnamespaces for the rules
 * engine, messaging and the command line front-end.
 */
namespace Coup {

/** \brief Number of distinct roles
 */
constexpr auto N_ROLES = 5;

/** \brief Number of copies of each role in a full deck
 */
constexpr auto N_COPIES_PER_ROLE = 3;

/** \brief Number of cards in a full deck
 */
constexpr auto N_CARDS = N_ROLES * N_COPIES_PER_ROLE; // 15

/** \brief Number of influence cards dealt to each player
 */
constexpr auto N_CARDS_PER_PLAYER = 2;

/** \brief Minimum number of players in a game
 */
constexpr auto MIN_PLAYERS = 2;

/** \brief Maximum number of players in a game
 */
constexpr auto MAX_PLAYERS = 8;

/** \brief Coins each player starts with
 */
constexpr auto STARTING_COINS = 2;

constexpr auto INCOME_AMOUNT = 1;
constexpr auto FOREIGN_AID_AMOUNT = 2;
constexpr auto TAX_AMOUNT = 3;
constexpr auto STEAL_AMOUNT = 2;

constexpr auto COUP_COST = 7;
constexpr auto ASSASSINATE_COST = 3;

/** \brief Coin count at which coup becomes the only allowed action
 */
constexpr auto MANDATORY_COUP_COINS = 10;

/** \brief Number of cards drawn from the deck in an exchange
 */
constexpr auto N_EXCHANGE_DRAWS = 2;

/** \brief Default number of trailing in‐game log entries shown in a view
 */
constexpr auto DEFAULT_LOG_RETENTION = 80;

}

#endif // COUPCONSTANTS_HH_
