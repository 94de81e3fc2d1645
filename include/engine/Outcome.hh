/** \file
 *
 * \brief Definition of Coup::Engine::Outcome and related types
 */

#ifndef ENGINE_OUTCOME_HH_
#define ENGINE_OUTCOME_HH_

#include "coup/Player.hh"
#include "coup/Role.hh"

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace Coup {
namespace Engine {

/** \brief Diagnostic code of an engine call
 *
 * Illegal requests are never reported as errors to the caller. Instead they
 * are no‐ops, and the diagnostic tells an observer why the request made no
 * progress. Any diagnostic other than NONE guarantees that the authoritative
 * state (apart from an explanatory in‐game log entry) did not change.
 */
enum class Diagnostic {
    NONE,                 ///< The request was accepted
    NO_PENDING_ACTION,    ///< A response was given while nothing is pending
    ACTION_PENDING,       ///< An action was initiated while one is pending
    GAME_OVER,            ///< The game has already ended
    UNKNOWN_PLAYER,       ///< The acting player is not in the game
    MUST_COUP,            ///< The actor has 10+ coins and must coup
    UNKNOWN_ACTION,       ///< The action type is not known
    INVALID_TARGET,       ///< The target is missing, dead or the actor
    INSUFFICIENT_COINS,   ///< The actor cannot pay for the action
    NOT_ELIGIBLE,         ///< The responder may not respond in this stage
    UNEXPECTED_RESPONSE,  ///< The response type is not accepted in this stage
    INVALID_CARD,         ///< The chosen influence slot cannot be revealed
    INVALID_CHOICE,       ///< The exchange choice is malformed
};

/** \brief Type of \ref DIAGNOSTIC_TO_STRING_MAP
 */
using DiagnosticToStringMap = boost::bimaps::bimap<Diagnostic, std::string>;

/** \brief Two-way map between diagnostics and their names
 */
extern const DiagnosticToStringMap DIAGNOSTIC_TO_STRING_MAP;

/** \brief An option of the exchange choice
 */
struct ExchangeOption {
    std::string id;  ///< \brief Synthetic identifier of the option
    Role role;       ///< \brief The role of the option

    /// \brief Equality comparison
    bool operator==(const ExchangeOption&) const = default;
};

/** \brief Vector of exchange options
 */
using ExchangeOptionVector = std::vector<ExchangeOption>;

/** \brief Payload revealing the exchange options to the actor
 */
struct ExchangeOptionsMessage {
    int keepCount;                 ///< \brief Number of options to keep
    ExchangeOptionVector options;  ///< \brief The options with their roles

    /// \brief Equality comparison
    bool operator==(const ExchangeOptionsMessage&) const = default;
};

/** \brief Message that must be delivered to a single player only
 */
struct PrivateMessage {
    PlayerId recipient;              ///< \brief The only allowed recipient
    ExchangeOptionsMessage message;  ///< \brief The payload

    /// \brief Equality comparison
    bool operator==(const PrivateMessage&) const = default;
};

/** \brief The result of initiating an action or responding to one
 */
struct Outcome {
    /** \brief Diagnostic code, Diagnostic::NONE for accepted requests
     */
    Diagnostic diagnostic {Diagnostic::NONE};

    /** \brief In‐game log entries appended while handling the request
     */
    std::vector<std::string> log {};

    /** \brief Targeted messages the transport must deliver privately
     */
    std::vector<PrivateMessage> privateMessages {};
};

/** \brief Output diagnostic to stream
 */
std::ostream& operator<<(std::ostream& os, Diagnostic diagnostic);

}
}

#endif // ENGINE_OUTCOME_HH_
