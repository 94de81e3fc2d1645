/** \file
 *
 * \brief Definition of JSON serializer for Coup::Engine::Outcome
 *
 * \page jsonoutcome Outcome JSON representation
 *
 * A Coup::Engine::Diagnostic is represented by a string: "none",
 * "noPendingAction", "actionPending", "gameOver", "unknownPlayer",
 * "mustCoup", "unknownAction", "invalidTarget", "insufficientCoins",
 * "notEligible", "unexpectedResponse", "invalidCard" or "invalidChoice".
 *
 * A Coup::Engine::PrivateMessage is represented by the following JSON
 * object:
 *
 * \code{.json}
 * {
 *     "to": <recipient>,
 *     "msg": {
 *         "type": "private",
 *         "kind": "exchangeOptions",
 *         "keepCount": <keepCount>,
 *         "options": [ { "id": <id>, "role": <role> }, ... ]
 *     }
 * }
 * \endcode
 *
 * A Coup::Engine::Outcome is represented by the following JSON object:
 *
 * \code{.json}
 * {
 *     "diagnostic": <diagnostic>,
 *     "log": [ <entry>, ... ],
 *     "private": [ <privateMessage>, ... ]
 * }
 * \endcode
 */

#ifndef MESSAGING_OUTCOMEJSONSERIALIZER_HH_
#define MESSAGING_OUTCOMEJSONSERIALIZER_HH_

#include "engine/Outcome.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Coup {
namespace Engine {

/** \brief Key for Outcome diagnostic
 *
 * \sa \ref jsonoutcome
 */
extern const std::string OUTCOME_DIAGNOSTIC_KEY;

/** \brief Key for Outcome log entries
 *
 * \sa \ref jsonoutcome
 */
extern const std::string OUTCOME_LOG_KEY;

/** \brief Key for Outcome private messages
 *
 * \sa \ref jsonoutcome
 */
extern const std::string OUTCOME_PRIVATE_KEY;

/** \brief Key for PrivateMessage recipient
 *
 * \sa \ref jsonoutcome
 */
extern const std::string PRIVATE_MESSAGE_TO_KEY;

/** \brief Key for PrivateMessage payload
 *
 * \sa \ref jsonoutcome
 */
extern const std::string PRIVATE_MESSAGE_MSG_KEY;

/** \brief Convert Diagnostic to JSON
 */
void to_json(nlohmann::json& j, Diagnostic diagnostic);

/** \brief Convert JSON to Diagnostic
 */
void from_json(const nlohmann::json& j, Diagnostic& diagnostic);

/** \brief Convert ExchangeOption to JSON
 */
void to_json(nlohmann::json& j, const ExchangeOption& option);

/** \brief Convert JSON to ExchangeOption
 */
void from_json(const nlohmann::json& j, ExchangeOption& option);

/** \brief Convert PrivateMessage to JSON
 */
void to_json(nlohmann::json& j, const PrivateMessage& message);

/** \brief Convert JSON to PrivateMessage
 */
void from_json(const nlohmann::json& j, PrivateMessage& message);

/** \brief Convert Outcome to JSON
 */
void to_json(nlohmann::json& j, const Outcome& outcome);

}
}

#endif // MESSAGING_OUTCOMEJSONSERIALIZER_HH_
