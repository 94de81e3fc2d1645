/** \file
 *
 * \brief Definition of JSON serializer for Coup::Response
 *
 * \page jsonresponse Response JSON representation
 *
 * A Coup::Response is represented by a JSON object consisting at least of the
 * following:
 *
 * \code{.json}
 * {
 *     "type": <type>
 * }
 * \endcode
 *
 * - &lt;type&gt; is a string representing the type of the response. It must
 *   be one of the following: "pass", "challenge", "block", "loseInfluence",
 *   "exchangeChoice".
 *
 * If the response carries a payload, the object in addition includes it:
 *
 * \code{.json}
 * {
 *     "type": "block",
 *     "payload": { "role": <role> }
 * }
 * \endcode
 *
 * - The payload of "block" contains the claimed role, see \ref jsonrole
 * - The payload of "loseInfluence" contains "cardIndex", the slot index of
 *   the card to reveal
 * - The payload of "exchangeChoice" contains "keep", an array of the
 *   identifiers of the exchange options to keep
 */

#ifndef MESSAGING_RESPONSEJSONSERIALIZER_HH_
#define MESSAGING_RESPONSEJSONSERIALIZER_HH_

#include "coup/Response.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Coup {

/** \brief Key for Response type
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_TYPE_KEY;

/** \brief Key for Response payload
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_PAYLOAD_KEY;

/** \brief Tag for Response type Pass
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_PASS_TAG;

/** \brief Tag for Response type Challenge
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_CHALLENGE_TAG;

/** \brief Tag for Response type Block
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_BLOCK_TAG;

/** \brief Tag for Response type LoseInfluence
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_LOSE_INFLUENCE_TAG;

/** \brief Tag for Response type ExchangeChoice
 *
 * \sa \ref jsonresponse
 */
extern const std::string RESPONSE_EXCHANGE_CHOICE_TAG;

/** \brief Key for the role in Block payload
 */
extern const std::string RESPONSE_ROLE_KEY;

/** \brief Key for the card index in LoseInfluence payload
 */
extern const std::string RESPONSE_CARD_INDEX_KEY;

/** \brief Key for the kept options in ExchangeChoice payload
 */
extern const std::string RESPONSE_KEEP_KEY;

/** \brief Convert Response to JSON
 */
void to_json(nlohmann::json& j, const Response& response);

/** \brief Convert JSON to Response
 */
void from_json(const nlohmann::json& j, Response& response);

}

#endif // MESSAGING_RESPONSEJSONSERIALIZER_HH_
