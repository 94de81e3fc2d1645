/** \file
 *
 * \brief Definition of JSON serializer for Coup::Engine::Continuation
 *
 * \page jsoncontinuation Continuation JSON representation
 *
 * A Coup::Engine::Continuation is represented by a JSON object consisting at
 * least of the following:
 *
 * \code{.json}
 * {
 *     "type": <type>
 * }
 * \endcode
 *
 * - &lt;type&gt; is one of the following: "endTurn",
 *   "assassinate_open_block", "assassinate_block_stands",
 *   "assassinate_force_target_loss", "endTurn_after_assassination",
 *   "steal_open_block", "steal_apply", "steal_block_stands",
 *   "steal_apply_after_block_fail", "exchange_start_choice".
 *
 * The players captured by the continuation are included as strings under
 * the keys "actorId" and "targetId" when the continuation has them.
 */

#ifndef MESSAGING_CONTINUATIONJSONSERIALIZER_HH_
#define MESSAGING_CONTINUATIONJSONSERIALIZER_HH_

#include "engine/Continuation.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Coup {
namespace Engine {

/** \brief Key for Continuation type
 *
 * \sa \ref jsoncontinuation
 */
extern const std::string CONTINUATION_TYPE_KEY;

/** \brief Key for the actor captured by Continuation
 *
 * \sa \ref jsoncontinuation
 */
extern const std::string CONTINUATION_ACTOR_ID_KEY;

/** \brief Key for the target captured by Continuation
 *
 * \sa \ref jsoncontinuation
 */
extern const std::string CONTINUATION_TARGET_ID_KEY;

/** \brief Convert Continuation to JSON
 */
void to_json(nlohmann::json& j, const Continuation& continuation);

/** \brief Convert JSON to Continuation
 */
void from_json(const nlohmann::json& j, Continuation& continuation);

}
}

#endif // MESSAGING_CONTINUATIONJSONSERIALIZER_HH_
