/** \file
 *
 * \brief Definition of JSON serializer for Coup::Engine::PendingAction
 *
 * \page jsonpendingaction PendingAction JSON representation
 *
 * A Coup::Engine::PendingAction is represented by a JSON object consisting at
 * least of the following:
 *
 * \code{.json}
 * {
 *     "type": <type>,
 *     "stage": <stage>
 * }
 * \endcode
 *
 * - &lt;type&gt; is one of the following: "loseInfluence", "foreign_aid",
 *   "tax", "assassinate", "steal", "exchange".
 * - &lt;stage&gt; is one of the following: "awaitingChallenge",
 *   "awaitingBlock", "awaitingChallengeBlock", "awaitingChoice".
 *
 * Depending on the type and the stage, the object in addition contains the
 * following keys:
 *
 * - "playerId", "reason" and "continuation" for "loseInfluence". The reason
 *   is one of "coup", "assassinated", "failed_challenge", "lost_challenge".
 *   The continuation is described in \ref jsoncontinuation.
 * - "actorId" for every other type, and "targetId" for "assassinate" and
 *   "steal".
 * - "claimedRole" for claimed actions (see \ref jsonrole).
 * - "blockedBy" in the "awaitingChallengeBlock" stage, and "blockRole" for
 *   a blocked "steal".
 * - "responders" in the stages waiting for responses. It is an array of
 *   objects with keys "playerId" and "status", where status is one of
 *   "pending", "passed", "challenged", in the order of seating.
 * - "keepCount" and "optionCount" for "exchange" in the "awaitingChoice"
 *   stage.
 *
 * The claimed role is derived from the type, and it is ignored when
 * converting from JSON.
 */

#ifndef MESSAGING_PENDINGACTIONJSONSERIALIZER_HH_
#define MESSAGING_PENDINGACTIONJSONSERIALIZER_HH_

#include "engine/PendingAction.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Coup {
namespace Engine {

/** \brief Key for PendingAction type
 *
 * \sa \ref jsonpendingaction
 */
extern const std::string PENDING_ACTION_TYPE_KEY;

/** \brief Key for PendingAction stage
 *
 * \sa \ref jsonpendingaction
 */
extern const std::string PENDING_ACTION_STAGE_KEY;

/** \brief Key for the player losing influence
 */
extern const std::string PENDING_ACTION_PLAYER_ID_KEY;

/** \brief Key for the reason of losing influence
 */
extern const std::string PENDING_ACTION_REASON_KEY;

/** \brief Key for the continuation after losing influence
 */
extern const std::string PENDING_ACTION_CONTINUATION_KEY;

/** \brief Key for the actor
 */
extern const std::string PENDING_ACTION_ACTOR_ID_KEY;

/** \brief Key for the target
 */
extern const std::string PENDING_ACTION_TARGET_ID_KEY;

/** \brief Key for the claimed role
 */
extern const std::string PENDING_ACTION_CLAIMED_ROLE_KEY;

/** \brief Key for the blocker
 */
extern const std::string PENDING_ACTION_BLOCKED_BY_KEY;

/** \brief Key for the role claimed for the block
 */
extern const std::string PENDING_ACTION_BLOCK_ROLE_KEY;

/** \brief Key for the responders
 */
extern const std::string PENDING_ACTION_RESPONDERS_KEY;

/** \brief Key for the number of exchange options to keep
 */
extern const std::string PENDING_ACTION_KEEP_COUNT_KEY;

/** \brief Key for the number of exchange options
 */
extern const std::string PENDING_ACTION_OPTION_COUNT_KEY;

/** \brief Key for the responding player
 */
extern const std::string RESPONDERS_PLAYER_ID_KEY;

/** \brief Key for the status of the responding player
 */
extern const std::string RESPONDERS_STATUS_KEY;

/** \brief Convert ResponseStatus to JSON
 */
void to_json(nlohmann::json& j, ResponseStatus status);

/** \brief Convert JSON to ResponseStatus
 */
void from_json(const nlohmann::json& j, ResponseStatus& status);

/** \brief Convert LossReason to JSON
 */
void to_json(nlohmann::json& j, LossReason reason);

/** \brief Convert JSON to LossReason
 */
void from_json(const nlohmann::json& j, LossReason& reason);

/** \brief Convert Responders to JSON
 */
void to_json(nlohmann::json& j, const Responders& responders);

/** \brief Convert JSON to Responders
 */
void from_json(const nlohmann::json& j, Responders& responders);

/** \brief Convert PendingAction to JSON
 */
void to_json(nlohmann::json& j, const PendingAction& pendingAction);

/** \brief Convert JSON to PendingAction
 */
void from_json(const nlohmann::json& j, PendingAction& pendingAction);

}
}

#endif // MESSAGING_PENDINGACTIONJSONSERIALIZER_HH_
