/** \file
 *
 * \brief Definition of Coup::Engine::PendingAction variant
 *
 * The pending action is the single in‐flight negotiation gating all further
 * play. Each alternative of the variant corresponds to one action kind in
 * one stage, so combinations of fields that make no sense in a stage cannot
 * be represented.
 */

#ifndef ENGINE_PENDINGACTION_HH_
#define ENGINE_PENDINGACTION_HH_

#include "coup/Player.hh"
#include "coup/Role.hh"
#include "engine/Continuation.hh"

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Coup {
namespace Engine {

/** \brief Response status of an eligible responder
 */
enum class ResponseStatus {
    PENDING,
    PASSED,
    CHALLENGED,
};

/** \brief Type of \ref RESPONSE_STATUS_TO_STRING_MAP
 */
using ResponseStatusToStringMap =
    boost::bimaps::bimap<ResponseStatus, std::string>;

/** \brief Two-way map between response statuses and their names
 */
extern const ResponseStatusToStringMap RESPONSE_STATUS_TO_STRING_MAP;

/** \brief The players eligible to respond in a negotiation stage
 *
 * Responders is an ordered mapping from player identifiers to their response
 * status. The order is the seating order of the players.
 */
class Responders {
public:

    /** \brief Entry of the mapping
     */
    using Entry = std::pair<PlayerId, ResponseStatus>;

    /** \brief Type of the underlying container
     */
    using EntryVector = std::vector<Entry>;

    /** \brief Create empty responders
     */
    Responders() = default;

    /** \brief Create responders from entries
     *
     * \param entries the entries, at most one per player
     */
    explicit Responders(EntryVector entries);

    /** \brief Create responders consisting of a single pending player
     *
     * \param playerId the player addressed
     */
    static Responders addressedTo(const PlayerId& playerId);

    /** \brief Determine if a player is eligible to respond
     */
    bool isEligible(const PlayerId& playerId) const;

    /** \brief Record response status of a player
     *
     * \return true if \p playerId was eligible and the status was recorded,
     * false otherwise
     */
    bool record(const PlayerId& playerId, ResponseStatus status);

    /** \brief Get the first responder that challenged
     *
     * \return the identifier of the first challenger in seating order, or
     * none if nobody has challenged
     */
    std::optional<PlayerId> getFirstChallenger() const;

    /** \brief Determine if every eligible responder has passed
     */
    bool haveAllPassed() const;

    /** \brief Get the status of a player
     *
     * \return the status, or none if \p playerId is not eligible
     */
    std::optional<ResponseStatus> getStatus(const PlayerId& playerId) const;

    /** \brief Get the entries
     */
    const EntryVector& getEntries() const { return entries; }

    /// \brief Equality comparison
    bool operator==(const Responders&) const = default;

private:

    EntryVector entries;
};

/** \brief Reason for a forced influence loss
 */
enum class LossReason {
    COUP,
    ASSASSINATED,
    FAILED_CHALLENGE,
    LOST_CHALLENGE,
};

/** \brief Type of \ref LOSS_REASON_TO_STRING_MAP
 */
using LossReasonToStringMap = boost::bimaps::bimap<LossReason, std::string>;

/** \brief Two-way map between loss reasons and their names
 */
extern const LossReasonToStringMap LOSS_REASON_TO_STRING_MAP;

/** \brief A player must choose an influence to lose
 */
struct LoseInfluence {
    PlayerId playerId;          ///< \brief The player losing influence
    LossReason reason;          ///< \brief Why the influence is lost
    Continuation continuation;  ///< \brief What happens afterwards

    /// \brief Equality comparison
    bool operator==(const LoseInfluence&) const = default;
};

/** \brief Foreign aid is open for a Duke block by anyone except the actor
 */
struct ForeignAidAwaitingBlock {
    PlayerId actorId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const ForeignAidAwaitingBlock&) const = default;
};

/** \brief The Duke block of foreign aid is open for challenges
 */
struct ForeignAidAwaitingChallengeBlock {
    PlayerId actorId;
    PlayerId blockerId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const ForeignAidAwaitingChallengeBlock&) const = default;
};

/** \brief The Duke claim for tax is open for challenges
 */
struct TaxAwaitingChallenge {
    PlayerId actorId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const TaxAwaitingChallenge&) const = default;
};

/** \brief The Assassin claim is open for challenges
 */
struct AssassinateAwaitingChallenge {
    PlayerId actorId;
    PlayerId targetId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const AssassinateAwaitingChallenge&) const = default;
};

/** \brief The target of the assassination may block with Contessa
 */
struct AssassinateAwaitingBlock {
    PlayerId actorId;
    PlayerId targetId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const AssassinateAwaitingBlock&) const = default;
};

/** \brief The Contessa block of the target is open for challenges
 */
struct AssassinateAwaitingChallengeBlock {
    PlayerId actorId;
    PlayerId targetId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const AssassinateAwaitingChallengeBlock&) const = default;
};

/** \brief The Captain claim is open for challenges
 */
struct StealAwaitingChallenge {
    PlayerId actorId;
    PlayerId targetId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const StealAwaitingChallenge&) const = default;
};

/** \brief The target of the steal may block with Captain or Ambassador
 */
struct StealAwaitingBlock {
    PlayerId actorId;
    PlayerId targetId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const StealAwaitingBlock&) const = default;
};

/** \brief The block of the target is open for challenges
 */
struct StealAwaitingChallengeBlock {
    PlayerId actorId;
    PlayerId targetId;
    Role blockRole;  ///< \brief The role claimed for the block
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const StealAwaitingChallengeBlock&) const = default;
};

/** \brief The Ambassador claim is open for challenges
 */
struct ExchangeAwaitingChallenge {
    PlayerId actorId;
    Responders responders;

    /// \brief Equality comparison
    bool operator==(const ExchangeAwaitingChallenge&) const = default;
};

/** \brief The actor must choose the cards to keep
 *
 * Only the public fact that the actor chooses \ref keepCount of \ref
 * optionCount options is recorded. The options themselves are a secret of
 * the actor, see GameState::getExchangeSecret().
 */
struct ExchangeAwaitingChoice {
    PlayerId actorId;
    int keepCount;
    int optionCount;

    /// \brief Equality comparison
    bool operator==(const ExchangeAwaitingChoice&) const = default;
};

/** \brief The in‐flight negotiation
 */
using PendingAction = std::variant<
    LoseInfluence,
    ForeignAidAwaitingBlock, ForeignAidAwaitingChallengeBlock,
    TaxAwaitingChallenge,
    AssassinateAwaitingChallenge, AssassinateAwaitingBlock,
    AssassinateAwaitingChallengeBlock,
    StealAwaitingChallenge, StealAwaitingBlock, StealAwaitingChallengeBlock,
    ExchangeAwaitingChallenge, ExchangeAwaitingChoice>;

/** \brief Get the name of the action kind of a pending action
 *
 * \return “loseInfluence”, “foreign_aid”, “tax”, “assassinate”, “steal” or
 * “exchange”
 */
std::string_view getActionName(const PendingAction& pendingAction);

/** \brief Get the name of the stage of a pending action
 *
 * \return “awaitingChallenge”, “awaitingBlock”, “awaitingChallengeBlock” or
 * “awaitingChoice”
 */
std::string_view getStageName(const PendingAction& pendingAction);

/** \brief Get the role claimed by the actor
 *
 * \return the role the actor claimed for the action under negotiation, or
 * none if the pending action does not involve an actor claim (forced loss,
 * foreign aid)
 */
std::optional<Role> getClaimedRole(const PendingAction& pendingAction);

/** \brief Output response status to stream
 */
std::ostream& operator<<(std::ostream& os, ResponseStatus status);

/** \brief Output loss reason to stream
 */
std::ostream& operator<<(std::ostream& os, LossReason reason);

/** \brief Output pending action to stream
 *
 * Only public information is output.
 */
std::ostream& operator<<(std::ostream& os, const PendingAction& pendingAction);

}
}

#endif // ENGINE_PENDINGACTION_HH_
