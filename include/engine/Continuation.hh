/** \file
 *
 * \brief Definition of Coup::Engine::Continuation variant
 *
 * A continuation describes the transition the response resolver performs
 * once an outstanding forced influence loss has been completed. It is pure
 * data: it captures nothing beyond the identifiers listed in its
 * alternatives, so a pending action containing it can be serialized, logged
 * and resumed across a transport round trip.
 */

#ifndef ENGINE_CONTINUATION_HH_
#define ENGINE_CONTINUATION_HH_

#include "coup/Player.hh"

#include <iosfwd>
#include <variant>

namespace Coup {
namespace Engine {

/** \brief End the turn
 */
struct EndTurn {
    /// \brief Equality comparison
    bool operator==(const EndTurn&) const = default;
};

/** \brief Open the Contessa block window addressed to the assassination target
 */
struct AssassinateOpenBlock {
    PlayerId actorId;   ///< \brief The assassin
    PlayerId targetId;  ///< \brief The target of the assassination

    /// \brief Equality comparison
    bool operator==(const AssassinateOpenBlock&) const = default;
};

/** \brief The Contessa block was proven, the assassination is blocked
 */
struct AssassinateBlockStands {
    /// \brief Equality comparison
    bool operator==(const AssassinateBlockStands&) const = default;
};

/** \brief The Contessa block failed, the target must now lose influence
 */
struct AssassinateForceTargetLoss {
    PlayerId actorId;   ///< \brief The assassin
    PlayerId targetId;  ///< \brief The target of the assassination

    /// \brief Equality comparison
    bool operator==(const AssassinateForceTargetLoss&) const = default;
};

/** \brief The assassination target has lost influence, end the turn
 */
struct EndTurnAfterAssassination {
    PlayerId targetId;  ///< \brief The target of the assassination

    /// \brief Equality comparison
    bool operator==(const EndTurnAfterAssassination&) const = default;
};

/** \brief Open the block window addressed to the steal target
 */
struct StealOpenBlock {
    PlayerId actorId;   ///< \brief The player stealing
    PlayerId targetId;  ///< \brief The player stolen from

    /// \brief Equality comparison
    bool operator==(const StealOpenBlock&) const = default;
};

/** \brief Transfer the stolen coins and end the turn
 */
struct StealApply {
    PlayerId actorId;   ///< \brief The player stealing
    PlayerId targetId;  ///< \brief The player stolen from

    /// \brief Equality comparison
    bool operator==(const StealApply&) const = default;
};

/** \brief The block of the steal was proven, the steal is blocked
 */
struct StealBlockStands {
    /// \brief Equality comparison
    bool operator==(const StealBlockStands&) const = default;
};

/** \brief The block of the steal failed, transfer the coins and end the turn
 */
struct StealApplyAfterBlockFail {
    PlayerId actorId;   ///< \brief The player stealing
    PlayerId targetId;  ///< \brief The player stolen from

    /// \brief Equality comparison
    bool operator==(const StealApplyAfterBlockFail&) const = default;
};

/** \brief Start the exchange option choice of the actor
 */
struct ExchangeStartChoice {
    PlayerId actorId;   ///< \brief The player exchanging

    /// \brief Equality comparison
    bool operator==(const ExchangeStartChoice&) const = default;
};

/** \brief Transition to perform after a forced influence loss
 */
using Continuation = std::variant<
    EndTurn, AssassinateOpenBlock, AssassinateBlockStands,
    AssassinateForceTargetLoss, EndTurnAfterAssassination, StealOpenBlock,
    StealApply, StealBlockStands, StealApplyAfterBlockFail,
    ExchangeStartChoice>;

/// \cond internal

std::ostream& operator<<(std::ostream& os, const EndTurn&);
std::ostream& operator<<(std::ostream& os, const AssassinateOpenBlock& c);
std::ostream& operator<<(std::ostream& os, const AssassinateBlockStands&);
std::ostream& operator<<(
    std::ostream& os, const AssassinateForceTargetLoss& c);
std::ostream& operator<<(std::ostream& os, const EndTurnAfterAssassination& c);
std::ostream& operator<<(std::ostream& os, const StealOpenBlock& c);
std::ostream& operator<<(std::ostream& os, const StealApply& c);
std::ostream& operator<<(std::ostream& os, const StealBlockStands&);
std::ostream& operator<<(std::ostream& os, const StealApplyAfterBlockFail& c);
std::ostream& operator<<(std::ostream& os, const ExchangeStartChoice& c);

/// \endcond

}
}

#endif // ENGINE_CONTINUATION_HH_
