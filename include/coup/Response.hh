/** \file
 *
 * \brief Definition of Coup::Response variant and related concepts
 */

#ifndef RESPONSE_HH_
#define RESPONSE_HH_

#include "coup/Role.hh"

#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace Coup {

/** \brief Response declining to challenge or block
 */
struct PassResponse {
    /// \brief Equality comparison
    bool operator==(const PassResponse&) const = default;
};

/** \brief Response challenging the claim under negotiation
 */
struct ChallengeResponse {
    /// \brief Equality comparison
    bool operator==(const ChallengeResponse&) const = default;
};

/** \brief Response blocking the action by claiming a role
 */
struct BlockResponse {
    Role role;  ///< \brief The role claimed for the block

    /// \brief Equality comparison
    bool operator==(const BlockResponse&) const = default;
};

/** \brief Response choosing which influence to lose
 */
struct LoseInfluenceResponse {
    int cardIndex;  ///< \brief The slot index of the card to reveal

    /// \brief Equality comparison
    bool operator==(const LoseInfluenceResponse&) const = default;
};

/** \brief Response choosing the cards to keep in an exchange
 */
struct ExchangeChoiceResponse {
    /** \brief Identifiers of the exchange options to keep
     *
     * Duplicates are allowed but collapse to one choice.
     */
    std::vector<std::string> keep;

    /// \brief Equality comparison
    bool operator==(const ExchangeChoiceResponse&) const = default;
};

/** \brief Response of a player to the pending action
 *
 * A \ref Response wraps exactly one of the response types. Which of them are
 * accepted depends on the stage of the pending action.
 */
using Response = std::variant<
    PassResponse, ChallengeResponse, BlockResponse, LoseInfluenceResponse,
    ExchangeChoiceResponse>;

/** \brief Output pass to stream
 *
 * \param os the output stream
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const PassResponse&);

/** \brief Output challenge to stream
 *
 * \param os the output stream
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const ChallengeResponse&);

/** \brief Output block to stream
 *
 * \param os the output stream
 * \param response the response to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const BlockResponse& response);

/** \brief Output influence loss choice to stream
 *
 * \param os the output stream
 * \param response the response to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(
    std::ostream& os, const LoseInfluenceResponse& response);

/** \brief Output exchange choice to stream
 *
 * \param os the output stream
 * \param response the response to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(
    std::ostream& os, const ExchangeChoiceResponse& response);

}

#endif // RESPONSE_HH_
