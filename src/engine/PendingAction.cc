#include "engine/PendingAction.hh"

#include "IoUtility.hh"

#include <algorithm>
#include <array>
#include <ostream>

namespace Coup {
namespace Engine {

namespace {

const auto RESPONSE_STATUS_NAMES = std::array {
    ResponseStatusToStringMap::value_type {ResponseStatus::PENDING, "pending"},
    ResponseStatusToStringMap::value_type {ResponseStatus::PASSED, "passed"},
    ResponseStatusToStringMap::value_type {
        ResponseStatus::CHALLENGED, "challenged"},
};

const auto LOSS_REASON_NAMES = std::array {
    LossReasonToStringMap::value_type {LossReason::COUP, "coup"},
    LossReasonToStringMap::value_type {
        LossReason::ASSASSINATED, "assassinated"},
    LossReasonToStringMap::value_type {
        LossReason::FAILED_CHALLENGE, "failed_challenge"},
    LossReasonToStringMap::value_type {
        LossReason::LOST_CHALLENGE, "lost_challenge"},
};

struct ActionNameVisitor {
    std::string_view operator()(const LoseInfluence&) const
    {
        return "loseInfluence";
    }
    std::string_view operator()(const ForeignAidAwaitingBlock&) const
    {
        return "foreign_aid";
    }
    std::string_view operator()(const ForeignAidAwaitingChallengeBlock&) const
    {
        return "foreign_aid";
    }
    std::string_view operator()(const TaxAwaitingChallenge&) const
    {
        return "tax";
    }
    std::string_view operator()(const AssassinateAwaitingChallenge&) const
    {
        return "assassinate";
    }
    std::string_view operator()(const AssassinateAwaitingBlock&) const
    {
        return "assassinate";
    }
    std::string_view operator()(const AssassinateAwaitingChallengeBlock&) const
    {
        return "assassinate";
    }
    std::string_view operator()(const StealAwaitingChallenge&) const
    {
        return "steal";
    }
    std::string_view operator()(const StealAwaitingBlock&) const
    {
        return "steal";
    }
    std::string_view operator()(const StealAwaitingChallengeBlock&) const
    {
        return "steal";
    }
    std::string_view operator()(const ExchangeAwaitingChallenge&) const
    {
        return "exchange";
    }
    std::string_view operator()(const ExchangeAwaitingChoice&) const
    {
        return "exchange";
    }
};

constexpr auto AWAITING_CHALLENGE = std::string_view {"awaitingChallenge"};
constexpr auto AWAITING_BLOCK = std::string_view {"awaitingBlock"};
constexpr auto AWAITING_CHALLENGE_BLOCK =
    std::string_view {"awaitingChallengeBlock"};
constexpr auto AWAITING_CHOICE = std::string_view {"awaitingChoice"};

struct StageNameVisitor {
    std::string_view operator()(const LoseInfluence&) const
    {
        return AWAITING_CHOICE;
    }
    std::string_view operator()(const ForeignAidAwaitingBlock&) const
    {
        return AWAITING_BLOCK;
    }
    std::string_view operator()(const ForeignAidAwaitingChallengeBlock&) const
    {
        return AWAITING_CHALLENGE_BLOCK;
    }
    std::string_view operator()(const TaxAwaitingChallenge&) const
    {
        return AWAITING_CHALLENGE;
    }
    std::string_view operator()(const AssassinateAwaitingChallenge&) const
    {
        return AWAITING_CHALLENGE;
    }
    std::string_view operator()(const AssassinateAwaitingBlock&) const
    {
        return AWAITING_BLOCK;
    }
    std::string_view operator()(const AssassinateAwaitingChallengeBlock&) const
    {
        return AWAITING_CHALLENGE_BLOCK;
    }
    std::string_view operator()(const StealAwaitingChallenge&) const
    {
        return AWAITING_CHALLENGE;
    }
    std::string_view operator()(const StealAwaitingBlock&) const
    {
        return AWAITING_BLOCK;
    }
    std::string_view operator()(const StealAwaitingChallengeBlock&) const
    {
        return AWAITING_CHALLENGE_BLOCK;
    }
    std::string_view operator()(const ExchangeAwaitingChallenge&) const
    {
        return AWAITING_CHALLENGE;
    }
    std::string_view operator()(const ExchangeAwaitingChoice&) const
    {
        return AWAITING_CHOICE;
    }
};

}

const ResponseStatusToStringMap RESPONSE_STATUS_TO_STRING_MAP(
    RESPONSE_STATUS_NAMES.begin(), RESPONSE_STATUS_NAMES.end());

const LossReasonToStringMap LOSS_REASON_TO_STRING_MAP(
    LOSS_REASON_NAMES.begin(), LOSS_REASON_NAMES.end());

Responders::Responders(EntryVector entries) :
    entries(std::move(entries))
{
}

Responders Responders::addressedTo(const PlayerId& playerId)
{
    return Responders {EntryVector {{playerId, ResponseStatus::PENDING}}};
}

bool Responders::isEligible(const PlayerId& playerId) const
{
    return getStatus(playerId).has_value();
}

bool Responders::record(const PlayerId& playerId, const ResponseStatus status)
{
    const auto iter = std::ranges::find(entries, playerId, &Entry::first);
    if (iter == entries.end()) {
        return false;
    }
    iter->second = status;
    return true;
}

std::optional<PlayerId> Responders::getFirstChallenger() const
{
    const auto iter = std::ranges::find(
        entries, ResponseStatus::CHALLENGED, &Entry::second);
    if (iter != entries.end()) {
        return iter->first;
    }
    return std::nullopt;
}

bool Responders::haveAllPassed() const
{
    return std::ranges::all_of(
        entries,
        [](const auto& entry)
        {
            return entry.second == ResponseStatus::PASSED;
        });
}

std::optional<ResponseStatus> Responders::getStatus(
    const PlayerId& playerId) const
{
    const auto iter = std::ranges::find(entries, playerId, &Entry::first);
    if (iter != entries.end()) {
        return iter->second;
    }
    return std::nullopt;
}

std::string_view getActionName(const PendingAction& pendingAction)
{
    return std::visit(ActionNameVisitor {}, pendingAction);
}

std::string_view getStageName(const PendingAction& pendingAction)
{
    return std::visit(StageNameVisitor {}, pendingAction);
}

std::optional<Role> getClaimedRole(const PendingAction& pendingAction)
{
    if (std::holds_alternative<TaxAwaitingChallenge>(pendingAction)) {
        return Role::DUKE;
    } else if (
        std::holds_alternative<AssassinateAwaitingChallenge>(pendingAction) ||
        std::holds_alternative<AssassinateAwaitingBlock>(pendingAction) ||
        std::holds_alternative<AssassinateAwaitingChallengeBlock>(
            pendingAction)) {
        return Role::ASSASSIN;
    } else if (
        std::holds_alternative<StealAwaitingChallenge>(pendingAction) ||
        std::holds_alternative<StealAwaitingBlock>(pendingAction) ||
        std::holds_alternative<StealAwaitingChallengeBlock>(pendingAction)) {
        return Role::CAPTAIN;
    } else if (
        std::holds_alternative<ExchangeAwaitingChallenge>(pendingAction) ||
        std::holds_alternative<ExchangeAwaitingChoice>(pendingAction)) {
        return Role::AMBASSADOR;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const ResponseStatus status)
{
    return os << RESPONSE_STATUS_TO_STRING_MAP.left.at(status);
}

std::ostream& operator<<(std::ostream& os, const LossReason reason)
{
    return os << LOSS_REASON_TO_STRING_MAP.left.at(reason);
}

std::ostream& operator<<(std::ostream& os, const PendingAction& pendingAction)
{
    using Coup::operator<<;
    os << getActionName(pendingAction) << " " << getStageName(pendingAction);
    if (const auto* loss = std::get_if<LoseInfluence>(&pendingAction)) {
        os << " " << loss->playerId << " (" << loss->reason << ", then "
           << loss->continuation << ")";
    }
    return os;
}

}
}
