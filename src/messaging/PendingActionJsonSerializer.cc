#include "messaging/PendingActionJsonSerializer.hh"

#include "messaging/ContinuationJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/RoleJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"

#include <functional>
#include <map>
#include <utility>

using nlohmann::json;

namespace Coup {
namespace Engine {

const std::string PENDING_ACTION_TYPE_KEY {"type"};
const std::string PENDING_ACTION_STAGE_KEY {"stage"};
const std::string PENDING_ACTION_PLAYER_ID_KEY {"playerId"};
const std::string PENDING_ACTION_REASON_KEY {"reason"};
const std::string PENDING_ACTION_CONTINUATION_KEY {"continuation"};
const std::string PENDING_ACTION_ACTOR_ID_KEY {"actorId"};
const std::string PENDING_ACTION_TARGET_ID_KEY {"targetId"};
const std::string PENDING_ACTION_CLAIMED_ROLE_KEY {"claimedRole"};
const std::string PENDING_ACTION_BLOCKED_BY_KEY {"blockedBy"};
const std::string PENDING_ACTION_BLOCK_ROLE_KEY {"blockRole"};
const std::string PENDING_ACTION_RESPONDERS_KEY {"responders"};
const std::string PENDING_ACTION_KEEP_COUNT_KEY {"keepCount"};
const std::string PENDING_ACTION_OPTION_COUNT_KEY {"optionCount"};
const std::string RESPONDERS_PLAYER_ID_KEY {"playerId"};
const std::string RESPONDERS_STATUS_KEY {"status"};

namespace {

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    void operator()(const LoseInfluence& stage) const
    {
        j[PENDING_ACTION_PLAYER_ID_KEY] = stage.playerId;
        j[PENDING_ACTION_REASON_KEY] = stage.reason;
        j[PENDING_ACTION_CONTINUATION_KEY] = stage.continuation;
    }
    void operator()(const ForeignAidAwaitingBlock& stage) const
    {
        j[PENDING_ACTION_ACTOR_ID_KEY] = stage.actorId;
        j[PENDING_ACTION_RESPONDERS_KEY] = stage.responders;
    }
    void operator()(const ForeignAidAwaitingChallengeBlock& stage) const
    {
        j[PENDING_ACTION_ACTOR_ID_KEY] = stage.actorId;
        j[PENDING_ACTION_BLOCKED_BY_KEY] = stage.blockerId;
        j[PENDING_ACTION_RESPONDERS_KEY] = stage.responders;
    }
    void operator()(const TaxAwaitingChallenge& stage) const
    {
        j[PENDING_ACTION_ACTOR_ID_KEY] = stage.actorId;
        j[PENDING_ACTION_RESPONDERS_KEY] = stage.responders;
    }
    void operator()(const AssassinateAwaitingChallenge& stage) const
    {
        putTargeted(stage);
    }
    void operator()(const AssassinateAwaitingBlock& stage) const
    {
        putTargeted(stage);
    }
    void operator()(const AssassinateAwaitingChallengeBlock& stage) const
    {
        putTargeted(stage);
        j[PENDING_ACTION_BLOCKED_BY_KEY] = stage.targetId;
    }
    void operator()(const StealAwaitingChallenge& stage) const
    {
        putTargeted(stage);
    }
    void operator()(const StealAwaitingBlock& stage) const
    {
        putTargeted(stage);
    }
    void operator()(const StealAwaitingChallengeBlock& stage) const
    {
        putTargeted(stage);
        j[PENDING_ACTION_BLOCKED_BY_KEY] = stage.targetId;
        j[PENDING_ACTION_BLOCK_ROLE_KEY] = stage.blockRole;
    }
    void operator()(const ExchangeAwaitingChallenge& stage) const
    {
        j[PENDING_ACTION_ACTOR_ID_KEY] = stage.actorId;
        j[PENDING_ACTION_RESPONDERS_KEY] = stage.responders;
    }
    void operator()(const ExchangeAwaitingChoice& stage) const
    {
        j[PENDING_ACTION_ACTOR_ID_KEY] = stage.actorId;
        j[PENDING_ACTION_KEEP_COUNT_KEY] = stage.keepCount;
        j[PENDING_ACTION_OPTION_COUNT_KEY] = stage.optionCount;
    }

private:

    template<typename Stage>
    void putTargeted(const Stage& stage) const
    {
        j[PENDING_ACTION_ACTOR_ID_KEY] = stage.actorId;
        j[PENDING_ACTION_TARGET_ID_KEY] = stage.targetId;
        j[PENDING_ACTION_RESPONDERS_KEY] = stage.responders;
    }

    json& j;
};

PlayerId getActorId(const json& j)
{
    return j.at(PENDING_ACTION_ACTOR_ID_KEY).get<PlayerId>();
}

PlayerId getTargetId(const json& j)
{
    return j.at(PENDING_ACTION_TARGET_ID_KEY).get<PlayerId>();
}

Responders readResponders(const json& j)
{
    return j.at(PENDING_ACTION_RESPONDERS_KEY).get<Responders>();
}

template<typename Stage>
PendingAction makeTargeted(const json& j)
{
    return Stage {getActorId(j), getTargetId(j), readResponders(j)};
}

template<typename Stage>
PendingAction makeUntargeted(const json& j)
{
    return Stage {getActorId(j), readResponders(j)};
}

using StageKey = std::pair<std::string, std::string>;

const auto STAGES =
    std::map<StageKey, std::function<PendingAction(const json&)>> {
    { {"loseInfluence", "awaitingChoice"},
      [](const json& j) -> PendingAction
      {
          return LoseInfluence {
              j.at(PENDING_ACTION_PLAYER_ID_KEY).get<PlayerId>(),
              j.at(PENDING_ACTION_REASON_KEY).get<LossReason>(),
              j.at(PENDING_ACTION_CONTINUATION_KEY).get<Continuation>()};
      }
    },
    { {"foreign_aid", "awaitingBlock"},
      makeUntargeted<ForeignAidAwaitingBlock> },
    { {"foreign_aid", "awaitingChallengeBlock"},
      [](const json& j) -> PendingAction
      {
          return ForeignAidAwaitingChallengeBlock {
              getActorId(j),
              j.at(PENDING_ACTION_BLOCKED_BY_KEY).get<PlayerId>(),
              readResponders(j)};
      }
    },
    { {"tax", "awaitingChallenge"}, makeUntargeted<TaxAwaitingChallenge> },
    { {"assassinate", "awaitingChallenge"},
      makeTargeted<AssassinateAwaitingChallenge> },
    { {"assassinate", "awaitingBlock"},
      makeTargeted<AssassinateAwaitingBlock> },
    { {"assassinate", "awaitingChallengeBlock"},
      makeTargeted<AssassinateAwaitingChallengeBlock> },
    { {"steal", "awaitingChallenge"}, makeTargeted<StealAwaitingChallenge> },
    { {"steal", "awaitingBlock"}, makeTargeted<StealAwaitingBlock> },
    { {"steal", "awaitingChallengeBlock"},
      [](const json& j) -> PendingAction
      {
          return StealAwaitingChallengeBlock {
              getActorId(j), getTargetId(j),
              j.at(PENDING_ACTION_BLOCK_ROLE_KEY).get<Role>(),
              readResponders(j)};
      }
    },
    { {"exchange", "awaitingChallenge"},
      makeUntargeted<ExchangeAwaitingChallenge> },
    { {"exchange", "awaitingChoice"},
      [](const json& j) -> PendingAction
      {
          return ExchangeAwaitingChoice {
              getActorId(j),
              Messaging::validate(
                  Messaging::jsonToInteger<int>(
                      j.at(PENDING_ACTION_KEEP_COUNT_KEY)),
                  [](const auto n) { return n > 0; }),
              Messaging::validate(
                  Messaging::jsonToInteger<int>(
                      j.at(PENDING_ACTION_OPTION_COUNT_KEY)),
                  [](const auto n) { return n > 0; })};
      }
    }};

}

void to_json(json& j, const ResponseStatus status)
{
    j = Messaging::enumToJson(status, RESPONSE_STATUS_TO_STRING_MAP.left);
}

void from_json(const json& j, ResponseStatus& status)
{
    status = Messaging::jsonToEnum<ResponseStatus>(
        j, RESPONSE_STATUS_TO_STRING_MAP.right);
}

void to_json(json& j, const LossReason reason)
{
    j = Messaging::enumToJson(reason, LOSS_REASON_TO_STRING_MAP.left);
}

void from_json(const json& j, LossReason& reason)
{
    reason = Messaging::jsonToEnum<LossReason>(
        j, LOSS_REASON_TO_STRING_MAP.right);
}

void to_json(json& j, const Responders& responders)
{
    j = json::array();
    for (const auto& [player_id, status] : responders.getEntries()) {
        j.push_back(
            json {
                {RESPONDERS_PLAYER_ID_KEY, player_id},
                {RESPONDERS_STATUS_KEY, status}});
    }
}

void from_json(const json& j, Responders& responders)
{
    if (!j.is_array()) {
        throw Messaging::SerializationFailureException {};
    }
    auto entries = Responders::EntryVector {};
    for (const auto& e : j) {
        entries.emplace_back(
            e.at(RESPONDERS_PLAYER_ID_KEY).get<PlayerId>(),
            e.at(RESPONDERS_STATUS_KEY).get<ResponseStatus>());
    }
    responders = Responders {std::move(entries)};
}

void to_json(json& j, const PendingAction& pendingAction)
{
    j[PENDING_ACTION_TYPE_KEY] = std::string {getActionName(pendingAction)};
    j[PENDING_ACTION_STAGE_KEY] = std::string {getStageName(pendingAction)};
    if (const auto role = getClaimedRole(pendingAction)) {
        j[PENDING_ACTION_CLAIMED_ROLE_KEY] = *role;
    }
    std::visit(JsonSerializerVisitor {j}, pendingAction);
}

void from_json(const json& j, PendingAction& pendingAction)
{
    const auto iter = STAGES.find(
        StageKey {
            j.at(PENDING_ACTION_TYPE_KEY).get<std::string>(),
            j.at(PENDING_ACTION_STAGE_KEY).get<std::string>()});
    if (iter != STAGES.end()) {
        pendingAction = iter->second(j);
    } else {
        throw Messaging::SerializationFailureException {};
    }
}

}
}
