#include "messaging/ContinuationJsonSerializer.hh"

#include "messaging/SerializationFailureException.hh"

#include <functional>
#include <map>

using nlohmann::json;

namespace Coup {
namespace Engine {

const std::string CONTINUATION_TYPE_KEY {"type"};
const std::string CONTINUATION_ACTOR_ID_KEY {"actorId"};
const std::string CONTINUATION_TARGET_ID_KEY {"targetId"};

namespace {

const std::string END_TURN_TAG {"endTurn"};
const std::string ASSASSINATE_OPEN_BLOCK_TAG {"assassinate_open_block"};
const std::string ASSASSINATE_BLOCK_STANDS_TAG {"assassinate_block_stands"};
const std::string ASSASSINATE_FORCE_TARGET_LOSS_TAG {
    "assassinate_force_target_loss"};
const std::string END_TURN_AFTER_ASSASSINATION_TAG {
    "endTurn_after_assassination"};
const std::string STEAL_OPEN_BLOCK_TAG {"steal_open_block"};
const std::string STEAL_APPLY_TAG {"steal_apply"};
const std::string STEAL_BLOCK_STANDS_TAG {"steal_block_stands"};
const std::string STEAL_APPLY_AFTER_BLOCK_FAIL_TAG {
    "steal_apply_after_block_fail"};
const std::string EXCHANGE_START_CHOICE_TAG {"exchange_start_choice"};

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    auto operator()(const EndTurn&) const { return END_TURN_TAG; }
    auto operator()(const AssassinateOpenBlock& c) const
    {
        putActorAndTarget(c);
        return ASSASSINATE_OPEN_BLOCK_TAG;
    }
    auto operator()(const AssassinateBlockStands&) const
    {
        return ASSASSINATE_BLOCK_STANDS_TAG;
    }
    auto operator()(const AssassinateForceTargetLoss& c) const
    {
        putActorAndTarget(c);
        return ASSASSINATE_FORCE_TARGET_LOSS_TAG;
    }
    auto operator()(const EndTurnAfterAssassination& c) const
    {
        j[CONTINUATION_TARGET_ID_KEY] = c.targetId;
        return END_TURN_AFTER_ASSASSINATION_TAG;
    }
    auto operator()(const StealOpenBlock& c) const
    {
        putActorAndTarget(c);
        return STEAL_OPEN_BLOCK_TAG;
    }
    auto operator()(const StealApply& c) const
    {
        putActorAndTarget(c);
        return STEAL_APPLY_TAG;
    }
    auto operator()(const StealBlockStands&) const
    {
        return STEAL_BLOCK_STANDS_TAG;
    }
    auto operator()(const StealApplyAfterBlockFail& c) const
    {
        putActorAndTarget(c);
        return STEAL_APPLY_AFTER_BLOCK_FAIL_TAG;
    }
    auto operator()(const ExchangeStartChoice& c) const
    {
        j[CONTINUATION_ACTOR_ID_KEY] = c.actorId;
        return EXCHANGE_START_CHOICE_TAG;
    }

private:

    template<typename C>
    void putActorAndTarget(const C& c) const
    {
        j[CONTINUATION_ACTOR_ID_KEY] = c.actorId;
        j[CONTINUATION_TARGET_ID_KEY] = c.targetId;
    }

    json& j;
};

PlayerId getActorId(const json& j)
{
    return j.at(CONTINUATION_ACTOR_ID_KEY).get<PlayerId>();
}

PlayerId getTargetId(const json& j)
{
    return j.at(CONTINUATION_TARGET_ID_KEY).get<PlayerId>();
}

template<typename C>
Continuation makeWithActorAndTarget(const json& j)
{
    return C {getActorId(j), getTargetId(j)};
}

const auto CONTINUATIONS =
    std::map<std::string, std::function<Continuation(const json&)>> {
    { END_TURN_TAG, [](const json&) { return Continuation {EndTurn {}}; }},
    { ASSASSINATE_OPEN_BLOCK_TAG,
      makeWithActorAndTarget<AssassinateOpenBlock> },
    { ASSASSINATE_BLOCK_STANDS_TAG,
      [](const json&) { return Continuation {AssassinateBlockStands {}}; }},
    { ASSASSINATE_FORCE_TARGET_LOSS_TAG,
      makeWithActorAndTarget<AssassinateForceTargetLoss> },
    { END_TURN_AFTER_ASSASSINATION_TAG,
      [](const json& j)
      {
          return Continuation {EndTurnAfterAssassination {getTargetId(j)}};
      }
    },
    { STEAL_OPEN_BLOCK_TAG, makeWithActorAndTarget<StealOpenBlock> },
    { STEAL_APPLY_TAG, makeWithActorAndTarget<StealApply> },
    { STEAL_BLOCK_STANDS_TAG,
      [](const json&) { return Continuation {StealBlockStands {}}; }},
    { STEAL_APPLY_AFTER_BLOCK_FAIL_TAG,
      makeWithActorAndTarget<StealApplyAfterBlockFail> },
    { EXCHANGE_START_CHOICE_TAG,
      [](const json& j)
      {
          return Continuation {ExchangeStartChoice {getActorId(j)}};
      }
    }};

}

void to_json(json& j, const Continuation& continuation)
{
    j[CONTINUATION_TYPE_KEY] =
        std::visit(JsonSerializerVisitor {j}, continuation);
}

void from_json(const json& j, Continuation& continuation)
{
    const auto iter = CONTINUATIONS.find(
        j.at(CONTINUATION_TYPE_KEY).get<std::string>());
    if (iter != CONTINUATIONS.end()) {
        continuation = iter->second(j);
    } else {
        throw Messaging::SerializationFailureException {};
    }
}

}
}
