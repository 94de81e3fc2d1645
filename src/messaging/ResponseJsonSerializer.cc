#include "messaging/ResponseJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"
#include "messaging/RoleJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"

#include <functional>
#include <map>
#include <vector>

using nlohmann::json;

namespace Coup {

const std::string RESPONSE_TYPE_KEY {"type"};
const std::string RESPONSE_PAYLOAD_KEY {"payload"};
const std::string RESPONSE_PASS_TAG {"pass"};
const std::string RESPONSE_CHALLENGE_TAG {"challenge"};
const std::string RESPONSE_BLOCK_TAG {"block"};
const std::string RESPONSE_LOSE_INFLUENCE_TAG {"loseInfluence"};
const std::string RESPONSE_EXCHANGE_CHOICE_TAG {"exchangeChoice"};
const std::string RESPONSE_ROLE_KEY {"role"};
const std::string RESPONSE_CARD_INDEX_KEY {"cardIndex"};
const std::string RESPONSE_KEEP_KEY {"keep"};

namespace {

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    auto operator()(const PassResponse&) const { return RESPONSE_PASS_TAG; }
    auto operator()(const ChallengeResponse&) const
    {
        return RESPONSE_CHALLENGE_TAG;
    }
    auto operator()(const BlockResponse& block) const
    {
        j[RESPONSE_PAYLOAD_KEY] = json {{RESPONSE_ROLE_KEY, block.role}};
        return RESPONSE_BLOCK_TAG;
    }
    auto operator()(const LoseInfluenceResponse& loss) const
    {
        j[RESPONSE_PAYLOAD_KEY] =
            json {{RESPONSE_CARD_INDEX_KEY, loss.cardIndex}};
        return RESPONSE_LOSE_INFLUENCE_TAG;
    }
    auto operator()(const ExchangeChoiceResponse& choice) const
    {
        j[RESPONSE_PAYLOAD_KEY] = json {{RESPONSE_KEEP_KEY, choice.keep}};
        return RESPONSE_EXCHANGE_CHOICE_TAG;
    }

private:
    json& j;
};

const json& getPayload(const json& j)
{
    const auto& payload = j.at(RESPONSE_PAYLOAD_KEY);
    if (!payload.is_object()) {
        throw Messaging::SerializationFailureException {};
    }
    return payload;
}

const auto RESPONSES =
    std::map<std::string, std::function<Response(const json&)>> {
    { RESPONSE_PASS_TAG, [](const json&) { return Response {PassResponse {}}; }},
    { RESPONSE_CHALLENGE_TAG,
      [](const json&) { return Response {ChallengeResponse {}}; }},
    { RESPONSE_BLOCK_TAG,
      [](const json& j)
      {
          return Response {
              BlockResponse {
                  getPayload(j).at(RESPONSE_ROLE_KEY).get<Role>()}};
      }
    },
    { RESPONSE_LOSE_INFLUENCE_TAG,
      [](const json& j)
      {
          return Response {
              LoseInfluenceResponse {
                  Messaging::jsonToInteger<int>(
                      getPayload(j).at(RESPONSE_CARD_INDEX_KEY))}};
      }
    },
    { RESPONSE_EXCHANGE_CHOICE_TAG,
      [](const json& j)
      {
          return Response {
              ExchangeChoiceResponse {
                  getPayload(j).at(RESPONSE_KEEP_KEY)
                      .get<std::vector<std::string>>()}};
      }
    }};

}

void to_json(json& j, const Response& response)
{
    j[RESPONSE_TYPE_KEY] = std::visit(JsonSerializerVisitor {j}, response);
}

void from_json(const json& j, Response& response)
{
    const auto iter = RESPONSES.find(
        j.at(RESPONSE_TYPE_KEY).get<std::string>());
    if (iter != RESPONSES.end()) {
        response = iter->second(j);
    } else {
        throw Messaging::SerializationFailureException {};
    }
}

}
