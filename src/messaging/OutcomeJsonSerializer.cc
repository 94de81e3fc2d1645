#include "messaging/OutcomeJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"
#include "messaging/RoleJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"

using nlohmann::json;

namespace Coup {
namespace Engine {

const std::string OUTCOME_DIAGNOSTIC_KEY {"diagnostic"};
const std::string OUTCOME_LOG_KEY {"log"};
const std::string OUTCOME_PRIVATE_KEY {"private"};
const std::string PRIVATE_MESSAGE_TO_KEY {"to"};
const std::string PRIVATE_MESSAGE_MSG_KEY {"msg"};

namespace {

const std::string MSG_TYPE_KEY {"type"};
const std::string MSG_KIND_KEY {"kind"};
const std::string MSG_KEEP_COUNT_KEY {"keepCount"};
const std::string MSG_OPTIONS_KEY {"options"};
const std::string MSG_PRIVATE_TAG {"private"};
const std::string MSG_EXCHANGE_OPTIONS_TAG {"exchangeOptions"};
const std::string OPTION_ID_KEY {"id"};
const std::string OPTION_ROLE_KEY {"role"};

void checkTag(const json& j, const std::string& key, const std::string& tag)
{
    if (j.at(key) != json(tag)) {
        throw Messaging::SerializationFailureException {};
    }
}

}

void to_json(json& j, const Diagnostic diagnostic)
{
    j = Messaging::enumToJson(diagnostic, DIAGNOSTIC_TO_STRING_MAP.left);
}

void from_json(const json& j, Diagnostic& diagnostic)
{
    diagnostic = Messaging::jsonToEnum<Diagnostic>(
        j, DIAGNOSTIC_TO_STRING_MAP.right);
}

void to_json(json& j, const ExchangeOption& option)
{
    j.emplace(OPTION_ID_KEY, option.id);
    j.emplace(OPTION_ROLE_KEY, option.role);
}

void from_json(const json& j, ExchangeOption& option)
{
    option.id = j.at(OPTION_ID_KEY).get<std::string>();
    option.role = j.at(OPTION_ROLE_KEY).get<Role>();
}

void to_json(json& j, const PrivateMessage& message)
{
    j[PRIVATE_MESSAGE_TO_KEY] = message.recipient;
    j[PRIVATE_MESSAGE_MSG_KEY] = json {
        {MSG_TYPE_KEY, MSG_PRIVATE_TAG},
        {MSG_KIND_KEY, MSG_EXCHANGE_OPTIONS_TAG},
        {MSG_KEEP_COUNT_KEY, message.message.keepCount},
        {MSG_OPTIONS_KEY, message.message.options},
    };
}

void from_json(const json& j, PrivateMessage& message)
{
    message.recipient = j.at(PRIVATE_MESSAGE_TO_KEY).get<PlayerId>();
    const auto& msg = j.at(PRIVATE_MESSAGE_MSG_KEY);
    checkTag(msg, MSG_TYPE_KEY, MSG_PRIVATE_TAG);
    checkTag(msg, MSG_KIND_KEY, MSG_EXCHANGE_OPTIONS_TAG);
    message.message.keepCount = Messaging::validate(
        Messaging::jsonToInteger<int>(msg.at(MSG_KEEP_COUNT_KEY)),
        [](const auto n) { return n > 0; });
    message.message.options =
        msg.at(MSG_OPTIONS_KEY).get<ExchangeOptionVector>();
}

void to_json(json& j, const Outcome& outcome)
{
    j[OUTCOME_DIAGNOSTIC_KEY] = outcome.diagnostic;
    j[OUTCOME_LOG_KEY] = outcome.log;
    j[OUTCOME_PRIVATE_KEY] = outcome.privateMessages;
}

}
}
