#include "messaging/ActionTypeJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Coup {

void to_json(json& j, const ActionType actionType)
{
    j = Messaging::enumToJson(actionType, ACTION_TYPE_TO_STRING_MAP.left);
}

void from_json(const json& j, ActionType& actionType)
{
    actionType = Messaging::jsonToEnum<ActionType>(
        j, ACTION_TYPE_TO_STRING_MAP.right);
}

}
