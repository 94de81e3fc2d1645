#include "messaging/RoleJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Coup {

void to_json(json& j, const Role role)
{
    j = Messaging::enumToJson(role, ROLE_TO_STRING_MAP.left);
}

void from_json(const json& j, Role& role)
{
    role = Messaging::jsonToEnum<Role>(j, ROLE_TO_STRING_MAP.right);
}

}
