#include "coup/ActionType.hh"

#include <array>
#include <ostream>

namespace Coup {

namespace {

const auto ACTION_TYPE_NAMES = std::array {
    ActionTypeToStringMap::value_type {ActionType::INCOME, "income"},
    ActionTypeToStringMap::value_type {ActionType::COUP, "coup"},
    ActionTypeToStringMap::value_type {ActionType::FOREIGN_AID, "foreign_aid"},
    ActionTypeToStringMap::value_type {ActionType::TAX, "tax"},
    ActionTypeToStringMap::value_type {ActionType::ASSASSINATE, "assassinate"},
    ActionTypeToStringMap::value_type {ActionType::STEAL, "steal"},
    ActionTypeToStringMap::value_type {ActionType::EXCHANGE, "exchange"},
};

}

const ActionTypeToStringMap ACTION_TYPE_TO_STRING_MAP(
    ACTION_TYPE_NAMES.begin(), ACTION_TYPE_NAMES.end());

std::optional<ActionType> actionTypeFromString(const std::string_view name)
{
    const auto iter = ACTION_TYPE_TO_STRING_MAP.right.find(std::string {name});
    if (iter != ACTION_TYPE_TO_STRING_MAP.right.end()) {
        return iter->second;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const ActionType actionType)
{
    return os << ACTION_TYPE_TO_STRING_MAP.left.at(actionType);
}

}
