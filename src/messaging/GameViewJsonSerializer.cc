#include "messaging/GameViewJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"
#include "messaging/PendingActionJsonSerializer.hh"
#include "messaging/RoleJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"
#include "Utility.hh"

#include <optional>
#include <vector>

using nlohmann::json;

namespace Coup {
namespace Engine {

const std::string GAME_VIEW_PLAYERS_KEY {"players"};
const std::string GAME_VIEW_LOG_KEY {"log"};
const std::string GAME_VIEW_PENDING_ACTION_KEY {"pendingAction"};
const std::string GAME_VIEW_TURN_PLAYER_ID_KEY {"turnPlayerId"};
const std::string GAME_VIEW_GAME_OVER_KEY {"gameOver"};
const std::string GAME_VIEW_WINNER_ID_KEY {"winnerId"};

namespace {

const std::string CARD_ROLE_KEY {"role"};
const std::string CARD_REVEALED_KEY {"revealed"};
const std::string PLAYER_ID_KEY {"id"};
const std::string PLAYER_NAME_KEY {"name"};
const std::string PLAYER_COINS_KEY {"coins"};
const std::string PLAYER_ALIVE_KEY {"alive"};
const std::string PLAYER_INFLUENCE_KEY {"influence"};

class JsonSerializerVisitor {
public:
    JsonSerializerVisitor(json& j) : j {j} {}

    void operator()(const HiddenCard&) const
    {
        j[CARD_ROLE_KEY] = nullptr;
        j[CARD_REVEALED_KEY] = false;
    }
    void operator()(const VisibleCard& card) const
    {
        j[CARD_ROLE_KEY] = card.role;
        j[CARD_REVEALED_KEY] = card.revealed;
    }

private:
    json& j;
};

}

void to_json(json& j, const CardView& card)
{
    std::visit(JsonSerializerVisitor {j}, card);
}

void from_json(const json& j, CardView& card)
{
    const auto& role = j.at(CARD_ROLE_KEY);
    const auto revealed = j.at(CARD_REVEALED_KEY).get<bool>();
    if (role.is_null()) {
        if (revealed) {
            throw Messaging::SerializationFailureException {};
        }
        card = HiddenCard {};
    } else {
        card = VisibleCard {role.get<Role>(), revealed};
    }
}

void to_json(json& j, const PlayerView& player)
{
    j[PLAYER_ID_KEY] = player.id;
    j[PLAYER_NAME_KEY] = player.name;
    j[PLAYER_COINS_KEY] = player.coins;
    j[PLAYER_ALIVE_KEY] = player.alive;
    auto& influence = j[PLAYER_INFLUENCE_KEY] = json::array();
    for (const auto& card : player.influence) {
        influence.push_back(card);
    }
}

void from_json(const json& j, PlayerView& player)
{
    player.id = j.at(PLAYER_ID_KEY).get<PlayerId>();
    player.name = j.at(PLAYER_NAME_KEY).get<std::string>();
    player.coins = Messaging::validate(
        Messaging::jsonToInteger<int>(j.at(PLAYER_COINS_KEY)),
        [](const auto n) { return n >= 0; });
    player.alive = j.at(PLAYER_ALIVE_KEY).get<bool>();
    const auto& influence = j.at(PLAYER_INFLUENCE_KEY);
    if (!influence.is_array() ||
        influence.size() != player.influence.size()) {
        throw Messaging::SerializationFailureException {};
    }
    for (const auto n : to(N_CARDS_PER_PLAYER)) {
        player.influence[n] = influence[n].get<CardView>();
    }
}

void to_json(json& j, const GameView& view)
{
    j[GAME_VIEW_PLAYERS_KEY] = view.players;
    j[GAME_VIEW_LOG_KEY] = view.log;
    j[GAME_VIEW_PENDING_ACTION_KEY] = view.pendingAction;
    j[GAME_VIEW_TURN_PLAYER_ID_KEY] = view.turnPlayerId;
    j[GAME_VIEW_GAME_OVER_KEY] = view.gameOver;
    j[GAME_VIEW_WINNER_ID_KEY] = view.winnerId;
}

void from_json(const json& j, GameView& view)
{
    view.players = j.at(GAME_VIEW_PLAYERS_KEY).get<std::vector<PlayerView>>();
    view.log = j.at(GAME_VIEW_LOG_KEY).get<std::vector<std::string>>();
    view.pendingAction = j.at(GAME_VIEW_PENDING_ACTION_KEY)
        .get<std::optional<PendingAction>>();
    view.turnPlayerId = j.at(GAME_VIEW_TURN_PLAYER_ID_KEY)
        .get<std::optional<PlayerId>>();
    view.gameOver = j.at(GAME_VIEW_GAME_OVER_KEY).get<bool>();
    view.winnerId = j.at(GAME_VIEW_WINNER_ID_KEY)
        .get<std::optional<PlayerId>>();
}

}
}
