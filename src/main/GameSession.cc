#include "main/GameSession.hh"

#include "main/Config.hh"
#include "messaging/GameViewJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/OutcomeJsonSerializer.hh"
#include "messaging/ResponseJsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"
#include "Logging.hh"

#include <nlohmann/json.hpp>

#include <istream>
#include <optional>
#include <ostream>

using nlohmann::json;

namespace Coup {
namespace Main {

namespace {

const std::string COMMAND_KEY {"command"};
const std::string PLAYER_KEY {"player"};
const std::string ACTION_KEY {"action"};
const std::string TARGET_KEY {"target"};
const std::string RESPONSE_KEY {"response"};
const std::string VIEW_KEY {"view"};
const std::string ERROR_KEY {"error"};
const std::string INITIATE_COMMAND {"initiate"};
const std::string RESPOND_COMMAND {"respond"};
const std::string VIEW_COMMAND {"view"};
const std::string MALFORMED_REQUEST {"malformed request"};

Engine::PlayerInfoVector getPlayersOrDefault(const Config& config)
{
    if (const auto& players = config.getPlayers(); !players.empty()) {
        return players;
    }
    return {{"p1", "p1"}, {"p2", "p2"}};
}

template<typename T>
std::optional<T> optionalGet(const json& j, const std::string& key)
{
    const auto iter = j.find(key);
    if (iter == j.end() || iter->is_null()) {
        return std::nullopt;
    }
    return iter->get<T>();
}

}

GameSession::GameSession(const Config& config) :
    engine {getPlayersOrDefault(config), Deck {}, config.getLogRetention()}
{
}

std::string GameSession::processRequest(const std::string_view request)
{
    try {
        const auto j = json::parse(request);
        const auto command = j.at(COMMAND_KEY).get<std::string>();
        const auto player_id = optionalGet<PlayerId>(j, PLAYER_KEY);
        auto outcome = Engine::Outcome {};
        if (command == INITIATE_COMMAND && player_id) {
            const auto action = j.at(ACTION_KEY).get<std::string>();
            const auto target_id = optionalGet<PlayerId>(j, TARGET_KEY);
            const auto& state = engine.getState();
            const auto current_player = state.getCurrentPlayer();
            if (current_player && current_player->id != *player_id &&
                state.getPlayer(*player_id)) {
                log(LogLevel::DEBUG, "%s tried to act out of turn",
                    *player_id);
                outcome.diagnostic = Engine::Diagnostic::NOT_ELIGIBLE;
            } else {
                outcome = engine.initiate(*player_id, action, target_id);
            }
        } else if (command == RESPOND_COMMAND && player_id) {
            const auto response = j.at(RESPONSE_KEY).get<Response>();
            outcome = engine.respond(*player_id, response);
        } else if (command != VIEW_COMMAND) {
            throw Messaging::SerializationFailureException {};
        }
        auto reply = json(outcome);
        reply[VIEW_KEY] = engine.getViewFor(player_id);
        return reply.dump();
    } catch (const json::exception& e) {
        log(LogLevel::DEBUG, "Malformed request: %s", e.what());
    } catch (const Messaging::SerializationFailureException&) {
        log(LogLevel::DEBUG, "Malformed request: %s", request);
    }
    return json {{ERROR_KEY, MALFORMED_REQUEST}}.dump();
}

void GameSession::run(std::istream& in, std::ostream& out)
{
    auto line = std::string {};
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        out << processRequest(line) << std::endl;
    }
}

const Engine::CoupEngine& GameSession::getEngine() const
{
    return engine;
}

}
}
