#include "engine/CoupEngine.hh"

#include "engine/ActionInitiator.hh"
#include "engine/ResponseResolver.hh"
#include "Logging.hh"

#include <algorithm>
#include <utility>

namespace Coup {
namespace Engine {

CoupEngine::CoupEngine(
    const PlayerInfoVector& players, Deck deck, const int logRetention) :
    state(players, std::move(deck), logRetention)
{
}

template<typename Function>
Outcome CoupEngine::process(const PlayerId& playerId, Function&& function)
{
    const auto log_count_before = state.getLogCount();
    auto outcome = std::forward<Function>(function)();

    const auto& game_log = state.getLog();
    const auto n_new_entries = std::min(
        state.getLogCount() - log_count_before,
        static_cast<long>(game_log.size()));
    outcome.log.assign(game_log.end() - n_new_entries, game_log.end());

    if (outcome.diagnostic != Diagnostic::NONE) {
        log(LogLevel::DEBUG, "Request from %s rejected: %s", playerId,
            outcome.diagnostic);
    } else if (!state.getPendingAction()) {
        log(LogLevel::INFO, "Turn completed, %s",
            state.isGameOver() ? "game over" : "next turn started");
    }
    return outcome;
}

Outcome CoupEngine::initiate(
    const PlayerId& actorId, const ActionType actionType,
    const std::optional<PlayerId>& targetId)
{
    return process(
        actorId,
        [&]() -> Outcome
        {
            if (state.isGameOver()) {
                return {Diagnostic::GAME_OVER};
            }
            if (state.getPendingAction()) {
                return {Diagnostic::ACTION_PENDING};
            }
            return initiateAction(state, actorId, actionType, targetId);
        });
}

Outcome CoupEngine::initiate(
    const PlayerId& actorId, const std::string_view actionType,
    const std::optional<PlayerId>& targetId)
{
    return process(
        actorId,
        [&]() -> Outcome
        {
            if (state.isGameOver()) {
                return {Diagnostic::GAME_OVER};
            }
            if (state.getPendingAction()) {
                return {Diagnostic::ACTION_PENDING};
            }
            return initiateAction(state, actorId, actionType, targetId);
        });
}

Outcome CoupEngine::respond(const PlayerId& playerId, const Response& response)
{
    return process(
        playerId,
        [&]() -> Outcome
        {
            if (state.isGameOver()) {
                return {Diagnostic::GAME_OVER};
            }
            return resolveResponse(state, playerId, response);
        });
}

GameView CoupEngine::getViewFor(const std::optional<PlayerId>& viewerId) const
{
    return state.getViewFor(viewerId);
}

const GameState& CoupEngine::getState() const
{
    return state;
}

}
}
