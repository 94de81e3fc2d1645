#include "engine/Exchange.hh"

#include "engine/GameState.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace Coup {
namespace Engine {

Outcome startExchangeChoice(GameState& state, const PlayerId& actorId)
{
    const auto actor = state.getPlayer(actorId);
    if (!actor || state.isGameOver()) {
        state.finishTurn();
        return {};
    }
    const auto slots = getUnrevealedSlots(*actor);
    const auto keep_count = static_cast<int>(slots.size());
    if (keep_count == 0) {
        state.finishTurn();
        return {};
    }

    auto options = ExchangeOptionVector {};
    auto seq = 0;
    for (const auto slot : slots) {
        options.emplace_back(
            ExchangeOption {
                "h" + std::to_string(seq++), actor->influence[slot].role});
    }
    for ([[maybe_unused]] const auto n : to(N_EXCHANGE_DRAWS)) {
        options.emplace_back(
            ExchangeOption {"d" + std::to_string(seq++), state.drawOne()});
    }

    const auto option_count = static_cast<int>(options.size());
    state.setExchangeSecret(actorId, ExchangeSecret {keep_count, options});
    state.setPendingAction(
        ExchangeAwaitingChoice {actorId, keep_count, option_count});
    log(LogLevel::DEBUG, "Exchange options sent to %s", actorId);

    auto outcome = Outcome {};
    outcome.privateMessages.emplace_back(
        PrivateMessage {
            actorId, ExchangeOptionsMessage {keep_count, std::move(options)}});
    return outcome;
}

Outcome completeExchangeChoice(
    GameState& state, const PlayerId& actorId,
    const ExchangeChoiceResponse& choice)
{
    const auto secret = state.getExchangeSecret(actorId);
    const auto actor = state.getPlayer(actorId);
    if (!secret || !actor) {
        return {Diagnostic::INVALID_CHOICE};
    }

    const auto keep = std::set<std::string>(
        choice.keep.begin(), choice.keep.end());
    if (std::ssize(keep) != secret->keepCount) {
        return {Diagnostic::INVALID_CHOICE};
    }
    auto chosen = std::vector<Role> {};
    auto returned = std::vector<Role> {};
    for (const auto& option : secret->options) {
        if (keep.contains(option.id)) {
            chosen.push_back(option.role);
        } else {
            returned.push_back(option.role);
        }
    }
    if (std::ssize(chosen) != secret->keepCount) {
        return {Diagnostic::INVALID_CHOICE};
    }
    const auto slots = getUnrevealedSlots(*actor);
    if (slots.size() != chosen.size()) {
        return {Diagnostic::INVALID_CHOICE};
    }

    for (const auto n : to(std::ssize(slots))) {
        actor->influence[slots[n]] = Card {chosen[n], false};
    }
    state.returnToDeck(returned);
    state.eraseExchangeSecret(actorId);
    state.appendLog(
        (boost::format("%s completes Exchange.") % *actor).str());
    state.finishTurn();
    return {};
}

}
}
