#include "engine/ActionInitiator.hh"

#include "engine/GameState.hh"
#include "engine/ResponseResolver.hh"

#include <boost/format.hpp>

#include <string>
#include <utility>

namespace Coup {
namespace Engine {

namespace {

const Player* getValidTarget(
    const GameState& state, const std::optional<PlayerId>& targetId)
{
    if (!targetId) {
        return nullptr;
    }
    const auto target = state.getPlayer(*targetId);
    return (target && isAlive(*target)) ? target : nullptr;
}

Outcome reject(GameState& state, const Diagnostic diagnostic, std::string entry)
{
    state.appendLog(std::move(entry));
    return {diagnostic};
}

}

Outcome initiateAction(
    GameState& state, const PlayerId& actorId, const ActionType actionType,
    const std::optional<PlayerId>& targetId)
{
    const auto actor = state.getPlayer(actorId);
    if (!actor) {
        return {Diagnostic::UNKNOWN_PLAYER};
    }
    if (actionType != ActionType::COUP && actor->coins >= MANDATORY_COUP_COINS) {
        return reject(
            state, Diagnostic::MUST_COUP,
            (boost::format("%s has %d+ coins and must Coup.")
             % *actor % MANDATORY_COUP_COINS).str());
    }

    switch (actionType) {
    case ActionType::INCOME:
        actor->coins += INCOME_AMOUNT;
        state.appendLog(
            (boost::format("%s takes Income (+%d).")
             % *actor % INCOME_AMOUNT).str());
        state.finishTurn();
        return {};

    case ActionType::COUP:
    {
        const auto target = getValidTarget(state, targetId);
        if (!target) {
            return reject(
                state, Diagnostic::INVALID_TARGET, "Invalid Coup target.");
        }
        if (actor->coins < COUP_COST) {
            return reject(
                state, Diagnostic::INSUFFICIENT_COINS,
                (boost::format("%s cannot Coup (needs %d coins).")
                 % *actor % COUP_COST).str());
        }
        actor->coins -= COUP_COST;
        state.appendLog(
            (boost::format("%s launches a Coup on %s (%d coins).")
             % *actor % *target % COUP_COST).str());
        return beginLoseInfluence(
            state, target->id, LossReason::COUP, EndTurn {});
    }

    case ActionType::FOREIGN_AID:
        // Granted tentatively, revoked if the block stands
        actor->coins += FOREIGN_AID_AMOUNT;
        state.appendLog(
            (boost::format("%s attempts Foreign Aid (+%d).")
             % *actor % FOREIGN_AID_AMOUNT).str());
        state.setPendingAction(
            ForeignAidAwaitingBlock {
                actorId, state.makeRespondersExcept(actorId)});
        return {};

    case ActionType::TAX:
        state.appendLog(
            (boost::format("%s claims Duke for Tax (+%d).")
             % *actor % TAX_AMOUNT).str());
        state.setPendingAction(
            TaxAwaitingChallenge {
                actorId, state.makeRespondersExcept(actorId)});
        return {};

    case ActionType::ASSASSINATE:
    {
        const auto target = getValidTarget(state, targetId);
        if (!target || target->id == actorId) {
            return reject(
                state, Diagnostic::INVALID_TARGET,
                "Invalid Assassination target.");
        }
        if (actor->coins < ASSASSINATE_COST) {
            return reject(
                state, Diagnostic::INSUFFICIENT_COINS,
                (boost::format("%s cannot Assassinate (needs %d coins).")
                 % *actor % ASSASSINATE_COST).str());
        }
        actor->coins -= ASSASSINATE_COST;
        state.appendLog(
            (boost::format(
                "%s claims Assassin to assassinate %s (%d coins).")
             % *actor % *target % ASSASSINATE_COST).str());
        state.setPendingAction(
            AssassinateAwaitingChallenge {
                actorId, target->id, state.makeRespondersExcept(actorId)});
        return {};
    }

    case ActionType::STEAL:
    {
        const auto target = getValidTarget(state, targetId);
        if (!target || target->id == actorId) {
            return reject(
                state, Diagnostic::INVALID_TARGET, "Invalid Steal target.");
        }
        state.appendLog(
            (boost::format("%s claims Captain to steal from %s.")
             % *actor % *target).str());
        state.setPendingAction(
            StealAwaitingChallenge {
                actorId, target->id, state.makeRespondersExcept(actorId)});
        return {};
    }

    case ActionType::EXCHANGE:
        state.appendLog(
            (boost::format("%s claims Ambassador to Exchange.") % *actor).str());
        state.setPendingAction(
            ExchangeAwaitingChallenge {
                actorId, state.makeRespondersExcept(actorId)});
        return {};
    }

    return reject(
        state, Diagnostic::UNKNOWN_ACTION,
        (boost::format("Unknown action: %s")
         % static_cast<int>(actionType)).str());
}

Outcome initiateAction(
    GameState& state, const PlayerId& actorId,
    const std::string_view actionType, const std::optional<PlayerId>& targetId)
{
    if (const auto action_type = actionTypeFromString(actionType)) {
        return initiateAction(state, actorId, *action_type, targetId);
    }
    const auto actor = state.getPlayer(actorId);
    if (!actor) {
        return {Diagnostic::UNKNOWN_PLAYER};
    }
    if (actor->coins >= MANDATORY_COUP_COINS) {
        return reject(
            state, Diagnostic::MUST_COUP,
            (boost::format("%s has %d+ coins and must Coup.")
             % *actor % MANDATORY_COUP_COINS).str());
    }
    return reject(
        state, Diagnostic::UNKNOWN_ACTION,
        (boost::format("Unknown action: %s") % actionType).str());
}

}
}
