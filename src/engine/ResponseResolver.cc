#include "engine/ResponseResolver.hh"

#include "engine/Exchange.hh"
#include "engine/GameState.hh"
#include "Logging.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <utility>

namespace Coup {
namespace Engine {

namespace {

void applySteal(
    GameState& state, const PlayerId& actorId, const PlayerId& targetId)
{
    const auto actor = state.getPlayer(actorId);
    const auto target = state.getPlayer(targetId);
    if (!actor || !target) {
        return;
    }
    const auto amount = std::min(STEAL_AMOUNT, target->coins);
    target->coins -= amount;
    actor->coins += amount;
    state.appendLog(
        (boost::format("%s steals %d coin(s) from %s.")
         % *actor % amount % *target).str());
}

void appendChallengeLog(
    GameState& state, const PlayerId& challengerId, const bool block,
    const bool success)
{
    const auto challenger = state.getPlayer(challengerId);
    state.appendLog(
        (boost::format("%s challenges%s — %s.")
         % *challenger % (block ? " block" : "")
         % (success ? "SUCCESS" : "FAILED")).str());
}

Outcome finishTurn(GameState& state)
{
    state.finishTurn();
    return {};
}

// Records a pass or a challenge, the only responses accepted in a stage
// where claims may be challenged
Diagnostic recordChallengeResponse(
    Responders& responders, const PlayerId& playerId,
    const Response& response)
{
    if (!responders.isEligible(playerId)) {
        return Diagnostic::NOT_ELIGIBLE;
    }
    if (std::holds_alternative<PassResponse>(response)) {
        responders.record(playerId, ResponseStatus::PASSED);
    } else if (std::holds_alternative<ChallengeResponse>(response)) {
        responders.record(playerId, ResponseStatus::CHALLENGED);
    } else {
        return Diagnostic::UNEXPECTED_RESPONSE;
    }
    return Diagnostic::NONE;
}

class ResponseVisitor {
public:

    ResponseVisitor(
        GameState& state, const PlayerId& playerId, const Response& response) :
        state {state},
        playerId {playerId},
        response {response}
    {
    }

    Outcome operator()(const LoseInfluence& stage) const
    {
        if (playerId != stage.playerId) {
            return {Diagnostic::NOT_ELIGIBLE};
        }
        const auto loss = std::get_if<LoseInfluenceResponse>(&response);
        if (!loss) {
            return {Diagnostic::UNEXPECTED_RESPONSE};
        }
        if (!state.loseInfluence(playerId, loss->cardIndex)) {
            return {Diagnostic::INVALID_CARD};
        }
        state.clearPendingAction();
        return continueAfterLoss(state, stage.continuation);
    }

    Outcome operator()(TaxAwaitingChallenge& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.actorId, Role::DUKE)) {
                appendChallengeLog(state, *challenger_id, false, false);
                state.revealAndRedraw(stage.actorId, Role::DUKE);
                takeTax(stage.actorId);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    EndTurn {});
            }
            appendChallengeLog(state, *challenger_id, false, true);
            state.appendLog("Tax fails.");
            return beginLoseInfluence(
                state, stage.actorId, LossReason::LOST_CHALLENGE, EndTurn {});
        }
        if (stage.responders.haveAllPassed()) {
            takeTax(stage.actorId);
            return finishTurn(state);
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(ForeignAidAwaitingBlock& stage) const
    {
        if (!stage.responders.isEligible(playerId)) {
            return {Diagnostic::NOT_ELIGIBLE};
        }
        if (const auto block = std::get_if<BlockResponse>(&response)) {
            if (block->role != Role::DUKE) {
                return {Diagnostic::UNEXPECTED_RESPONSE};
            }
            state.appendLog(
                (boost::format("%s blocks Foreign Aid with Duke.")
                 % *state.getPlayer(playerId)).str());
            state.setPendingAction(
                ForeignAidAwaitingChallengeBlock {
                    stage.actorId, playerId,
                    state.makeRespondersExcept(playerId)});
            return {};
        }
        if (!std::holds_alternative<PassResponse>(response)) {
            return {Diagnostic::UNEXPECTED_RESPONSE};
        }
        stage.responders.record(playerId, ResponseStatus::PASSED);
        if (stage.responders.haveAllPassed()) {
            state.appendLog("Foreign Aid succeeds.");
            return finishTurn(state);
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(ForeignAidAwaitingChallengeBlock& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.blockerId, Role::DUKE)) {
                appendChallengeLog(state, *challenger_id, true, false);
                state.revealAndRedraw(stage.blockerId, Role::DUKE);
                revokeForeignAid(stage.actorId);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    EndTurn {});
            }
            appendChallengeLog(state, *challenger_id, true, true);
            state.appendLog("Block fails. Foreign Aid succeeds.");
            return beginLoseInfluence(
                state, stage.blockerId, LossReason::LOST_CHALLENGE,
                EndTurn {});
        }
        if (stage.responders.haveAllPassed()) {
            revokeForeignAid(stage.actorId);
            return finishTurn(state);
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(AssassinateAwaitingChallenge& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.actorId, Role::ASSASSIN)) {
                appendChallengeLog(state, *challenger_id, false, false);
                state.revealAndRedraw(stage.actorId, Role::ASSASSIN);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    AssassinateOpenBlock {stage.actorId, stage.targetId});
            }
            appendChallengeLog(state, *challenger_id, false, true);
            state.appendLog("Assassination fails.");
            return beginLoseInfluence(
                state, stage.actorId, LossReason::LOST_CHALLENGE, EndTurn {});
        }
        if (stage.responders.haveAllPassed()) {
            return continueAfterLoss(
                state, AssassinateOpenBlock {stage.actorId, stage.targetId});
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(const AssassinateAwaitingBlock& stage) const
    {
        if (!stage.responders.isEligible(playerId)) {
            return {Diagnostic::NOT_ELIGIBLE};
        }
        const auto actor_id = stage.actorId;
        const auto target_id = stage.targetId;
        if (std::holds_alternative<PassResponse>(response)) {
            return beginLoseInfluence(
                state, target_id, LossReason::ASSASSINATED,
                EndTurnAfterAssassination {target_id});
        }
        const auto block = std::get_if<BlockResponse>(&response);
        if (!block || block->role != Role::CONTESSA) {
            return {Diagnostic::UNEXPECTED_RESPONSE};
        }
        state.appendLog(
            (boost::format("%s blocks the assassination with Contessa.")
             % *state.getPlayer(target_id)).str());
        state.setPendingAction(
            AssassinateAwaitingChallengeBlock {
                actor_id, target_id, state.makeRespondersExcept(target_id)});
        return {};
    }

    Outcome operator()(AssassinateAwaitingChallengeBlock& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.targetId, Role::CONTESSA)) {
                appendChallengeLog(state, *challenger_id, true, false);
                state.revealAndRedraw(stage.targetId, Role::CONTESSA);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    AssassinateBlockStands {});
            }
            appendChallengeLog(state, *challenger_id, true, true);
            return beginLoseInfluence(
                state, stage.targetId, LossReason::LOST_CHALLENGE,
                AssassinateForceTargetLoss {stage.actorId, stage.targetId});
        }
        if (stage.responders.haveAllPassed()) {
            return continueAfterLoss(state, AssassinateBlockStands {});
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(StealAwaitingChallenge& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.actorId, Role::CAPTAIN)) {
                appendChallengeLog(state, *challenger_id, false, false);
                state.revealAndRedraw(stage.actorId, Role::CAPTAIN);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    StealOpenBlock {stage.actorId, stage.targetId});
            }
            appendChallengeLog(state, *challenger_id, false, true);
            state.appendLog("Steal fails.");
            return beginLoseInfluence(
                state, stage.actorId, LossReason::LOST_CHALLENGE, EndTurn {});
        }
        if (stage.responders.haveAllPassed()) {
            return continueAfterLoss(
                state, StealOpenBlock {stage.actorId, stage.targetId});
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(const StealAwaitingBlock& stage) const
    {
        if (!stage.responders.isEligible(playerId)) {
            return {Diagnostic::NOT_ELIGIBLE};
        }
        const auto actor_id = stage.actorId;
        const auto target_id = stage.targetId;
        if (std::holds_alternative<PassResponse>(response)) {
            return continueAfterLoss(state, StealApply {actor_id, target_id});
        }
        const auto block = std::get_if<BlockResponse>(&response);
        if (!block ||
            (block->role != Role::CAPTAIN && block->role != Role::AMBASSADOR)) {
            return {Diagnostic::UNEXPECTED_RESPONSE};
        }
        const auto role = block->role;
        state.appendLog(
            (boost::format("%s blocks the steal with %s.")
             % *state.getPlayer(target_id) % role).str());
        state.setPendingAction(
            StealAwaitingChallengeBlock {
                actor_id, target_id, role,
                state.makeRespondersExcept(target_id)});
        return {};
    }

    Outcome operator()(StealAwaitingChallengeBlock& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.targetId, stage.blockRole)) {
                appendChallengeLog(state, *challenger_id, true, false);
                state.revealAndRedraw(stage.targetId, stage.blockRole);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    StealBlockStands {});
            }
            appendChallengeLog(state, *challenger_id, true, true);
            return beginLoseInfluence(
                state, stage.targetId, LossReason::LOST_CHALLENGE,
                StealApplyAfterBlockFail {stage.actorId, stage.targetId});
        }
        if (stage.responders.haveAllPassed()) {
            return continueAfterLoss(state, StealBlockStands {});
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(ExchangeAwaitingChallenge& stage) const
    {
        if (const auto d = recordChallengeResponse(
                stage.responders, playerId, response);
            d != Diagnostic::NONE) {
            return {d};
        }
        if (const auto challenger_id = stage.responders.getFirstChallenger()) {
            if (state.playerHasRole(stage.actorId, Role::AMBASSADOR)) {
                appendChallengeLog(state, *challenger_id, false, false);
                state.revealAndRedraw(stage.actorId, Role::AMBASSADOR);
                return beginLoseInfluence(
                    state, *challenger_id, LossReason::FAILED_CHALLENGE,
                    ExchangeStartChoice {stage.actorId});
            }
            appendChallengeLog(state, *challenger_id, false, true);
            state.appendLog("Exchange fails.");
            return beginLoseInfluence(
                state, stage.actorId, LossReason::LOST_CHALLENGE, EndTurn {});
        }
        if (stage.responders.haveAllPassed()) {
            return startExchangeChoice(state, stage.actorId);
        }
        state.setPendingAction(std::move(stage));
        return {};
    }

    Outcome operator()(const ExchangeAwaitingChoice& stage) const
    {
        if (playerId != stage.actorId) {
            return {Diagnostic::NOT_ELIGIBLE};
        }
        const auto choice = std::get_if<ExchangeChoiceResponse>(&response);
        if (!choice) {
            return {Diagnostic::UNEXPECTED_RESPONSE};
        }
        return completeExchangeChoice(state, stage.actorId, *choice);
    }

private:

    void takeTax(const PlayerId& actorId) const
    {
        const auto actor = state.getPlayer(actorId);
        actor->coins += TAX_AMOUNT;
        state.appendLog(
            (boost::format("%s takes Tax (+%d).") % *actor % TAX_AMOUNT).str());
    }

    void revokeForeignAid(const PlayerId& actorId) const
    {
        state.getPlayer(actorId)->coins -= FOREIGN_AID_AMOUNT;
        state.appendLog("Foreign Aid is blocked.");
    }

    GameState& state;
    const PlayerId& playerId;
    const Response& response;
};

class ContinuationVisitor {
public:

    explicit ContinuationVisitor(GameState& state) : state {state} {}

    Outcome operator()(const EndTurn&) const
    {
        return finishTurn(state);
    }

    Outcome operator()(const AssassinateOpenBlock& c) const
    {
        if (state.isGameOver() || !state.isAlive(c.targetId)) {
            return finishTurn(state);
        }
        state.setPendingAction(
            AssassinateAwaitingBlock {
                c.actorId, c.targetId, Responders::addressedTo(c.targetId)});
        return {};
    }

    Outcome operator()(const AssassinateBlockStands&) const
    {
        state.appendLog("Assassination is blocked.");
        return finishTurn(state);
    }

    Outcome operator()(const AssassinateForceTargetLoss& c) const
    {
        return beginLoseInfluence(
            state, c.targetId, LossReason::ASSASSINATED,
            EndTurnAfterAssassination {c.targetId});
    }

    Outcome operator()(const EndTurnAfterAssassination& c) const
    {
        if (const auto target = state.getPlayer(c.targetId)) {
            state.appendLog(
                (boost::format("%s is assassinated.") % *target).str());
        }
        return finishTurn(state);
    }

    Outcome operator()(const StealOpenBlock& c) const
    {
        if (state.isGameOver() || !state.isAlive(c.targetId)) {
            applySteal(state, c.actorId, c.targetId);
            return finishTurn(state);
        }
        state.setPendingAction(
            StealAwaitingBlock {
                c.actorId, c.targetId, Responders::addressedTo(c.targetId)});
        return {};
    }

    Outcome operator()(const StealApply& c) const
    {
        applySteal(state, c.actorId, c.targetId);
        return finishTurn(state);
    }

    Outcome operator()(const StealBlockStands&) const
    {
        state.appendLog("Steal is blocked.");
        return finishTurn(state);
    }

    Outcome operator()(const StealApplyAfterBlockFail& c) const
    {
        applySteal(state, c.actorId, c.targetId);
        return finishTurn(state);
    }

    Outcome operator()(const ExchangeStartChoice& c) const
    {
        return startExchangeChoice(state, c.actorId);
    }

private:

    GameState& state;
};

}

Outcome resolveResponse(
    GameState& state, const PlayerId& playerId, const Response& response)
{
    const auto pending = state.getPendingAction();
    if (!pending) {
        return {Diagnostic::NO_PENDING_ACTION};
    }
    // The stage is copied because the visitor may replace the pending action
    auto stage = *pending;
    return std::visit(ResponseVisitor {state, playerId, response}, stage);
}

Outcome beginLoseInfluence(
    GameState& state, const PlayerId& playerId, const LossReason reason,
    Continuation continuation)
{
    const auto player = state.getPlayer(playerId);
    if (state.isGameOver() || !player || !isAlive(*player)) {
        log(LogLevel::DEBUG,
            "Skipping influence loss of %s, continuing with %s",
            playerId, continuation);
        return continueAfterLoss(state, continuation);
    }
    state.setPendingAction(
        LoseInfluence {playerId, reason, std::move(continuation)});
    return {};
}

Outcome continueAfterLoss(GameState& state, const Continuation& continuation)
{
    return std::visit(ContinuationVisitor {state}, continuation);
}

}
}
