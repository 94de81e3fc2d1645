#include "engine/ActionInitiator.hh"
#include "engine/GameState.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace std::string_literals;

using Coup::ActionType;
using Coup::Role;
using Coup::Engine::Diagnostic;
using Coup::Engine::GameState;
using Coup::Engine::PendingAction;
using Coup::Engine::PlayerInfoVector;
using Coup::Engine::ResponseStatus;

class ActionInitiatorTest : public testing::Test {
protected:

    Diagnostic initiate(
        const ActionType actionType,
        const std::optional<Coup::PlayerId>& targetId = std::nullopt)
    {
        return Coup::Engine::initiateAction(
            state, "p1", actionType, targetId).diagnostic;
    }

    void setCoins(const Coup::PlayerId& playerId, const int coins)
    {
        state.getPlayer(playerId)->coins = coins;
    }

    void assertRejected(const Diagnostic expected, const Diagnostic actual)
    {
        EXPECT_EQ(expected, actual);
        EXPECT_FALSE(state.getPendingAction());
        EXPECT_EQ("p1", state.getCurrentPlayer()->id);
    }

    GameState state {
        PlayerInfoVector {{"p1", "Alice"}, {"p2", "Bob"}, {"p3", "Carol"}},
        Coup::makeStackedDeck(
            {{Role::ASSASSIN, Role::CAPTAIN},
             {Role::CONTESSA, Role::DUKE},
             {Role::AMBASSADOR, Role::DUKE}})};
};

TEST_F(ActionInitiatorTest, testIncome)
{
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::INCOME));
    EXPECT_EQ(3, state.getPlayer("p1")->coins);
    EXPECT_FALSE(state.getPendingAction());
    EXPECT_EQ("p2", state.getCurrentPlayer()->id);
    const auto& log = state.getLog();
    EXPECT_EQ("Alice takes Income (+1).", log[log.size() - 2]);
    EXPECT_EQ("It is now Bob's turn.", log.back());
}

TEST_F(ActionInitiatorTest, testCoup)
{
    setCoins("p1", 8);
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::COUP, "p2"s));
    EXPECT_EQ(1, state.getPlayer("p1")->coins);
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    EXPECT_EQ(
        (PendingAction {
            Coup::Engine::LoseInfluence {
                "p2", Coup::Engine::LossReason::COUP,
                Coup::Engine::EndTurn {}}}),
        *pending);
    EXPECT_EQ("Alice launches a Coup on Bob (7 coins).", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testCoupWithInsufficientCoins)
{
    setCoins("p1", 6);
    assertRejected(
        Diagnostic::INSUFFICIENT_COINS, initiate(ActionType::COUP, "p2"s));
    EXPECT_EQ(6, state.getPlayer("p1")->coins);
    EXPECT_EQ("Alice cannot Coup (needs 7 coins).", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testCoupWithoutTarget)
{
    setCoins("p1", 7);
    assertRejected(Diagnostic::INVALID_TARGET, initiate(ActionType::COUP));
    EXPECT_EQ(7, state.getPlayer("p1")->coins);
    EXPECT_EQ("Invalid Coup target.", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testCoupOnEliminatedPlayer)
{
    setCoins("p1", 7);
    state.loseInfluence("p2", 0);
    state.loseInfluence("p2", 1);
    assertRejected(
        Diagnostic::INVALID_TARGET, initiate(ActionType::COUP, "p2"s));
}

TEST_F(ActionInitiatorTest, testMustCoup)
{
    setCoins("p1", 10);
    for (const auto action_type : {
            ActionType::INCOME, ActionType::FOREIGN_AID, ActionType::TAX,
            ActionType::EXCHANGE}) {
        assertRejected(Diagnostic::MUST_COUP, initiate(action_type));
        EXPECT_EQ("Alice has 10+ coins and must Coup.", state.getLog().back());
    }
    for (const auto action_type : {
            ActionType::ASSASSINATE, ActionType::STEAL}) {
        assertRejected(Diagnostic::MUST_COUP, initiate(action_type, "p2"s));
        EXPECT_EQ("Alice has 10+ coins and must Coup.", state.getLog().back());
    }
    EXPECT_EQ(10, state.getPlayer("p1")->coins);
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::COUP, "p3"s));
}

TEST_F(ActionInitiatorTest, testMustCoupWithMoreThanTenCoins)
{
    setCoins("p1", 12);
    for (const auto action_type : {
            ActionType::INCOME, ActionType::FOREIGN_AID, ActionType::TAX,
            ActionType::EXCHANGE}) {
        assertRejected(Diagnostic::MUST_COUP, initiate(action_type));
    }
    for (const auto action_type : {
            ActionType::ASSASSINATE, ActionType::STEAL}) {
        assertRejected(Diagnostic::MUST_COUP, initiate(action_type, "p2"s));
    }
    EXPECT_EQ(12, state.getPlayer("p1")->coins);
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::COUP, "p2"s));
    EXPECT_EQ(5, state.getPlayer("p1")->coins);
}

TEST_F(ActionInitiatorTest, testForeignAid)
{
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::FOREIGN_AID));
    EXPECT_EQ(4, state.getPlayer("p1")->coins);
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    const auto stage = std::get_if<Coup::Engine::ForeignAidAwaitingBlock>(
        pending);
    ASSERT_TRUE(stage);
    EXPECT_EQ("p1", stage->actorId);
    EXPECT_FALSE(stage->responders.isEligible("p1"));
    EXPECT_EQ(ResponseStatus::PENDING, stage->responders.getStatus("p2"));
    EXPECT_EQ(ResponseStatus::PENDING, stage->responders.getStatus("p3"));
}

TEST_F(ActionInitiatorTest, testTax)
{
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::TAX));
    EXPECT_EQ(2, state.getPlayer("p1")->coins);
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    EXPECT_TRUE(
        std::holds_alternative<Coup::Engine::TaxAwaitingChallenge>(*pending));
    EXPECT_EQ(Role::DUKE, Coup::Engine::getClaimedRole(*pending));
    EXPECT_EQ("Alice claims Duke for Tax (+3).", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testAssassinate)
{
    setCoins("p1", 3);
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::ASSASSINATE, "p2"s));
    EXPECT_EQ(0, state.getPlayer("p1")->coins);
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    const auto stage =
        std::get_if<Coup::Engine::AssassinateAwaitingChallenge>(pending);
    ASSERT_TRUE(stage);
    EXPECT_EQ("p2", stage->targetId);
    EXPECT_TRUE(stage->responders.isEligible("p2"));
    EXPECT_TRUE(stage->responders.isEligible("p3"));
}

TEST_F(ActionInitiatorTest, testAssassinateWithInsufficientCoins)
{
    assertRejected(
        Diagnostic::INSUFFICIENT_COINS,
        initiate(ActionType::ASSASSINATE, "p2"s));
    EXPECT_EQ(2, state.getPlayer("p1")->coins);
    EXPECT_EQ(
        "Alice cannot Assassinate (needs 3 coins).", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testAssassinateSelf)
{
    setCoins("p1", 3);
    assertRejected(
        Diagnostic::INVALID_TARGET, initiate(ActionType::ASSASSINATE, "p1"s));
    EXPECT_EQ("Invalid Assassination target.", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testSteal)
{
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::STEAL, "p3"s));
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    const auto stage = std::get_if<Coup::Engine::StealAwaitingChallenge>(
        pending);
    ASSERT_TRUE(stage);
    EXPECT_EQ("p3", stage->targetId);
    EXPECT_EQ("Alice claims Captain to steal from Carol.", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testStealWithUnknownTarget)
{
    assertRejected(
        Diagnostic::INVALID_TARGET, initiate(ActionType::STEAL, "p9"s));
    EXPECT_EQ("Invalid Steal target.", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testExchange)
{
    EXPECT_EQ(Diagnostic::NONE, initiate(ActionType::EXCHANGE));
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    EXPECT_TRUE(
        std::holds_alternative<Coup::Engine::ExchangeAwaitingChallenge>(
            *pending));
    EXPECT_EQ("Alice claims Ambassador to Exchange.", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testUnknownPlayer)
{
    const auto log_count = state.getLogCount();
    EXPECT_EQ(
        Diagnostic::UNKNOWN_PLAYER,
        Coup::Engine::initiateAction(
            state, "p9", ActionType::INCOME, std::nullopt).diagnostic);
    EXPECT_EQ(log_count, state.getLogCount());
}

TEST_F(ActionInitiatorTest, testActionByName)
{
    EXPECT_EQ(
        Diagnostic::NONE,
        Coup::Engine::initiateAction(
            state, "p1", "income", std::nullopt).diagnostic);
    EXPECT_EQ(3, state.getPlayer("p1")->coins);
}

TEST_F(ActionInitiatorTest, testUnknownActionName)
{
    assertRejected(
        Diagnostic::UNKNOWN_ACTION,
        Coup::Engine::initiateAction(
            state, "p1", "bribe", std::nullopt).diagnostic);
    EXPECT_EQ("Unknown action: bribe", state.getLog().back());
}

TEST_F(ActionInitiatorTest, testUnknownActionNameWithTenCoins)
{
    setCoins("p1", 10);
    assertRejected(
        Diagnostic::MUST_COUP,
        Coup::Engine::initiateAction(
            state, "p1", "bribe", std::nullopt).diagnostic);
}
