#include "engine/CoupEngine.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <variant>

using namespace std::string_literals;

using Coup::ActionType;
using Coup::LoseInfluenceResponse;
using Coup::PassResponse;
using Coup::Role;
using Coup::Engine::CoupEngine;
using Coup::Engine::Diagnostic;
using Coup::Engine::Outcome;
using Coup::Engine::PlayerInfoVector;

using testing::ElementsAre;
using testing::IsEmpty;

namespace {

const auto PLAYERS = PlayerInfoVector {{"p1", "Alice"}, {"p2", "Bob"}};

}

class CoupEngineTest : public testing::Test {
protected:

    void expectAccepted(const Outcome& outcome)
    {
        EXPECT_EQ(Diagnostic::NONE, outcome.diagnostic);
    }

    void assassinateBob(const int cardIndex)
    {
        expectAccepted(engine.initiate("p1", ActionType::ASSASSINATE, "p2"s));
        expectAccepted(engine.respond("p2", PassResponse {}));
        expectAccepted(engine.respond("p2", PassResponse {}));
        expectAccepted(engine.respond("p2", LoseInfluenceResponse {cardIndex}));
    }

    void taxForAlice()
    {
        expectAccepted(engine.initiate("p1", ActionType::TAX));
        expectAccepted(engine.respond("p2", PassResponse {}));
    }

    CoupEngine engine {
        PLAYERS,
        Coup::makeStackedDeck(
            {{Role::DUKE, Role::ASSASSIN}, {Role::CAPTAIN, Role::AMBASSADOR}})};
};

TEST_F(CoupEngineTest, testInvalidPlayers)
{
    EXPECT_THROW(
        CoupEngine(PlayerInfoVector {{"p1", "Alice"}}), std::invalid_argument);
}

TEST_F(CoupEngineTest, testOutcomeContainsNewLogEntries)
{
    const auto outcome = engine.initiate("p1", "income");
    expectAccepted(outcome);
    EXPECT_THAT(
        outcome.log,
        ElementsAre("Alice takes Income (+1).", "It is now Bob's turn."));
    EXPECT_THAT(outcome.privateMessages, IsEmpty());
}

TEST_F(CoupEngineTest, testRejectedActionContainsReason)
{
    const auto outcome = engine.initiate("p1", "bribe");
    EXPECT_EQ(Diagnostic::UNKNOWN_ACTION, outcome.diagnostic);
    EXPECT_THAT(outcome.log, ElementsAre("Unknown action: bribe"));
}

TEST_F(CoupEngineTest, testActionPending)
{
    expectAccepted(engine.initiate("p1", ActionType::TAX));
    const auto outcome = engine.initiate("p1", ActionType::INCOME);
    EXPECT_EQ(Diagnostic::ACTION_PENDING, outcome.diagnostic);
    EXPECT_THAT(outcome.log, IsEmpty());
    EXPECT_EQ(2, engine.getState().getPlayer("p1")->coins);
}

TEST_F(CoupEngineTest, testRespondWithoutPendingAction)
{
    const auto outcome = engine.respond("p2", PassResponse {});
    EXPECT_EQ(Diagnostic::NO_PENDING_ACTION, outcome.diagnostic);
    EXPECT_THAT(outcome.log, IsEmpty());
}

TEST_F(CoupEngineTest, testViewFor)
{
    const auto view = engine.getViewFor("p2"s);
    EXPECT_TRUE(
        std::holds_alternative<Coup::Engine::HiddenCard>(
            view.players[0].influence[0]));
    EXPECT_TRUE(
        std::holds_alternative<Coup::Engine::VisibleCard>(
            view.players[1].influence[0]));
    EXPECT_EQ("p1", view.turnPlayerId);
}

TEST_F(CoupEngineTest, testGameOver)
{
    taxForAlice();
    expectAccepted(engine.initiate("p2", ActionType::INCOME));
    assassinateBob(0);
    expectAccepted(engine.initiate("p2", ActionType::INCOME));
    taxForAlice();
    expectAccepted(engine.initiate("p2", ActionType::INCOME));

    expectAccepted(engine.initiate("p1", ActionType::ASSASSINATE, "p2"s));
    expectAccepted(engine.respond("p2", PassResponse {}));
    expectAccepted(engine.respond("p2", PassResponse {}));
    const auto outcome = engine.respond("p2", LoseInfluenceResponse {1});
    expectAccepted(outcome);
    EXPECT_THAT(
        outcome.log,
        ElementsAre(
            "Bob loses influence (Ambassador revealed).", "Alice wins!",
            "Bob is assassinated."));

    const auto& state = engine.getState();
    EXPECT_TRUE(state.isGameOver());
    EXPECT_EQ("p1", state.getWinnerId());
    EXPECT_EQ(
        Diagnostic::GAME_OVER,
        engine.initiate("p2", ActionType::INCOME).diagnostic);
    EXPECT_EQ(
        Diagnostic::GAME_OVER,
        engine.respond("p2", PassResponse {}).diagnostic);

    const auto view = engine.getViewFor(std::nullopt);
    EXPECT_TRUE(view.gameOver);
    EXPECT_EQ("p1", view.winnerId);
    EXPECT_FALSE(view.turnPlayerId);
    EXPECT_FALSE(view.pendingAction);
}

TEST_F(CoupEngineTest, testOutcomeLogIsLimitedByRetention)
{
    auto short_log_engine = CoupEngine {PLAYERS, Coup::Deck {}, 1};
    const auto outcome = short_log_engine.initiate("p1", ActionType::INCOME);
    EXPECT_THAT(outcome.log, ElementsAre("It is now Bob's turn."));
}
