#include "engine/ActionInitiator.hh"
#include "engine/Exchange.hh"
#include "engine/GameState.hh"
#include "engine/ResponseResolver.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

using Coup::ActionType;
using Coup::ChallengeResponse;
using Coup::ExchangeChoiceResponse;
using Coup::LoseInfluenceResponse;
using Coup::PassResponse;
using Coup::PlayerId;
using Coup::Response;
using Coup::Role;
using namespace Coup::Engine;

class ExchangeTest : public testing::Test {
protected:

    void SetUp() override
    {
        ASSERT_EQ(
            Diagnostic::NONE,
            initiateAction(
                state, "p1", ActionType::EXCHANGE, std::nullopt).diagnostic);
    }

    Outcome respond(const PlayerId& playerId, const Response& response)
    {
        return resolveResponse(state, playerId, response);
    }

    Outcome openChoice()
    {
        respond("p2", PassResponse {});
        return respond("p3", PassResponse {});
    }

    Diagnostic choose(const std::vector<std::string>& keep)
    {
        return respond("p1", ExchangeChoiceResponse {keep}).diagnostic;
    }

    auto snapshot()
    {
        const auto pending = state.getPendingAction();
        const auto secret = state.getExchangeSecret("p1");
        return std::tuple {
            state.getPlayers(),
            pending ? std::optional {*pending} : std::nullopt,
            secret ? std::optional {*secret} : std::nullopt,
            state.getDeck().getCards(),
            state.getLogCount()};
    }

    GameState state {
        PlayerInfoVector {{"p1", "Alice"}, {"p2", "Bob"}, {"p3", "Carol"}},
        Coup::makeStackedDeck(
            {{Role::AMBASSADOR, Role::CAPTAIN},
             {Role::CONTESSA, Role::DUKE},
             {Role::ASSASSIN, Role::DUKE}},
            {Role::CONTESSA, Role::ASSASSIN})};
};

TEST_F(ExchangeTest, testExchangeOptionsAreSentToActorOnly)
{
    EXPECT_TRUE(respond("p2", PassResponse {}).privateMessages.empty());
    const auto outcome = openChoice();
    EXPECT_EQ(Diagnostic::NONE, outcome.diagnostic);
    const auto options = ExchangeOptionVector {
        {"h0", Role::AMBASSADOR},
        {"h1", Role::CAPTAIN},
        {"d2", Role::CONTESSA},
        {"d3", Role::ASSASSIN},
    };
    ASSERT_EQ(1u, outcome.privateMessages.size());
    EXPECT_EQ(
        (PrivateMessage {"p1", ExchangeOptionsMessage {2, options}}),
        outcome.privateMessages.front());
    EXPECT_EQ((ExchangeSecret {2, options}), *state.getExchangeSecret("p1"));
    EXPECT_EQ(
        Coup::N_CARDS - 3 * Coup::N_CARDS_PER_PLAYER - 2,
        state.getDeck().getNumberOfCards());
}

TEST_F(ExchangeTest, testPendingChoiceDoesNotRevealOptions)
{
    openChoice();
    const auto expected = PendingAction {ExchangeAwaitingChoice {"p1", 2, 4}};
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    EXPECT_EQ(expected, *pending);
    EXPECT_EQ(expected, state.getViewFor("p2").pendingAction);
}

TEST_F(ExchangeTest, testCompleteExchange)
{
    openChoice();
    EXPECT_EQ(Diagnostic::NONE, choose({"d3", "h1"}));
    const auto player = state.getPlayer("p1");
    EXPECT_EQ((Coup::Card {Role::CAPTAIN, false}), player->influence[0]);
    EXPECT_EQ((Coup::Card {Role::ASSASSIN, false}), player->influence[1]);
    const auto& deck = state.getDeck();
    EXPECT_EQ(
        Coup::N_CARDS - 3 * Coup::N_CARDS_PER_PLAYER,
        deck.getNumberOfCards());
    EXPECT_EQ(3, deck.count(Role::AMBASSADOR));
    EXPECT_EQ(2, deck.count(Role::CONTESSA));
    EXPECT_EQ(Coup::getStandardRoleCounts(), Coup::countRoles(state));
    EXPECT_FALSE(state.getExchangeSecret("p1"));
    EXPECT_FALSE(state.getPendingAction());
    EXPECT_EQ("p2", state.getCurrentPlayer()->id);
    const auto& log = state.getLog();
    EXPECT_EQ("Alice completes Exchange.", log[log.size() - 2]);
}

TEST_F(ExchangeTest, testInvalidChoices)
{
    openChoice();
    const auto before = snapshot();
    EXPECT_EQ(Diagnostic::INVALID_CHOICE, choose({"d2"}));
    EXPECT_EQ(Diagnostic::INVALID_CHOICE, choose({"d2", "d2"}));
    EXPECT_EQ(Diagnostic::INVALID_CHOICE, choose({"d2", "x9"}));
    EXPECT_EQ(Diagnostic::INVALID_CHOICE, choose({"h0", "h1", "d2"}));
    EXPECT_EQ(Diagnostic::INVALID_CHOICE, choose({}));
    EXPECT_EQ(before, snapshot());
}

TEST_F(ExchangeTest, testOnlyActorMayChoose)
{
    openChoice();
    const auto before = snapshot();
    EXPECT_EQ(
        Diagnostic::NOT_ELIGIBLE,
        respond("p2", ExchangeChoiceResponse {{"d2", "d3"}}).diagnostic);
    EXPECT_EQ(
        Diagnostic::UNEXPECTED_RESPONSE,
        respond("p1", PassResponse {}).diagnostic);
    EXPECT_EQ(before, snapshot());
}

TEST_F(ExchangeTest, testExchangeChallengeFails)
{
    EXPECT_EQ(
        Diagnostic::NONE, respond("p2", ChallengeResponse {}).diagnostic);
    const auto& log = state.getLog();
    EXPECT_EQ("Bob challenges — FAILED.", log[log.size() - 3]);
    const auto pending = state.getPendingAction();
    ASSERT_TRUE(pending);
    EXPECT_EQ(
        (PendingAction {
            LoseInfluence {
                "p2", LossReason::FAILED_CHALLENGE,
                ExchangeStartChoice {"p1"}}}),
        *pending);
    const auto outcome = respond("p2", LoseInfluenceResponse {0});
    EXPECT_EQ(Diagnostic::NONE, outcome.diagnostic);
    ASSERT_EQ(1u, outcome.privateMessages.size());
    const auto& message = outcome.privateMessages.front();
    EXPECT_EQ("p1", message.recipient);
    EXPECT_EQ(2, message.message.keepCount);
    ASSERT_EQ(4u, message.message.options.size());
    EXPECT_EQ("h0", message.message.options[0].id);
    EXPECT_EQ("d3", message.message.options[3].id);
    EXPECT_EQ(
        Coup::N_CARDS,
        state.getDeck().getNumberOfCards() + 3 * Coup::N_CARDS_PER_PLAYER + 2);
}

class ExchangeWithOneInfluenceTest : public ExchangeTest {
protected:

    void SetUp() override
    {
        state.getPlayer("p1")->influence[0].revealed = true;
        ExchangeTest::SetUp();
    }
};

TEST_F(ExchangeWithOneInfluenceTest, testExchangeWithOneInfluence)
{
    const auto outcome = openChoice();
    ASSERT_EQ(1u, outcome.privateMessages.size());
    const auto& message = outcome.privateMessages.front().message;
    EXPECT_EQ(1, message.keepCount);
    EXPECT_EQ(
        (ExchangeOptionVector {
            {"h0", Role::CAPTAIN},
            {"d1", Role::CONTESSA},
            {"d2", Role::ASSASSIN}}),
        message.options);
    EXPECT_EQ(Diagnostic::INVALID_CHOICE, choose({"d1", "d2"}));
    EXPECT_EQ(Diagnostic::NONE, choose({"d2"}));
    const auto player = state.getPlayer("p1");
    EXPECT_EQ((Coup::Card {Role::AMBASSADOR, true}), player->influence[0]);
    EXPECT_EQ((Coup::Card {Role::ASSASSIN, false}), player->influence[1]);
}
