#include "main/Config.hh"
#include "main/GameSession.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace std::string_literals;

using Coup::Main::Config;
using Coup::Main::GameSession;

using nlohmann::json;

namespace {

const auto MALFORMED = json {{"error", "malformed request"}};

}

class GameSessionTest : public testing::Test {
protected:

    json process(const json& request)
    {
        return json::parse(session.processRequest(request.dump()));
    }

    json processRaw(const std::string& request)
    {
        return json::parse(session.processRequest(request));
    }

    Config config {};
    GameSession session {config};
};

TEST_F(GameSessionTest, testDefaultPlayers)
{
    const auto reply = process(json {{"command", "view"}});
    const auto& players = reply.at("view").at("players");
    ASSERT_EQ(2u, players.size());
    EXPECT_EQ(json("p1"), players[0].at("id"));
    EXPECT_EQ(json("p2"), players[1].at("id"));
    EXPECT_EQ(json("p1"), reply.at("view").at("turnPlayerId"));
    EXPECT_EQ(json("none"), reply.at("diagnostic"));
    EXPECT_EQ(json::array(), reply.at("log"));
}

TEST_F(GameSessionTest, testSpectatorViewHidesAllRoles)
{
    const auto reply = process(json {{"command", "view"}});
    for (const auto& player : reply.at("view").at("players")) {
        for (const auto& card : player.at("influence")) {
            EXPECT_TRUE(card.at("role").is_null());
        }
    }
}

TEST_F(GameSessionTest, testPlayerViewShowsOwnRolesOnly)
{
    const auto reply = process(json {{"command", "view"}, {"player", "p1"}});
    const auto& players = reply.at("view").at("players");
    for (const auto& card : players[0].at("influence")) {
        EXPECT_TRUE(card.at("role").is_string());
    }
    for (const auto& card : players[1].at("influence")) {
        EXPECT_TRUE(card.at("role").is_null());
    }
}

TEST_F(GameSessionTest, testInitiate)
{
    const auto reply = process(
        json {{"command", "initiate"}, {"player", "p1"}, {"action", "income"}});
    EXPECT_EQ(json("none"), reply.at("diagnostic"));
    EXPECT_EQ(
        (json {"p1 takes Income (+1).", "It is now p2's turn."}),
        reply.at("log"));
    EXPECT_EQ(json(3), reply.at("view").at("players")[0].at("coins"));
    EXPECT_EQ(json("p2"), reply.at("view").at("turnPlayerId"));
}

TEST_F(GameSessionTest, testInitiateOutOfTurn)
{
    const auto reply = process(
        json {{"command", "initiate"}, {"player", "p2"}, {"action", "income"}});
    EXPECT_EQ(json("notEligible"), reply.at("diagnostic"));
    EXPECT_EQ(json(2), reply.at("view").at("players")[1].at("coins"));
    EXPECT_EQ(json("p1"), reply.at("view").at("turnPlayerId"));
}

TEST_F(GameSessionTest, testInitiateUnknownPlayer)
{
    const auto reply = process(
        json {{"command", "initiate"}, {"player", "p9"}, {"action", "income"}});
    EXPECT_EQ(json("unknownPlayer"), reply.at("diagnostic"));
}

TEST_F(GameSessionTest, testInitiateUnknownAction)
{
    const auto reply = process(
        json {{"command", "initiate"}, {"player", "p1"}, {"action", "bribe"}});
    EXPECT_EQ(json("unknownAction"), reply.at("diagnostic"));
}

TEST_F(GameSessionTest, testRespond)
{
    process(
        json {
            {"command", "initiate"},
            {"player", "p1"},
            {"action", "foreign_aid"}});
    const auto reply = process(
        json {
            {"command", "respond"},
            {"player", "p2"},
            {"response", {{"type", "pass"}}}});
    EXPECT_EQ(json("none"), reply.at("diagnostic"));
    EXPECT_EQ(json(4), reply.at("view").at("players")[0].at("coins"));
    EXPECT_TRUE(reply.at("view").at("pendingAction").is_null());
}

TEST_F(GameSessionTest, testPendingActionIsVisible)
{
    const auto reply = process(
        json {
            {"command", "initiate"},
            {"player", "p1"},
            {"action", "foreign_aid"}});
    const auto& pending = reply.at("view").at("pendingAction");
    EXPECT_EQ(json("foreign_aid"), pending.at("type"));
    EXPECT_EQ(json("awaitingBlock"), pending.at("stage"));
}

TEST_F(GameSessionTest, testRespondWithoutPendingAction)
{
    const auto reply = process(
        json {
            {"command", "respond"},
            {"player", "p2"},
            {"response", {{"type", "pass"}}}});
    EXPECT_EQ(json("noPendingAction"), reply.at("diagnostic"));
}

TEST_F(GameSessionTest, testInvalidJson)
{
    EXPECT_EQ(MALFORMED, processRaw("{not json"s));
}

TEST_F(GameSessionTest, testMissingCommand)
{
    EXPECT_EQ(MALFORMED, process(json {{"player", "p1"}}));
}

TEST_F(GameSessionTest, testUnknownCommand)
{
    EXPECT_EQ(MALFORMED, process(json {{"command", "shuffle"}}));
}

TEST_F(GameSessionTest, testInitiateWithoutPlayer)
{
    EXPECT_EQ(
        MALFORMED, process(json {{"command", "initiate"}, {"action", "income"}}));
}

TEST_F(GameSessionTest, testUnknownResponseType)
{
    process(
        json {
            {"command", "initiate"},
            {"player", "p1"},
            {"action", "foreign_aid"}});
    EXPECT_EQ(
        MALFORMED,
        process(
            json {
                {"command", "respond"},
                {"player", "p2"},
                {"response", {{"type", "shrug"}}}}));
}

TEST_F(GameSessionTest, testNonIntegerCardIndex)
{
    for (const auto& card_index : {json(true), json(0.5), json(4294967296)}) {
        EXPECT_EQ(
            MALFORMED,
            process(
                json {
                    {"command", "respond"},
                    {"player", "p2"},
                    {"response", {
                        {"type", "loseInfluence"},
                        {"payload", {{"cardIndex", card_index}}}}}}));
    }
}

TEST_F(GameSessionTest, testRun)
{
    auto in = std::istringstream {
        R"({"command": "initiate", "player": "p1", "action": "income"})"
        "\n\n"
        "garbage\n"s};
    auto out = std::ostringstream {};
    session.run(in, out);
    auto lines = std::istringstream {out.str()};
    auto line = std::string {};
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(json("none"), json::parse(line).at("diagnostic"));
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(MALFORMED, json::parse(line));
    EXPECT_FALSE(std::getline(lines, line));
}

TEST(GameSessionConfigTest, testConfiguredPlayers)
{
    auto in = std::istringstream {R"EOF(
players = {
  { id = "a", name = "Alice" },
  { id = "b", name = "Bob" },
  { id = "c", name = "Carol" },
}
log_retention = 1
)EOF"s};
    const auto config = Config {in};
    auto session = GameSession {config};
    const auto& state = session.getEngine().getState();
    ASSERT_EQ(3u, state.getPlayers().size());
    EXPECT_EQ("Carol"s, state.getPlayers()[2].name);
    const auto reply = json::parse(
        session.processRequest(
            json {
                {"command", "initiate"},
                {"player", "a"},
                {"action", "income"}}.dump()));
    EXPECT_EQ(json {"It is now Bob's turn."}, reply.at("view").at("log"));
}
