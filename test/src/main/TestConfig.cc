#include "coup/CoupConstants.hh"
#include "engine/GameState.hh"
#include "main/Config.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace std::string_literals;

using Coup::Engine::PlayerInfo;
using Coup::Engine::PlayerInfoVector;
using Coup::Main::Config;

class ConfigTest : public testing::Test {
protected:
    std::istringstream in;

    void assertThrows()
    {
        auto f = [this]() { static_cast<void>(Config {in}); };
        EXPECT_THROW(f(), std::runtime_error);
    }
};

TEST_F(ConfigTest, testBadStream)
{
    in.setstate(std::ios::failbit);
    assertThrows();
}

TEST_F(ConfigTest, testBadSyntax)
{
    in.str("this is invalid"s);
    assertThrows();
}

TEST_F(ConfigTest, testRuntimeError)
{
    in.str("error(\"no players today\")"s);
    assertThrows();
}

TEST_F(ConfigTest, testDefaultConfig)
{
    const auto config = Config {};
    EXPECT_TRUE(config.getPlayers().empty());
    EXPECT_EQ(Coup::DEFAULT_LOG_RETENTION, config.getLogRetention());
}

TEST_F(ConfigTest, testEmptyScript)
{
    const auto config = Config {in};
    EXPECT_TRUE(config.getPlayers().empty());
    EXPECT_EQ(Coup::DEFAULT_LOG_RETENTION, config.getLogRetention());
}

TEST_F(ConfigTest, testParsePlayers)
{
    in.str(R"EOF(
players = {
  { id = "p1", name = "Alice" },
  { id = "p2", name = "Bob" },
  { id = "p3", name = "Carol" },
}
)EOF"s);
    const auto config = Config {in};
    const auto expected_players = PlayerInfoVector {
        PlayerInfo { "p1"s, "Alice"s },
        PlayerInfo { "p2"s, "Bob"s },
        PlayerInfo { "p3"s, "Carol"s },
    };
    EXPECT_EQ(expected_players, config.getPlayers());
}

TEST_F(ConfigTest, testPlayerNameDefaultsToId)
{
    in.str(R"EOF(
players = {
  { id = "p1" },
  { id = "p2", name = 42 },
}
)EOF"s);
    const auto config = Config {in};
    const auto expected_players = PlayerInfoVector {
        PlayerInfo { "p1"s, "p1"s },
        PlayerInfo { "p2"s, "p2"s },
    };
    EXPECT_EQ(expected_players, config.getPlayers());
}

TEST_F(ConfigTest, testInvalidPlayersAreSkipped)
{
    in.str(R"EOF(
players = {
  "p0",
  { name = "Nobody" },
  { id = "p1", name = "Alice" },
}
)EOF"s);
    const auto config = Config {in};
    const auto expected_players = PlayerInfoVector {
        PlayerInfo { "p1"s, "Alice"s },
    };
    EXPECT_EQ(expected_players, config.getPlayers());
}

TEST_F(ConfigTest, testPlayersWrongType)
{
    in.str(R"EOF(
players = "invalid"
)EOF"s);
    const auto config = Config {in};
    EXPECT_TRUE(config.getPlayers().empty());
}

TEST_F(ConfigTest, testParseLogRetention)
{
    in.str(R"EOF(
log_retention = 5
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(5, config.getLogRetention());
}

TEST_F(ConfigTest, testNonPositiveLogRetention)
{
    in.str(R"EOF(
log_retention = 0
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(Coup::DEFAULT_LOG_RETENTION, config.getLogRetention());
}

TEST_F(ConfigTest, testLogRetentionWrongType)
{
    in.str(R"EOF(
log_retention = "many"
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(Coup::DEFAULT_LOG_RETENTION, config.getLogRetention());
}

TEST_F(ConfigTest, testLogRetentionOutOfRange)
{
    in.str(R"EOF(
log_retention = 4294967301
)EOF"s);
    const auto config = Config {in};
    EXPECT_EQ(Coup::DEFAULT_LOG_RETENTION, config.getLogRetention());
}
