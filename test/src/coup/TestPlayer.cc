#include "coup/Player.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using Coup::Card;
using Coup::Player;
using Coup::Role;

class PlayerTest : public testing::Test {
protected:
    Player player {
        "p1", "Alice", Coup::STARTING_COINS,
        {Card {Role::DUKE, false}, Card {Role::CONTESSA, false}}};
};

TEST_F(PlayerTest, testPlayerWithUnrevealedCardsIsAlive)
{
    EXPECT_TRUE(isAlive(player));
    EXPECT_EQ(2, countUnrevealed(player));
    EXPECT_EQ((std::vector {0, 1}), getUnrevealedSlots(player));
}

TEST_F(PlayerTest, testRevealedCardsAreNotCounted)
{
    player.influence[0].revealed = true;
    EXPECT_TRUE(isAlive(player));
    EXPECT_EQ(1, countUnrevealed(player));
    EXPECT_EQ(std::vector {1}, getUnrevealedSlots(player));
}

TEST_F(PlayerTest, testPlayerWithAllCardsRevealedIsDead)
{
    player.influence[0].revealed = true;
    player.influence[1].revealed = true;
    EXPECT_FALSE(isAlive(player));
    EXPECT_EQ(0, countUnrevealed(player));
    EXPECT_TRUE(getUnrevealedSlots(player).empty());
}

TEST_F(PlayerTest, testHoldsRole)
{
    EXPECT_TRUE(holdsRole(player, Role::DUKE));
    EXPECT_FALSE(holdsRole(player, Role::CAPTAIN));
    player.influence[0].revealed = true;
    EXPECT_FALSE(holdsRole(player, Role::DUKE));
}

TEST_F(PlayerTest, testOutputPrintsName)
{
    auto out = std::ostringstream {};
    out << player;
    EXPECT_EQ("Alice", out.str());
}
