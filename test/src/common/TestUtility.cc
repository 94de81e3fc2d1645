#include "Utility.hh"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

TEST(UtilityTest, testTo)
{
    auto values = std::vector<int> {};
    for (const auto n : Coup::to(3)) {
        values.push_back(n);
    }
    EXPECT_EQ((std::vector<int> {0, 1, 2}), values);
}

TEST(UtilityTest, testToEmpty)
{
    EXPECT_TRUE(Coup::to(0).empty());
}

TEST(UtilityTest, testToNegative)
{
    EXPECT_THROW(Coup::to(-1), std::invalid_argument);
}
