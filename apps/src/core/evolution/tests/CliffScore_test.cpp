#include "core/evolution/CliffScore.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace KnapEvo;

TEST(CliffScoreTest, DefaultScoreIsOverloaded)
{
    const CliffScore score;
    EXPECT_TRUE(score.isOverloaded());
    EXPECT_FALSE(score.isFeasible());
}

TEST(CliffScoreTest, OverloadedIsWorseThanAnyFeasibleScore)
{
    EXPECT_LT(CliffScore::overloaded(), CliffScore::feasible(0));
    EXPECT_LT(CliffScore::overloaded(), CliffScore::feasible(UINT64_MAX));
    EXPECT_GT(CliffScore::feasible(0), CliffScore::overloaded());
}

TEST(CliffScoreTest, FeasibleScoresOrderByValue)
{
    EXPECT_LT(CliffScore::feasible(3), CliffScore::feasible(7));
    EXPECT_GT(CliffScore::feasible(7), CliffScore::feasible(3));
    EXPECT_LE(CliffScore::feasible(7), CliffScore::feasible(7));
    EXPECT_GE(CliffScore::feasible(7), CliffScore::feasible(7));
    EXPECT_FALSE(CliffScore::feasible(7) < CliffScore::feasible(7));
}

TEST(CliffScoreTest, AllOverloadedScoresAreEqual)
{
    EXPECT_EQ(CliffScore::overloaded(), CliffScore(Overloaded{}));
    EXPECT_FALSE(CliffScore::overloaded() < CliffScore::overloaded());
    EXPECT_NE(CliffScore::overloaded(), CliffScore::feasible(0));
}

TEST(CliffScoreTest, GetValueReturnsFeasibleValue)
{
    const CliffScore score = Feasible{ .value = 42 };
    ASSERT_TRUE(score.isFeasible());
    EXPECT_EQ(score.getValue(), 42u);
}

TEST(CliffScoreTest, ToStringNamesTheCase)
{
    EXPECT_EQ(toString(CliffScore::feasible(7)), "Feasible(7)");
    EXPECT_EQ(toString(CliffScore::overloaded()), "Overloaded");
    EXPECT_EQ(fmt::format("{}", CliffScore::feasible(12)), "Feasible(12)");
}

TEST(CliffScoreTest, JsonRepresentationIsTagged)
{
    const nlohmann::json feasible = CliffScore::feasible(7);
    EXPECT_EQ(feasible["kind"], "Feasible");
    EXPECT_EQ(feasible["value"], 7u);

    const nlohmann::json overloaded = CliffScore::overloaded();
    EXPECT_EQ(overloaded["kind"], "Overloaded");
    EXPECT_FALSE(overloaded.contains("value"));

    EXPECT_EQ(feasible.get<CliffScore>(), CliffScore::feasible(7));
    EXPECT_EQ(overloaded.get<CliffScore>(), CliffScore::overloaded());
}

TEST(CliffScoreTest, UnknownJsonKindThrows)
{
    const nlohmann::json j = { { "kind", "Heavy" } };
    EXPECT_THROW(j.get<CliffScore>(), std::runtime_error);
}
