#include "core/evolution/Bitstring.h"
#include "core/evolution/RunResult.h"
#include "core/knapsack/KnapsackInstance.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace KnapEvo;

class RunResultTest : public ::testing::Test {
protected:
    KnapsackInstance instance = makeInstance();

    static KnapsackInstance makeInstance()
    {
        auto result = KnapsackInstance::create(
            {
                Item{ .id = 1, .value = 3, .weight = 2 },
                Item{ .id = 2, .value = 4, .weight = 3 },
                Item{ .id = 3, .value = 5, .weight = 4 },
            },
            5);
        return std::move(result.value());
    }
};

TEST_F(RunResultTest, EmptyRunSerializesNullBests)
{
    const RunResult result{ .generationsCompleted = 0, .stoppedEarly = true, .seed = 5 };

    const nlohmann::json j = runResultToJson(result, instance, false);

    EXPECT_TRUE(j["bestOverall"].is_null());
    EXPECT_TRUE(j["bestFinal"].is_null());
    EXPECT_EQ(j["stoppedEarly"], true);
    EXPECT_EQ(j["seed"], 5u);
    EXPECT_FALSE(j.contains("history"));
}

TEST_F(RunResultTest, IndividualIncludesPackingDetails)
{
    const Individual best{ .genome = Bitstring::fromString("110"), .score = CliffScore::feasible(7) };

    const nlohmann::json j = individualToJson(best, instance);

    EXPECT_EQ(j["score"]["kind"], "Feasible");
    EXPECT_EQ(j["score"]["value"], 7u);
    EXPECT_EQ(j["weight"], 5u);
    EXPECT_EQ(j["itemsPacked"], 2u);
    EXPECT_EQ(j["genome"], "110");
}

TEST_F(RunResultTest, HistoryIsIncludedOnRequest)
{
    RunResult result;
    result.bestEver = Individual{ .genome = Bitstring::fromString("111"), .score = CliffScore::overloaded() };
    result.bestEverGeneration = 0;
    result.generationsCompleted = 1;
    result.history.push_back(GenerationRecord{
        .generation = 0,
        .best = CliffScore::overloaded(),
        .feasibleCount = 0,
        .meanFeasibleValue = 0.0,
        .entropy = 0.0,
    });

    const nlohmann::json j = runResultToJson(result, instance, true);

    ASSERT_TRUE(j.contains("history"));
    ASSERT_EQ(j["history"].size(), 1u);
    EXPECT_EQ(j["history"][0]["best"]["kind"], "Overloaded");
    EXPECT_EQ(j["bestOverall"]["score"]["kind"], "Overloaded");
    EXPECT_EQ(j["bestOverall"]["weight"], 9u);
}
