#include "core/evolution/Bitstring.h"
#include "core/evolution/CliffScorer.h"
#include "core/evolution/GenerationInspector.h"
#include "core/evolution/Population.h"
#include "core/knapsack/KnapsackInstance.h"

#include <gtest/gtest.h>
#include <memory>

using namespace KnapEvo;

class GenerationInspectorTest : public ::testing::Test {
protected:
    // Weightless items worth 1, 2, 4 plus one item that never fits.
    CliffScorer scorer = makeScorer();

    static CliffScorer makeScorer()
    {
        auto result = KnapsackInstance::create(
            {
                Item{ .id = 1, .value = 1, .weight = 0 },
                Item{ .id = 2, .value = 2, .weight = 0 },
                Item{ .id = 3, .value = 4, .weight = 0 },
                Item{ .id = 4, .value = 8, .weight = 1 },
            },
            0);
        return CliffScorer(std::make_shared<const KnapsackInstance>(std::move(result.value())));
    }

    Population evaluated(const std::vector<std::string>& genomes)
    {
        std::vector<Bitstring> bitstrings;
        for (const auto& genome : genomes) {
            bitstrings.push_back(Bitstring::fromString(genome));
        }
        Population population(std::move(bitstrings));
        population.evaluate(scorer);
        return population;
    }
};

TEST_F(GenerationInspectorTest, FirstGenerationSetsBestEver)
{
    BestTrackingInspector inspector;
    const Population population = evaluated({ "1000", "0110", "0001" });

    const InspectionState state =
        inspector.inspect(InspectionState{}, GenerationView{ .generation = 0, .population = population });

    ASSERT_TRUE(state.bestEver.has_value());
    EXPECT_EQ(state.bestEver->score, CliffScore::feasible(6));
    EXPECT_EQ(state.bestEver->genome, Bitstring::fromString("0110"));
    EXPECT_EQ(state.bestEverGeneration, 0);
}

TEST_F(GenerationInspectorTest, BestEverNeverRegresses)
{
    BestTrackingInspector inspector;
    const Population strong = evaluated({ "0010", "1110" });
    const Population weak = evaluated({ "1000", "0001" });

    InspectionState state;
    state = inspector.inspect(std::move(state), GenerationView{ .generation = 0, .population = strong });
    state = inspector.inspect(std::move(state), GenerationView{ .generation = 1, .population = weak });

    EXPECT_EQ(state.bestEver->score, CliffScore::feasible(7));
    EXPECT_EQ(state.bestEverGeneration, 0);
    ASSERT_EQ(state.history.size(), 2u);
    EXPECT_EQ(state.history[1].best, CliffScore::feasible(1));
}

TEST_F(GenerationInspectorTest, EqualScoreKeepsEarlierBest)
{
    BestTrackingInspector inspector;
    const Population first = evaluated({ "0010" });
    const Population second = evaluated({ "1100", "1010" });
    const Population third = evaluated({ "0000", "1010" });

    InspectionState state;
    state = inspector.inspect(std::move(state), GenerationView{ .generation = 0, .population = first });
    state = inspector.inspect(std::move(state), GenerationView{ .generation = 1, .population = second });
    state = inspector.inspect(std::move(state), GenerationView{ .generation = 2, .population = third });

    EXPECT_EQ(state.bestEver->score, CliffScore::feasible(5));
    EXPECT_EQ(state.bestEverGeneration, 1);
}

TEST_F(GenerationInspectorTest, OverloadedBestIsReplacedByFeasible)
{
    BestTrackingInspector inspector;
    const Population overloaded = evaluated({ "1111" });
    const Population feasible = evaluated({ "0000" });

    InspectionState state;
    state = inspector.inspect(std::move(state), GenerationView{ .generation = 0, .population = overloaded });
    ASSERT_TRUE(state.bestEver.has_value());
    EXPECT_TRUE(state.bestEver->score.isOverloaded());

    state = inspector.inspect(std::move(state), GenerationView{ .generation = 1, .population = feasible });
    EXPECT_EQ(state.bestEver->score, CliffScore::feasible(0));
    EXPECT_EQ(state.bestEverGeneration, 1);
}

TEST_F(GenerationInspectorTest, HistoryRecordsGenerationStats)
{
    BestTrackingInspector inspector;
    const Population population = evaluated({ "1000", "1000", "0100", "0001" });

    const InspectionState state =
        inspector.inspect(InspectionState{}, GenerationView{ .generation = 3, .population = population });

    ASSERT_EQ(state.history.size(), 1u);
    const GenerationRecord& record = state.history[0];
    EXPECT_EQ(record.generation, 3);
    EXPECT_EQ(record.best, CliffScore::feasible(2));
    EXPECT_EQ(record.feasibleCount, 3u);
    EXPECT_DOUBLE_EQ(record.meanFeasibleValue, 4.0 / 3.0);
    EXPECT_NEAR(record.entropy, 1.5, 1e-12);
}

TEST_F(GenerationInspectorTest, HistoryCanBeDisabled)
{
    BestTrackingInspector inspector(0, false);
    const Population population = evaluated({ "0100" });

    const InspectionState state =
        inspector.inspect(InspectionState{}, GenerationView{ .generation = 0, .population = population });

    EXPECT_TRUE(state.history.empty());
    EXPECT_TRUE(state.bestEver.has_value());
}
