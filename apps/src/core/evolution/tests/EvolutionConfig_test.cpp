#include "core/evolution/EvolutionConfig.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace KnapEvo;

TEST(EvolutionConfigTest, DefaultsAreValid)
{
    const EvolutionConfig config;

    EXPECT_TRUE(validate(config).isValue());
    EXPECT_EQ(config.populationSize, 1000);
    EXPECT_EQ(config.tournamentSize, 2);
    EXPECT_EQ(config.maxGenerations, 1000);
    EXPECT_TRUE(config.parallelEvaluation);
    EXPECT_FALSE(config.seed.has_value());
}

TEST(EvolutionConfigTest, SmallestUsefulValuesAreValid)
{
    const EvolutionConfig config{
        .populationSize = 1,
        .tournamentSize = 1,
        .maxGenerations = 0,
        .parallelEvaluation = false,
        .maxParallelEvaluations = 0,
        .seed = 0,
        .logInterval = 0,
    };

    EXPECT_TRUE(validate(config).isValue());
}

TEST(EvolutionConfigTest, TournamentLargerThanPopulationIsValid)
{
    const EvolutionConfig config{ .populationSize = 3, .tournamentSize = 50 };
    EXPECT_TRUE(validate(config).isValue());
}

TEST(EvolutionConfigTest, RejectsEmptyPopulation)
{
    const EvolutionConfig config{ .populationSize = 0 };

    const auto result = validate(config);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("populationSize"), std::string::npos);
}

TEST(EvolutionConfigTest, RejectsZeroTournament)
{
    const EvolutionConfig config{ .tournamentSize = 0 };

    const auto result = validate(config);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("tournamentSize"), std::string::npos);
}

TEST(EvolutionConfigTest, RejectsNegativeCounts)
{
    EXPECT_TRUE(validate(EvolutionConfig{ .maxGenerations = -1 }).isError());
    EXPECT_TRUE(validate(EvolutionConfig{ .maxParallelEvaluations = -2 }).isError());
    EXPECT_TRUE(validate(EvolutionConfig{ .logInterval = -5 }).isError());
}

TEST(EvolutionConfigTest, JsonUsesFieldNames)
{
    const EvolutionConfig config{ .populationSize = 50, .tournamentSize = 4, .seed = 99 };

    const nlohmann::json j = config;

    EXPECT_EQ(j["populationSize"], 50);
    EXPECT_EQ(j["tournamentSize"], 4);
    EXPECT_EQ(j["seed"], 99u);
    EXPECT_EQ(j["parallelEvaluation"], true);
}

TEST(EvolutionConfigTest, UnsetSeedIsOmittedFromJson)
{
    const nlohmann::json j = EvolutionConfig{};
    EXPECT_FALSE(j.contains("seed"));
}

TEST(EvolutionConfigTest, PartialJsonKeepsDefaults)
{
    const nlohmann::json j = { { "tournamentSize", 8 }, { "seed", 1234 } };

    const auto config = j.get<EvolutionConfig>();

    EXPECT_EQ(config.tournamentSize, 8);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(config.seed.value(), 1234u);
    EXPECT_EQ(config.populationSize, 1000);
    EXPECT_EQ(config.maxGenerations, 1000);
}

TEST(EvolutionConfigTest, NullSeedLeavesSeedUnset)
{
    const nlohmann::json j = { { "seed", nullptr } };

    const auto config = j.get<EvolutionConfig>();

    EXPECT_FALSE(config.seed.has_value());
}

TEST(EvolutionConfigTest, WrongTypeThrows)
{
    const nlohmann::json j = { { "populationSize", "lots" } };
    EXPECT_THROW(j.get<EvolutionConfig>(), nlohmann::json::type_error);
}
