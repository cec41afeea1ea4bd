#include "core/evolution/Bitstring.h"
#include "core/knapsack/KnapsackInstance.h"

#include <gtest/gtest.h>
#include <limits>

using namespace KnapEvo;

TEST(KnapsackInstanceTest, CreateComputesTotals)
{
    auto result = KnapsackInstance::create(
        {
            Item{ .id = 1, .value = 3, .weight = 2 },
            Item{ .id = 2, .value = 4, .weight = 3 },
        },
        4);
    ASSERT_TRUE(result.isValue());

    const KnapsackInstance& instance = result.value();
    EXPECT_EQ(instance.getItemCount(), 2u);
    EXPECT_EQ(instance.getCapacity(), 4u);
    EXPECT_EQ(instance.getTotalWeight(), 5u);
    EXPECT_EQ(instance.getTotalValue(), 7u);
    EXPECT_EQ(instance.getItems()[1].id, 2u);
}

TEST(KnapsackInstanceTest, WeightAndValueSumSelectedItems)
{
    auto result = KnapsackInstance::create(
        {
            Item{ .id = 1, .value = 3, .weight = 2 },
            Item{ .id = 2, .value = 4, .weight = 3 },
            Item{ .id = 3, .value = 5, .weight = 4 },
        },
        5);
    ASSERT_TRUE(result.isValue());

    const Bitstring choices = Bitstring::fromString("101");
    EXPECT_EQ(result.value().weightOf(choices), 6u);
    EXPECT_EQ(result.value().valueOf(choices), 8u);
}

TEST(KnapsackInstanceTest, RejectsTotalWeightOverflow)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    auto result = KnapsackInstance::create(
        {
            Item{ .id = 1, .value = 1, .weight = max },
            Item{ .id = 2, .value = 1, .weight = 1 },
        },
        10);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("weight overflows"), std::string::npos);
}

TEST(KnapsackInstanceTest, RejectsTotalValueOverflow)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    auto result = KnapsackInstance::create(
        {
            Item{ .id = 1, .value = max, .weight = 1 },
            Item{ .id = 2, .value = max, .weight = 1 },
        },
        10);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("value overflows"), std::string::npos);
}

TEST(KnapsackInstanceTest, MaximumTotalsThatFitAreAccepted)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    auto result = KnapsackInstance::create(
        {
            Item{ .id = 1, .value = max - 1, .weight = max - 1 },
            Item{ .id = 2, .value = 1, .weight = 1 },
        },
        max);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().getTotalWeight(), max);
    EXPECT_EQ(result.value().valueOf(Bitstring::fromString("11")), max);
}
