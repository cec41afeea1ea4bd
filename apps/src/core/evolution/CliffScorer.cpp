#include "CliffScorer.h"

#include "Bitstring.h"
#include "core/Assert.h"
#include "core/knapsack/KnapsackInstance.h"

namespace KnapEvo {

CliffScore cliffScore(const Bitstring& genome, const KnapsackInstance& instance)
{
    KNAPEVO_ASSERT(
        genome.size() == instance.getItemCount(), "Genome length must match item count");

    // KnapsackInstance guarantees the sum of all weights and of all values
    // fits in 64 bits, so neither accumulator can wrap.
    const auto& items = instance.getItems();
    const uint64_t capacity = instance.getCapacity();

    uint64_t weight = 0;
    uint64_t value = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!genome[i]) {
            continue;
        }
        weight += items[i].weight;
        if (weight > capacity) {
            return CliffScore::overloaded();
        }
        value += items[i].value;
    }

    return CliffScore::feasible(value);
}

CliffScorer::CliffScorer(std::shared_ptr<const KnapsackInstance> instance)
    : instance_(std::move(instance))
{
    KNAPEVO_ASSERT(instance_ != nullptr, "CliffScorer requires an instance");
}

CliffScore CliffScorer::score(const Bitstring& genome) const
{
    return cliffScore(genome, *instance_);
}

} // namespace KnapEvo
