#include "Selection.h"

#include "Population.h"
#include "core/Assert.h"

namespace KnapEvo {

size_t tournamentSelectIndex(const Population& population, int tournamentSize, Rng& rng)
{
    KNAPEVO_ASSERT(!population.empty(), "Tournament selection requires a non-empty population");
    KNAPEVO_ASSERT(population.isEvaluated(), "Tournament selection requires scored individuals");
    KNAPEVO_ASSERT(tournamentSize > 0, "Tournament size must be positive");

    std::uniform_int_distribution<size_t> dist(0, population.size() - 1);

    size_t bestIdx = dist(rng);
    for (int i = 1; i < tournamentSize; ++i) {
        const size_t idx = dist(rng);
        if (population[idx].score > population[bestIdx].score) {
            bestIdx = idx;
        }
    }

    return bestIdx;
}

Bitstring tournamentSelect(const Population& population, int tournamentSize, Rng& rng)
{
    return population[tournamentSelectIndex(population, tournamentSize, rng)].genome;
}

} // namespace KnapEvo
