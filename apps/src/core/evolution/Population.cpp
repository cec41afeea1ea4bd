#include "Population.h"

#include "CliffScorer.h"
#include "EvaluationPool.h"
#include "core/Assert.h"

#include <cmath>
#include <unordered_map>

namespace KnapEvo {

Population::Population(std::vector<Bitstring> genomes)
{
    individuals_.reserve(genomes.size());
    for (auto& genome : genomes) {
        individuals_.push_back(Individual{ .genome = std::move(genome), .score = {} });
    }
}

Population Population::random(size_t size, size_t genomeLength, Rng& rng)
{
    std::vector<Bitstring> genomes;
    genomes.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        genomes.push_back(Bitstring::random(genomeLength, rng));
    }
    return Population(std::move(genomes));
}

void Population::evaluate(const CliffScorer& scorer, EvaluationPool* pool)
{
    const auto scoreRange = [this, &scorer](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            individuals_[i].score = scorer.score(individuals_[i].genome);
        }
    };

    if (pool) {
        pool->run(individuals_.size(), scoreRange);
    }
    else {
        scoreRange(0, individuals_.size());
    }
    evaluated_ = true;
}

size_t Population::bestIndex() const
{
    KNAPEVO_ASSERT(!individuals_.empty(), "Empty population has no best individual");
    KNAPEVO_ASSERT(evaluated_, "Population must be evaluated before ranking");

    size_t best = 0;
    for (size_t i = 1; i < individuals_.size(); ++i) {
        if (individuals_[i].score > individuals_[best].score) {
            best = i;
        }
    }
    return best;
}

PopulationStats Population::computeStats() const
{
    PopulationStats stats;

    double valueSum = 0.0;
    for (const auto& individual : individuals_) {
        if (individual.score.isFeasible()) {
            stats.feasibleCount++;
            valueSum += static_cast<double>(individual.score.getValue());
        }
    }
    if (stats.feasibleCount > 0) {
        stats.meanFeasibleValue = valueSum / static_cast<double>(stats.feasibleCount);
    }
    stats.entropy = populationEntropy(*this);

    return stats;
}

double populationEntropy(const Population& population)
{
    if (population.empty()) {
        return 0.0;
    }

    std::unordered_map<std::vector<bool>, size_t> counts;
    for (const auto& individual : population.getIndividuals()) {
        counts[individual.genome.bits]++;
    }

    const double total = static_cast<double>(population.size());
    double entropy = 0.0;
    for (const auto& [genome, count] : counts) {
        const double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

} // namespace KnapEvo
