#pragma once

#include "Individual.h"
#include "Rng.h"

#include <cstddef>
#include <vector>

namespace KnapEvo {

class CliffScorer;
class EvaluationPool;

struct PopulationStats {
    size_t feasibleCount = 0;
    double meanFeasibleValue = 0.0; // 0 when nothing is feasible.
    double entropy = 0.0;           // Bits; see populationEntropy().
};

/**
 * One generation's individuals. Genomes are fixed at construction; scores
 * are filled in by evaluate() and are Overloaded until then.
 */
class Population {
public:
    Population() = default;
    explicit Population(std::vector<Bitstring> genomes);

    static Population random(size_t size, size_t genomeLength, Rng& rng);

    size_t size() const { return individuals_.size(); }
    bool empty() const { return individuals_.empty(); }
    bool isEvaluated() const { return evaluated_; }

    const Individual& operator[](size_t index) const { return individuals_[index]; }
    const std::vector<Individual>& getIndividuals() const { return individuals_; }

    /**
     * Score every individual. With a pool the work is split across its
     * workers; without one it runs on the calling thread. Both produce the
     * same scores in the same slots.
     */
    void evaluate(const CliffScorer& scorer, EvaluationPool* pool = nullptr);

    // Index of the first individual with the maximum score. Requires evaluate().
    size_t bestIndex() const;
    const Individual& best() const { return individuals_[bestIndex()]; }

    PopulationStats computeStats() const;

private:
    std::vector<Individual> individuals_;
    bool evaluated_ = false;
};

/**
 * Shannon entropy (bits) of the frequency of distinct genomes:
 * 0 when every genome is identical, log2(size) when all differ.
 */
double populationEntropy(const Population& population);

} // namespace KnapEvo
