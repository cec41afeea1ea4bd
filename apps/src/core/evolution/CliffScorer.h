#pragma once

#include "CliffScore.h"

#include <memory>

namespace KnapEvo {

struct Bitstring;
class KnapsackInstance;

/**
 * Feasibility-gated fitness: Overloaded when the packed weight exceeds the
 * capacity, otherwise Feasible(total packed value).
 * Pure function; safe to call concurrently.
 */
CliffScore cliffScore(const Bitstring& genome, const KnapsackInstance& instance);

/**
 * Binds the cliff scoring function to one shared, read-only instance.
 */
class CliffScorer {
public:
    explicit CliffScorer(std::shared_ptr<const KnapsackInstance> instance);

    CliffScore score(const Bitstring& genome) const;

private:
    std::shared_ptr<const KnapsackInstance> instance_;
};

} // namespace KnapEvo
