#include "Mutation.h"

#include "Bitstring.h"

namespace KnapEvo {

Bitstring mutateOneOverLength(const Bitstring& parent, Rng& rng, MutationStats* stats)
{
    if (stats) {
        stats->flips = 0;
    }

    Bitstring child = parent;
    const size_t length = child.size();
    if (length == 0) {
        return child;
    }

    if (length == 1) {
        // Rate 1/1: the single bit always flips.
        child.bits[0] = !child.bits[0];
        if (stats) {
            stats->flips = 1;
        }
        return child;
    }

    // Gaps between independent Bernoulli(1/N) successes are geometric, so
    // jumping from flip to flip gives the same distribution as testing every
    // bit while drawing about one number per call.
    std::geometric_distribution<size_t> gap(1.0 / static_cast<double>(length));
    for (size_t i = gap(rng); i < length; i += gap(rng) + 1) {
        child.bits[i] = !child.bits[i];
        if (stats) {
            stats->flips++;
        }
    }

    return child;
}

} // namespace KnapEvo
