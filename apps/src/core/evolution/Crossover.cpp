#include "Crossover.h"

#include "Bitstring.h"
#include "core/Assert.h"

#include <cstdint>

namespace KnapEvo {

Bitstring uniformCrossover(const Bitstring& parentA, const Bitstring& parentB, Rng& rng)
{
    KNAPEVO_ASSERT(
        parentA.size() == parentB.size(), "Crossover parents must have the same length");

    Bitstring child(parentA.size());

    uint64_t coins = 0;
    for (size_t i = 0; i < child.size(); ++i) {
        if (i % 64 == 0) {
            coins = rng();
        }
        const bool fromA = ((coins >> (i % 64)) & 1u) != 0;
        child.bits[i] = fromA ? parentA.bits[i] : parentB.bits[i];
    }

    return child;
}

} // namespace KnapEvo
