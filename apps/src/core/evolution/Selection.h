#pragma once

#include "Rng.h"

#include <cstddef>

namespace KnapEvo {

struct Bitstring;
class Population;

/**
 * Tournament selection: draw tournamentSize individuals uniformly with
 * replacement and return the index of the best (first-seen on ties).
 * Selection pressure grows with tournament size; size 1 is uniform random.
 */
size_t tournamentSelectIndex(const Population& population, int tournamentSize, Rng& rng);

// Copy of the winning genome; the population is left untouched.
Bitstring tournamentSelect(const Population& population, int tournamentSize, Rng& rng);

} // namespace KnapEvo
