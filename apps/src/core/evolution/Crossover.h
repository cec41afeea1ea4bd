#pragma once

#include "Rng.h"

namespace KnapEvo {

struct Bitstring;

/**
 * Uniform crossover: each position copies parentA's or parentB's bit with
 * probability 1/2. Parents must have the same length.
 */
Bitstring uniformCrossover(const Bitstring& parentA, const Bitstring& parentB, Rng& rng);

} // namespace KnapEvo
