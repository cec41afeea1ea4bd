#pragma once

#include "Rng.h"

namespace KnapEvo {

struct Bitstring;

struct MutationStats {
    int flips = 0;
};

/**
 * Bit-flip mutation at rate 1/length: every position flips independently
 * with probability 1/N, so one bit flips per call on average regardless of
 * genome length. Returns a new genome; the parent is not modified.
 */
Bitstring mutateOneOverLength(const Bitstring& parent, Rng& rng, MutationStats* stats = nullptr);

} // namespace KnapEvo
