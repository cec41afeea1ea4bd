#pragma once

#include <random>

namespace KnapEvo {

// Engine-wide random source. Only the run loop thread draws from it.
using Rng = std::mt19937_64;

} // namespace KnapEvo
