#pragma once

#include "Bitstring.h"
#include "CliffScore.h"

namespace KnapEvo {

struct Individual {
    Bitstring genome;
    CliffScore score;
};

} // namespace KnapEvo
