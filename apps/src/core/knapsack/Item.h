#pragma once

#include <cstdint>

namespace KnapEvo {

struct Item {
    uint64_t id = 0; // As numbered in the instance file.
    uint64_t value = 0;
    uint64_t weight = 0;

    bool operator==(const Item& other) const = default;
};

} // namespace KnapEvo
