#pragma once

#include "Item.h"
#include "core/Result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace KnapEvo {

struct Bitstring;

/**
 * Immutable 0/1 knapsack problem: a capacity and the items to choose from.
 *
 * Construction rejects instances whose total weight or total value does not
 * fit in 64 bits, so every subset sum computed against the instance is
 * overflow-free.
 */
class KnapsackInstance {
public:
    static Result<KnapsackInstance, std::string> create(std::vector<Item> items, uint64_t capacity);

    const std::vector<Item>& getItems() const { return items_; }
    size_t getItemCount() const { return items_.size(); }
    uint64_t getCapacity() const { return capacity_; }
    uint64_t getTotalWeight() const { return totalWeight_; }
    uint64_t getTotalValue() const { return totalValue_; }

    // Sums over the items whose bit is set in choices.
    uint64_t weightOf(const Bitstring& choices) const;
    uint64_t valueOf(const Bitstring& choices) const;

private:
    KnapsackInstance(std::vector<Item> items, uint64_t capacity);

    std::vector<Item> items_;
    uint64_t capacity_ = 0;
    uint64_t totalWeight_ = 0;
    uint64_t totalValue_ = 0;
};

} // namespace KnapEvo
