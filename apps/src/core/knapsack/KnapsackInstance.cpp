#include "KnapsackInstance.h"

#include "core/Assert.h"
#include "core/evolution/Bitstring.h"

#include <limits>

namespace KnapEvo {

namespace {
bool addWouldOverflow(uint64_t sum, uint64_t addend)
{
    return addend > std::numeric_limits<uint64_t>::max() - sum;
}
} // namespace

Result<KnapsackInstance, std::string> KnapsackInstance::create(
    std::vector<Item> items, uint64_t capacity)
{
    uint64_t totalWeight = 0;
    uint64_t totalValue = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        if (addWouldOverflow(totalWeight, items[i].weight)) {
            return Result<KnapsackInstance, std::string>::error(
                "Total item weight overflows 64 bits at item index " + std::to_string(i));
        }
        if (addWouldOverflow(totalValue, items[i].value)) {
            return Result<KnapsackInstance, std::string>::error(
                "Total item value overflows 64 bits at item index " + std::to_string(i));
        }
        totalWeight += items[i].weight;
        totalValue += items[i].value;
    }

    KnapsackInstance instance(std::move(items), capacity);
    instance.totalWeight_ = totalWeight;
    instance.totalValue_ = totalValue;
    return Result<KnapsackInstance, std::string>::okay(std::move(instance));
}

KnapsackInstance::KnapsackInstance(std::vector<Item> items, uint64_t capacity)
    : items_(std::move(items)), capacity_(capacity)
{}

uint64_t KnapsackInstance::weightOf(const Bitstring& choices) const
{
    KNAPEVO_ASSERT(choices.size() == items_.size(), "Genome length must match item count");

    uint64_t weight = 0;
    for (size_t i = 0; i < items_.size(); ++i) {
        if (choices[i]) {
            weight += items_[i].weight;
        }
    }
    return weight;
}

uint64_t KnapsackInstance::valueOf(const Bitstring& choices) const
{
    KNAPEVO_ASSERT(choices.size() == items_.size(), "Genome length must match item count");

    uint64_t value = 0;
    for (size_t i = 0; i < items_.size(); ++i) {
        if (choices[i]) {
            value += items_[i].value;
        }
    }
    return value;
}

} // namespace KnapEvo
