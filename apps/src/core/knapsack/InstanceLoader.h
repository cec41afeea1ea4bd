#pragma once

#include "KnapsackInstance.h"
#include "core/Result.h"

#include <filesystem>
#include <string>

namespace KnapEvo {

/**
 * Reads knapsack instances in the knapsackProblemInstances text format:
 *
 *   3          <- item count N
 *   1 3 8      <- N lines of "id value weight"
 *   2 2 8
 *   3 9 1
 *   10         <- capacity
 *
 * Blank lines are ignored. Every number is a non-negative 64-bit integer.
 */
Result<KnapsackInstance, std::string> loadInstanceFromFile(const std::filesystem::path& path);

// sourceName only labels error messages.
Result<KnapsackInstance, std::string> loadInstanceFromString(
    const std::string& text, const std::string& sourceName = "<memory>");

} // namespace KnapEvo
