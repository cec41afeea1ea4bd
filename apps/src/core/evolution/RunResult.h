#pragma once

#include "GenerationInspector.h"
#include "Individual.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <vector>

namespace KnapEvo {

class KnapsackInstance;

/**
 * Output of a finished (or stopped) run.
 *
 * bestEver and finalGenerationBest are empty only when no generation was
 * evaluated (maxGenerations == 0, or a stop before the first evaluation).
 * Either may hold an Overloaded score.
 */
struct RunResult {
    std::optional<Individual> bestEver;
    int bestEverGeneration = -1;
    std::optional<Individual> finalGenerationBest;
    int generationsCompleted = 0;
    bool stoppedEarly = false;
    uint64_t seed = 0;
    double durationSec = 0.0;
    std::vector<GenerationRecord> history;
};

void to_json(nlohmann::json& j, const GenerationRecord& record);

// Score, packed weight, packed item count and the genome as a 0/1 string.
nlohmann::json individualToJson(const Individual& individual, const KnapsackInstance& instance);

nlohmann::json runResultToJson(
    const RunResult& result, const KnapsackInstance& instance, bool includeHistory);

} // namespace KnapEvo
