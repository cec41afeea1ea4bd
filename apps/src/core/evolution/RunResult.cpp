#include "RunResult.h"

#include "core/knapsack/KnapsackInstance.h"

#include <nlohmann/json.hpp>

namespace KnapEvo {

void to_json(nlohmann::json& j, const GenerationRecord& record)
{
    j = nlohmann::json{
        { "generation", record.generation },
        { "best", record.best },
        { "feasibleCount", record.feasibleCount },
        { "meanFeasibleValue", record.meanFeasibleValue },
        { "entropy", record.entropy },
    };
}

nlohmann::json individualToJson(const Individual& individual, const KnapsackInstance& instance)
{
    return nlohmann::json{
        { "score", individual.score },
        { "weight", instance.weightOf(individual.genome) },
        { "itemsPacked", individual.genome.countSet() },
        { "genome", individual.genome.toString() },
    };
}

nlohmann::json runResultToJson(
    const RunResult& result, const KnapsackInstance& instance, bool includeHistory)
{
    nlohmann::json j;
    j["bestOverall"] = result.bestEver.has_value()
        ? individualToJson(result.bestEver.value(), instance)
        : nlohmann::json(nullptr);
    j["bestOverallGeneration"] = result.bestEverGeneration;
    j["bestFinal"] = result.finalGenerationBest.has_value()
        ? individualToJson(result.finalGenerationBest.value(), instance)
        : nlohmann::json(nullptr);
    j["generationsCompleted"] = result.generationsCompleted;
    j["stoppedEarly"] = result.stoppedEarly;
    j["seed"] = result.seed;
    j["durationSec"] = result.durationSec;
    if (includeHistory) {
        j["history"] = result.history;
    }
    return j;
}

} // namespace KnapEvo
