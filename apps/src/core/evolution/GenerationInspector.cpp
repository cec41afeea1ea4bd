#include "GenerationInspector.h"

#include "Population.h"
#include "core/LoggingChannels.h"

namespace KnapEvo {

BestTrackingInspector::BestTrackingInspector(int logInterval, bool keepHistory)
    : logInterval_(logInterval), keepHistory_(keepHistory)
{}

InspectionState BestTrackingInspector::inspect(InspectionState state, const GenerationView& view)
{
    const Individual& best = view.population.best();
    const PopulationStats stats = view.population.computeStats();

    if (!state.bestEver.has_value() || best.score > state.bestEver->score) {
        state.bestEver = best;
        state.bestEverGeneration = view.generation;
    }

    GenerationRecord record{
        .generation = view.generation,
        .best = best.score,
        .feasibleCount = stats.feasibleCount,
        .meanFeasibleValue = stats.meanFeasibleValue,
        .entropy = stats.entropy,
    };

    LOG_DEBUG(
        Engine,
        "Best score in generation {} was {} (feasible {}/{}, entropy {:.3f})",
        record.generation,
        record.best,
        record.feasibleCount,
        view.population.size(),
        record.entropy);
    if (logInterval_ > 0 && view.generation % logInterval_ == 0) {
        LOG_INFO(
            Engine,
            "Generation {}: best {}, best ever {}, mean feasible value {:.1f}, entropy {:.3f}",
            record.generation,
            record.best,
            state.bestEver->score,
            record.meanFeasibleValue,
            record.entropy);
    }

    if (keepHistory_) {
        state.history.push_back(record);
    }

    return state;
}

} // namespace KnapEvo
