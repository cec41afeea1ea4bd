#pragma once

#include "CliffScore.h"
#include "Individual.h"

#include <optional>
#include <vector>

namespace KnapEvo {

class Population;

/**
 * Per-generation progress record.
 */
struct GenerationRecord {
    int generation = 0;
    CliffScore best;
    size_t feasibleCount = 0;
    double meanFeasibleValue = 0.0;
    double entropy = 0.0;
};

/**
 * State owned by the caller of an inspector. The engine passes it in each
 * generation and keeps whatever comes back; the inspector holds no
 * references to engine data between calls.
 */
struct InspectionState {
    std::optional<Individual> bestEver;
    int bestEverGeneration = -1;
    std::vector<GenerationRecord> history;
};

struct GenerationView {
    int generation = 0;
    const Population& population; // Fully evaluated.
};

/**
 * Observer invoked once per generation after evaluation. Must not modify the
 * population. Implementations are responsible for maintaining bestEver.
 */
class GenerationInspector {
public:
    virtual ~GenerationInspector() = default;

    virtual InspectionState inspect(InspectionState state, const GenerationView& view) = 0;
};

/**
 * Standard inspector: keeps the best-ever individual (strict improvement
 * only, so the earliest of equal scores wins), buffers a GenerationRecord
 * per generation, and logs progress.
 */
class BestTrackingInspector : public GenerationInspector {
public:
    explicit BestTrackingInspector(int logInterval = 0, bool keepHistory = true);

    InspectionState inspect(InspectionState state, const GenerationView& view) override;

private:
    int logInterval_;
    bool keepHistory_;
};

} // namespace KnapEvo
