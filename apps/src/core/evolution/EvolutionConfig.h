#pragma once

#include "core/Result.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>

namespace KnapEvo {

/**
 * Configuration for one evolutionary run.
 */
struct EvolutionConfig {
    int populationSize = 1000;
    int tournamentSize = 2;
    int maxGenerations = 1000;
    bool parallelEvaluation = true;
    int maxParallelEvaluations = 0; // 0 = auto (use detected core count).
    std::optional<uint64_t> seed;   // Unset = seeded from std::random_device.
    int logInterval = 100;          // Info-level progress every N generations; 0 = never.
};

// Rejects out-of-range values; nothing is clamped.
Result<std::monostate, std::string> validate(const EvolutionConfig& config);

void to_json(nlohmann::json& j, const EvolutionConfig& config);
void from_json(const nlohmann::json& j, EvolutionConfig& config);

} // namespace KnapEvo
