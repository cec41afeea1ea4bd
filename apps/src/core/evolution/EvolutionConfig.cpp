#include "EvolutionConfig.h"

#include "core/ReflectSerializer.h"

#include <nlohmann/json.hpp>

namespace KnapEvo {

Result<std::monostate, std::string> validate(const EvolutionConfig& config)
{
    using ValidationResult = Result<std::monostate, std::string>;

    if (config.populationSize < 1) {
        return ValidationResult::error(
            "populationSize must be at least 1 (got " + std::to_string(config.populationSize)
            + ")");
    }
    if (config.tournamentSize < 1) {
        return ValidationResult::error(
            "tournamentSize must be at least 1 (got " + std::to_string(config.tournamentSize)
            + ")");
    }
    if (config.maxGenerations < 0) {
        return ValidationResult::error(
            "maxGenerations must not be negative (got " + std::to_string(config.maxGenerations)
            + ")");
    }
    if (config.maxParallelEvaluations < 0) {
        return ValidationResult::error(
            "maxParallelEvaluations must not be negative (got "
            + std::to_string(config.maxParallelEvaluations) + ")");
    }
    if (config.logInterval < 0) {
        return ValidationResult::error(
            "logInterval must not be negative (got " + std::to_string(config.logInterval) + ")");
    }

    return ValidationResult::okay(std::monostate{});
}

void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

} // namespace KnapEvo
