#include "Engine.h"

#include "Crossover.h"
#include "EvaluationPool.h"
#include "Mutation.h"
#include "Selection.h"
#include "core/LoggingChannels.h"
#include "core/knapsack/KnapsackInstance.h"

#include <random>

namespace KnapEvo {

namespace {
uint64_t makeRandomSeed()
{
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | static_cast<uint64_t>(device());
}
} // namespace

const char* toString(Engine::Phase phase)
{
    switch (phase) {
        case Engine::Phase::Initializing:
            return "Initializing";
        case Engine::Phase::Evaluating:
            return "Evaluating";
        case Engine::Phase::Reporting:
            return "Reporting";
        case Engine::Phase::Breeding:
            return "Breeding";
        case Engine::Phase::Terminated:
            return "Terminated";
    }
    return "Unknown";
}

Result<std::unique_ptr<Engine>, std::string> Engine::create(
    const EvolutionConfig& config,
    std::shared_ptr<const KnapsackInstance> instance,
    std::unique_ptr<GenerationInspector> inspector)
{
    using CreateResult = Result<std::unique_ptr<Engine>, std::string>;

    const auto validation = validate(config);
    if (validation.isError()) {
        LOG_ERROR(Config, "Rejected run configuration: {}", validation.errorValue());
        return CreateResult::error(validation.errorValue());
    }
    if (!instance) {
        return CreateResult::error("No knapsack instance given");
    }
    if (instance->getItemCount() == 0) {
        LOG_ERROR(Config, "Rejected instance with no items");
        return CreateResult::error("Knapsack instance has no items; genome length would be 0");
    }

    if (!inspector) {
        inspector = std::make_unique<BestTrackingInspector>(config.logInterval);
    }

    const uint64_t seed = config.seed.has_value() ? config.seed.value() : makeRandomSeed();

    // Constructor is private, so make_unique can't reach it.
    std::unique_ptr<Engine> engine(
        new Engine(config, std::move(instance), std::move(inspector), seed));
    return CreateResult::okay(std::move(engine));
}

Engine::Engine(
    const EvolutionConfig& config,
    std::shared_ptr<const KnapsackInstance> instance,
    std::unique_ptr<GenerationInspector> inspector,
    uint64_t seed)
    : config_(config),
      instance_(std::move(instance)),
      scorer_(instance_),
      inspector_(std::move(inspector)),
      seed_(seed),
      rng_(seed)
{
    if (config_.parallelEvaluation) {
        const int workers =
            resolveParallelEvaluations(config_.maxParallelEvaluations, config_.populationSize);
        if (workers > 1) {
            pool_ = std::make_unique<EvaluationPool>(workers);
        }
    }

    LOG_INFO(
        Engine,
        "Engine: items={}, capacity={}, population={}, tournament={}, generations={}, "
        "evaluation={}, seed={}",
        instance_->getItemCount(),
        instance_->getCapacity(),
        config_.populationSize,
        config_.tournamentSize,
        config_.maxGenerations,
        pool_ ? "parallel(" + std::to_string(pool_->getWorkerCount()) + ")" : "sequential",
        seed_);
}

Engine::~Engine() = default;

Engine::Phase Engine::step()
{
    if (phase_ == Phase::Terminated) {
        return phase_;
    }

    if (stopRequested_.load()) {
        LOG_INFO(
            Engine, "Engine: stop requested during {} of generation {}", toString(phase_), generation_);
        terminate(true);
        return phase_;
    }

    const auto start = std::chrono::steady_clock::now();

    switch (phase_) {
        case Phase::Initializing:
            initializePopulation();
            phase_ = config_.maxGenerations == 0 ? Phase::Terminated : Phase::Evaluating;
            break;
        case Phase::Evaluating:
            evaluatePopulation();
            phase_ = Phase::Reporting;
            break;
        case Phase::Reporting:
            reportGeneration();
            // The last generation is not bred; its children would never be scored.
            phase_ =
                generation_ + 1 >= config_.maxGenerations ? Phase::Terminated : Phase::Breeding;
            break;
        case Phase::Breeding:
            breedNextGeneration();
            generation_++;
            phase_ = Phase::Evaluating;
            break;
        case Phase::Terminated:
            break;
    }

    elapsed_ += std::chrono::steady_clock::now() - start;

    if (phase_ == Phase::Terminated) {
        terminate(false);
    }
    return phase_;
}

RunResult Engine::run()
{
    while (step() != Phase::Terminated) {
    }
    return getResult();
}

void Engine::requestStop()
{
    stopRequested_.store(true);
}

RunResult Engine::getResult() const
{
    return RunResult{
        .bestEver = inspection_.bestEver,
        .bestEverGeneration = inspection_.bestEverGeneration,
        .finalGenerationBest = finalGenerationBest_,
        .generationsCompleted = generationsCompleted_,
        .stoppedEarly = stoppedEarly_,
        .seed = seed_,
        .durationSec = std::chrono::duration<double>(elapsed_).count(),
        .history = inspection_.history,
    };
}

void Engine::initializePopulation()
{
    population_ = Population::random(
        static_cast<size_t>(config_.populationSize), instance_->getItemCount(), rng_);
    generation_ = 0;
    LOG_DEBUG(Engine, "Engine: initialized {} random genomes", population_.size());
}

void Engine::evaluatePopulation()
{
    population_.evaluate(scorer_, pool_.get());
    LOG_TRACE(Evaluation, "Engine: evaluated generation {}", generation_);
}

void Engine::reportGeneration()
{
    const GenerationView view{ .generation = generation_, .population = population_ };
    inspection_ = inspector_->inspect(std::move(inspection_), view);

    finalGenerationBest_ = population_.best();
    generationsCompleted_ = generation_ + 1;
}

void Engine::breedNextGeneration()
{
    const size_t populationSize = static_cast<size_t>(config_.populationSize);

    std::vector<Bitstring> offspring;
    offspring.reserve(populationSize);

    MutationStats stats;
    long totalFlips = 0;
    for (size_t i = 0; i < populationSize; ++i) {
        const size_t parentA = tournamentSelectIndex(population_, config_.tournamentSize, rng_);
        const size_t parentB = tournamentSelectIndex(population_, config_.tournamentSize, rng_);
        const Bitstring child =
            uniformCrossover(population_[parentA].genome, population_[parentB].genome, rng_);
        offspring.push_back(mutateOneOverLength(child, rng_, &stats));
        totalFlips += stats.flips;
    }

    LOG_TRACE(
        Engine,
        "Engine: bred generation {} ({} offspring, {:.2f} flips/child)",
        generation_ + 1,
        offspring.size(),
        static_cast<double>(totalFlips) / static_cast<double>(populationSize));

    population_ = Population(std::move(offspring));
}

void Engine::terminate(bool stoppedEarly)
{
    phase_ = Phase::Terminated;
    stoppedEarly_ = stoppedEarly;

    LOG_INFO(
        Engine,
        "Engine: terminated after {} generation(s){}",
        generationsCompleted_,
        stoppedEarly ? " (stopped early)" : "");
    LOG_INFO(
        Engine,
        "Best in final generation: {}",
        finalGenerationBest_ ? toString(finalGenerationBest_->score) : std::string("none"));
    LOG_INFO(
        Engine,
        "Best in overall run: {}",
        inspection_.bestEver ? toString(inspection_.bestEver->score) : std::string("none"));
}

} // namespace KnapEvo
