#pragma once

#include "CliffScorer.h"
#include "EvolutionConfig.h"
#include "GenerationInspector.h"
#include "Population.h"
#include "Rng.h"
#include "RunResult.h"
#include "core/Result.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace KnapEvo {

class EvaluationPool;
class KnapsackInstance;

/**
 * Generational GA run loop for one knapsack instance.
 *
 *   Initializing -> Evaluating(0) -> Reporting(0) -> Breeding(0) -> Evaluating(1) -> ...
 *     -> Reporting(maxGenerations - 1) -> Terminated
 *
 * Each step() advances one phase, so a caller can observe or stop the run
 * between phases. Breeding fills the next generation with
 * mutate(crossover(tournament, tournament)) children; there is no elitism,
 * the inspector's best-ever record keeps the best solution found.
 *
 * All random draws happen on the thread calling step(). Evaluation may run
 * on an EvaluationPool, but scoring is deterministic, so a seeded run gives
 * the same result in either evaluation mode.
 */
class Engine {
public:
    enum class Phase {
        Initializing,
        Evaluating,
        Reporting,
        Breeding,
        Terminated,
    };

    /**
     * Validate the configuration against the instance and build a ready
     * engine. Fails for invalid configs and for instances with no items.
     * A null inspector selects BestTrackingInspector.
     */
    static Result<std::unique_ptr<Engine>, std::string> create(
        const EvolutionConfig& config,
        std::shared_ptr<const KnapsackInstance> instance,
        std::unique_ptr<GenerationInspector> inspector = nullptr);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    Phase step();

    // Step until Terminated and return the result.
    RunResult run();

    /**
     * Ask the run to stop before the next phase. Safe to call from another
     * thread or a signal handler. The result keeps everything found so far.
     */
    void requestStop();
    bool isStopRequested() const { return stopRequested_.load(); }

    Phase getPhase() const { return phase_; }
    int getGeneration() const { return generation_; }
    uint64_t getSeed() const { return seed_; }
    const EvolutionConfig& getConfig() const { return config_; }
    const Population& getPopulation() const { return population_; }
    bool isParallel() const { return pool_ != nullptr; }

    RunResult getResult() const;

private:
    Engine(
        const EvolutionConfig& config,
        std::shared_ptr<const KnapsackInstance> instance,
        std::unique_ptr<GenerationInspector> inspector,
        uint64_t seed);

    void initializePopulation();
    void evaluatePopulation();
    void reportGeneration();
    void breedNextGeneration();
    void terminate(bool stoppedEarly);

    EvolutionConfig config_;
    std::shared_ptr<const KnapsackInstance> instance_;
    CliffScorer scorer_;
    std::unique_ptr<GenerationInspector> inspector_;
    std::unique_ptr<EvaluationPool> pool_;

    uint64_t seed_ = 0;
    Rng rng_;

    Phase phase_ = Phase::Initializing;
    int generation_ = 0;
    int generationsCompleted_ = 0;
    Population population_;
    InspectionState inspection_;
    std::optional<Individual> finalGenerationBest_;
    bool stoppedEarly_ = false;
    std::atomic<bool> stopRequested_{ false };
    std::chrono::steady_clock::duration elapsed_{};
};

const char* toString(Engine::Phase phase);

} // namespace KnapEvo
