#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/evolution/Engine.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/RunResult.h"
#include "core/knapsack/InstanceLoader.h"
#include "core/knapsack/KnapsackInstance.h"
#include <args.hxx>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using namespace KnapEvo;

namespace {

std::string getExamplesHelp()
{
    return "Examples:\n"
           "  knapevo knapsacks/tiny.txt\n"
           "  knapevo --tournament-size 8 --generations 500 knapsacks/big.txt\n"
           "  knapevo --seed 42 --sequential --history knapsacks/small.txt\n\n"
           "Defaults come from knapevo.json (searched in --config-dir, ./config,\n"
           "~/.config/knapevo, /etc/knapevo); command line flags override them.\n";
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "knapevo - genetic algorithm for the 0/1 knapsack problem",
        "Evolves bitstring solutions with tournament selection, uniform crossover and\n"
        "1/N bit-flip mutation, and prints the best solutions as JSON.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<int> population(
        parser, "size", "Population size (default: 1000)", { 'p', "population" });
    args::ValueFlag<int> tournamentSize(
        parser, "size", "Tournament size (default: 2)", { 't', "tournament-size" });
    args::ValueFlag<int> generations(
        parser, "count", "Number of generations (default: 1000)", { 'g', "generations" });
    args::ValueFlag<uint64_t> seed(
        parser, "seed", "Random seed for a reproducible run", { 's', "seed" });
    args::Flag sequential(
        parser, "sequential", "Evaluate on one thread instead of in parallel", { "sequential" });
    args::ValueFlag<int> threads(
        parser, "count", "Evaluation threads (default: detected core count)", { "threads" });
    args::ValueFlag<int> logInterval(
        parser, "count", "Log progress every N generations (0 = never)", { "log-interval" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for knapevo.json", { "config-dir" });
    args::ValueFlag<std::string> logChannels(
        parser, "spec", "Channel log levels, e.g. 'engine:debug,*:warn'", { "log-channels" });
    args::Flag history(
        parser, "history", "Include per-generation records in the output", { "history" });
    args::Positional<std::string> instancePath(
        parser, "instance", "Knapsack instance file", args::Options::Required);

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::Error& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 2;
    }

    // Console logging goes to stderr; stdout carries the JSON result.
    const auto consoleLevel = verbose ? spdlog::level::debug : spdlog::level::info;
    LoggingChannels::initialize(consoleLevel, spdlog::level::debug, "knapevo", true);
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto configResult = ConfigLoader::loadOrDefault();
    if (configResult.isError()) {
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }

    EvolutionConfig config = configResult.value();
    if (population) {
        config.populationSize = args::get(population);
    }
    if (tournamentSize) {
        config.tournamentSize = args::get(tournamentSize);
    }
    if (generations) {
        config.maxGenerations = args::get(generations);
    }
    if (seed) {
        config.seed = args::get(seed);
    }
    if (sequential) {
        config.parallelEvaluation = false;
    }
    if (threads) {
        config.maxParallelEvaluations = args::get(threads);
    }
    if (logInterval) {
        config.logInterval = args::get(logInterval);
    }

    const std::string path = args::get(instancePath);
    auto instanceResult = loadInstanceFromFile(path);
    if (instanceResult.isError()) {
        std::cerr << "Error: " << instanceResult.errorValue() << std::endl;
        return 1;
    }
    auto instance = std::make_shared<const KnapsackInstance>(std::move(instanceResult.value()));

    SLOG_INFO("Running on knapsack at: {}", path);
    SLOG_INFO("Running with tournament size: {}", config.tournamentSize);

    auto engineResult = Engine::create(config, instance);
    if (engineResult.isError()) {
        std::cerr << "Error: " << engineResult.errorValue() << std::endl;
        return 1;
    }
    std::unique_ptr<Engine> engine = std::move(engineResult.value());

    // Ctrl+C ends the run after the current phase; the best-so-far is still reported.
    // Note: Must use C-style function pointer, not lambda.
    static Engine* g_engine = nullptr;
    static auto sigintHandler = +[](int) -> void {
        if (g_engine) {
            g_engine->requestStop();
        }
    };

    g_engine = engine.get();
    auto oldHandler = std::signal(SIGINT, sigintHandler);

    const RunResult result = engine->run();

    std::signal(SIGINT, oldHandler);
    g_engine = nullptr;

    nlohmann::json output;
    output["instance"] = {
        { "path", path },
        { "items", instance->getItemCount() },
        { "capacity", instance->getCapacity() },
        { "totalWeight", instance->getTotalWeight() },
        { "totalValue", instance->getTotalValue() },
    };
    output["config"] = engine->getConfig();
    output["result"] = runResultToJson(result, *instance, static_cast<bool>(history));
    std::cout << output.dump(2) << std::endl;

    // The pool logs from its destructor, so it must go before the loggers do.
    engine.reset();
    spdlog::shutdown();
    return 0;
}
