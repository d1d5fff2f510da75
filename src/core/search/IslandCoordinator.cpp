#include "IslandCoordinator.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <thread>

namespace ArmySearch {

IslandCoordinator::IslandCoordinator(
    IslandConfig config,
    EvolutionStrategyConfig strategyConfig,
    SearchSpace space,
    Battle battle,
    const SimulatorOracle& oracle,
    SimulatorOracle::Duration battleTimeout)
    : config_(std::move(config)), migrationRng_(config_.seed)
{
    ARMYSEARCH_ASSERT(config_.numIslands > 0, "IslandCoordinator needs at least one island");

    const int totalWorkers = resolveWorkerCount(config_.totalWorkers);
    workersPerIsland_ = std::max(1, totalWorkers / config_.numIslands);

    LOG_INFO(
        Island,
        "Starting {} islands on battle '{}' with {} workers each",
        config_.numIslands,
        battle.id,
        workersPerIsland_);

    const int targetCost = searchTargetCost(battle);
    islands_.reserve(static_cast<size_t>(config_.numIslands));
    for (int i = 0; i < config_.numIslands; ++i) {
        Island island{
            .population = Population(),
            .strategy = std::make_unique<EvolutionStrategy>(strategyConfig, space),
            .evaluator =
                std::make_unique<Evaluator>(battle, oracle, workersPerIsland_, battleTimeout),
            .rng = std::mt19937(config_.seed + 1 + static_cast<uint32_t>(i)),
        };
        island.population = Population::random(
            space,
            static_cast<size_t>(strategyConfig.parentsPerGeneration),
            targetCost,
            island.rng);
        islands_.push_back(std::move(island));
    }
}

IslandCoordinator::~IslandCoordinator() = default;

const Population& IslandCoordinator::population(size_t island) const
{
    ARMYSEARCH_ASSERT(island < islands_.size(), "Island index out of range");
    return islands_[island].population;
}

void IslandCoordinator::setPopulation(size_t island, Population population)
{
    ARMYSEARCH_ASSERT(island < islands_.size(), "Island index out of range");
    ARMYSEARCH_ASSERT(!population.empty(), "Island population must not be empty");
    islands_[island].population = std::move(population);
}

Result<bool, std::string> IslandCoordinator::runEpoch(Deadline deadline)
{
    std::vector<std::optional<Result<EvolutionRunResult, std::string>>> results(islands_.size());
    std::vector<std::thread> threads;
    threads.reserve(islands_.size());

    for (size_t i = 0; i < islands_.size(); ++i) {
        threads.emplace_back([this, i, deadline, &results]() {
            Island& island = islands_[i];
            results[i] = island.strategy->run(
                island.population,
                *island.evaluator,
                config_.generationsPerEpoch,
                island.rng,
                deadline);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    bool timedOut = false;
    for (size_t i = 0; i < islands_.size(); ++i) {
        auto& result = results[i].value();
        if (result.isError()) {
            LOG_ERROR(Island, "Island {} failed: {}", i, result.errorValue());
            return Result<bool, std::string>::error(
                "Island " + std::to_string(i) + ": " + result.errorValue());
        }

        EvolutionRunResult& run = result.value();
        islands_[i].population = std::move(run.population);
        timedOut = timedOut || run.timedOut;
        if (run.best.has_value()) {
            LOG_INFO(
                Island,
                "Island {}: {} ({})",
                i,
                run.best->fitness().toString(),
                run.best->shortDescription());
        }
    }
    return Result<bool, std::string>::okay(timedOut);
}

void IslandCoordinator::migrate()
{
    if (islands_.size() < 2) {
        return;
    }

    // Snapshot every best before any island changes.
    std::vector<std::optional<Individual>> bests;
    bests.reserve(islands_.size());
    for (const Island& island : islands_) {
        bests.push_back(island.population.best());
    }

    for (size_t i = 0; i < islands_.size(); ++i) {
        std::uniform_int_distribution<size_t> pick(0, islands_.size() - 2);
        size_t source = pick(migrationRng_);
        if (source >= i) {
            source++;
        }
        if (!bests[source].has_value()) {
            continue;
        }

        Population next;
        if (bests[i].has_value()) {
            next.add(bests[i].value());
        }
        next.add(bests[source].value());
        for (const Individual& individual : islands_[i].population.individuals()) {
            next.add(individual);
        }

        LOG_DEBUG(
            Island,
            "Migrating '{}' from island {} to island {}",
            bests[source]->shortDescription(),
            source,
            i);
        islands_[i].population = std::move(next);
    }
}

std::optional<Individual> IslandCoordinator::globalBest() const
{
    std::optional<Individual> best;
    for (const Island& island : islands_) {
        auto candidate = island.population.best();
        if (candidate.has_value()
            && (!best.has_value() || candidate->fitness() > best->fitness())) {
            best = std::move(candidate);
        }
    }
    return best;
}

Result<IslandRunResult, std::string> IslandCoordinator::run()
{
    Deadline deadline;
    if (config_.optimizationTimeoutSeconds > 0.0) {
        deadline = std::chrono::steady_clock::now()
            + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                       std::chrono::duration<double>(config_.optimizationTimeoutSeconds));
    }

    IslandRunResult runResult;
    for (int epoch = 0; epoch < config_.numEpochs; ++epoch) {
        if (epoch > 0) {
            migrate();
        }

        auto epochResult = runEpoch(deadline);
        if (epochResult.isError()) {
            return Result<IslandRunResult, std::string>::error(epochResult.errorValue());
        }
        runResult.epochsCompleted++;

        if (epochResult.value()) {
            LOG_INFO(Island, "Optimization timeout reached in epoch {}", epoch + 1);
            runResult.timedOut = true;
            break;
        }
    }

    runResult.best = globalBest();
    for (const Island& island : islands_) {
        runResult.populations.push_back(island.population);
    }
    if (runResult.best.has_value()) {
        LOG_INFO(
            Island,
            "Global best: {} ({})",
            runResult.best->fitness().toString(),
            runResult.best->shortDescription());
    }
    return Result<IslandRunResult, std::string>::okay(std::move(runResult));
}

} // namespace ArmySearch
