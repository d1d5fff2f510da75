#pragma once

#include "Evaluator.h"
#include "EvolutionStrategy.h"
#include "Population.h"
#include "SearchConfig.h"
#include "core/army/SearchSpace.h"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace ArmySearch {

struct IslandRunResult {
    std::optional<Individual> best;
    std::vector<Population> populations;
    int epochsCompleted = 0;
    bool timedOut = false;
};

/**
 * Island model over one battle. Each island owns a population, its own
 * EvolutionStrategy (rates are never shared), its own random stream and its own
 * evaluation workers, which split totalWorkers between them. Islands run their
 * epochs on separate threads; migration happens between epochs only.
 */
class IslandCoordinator {
public:
    IslandCoordinator(
        IslandConfig config,
        EvolutionStrategyConfig strategyConfig,
        SearchSpace space,
        Battle battle,
        const SimulatorOracle& oracle,
        SimulatorOracle::Duration battleTimeout);
    ~IslandCoordinator();

    size_t islandCount() const { return islands_.size(); }
    int workersPerIsland() const { return workersPerIsland_; }
    const Population& population(size_t island) const;
    void setPopulation(size_t island, Population population);

    /**
     * Runs generationsPerEpoch generations on every island concurrently and
     * waits for all of them. A deadline stops each island early.
     * @return true when the deadline cut the epoch short.
     */
    Result<bool, std::string> runEpoch(Deadline deadline = std::nullopt);

    // Every island receives a copy of a random other island's best, next to its own best.
    void migrate();

    // Epochs with migration in between, bounded by the optimization timeout.
    Result<IslandRunResult, std::string> run();

    // Best evaluated individual over all islands.
    std::optional<Individual> globalBest() const;

private:
    struct Island {
        Population population;
        std::unique_ptr<EvolutionStrategy> strategy;
        std::unique_ptr<Evaluator> evaluator;
        std::mt19937 rng;
    };

    IslandConfig config_;
    int workersPerIsland_ = 1;
    std::vector<Island> islands_;
    std::mt19937 migrationRng_;
};

} // namespace ArmySearch
