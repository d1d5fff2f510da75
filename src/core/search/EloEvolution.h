#pragma once

#include "EvaluationPool.h"
#include "EvolutionStrategy.h"
#include "SearchConfig.h"
#include "core/army/SearchSpace.h"

#include <memory>
#include <random>
#include <string>
#include <vector>

namespace ArmySearch {

/**
 * An army with a self-play rating. Ratings only mean something relative to the
 * population the army has played against.
 */
struct RatedArmy {
    Army army;
    int points = 0;
    double elo = 1000.0;
    int wins = 0;
    int losses = 0;
    int draws = 0;

    int matchesPlayed() const { return wins + losses + draws; }

    // "2 core_archer (Elo 1016.0, W/L/D 1/0/0)"
    std::string toString() const;
};

/**
 * Standard Elo update after one match. outcome is from first's side; a timeout
 * scores half a point to each. Both ratings move by kFactor times the gap
 * between actual and expected score, so the pair's rating sum is unchanged.
 */
void updateElo(RatedArmy& first, RatedArmy& second, BattleOutcome outcome, double kFactor);

double medianElo(const std::vector<RatedArmy>& population);

// Highest rating first, ties in input order, at most count armies.
std::vector<RatedArmy> truncateByElo(std::vector<RatedArmy> population, size_t count);

// Best rating among tournamentSize draws with replacement.
const RatedArmy& selectByEloTournament(
    const std::vector<RatedArmy>& population, int tournamentSize, std::mt19937& rng);

struct EloRunResult {
    std::vector<RatedArmy> population; // Highest rating first.
    int generationsCompleted = 0;
    bool timedOut = false;
};

/**
 * Self-play co-evolution with no fixed enemy.
 *
 * One step: tournament-select childrenPerGeneration parents by rating and mutate
 * each once into a child rated initialElo. Then matchesPerGeneration random
 * (child, incumbent) pairs play in parallel, the child on the ally side and the
 * incumbent mirrored onto the enemy side. Ratings update in match order, and
 * the parentsPerGeneration highest-rated of incumbents plus children survive.
 */
class EloEvolution {
public:
    EloEvolution(
        EloEvolutionConfig config,
        SearchSpace space,
        const SimulatorOracle& oracle,
        int workerCount,
        SimulatorOracle::Duration battleTimeout);
    EloEvolution(
        EloEvolutionConfig config,
        SearchSpace space,
        std::shared_ptr<EvaluationPool> pool,
        SimulatorOracle::Duration battleTimeout);

    // parentsPerGeneration armies costing exactly targetCost, all at initialElo.
    std::vector<RatedArmy> randomPopulation(std::mt19937& rng) const;

    Result<std::vector<RatedArmy>, std::string> step(
        std::vector<RatedArmy> population, std::mt19937& rng);

    Result<EloRunResult, std::string> run(
        std::vector<RatedArmy> population,
        int generations,
        std::mt19937& rng,
        Deadline deadline = std::nullopt);

    const EloEvolutionConfig& config() const { return config_; }

private:
    RatedArmy rate(Army army) const;

    EloEvolutionConfig config_;
    SearchSpace space_;
    std::shared_ptr<EvaluationPool> pool_;
    SimulatorOracle::Duration battleTimeout_;
};

} // namespace ArmySearch
