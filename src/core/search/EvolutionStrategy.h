#pragma once

#include "Evaluator.h"
#include "Population.h"
#include "SearchConfig.h"
#include "core/army/SearchSpace.h"

#include <chrono>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace ArmySearch {

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

struct EvolutionRunResult {
    Population population;
    std::optional<Individual> best;
    int generationsCompleted = 0;
    bool timedOut = false;
};

/**
 * Self-adaptive (mu + lambda) evolution strategy.
 *
 * One step: draw parents and weighted-random mutation chains until the working
 * set holds parentsPerGeneration + childrenPerGeneration distinct armies (parents
 * included), evaluate it, keep the fittest parentsPerGeneration subject to the
 * per-composition category cap, then rescale each operator's weight by
 *   1 + adaptationRate * (successes - failures) / (successes + failures + 1)
 * where a success is a new child that outranks its parent, and renormalize the
 * weights to sum to one. mutationAdaptationRate must lie in [0, 1].
 *
 * Rates start at 1/n and are owned by this instance only.
 */
class EvolutionStrategy {
public:
    EvolutionStrategy(EvolutionStrategyConfig config, SearchSpace space);

    Result<Population, std::string> step(
        const Population& population, Evaluator& evaluator, std::mt19937& rng);

    // Repeated steps until the generation count or the deadline is reached.
    Result<EvolutionRunResult, std::string> run(
        Population population,
        Evaluator& evaluator,
        int generations,
        std::mt19937& rng,
        Deadline deadline = std::nullopt);

    const EvolutionStrategyConfig& config() const { return config_; }
    const std::vector<double>& rates() const { return rates_; }

    // Current weights keyed by operator display name, in line-up order.
    std::vector<std::pair<std::string, double>> mutationRates() const;

private:
    struct Attribution {
        size_t mutationIndex = 0;
        Fitness parentFitness;
        Army child;
    };

    Population selectSurvivors(const Population& candidates) const;
    void adaptRates(const std::vector<Attribution>& attributions, const Population& evaluated);

    EvolutionStrategyConfig config_;
    SearchSpace space_;
    std::vector<double> rates_;
};

} // namespace ArmySearch
