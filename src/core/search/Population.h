#pragma once

#include "EvaluationPool.h"
#include "Individual.h"
#include "PopulationSummary.h"
#include "core/army/SearchSpace.h"

#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace ArmySearch {

/**
 * A generation of individuals with no two sharing the same canonical army.
 */
class Population {
public:
    Population() = default;
    explicit Population(std::vector<Individual> individuals);

    // size armies of cost in [targetCost - maxDecrease, targetCost].
    static Population random(
        const SearchSpace& space,
        size_t size,
        int targetCost,
        std::mt19937& rng,
        int maxDecrease = 100);

    const std::vector<Individual>& individuals() const { return individuals_; }
    size_t size() const { return individuals_.size(); }
    bool empty() const { return individuals_.empty(); }
    const Individual& operator[](size_t index) const { return individuals_[index]; }

    bool contains(const Army& army) const { return armies_.count(army) > 0; }
    const Individual* find(const Army& army) const;

    // False, leaving the population unchanged, when the army is already present.
    bool add(Individual individual);

    size_t unevaluatedCount() const;

    /**
     * Evaluates every individual still lacking a fitness against the battle.
     * Already-evaluated individuals are skipped. On oracle failure the successful
     * results are still kept and the first failure is returned; failed
     * individuals stay unevaluated.
     * @return The number of individuals evaluated by this call.
     */
    Result<size_t, std::string> evaluate(
        const Battle& battle, EvaluationPool& pool, SimulatorOracle::Duration timeout);

    Result<size_t, std::string> evaluate(
        const Battle& battle,
        const SimulatorOracle& oracle,
        int workerCount,
        SimulatorOracle::Duration timeout);

    /**
     * Winners at the best individual's point cost, one per composition
     * description, ordered by remaining team health descending. Falls back to
     * the single best individual when that cost has no winner.
     * Requires every individual to be evaluated.
     */
    std::vector<Individual> bestIndividuals() const;

    // Highest-ranked evaluated individual; nullopt when none is evaluated.
    std::optional<Individual> best() const;

    // Evaluated individuals, best first.
    std::vector<Individual> sortedByFitness() const;

    PopulationSummary summarize() const;

private:
    std::vector<Individual> individuals_;
    std::unordered_map<Army, size_t, ArmyHash> armies_;
};

} // namespace ArmySearch
