#pragma once

#include "Evaluator.h"
#include "Population.h"
#include "SearchConfig.h"
#include "core/army/SearchSpace.h"

#include <random>
#include <string>

namespace ArmySearch {

/**
 * Generational GA: the top elitismSize individuals survive unchanged, the rest of
 * the generation is filled with selected pairs that are recombined with
 * probability crossoverRate and mutated with probability mutationRate each.
 * Duplicate armies are dropped. Population size is preserved.
 */
class ElitistEvolution {
public:
    ElitistEvolution(ElitistEvolutionConfig config, SearchSpace space);

    Result<Population, std::string> step(
        const Population& population, Evaluator& evaluator, std::mt19937& rng);

    const ElitistEvolutionConfig& config() const { return config_; }

private:
    Army maybeMutate(const Army& army, std::mt19937& rng) const;

    ElitistEvolutionConfig config_;
    SearchSpace space_;
};

} // namespace ArmySearch
