#include "ElitistEvolution.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

namespace ArmySearch {

ElitistEvolution::ElitistEvolution(ElitistEvolutionConfig config, SearchSpace space)
    : config_(std::move(config)), space_(std::move(space))
{
    ARMYSEARCH_ASSERT(!config_.crossovers.empty(), "ElitistEvolution needs a crossover");
    ARMYSEARCH_ASSERT(!config_.mutations.empty(), "ElitistEvolution needs a mutation");
}

Army ElitistEvolution::maybeMutate(const Army& army, std::mt19937& rng) const
{
    std::bernoulli_distribution mutate(config_.mutationRate);
    if (!mutate(rng)) {
        return army;
    }
    std::uniform_int_distribution<size_t> pick(0, config_.mutations.size() - 1);
    return applyMutation(config_.mutations[pick(rng)], army, space_, rng);
}

Result<Population, std::string> ElitistEvolution::step(
    const Population& population, Evaluator& evaluator, std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(!population.empty(), "ElitistEvolution::step on an empty population");

    Population current = population;
    if (auto result = evaluator.evaluate(current); result.isError()) {
        return Result<Population, std::string>::error(result.errorValue());
    }

    Population next;
    for (Individual& elite : current.sortedByFitness()) {
        if (next.size() >= static_cast<size_t>(config_.elitismSize)) {
            break;
        }
        next.add(std::move(elite));
    }

    std::bernoulli_distribution crossover(config_.crossoverRate);
    std::uniform_int_distribution<size_t> pickCrossover(0, config_.crossovers.size() - 1);

    int attempts = 0;
    while (next.size() < current.size()) {
        if (attempts++ >= config_.maxOffspringAttempts) {
            LOG_WARN(
                Evolution,
                "Elitist step gave up after {} attempts with {} of {} individuals",
                config_.maxOffspringAttempts,
                next.size(),
                current.size());
            break;
        }

        const Individual& first = selectParent(config_.selector, current.individuals(), rng);
        const Individual& second = selectParent(config_.selector, current.individuals(), rng);

        std::pair<Army, Army> children{ first.army(), second.army() };
        if (crossover(rng)) {
            children = applyCrossover(
                config_.crossovers[pickCrossover(rng)], first.army(), second.army(), rng);
        }

        for (Army* child : { &children.first, &children.second }) {
            if (next.size() >= current.size()) {
                break;
            }
            Army mutated = maybeMutate(*child, rng);
            // Unchanged copies keep the parent's fitness.
            if (const Individual* known = current.find(mutated)) {
                next.add(*known);
            }
            else {
                next.add(Individual(std::move(mutated), space_.catalog));
            }
        }
    }

    if (auto result = evaluator.evaluate(next); result.isError()) {
        return Result<Population, std::string>::error(result.errorValue());
    }
    return Result<Population, std::string>::okay(std::move(next));
}

} // namespace ArmySearch
