#include "EvolutionStrategy.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <map>

namespace ArmySearch {

EvolutionStrategy::EvolutionStrategy(EvolutionStrategyConfig config, SearchSpace space)
    : config_(std::move(config)), space_(std::move(space))
{
    ARMYSEARCH_ASSERT(!config_.mutations.empty(), "EvolutionStrategy needs at least one mutation");
    ARMYSEARCH_ASSERT(config_.parentsPerGeneration > 0, "parentsPerGeneration must be positive");
    ARMYSEARCH_ASSERT(config_.childrenPerGeneration > 0, "childrenPerGeneration must be positive");
    ARMYSEARCH_ASSERT(config_.categoryCap > 0, "categoryCap must be positive");
    ARMYSEARCH_ASSERT(config_.mutationsPerChild > 0, "mutationsPerChild must be positive");
    ARMYSEARCH_ASSERT(
        config_.mutationAdaptationRate >= 0.0 && config_.mutationAdaptationRate <= 1.0,
        "mutationAdaptationRate must lie in [0, 1]");

    rates_.assign(config_.mutations.size(), 1.0 / static_cast<double>(config_.mutations.size()));
}

Result<Population, std::string> EvolutionStrategy::step(
    const Population& population, Evaluator& evaluator, std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(!population.empty(), "EvolutionStrategy::step on an empty population");

    // Parents need a fitness to be credited against.
    Population parents = population;
    if (auto result = evaluator.evaluate(parents); result.isError()) {
        return Result<Population, std::string>::error(result.errorValue());
    }

    const size_t target =
        static_cast<size_t>(config_.parentsPerGeneration + config_.childrenPerGeneration);
    Population working = parents;
    std::vector<Attribution> attributions;
    std::discrete_distribution<size_t> pickMutation(rates_.begin(), rates_.end());
    std::vector<size_t> chain(static_cast<size_t>(config_.mutationsPerChild));

    int attempts = 0;
    while (working.size() < target) {
        if (attempts++ >= config_.maxOffspringAttempts) {
            LOG_WARN(
                Evolution,
                "Gave up on offspring after {} attempts with {} of {} distinct armies",
                config_.maxOffspringAttempts,
                working.size(),
                target);
            break;
        }

        const Individual& parent = selectParent(config_.selector, parents.individuals(), rng);
        Army child = parent.army();
        for (size_t& mutationIndex : chain) {
            mutationIndex = pickMutation(rng);
            child = applyMutation(config_.mutations[mutationIndex], child, space_, rng);
        }

        if (working.contains(child)) {
            continue;
        }
        for (const size_t mutationIndex : chain) {
            attributions.push_back(Attribution{ .mutationIndex = mutationIndex,
                                                .parentFitness = parent.fitness(),
                                                .child = child });
        }
        working.add(Individual(std::move(child), space_.catalog));
    }

    if (auto result = evaluator.evaluate(working); result.isError()) {
        return Result<Population, std::string>::error(result.errorValue());
    }

    Population next = selectSurvivors(working);
    adaptRates(attributions, working);

    if (LoggingChannels::get(LogChannel::Evolution)->should_log(spdlog::level::debug)) {
        LOG_DEBUG(Evolution, "Generation summary:\n{}", next.summarize().toString());
    }
    return Result<Population, std::string>::okay(std::move(next));
}

Population EvolutionStrategy::selectSurvivors(const Population& candidates) const
{
    Population next;
    std::map<CompositionKey, int> categoryCounts;
    for (Individual& individual : candidates.sortedByFitness()) {
        int& count = categoryCounts[individual.army().composition()];
        if (count >= config_.categoryCap) {
            continue;
        }
        count++;
        next.add(std::move(individual));
        if (next.size() >= static_cast<size_t>(config_.parentsPerGeneration)) {
            break;
        }
    }
    return next;
}

void EvolutionStrategy::adaptRates(
    const std::vector<Attribution>& attributions, const Population& evaluated)
{
    std::vector<int> successes(rates_.size(), 0);
    std::vector<int> counts(rates_.size(), 0);

    for (const Attribution& attribution : attributions) {
        const Individual* child = evaluated.find(attribution.child);
        if (!child || child->needsEvaluation()) {
            continue;
        }
        counts[attribution.mutationIndex]++;
        if (child->fitness() > attribution.parentFitness) {
            successes[attribution.mutationIndex]++;
        }
    }

    // With the adaptation rate in [0, 1] every factor is positive.
    double total = 0.0;
    for (size_t i = 0; i < rates_.size(); ++i) {
        const int failures = counts[i] - successes[i];
        rates_[i] *= 1.0
            + config_.mutationAdaptationRate * static_cast<double>(successes[i] - failures)
                / static_cast<double>(counts[i] + 1);
        total += rates_[i];
    }

    // Weights always sum to one.
    for (double& rate : rates_) {
        rate /= total;
    }
}

Result<EvolutionRunResult, std::string> EvolutionStrategy::run(
    Population population,
    Evaluator& evaluator,
    int generations,
    std::mt19937& rng,
    Deadline deadline)
{
    const auto expired = [&deadline]() {
        return deadline.has_value() && std::chrono::steady_clock::now() >= deadline.value();
    };

    EvolutionRunResult runResult;
    if (expired()) {
        runResult.population = std::move(population);
        runResult.best = runResult.population.best();
        runResult.timedOut = true;
        return Result<EvolutionRunResult, std::string>::okay(std::move(runResult));
    }

    if (auto result = evaluator.evaluate(population); result.isError()) {
        return Result<EvolutionRunResult, std::string>::error(result.errorValue());
    }
    runResult.best = population.best();

    for (int generation = 0; generation < generations; ++generation) {
        if (expired()) {
            LOG_INFO(
                Evolution,
                "Deadline reached after {} of {} generations",
                runResult.generationsCompleted,
                generations);
            runResult.timedOut = true;
            break;
        }

        auto next = step(population, evaluator, rng);
        if (next.isError()) {
            return Result<EvolutionRunResult, std::string>::error(next.errorValue());
        }
        population = std::move(next).value();
        runResult.generationsCompleted++;

        auto generationBest = population.best();
        if (generationBest.has_value()
            && (!runResult.best.has_value()
                || generationBest->fitness() > runResult.best->fitness())) {
            runResult.best = std::move(generationBest);
        }
        if (runResult.best.has_value()) {
            LOG_INFO(
                Evolution,
                "Generation {}: best {} ({})",
                generation + 1,
                runResult.best->fitness().toString(),
                runResult.best->shortDescription());
        }
    }

    runResult.population = std::move(population);
    return Result<EvolutionRunResult, std::string>::okay(std::move(runResult));
}

std::vector<std::pair<std::string, double>> EvolutionStrategy::mutationRates() const
{
    std::vector<std::pair<std::string, double>> named;
    named.reserve(rates_.size());
    for (size_t i = 0; i < rates_.size(); ++i) {
        named.emplace_back(mutationName(config_.mutations[i]), rates_[i]);
    }
    return named;
}

} // namespace ArmySearch
