#include "Population.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/operators/RandomArmy.h"

#include <algorithm>
#include <unordered_set>

namespace ArmySearch {

Population::Population(std::vector<Individual> individuals)
{
    individuals_.reserve(individuals.size());
    for (auto& individual : individuals) {
        add(std::move(individual));
    }
}

Population Population::random(
    const SearchSpace& space, size_t size, int targetCost, std::mt19937& rng, int maxDecrease)
{
    Population population;
    while (population.size() < size) {
        Army army = generateRandomArmy(space, targetCost, maxDecrease, rng);
        population.add(Individual(std::move(army), space.catalog));
    }
    return population;
}

bool Population::add(Individual individual)
{
    if (!armies_.emplace(individual.army(), individuals_.size()).second) {
        return false;
    }
    individuals_.push_back(std::move(individual));
    return true;
}

const Individual* Population::find(const Army& army) const
{
    const auto it = armies_.find(army);
    return it == armies_.end() ? nullptr : &individuals_[it->second];
}

size_t Population::unevaluatedCount() const
{
    return static_cast<size_t>(
        std::count_if(individuals_.begin(), individuals_.end(), [](const Individual& ind) {
            return ind.needsEvaluation();
        }));
}

Result<size_t, std::string> Population::evaluate(
    const Battle& battle, EvaluationPool& pool, SimulatorOracle::Duration timeout)
{
    const uint64_t enemyFingerprint = battle.enemies.fingerprint();
    std::vector<EvaluationPool::Task> tasks;
    for (size_t i = 0; i < individuals_.size(); ++i) {
        const Individual& individual = individuals_[i];
        if (const auto* evaluated = std::get_if<Individual::Evaluated>(&individual.state())) {
            ARMYSEARCH_ASSERT(
                evaluated->enemyFingerprint == enemyFingerprint,
                "Individual '" + individual.shortDescription()
                    + "' re-evaluated against a different enemy army");
            continue;
        }
        tasks.push_back(EvaluationPool::Task{
            .index = i, .army = individual.army(), .points = individual.points() });
    }
    if (tasks.empty()) {
        return Result<size_t, std::string>::okay(0);
    }

    LOG_DEBUG(
        Evaluation,
        "Evaluating {} of {} individuals on {} workers",
        tasks.size(),
        individuals_.size(),
        pool.workerCount());

    std::optional<std::string> firstError;
    size_t evaluated = 0;

    for (auto& result : pool.evaluate(battle, std::move(tasks), timeout)) {
        Individual& individual = individuals_[result.index];
        if (result.fitness.isError()) {
            if (!firstError.has_value()) {
                firstError = "Evaluation of '" + individual.shortDescription()
                    + "' failed: " + result.fitness.errorValue();
            }
            continue;
        }
        individual.setFitness(result.fitness.value(), enemyFingerprint);
        evaluated++;
    }

    if (firstError.has_value()) {
        return Result<size_t, std::string>::error(firstError.value());
    }
    return Result<size_t, std::string>::okay(evaluated);
}

Result<size_t, std::string> Population::evaluate(
    const Battle& battle,
    const SimulatorOracle& oracle,
    int workerCount,
    SimulatorOracle::Duration timeout)
{
    EvaluationPool pool(
        oracle, resolveWorkerCount(workerCount, static_cast<int>(unevaluatedCount())));
    return evaluate(battle, pool, timeout);
}

std::vector<Individual> Population::sortedByFitness() const
{
    std::vector<Individual> sorted;
    for (const Individual& individual : individuals_) {
        if (!individual.needsEvaluation()) {
            sorted.push_back(individual);
        }
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Individual& a, const Individual& b) {
        return a.fitness() > b.fitness();
    });
    return sorted;
}

std::optional<Individual> Population::best() const
{
    const Individual* bestIndividual = nullptr;
    for (const Individual& individual : individuals_) {
        if (individual.needsEvaluation()) {
            continue;
        }
        if (!bestIndividual || individual.fitness() > bestIndividual->fitness()) {
            bestIndividual = &individual;
        }
    }
    if (!bestIndividual) {
        return std::nullopt;
    }
    return *bestIndividual;
}

std::vector<Individual> Population::bestIndividuals() const
{
    ARMYSEARCH_ASSERT(!individuals_.empty(), "bestIndividuals() on an empty population");

    const Individual* top = &individuals_.front();
    for (const Individual& individual : individuals_) {
        if (individual.fitness() > top->fitness()) {
            top = &individual;
        }
    }

    const int bestPoints = top->fitness().points;
    std::vector<Individual> winners;
    std::unordered_set<std::string> seen;
    for (const Individual& individual : individuals_) {
        const Fitness& fitness = individual.fitness();
        if (fitness.isWin() && fitness.points == bestPoints
            && seen.insert(individual.shortDescription()).second) {
            winners.push_back(individual);
        }
    }

    if (winners.empty()) {
        return { *top };
    }

    std::stable_sort(winners.begin(), winners.end(), [](const Individual& a, const Individual& b) {
        return a.fitness().teamHealth > b.fitness().teamHealth;
    });
    return winners;
}

PopulationSummary Population::summarize() const
{
    PopulationSummary summary;
    summary.size = individuals_.size();

    std::vector<double> winningPoints;
    std::vector<double> losingEnemyHealth;
    for (const Individual& individual : individuals_) {
        for (const Placement& placement : individual.army().placements()) {
            summary.unitCounts[toString(placement.type)]++;
        }
        if (individual.needsEvaluation()) {
            continue;
        }

        summary.evaluated++;
        const Fitness& fitness = individual.fitness();
        switch (fitness.outcome) {
            case BattleOutcome::Win:
                summary.wins++;
                winningPoints.push_back(static_cast<double>(fitness.points));
                break;
            case BattleOutcome::Loss:
                summary.losses++;
                losingEnemyHealth.push_back(fitness.enemyHealth);
                break;
            case BattleOutcome::Timeout:
                summary.timeouts++;
                break;
        }
    }

    if (!winningPoints.empty()) {
        summary.winningPointQuantiles = computeQuantiles(std::move(winningPoints));
    }
    if (!losingEnemyHealth.empty()) {
        summary.losingEnemyHealthQuantiles = computeQuantiles(std::move(losingEnemyHealth));
    }

    if (!individuals_.empty() && summary.evaluated == individuals_.size()) {
        for (const Individual& individual : bestIndividuals()) {
            summary.bestDescriptions.push_back(
                individual.shortDescription() + " | " + individual.fitness().toString());
            for (const Placement& placement : individual.army().placements()) {
                summary.bestUnitCounts[toString(placement.type)]++;
            }
        }
    }
    return summary;
}

} // namespace ArmySearch
