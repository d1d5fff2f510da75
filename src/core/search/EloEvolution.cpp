#include "EloEvolution.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/operators/RandomArmy.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace ArmySearch {

std::string RatedArmy::toString() const
{
    return fmt::format(
        "{} (Elo {:.1f}, W/L/D {}/{}/{})", army.shortDescription(), elo, wins, losses, draws);
}

void updateElo(RatedArmy& first, RatedArmy& second, BattleOutcome outcome, double kFactor)
{
    const double expectedFirst = 1.0 / (1.0 + std::pow(10.0, (second.elo - first.elo) / 400.0));
    const double expectedSecond = 1.0 - expectedFirst;

    double scoreFirst = 0.5;
    switch (outcome) {
        case BattleOutcome::Win:
            scoreFirst = 1.0;
            first.wins++;
            second.losses++;
            break;
        case BattleOutcome::Loss:
            scoreFirst = 0.0;
            first.losses++;
            second.wins++;
            break;
        case BattleOutcome::Timeout:
            first.draws++;
            second.draws++;
            break;
    }

    first.elo += kFactor * (scoreFirst - expectedFirst);
    second.elo += kFactor * ((1.0 - scoreFirst) - expectedSecond);
}

double medianElo(const std::vector<RatedArmy>& population)
{
    ARMYSEARCH_ASSERT(!population.empty(), "medianElo of an empty population");

    std::vector<double> ratings;
    ratings.reserve(population.size());
    for (const RatedArmy& rated : population) {
        ratings.push_back(rated.elo);
    }
    std::sort(ratings.begin(), ratings.end());

    const size_t middle = ratings.size() / 2;
    if (ratings.size() % 2 == 1) {
        return ratings[middle];
    }
    return (ratings[middle - 1] + ratings[middle]) / 2.0;
}

std::vector<RatedArmy> truncateByElo(std::vector<RatedArmy> population, size_t count)
{
    std::stable_sort(
        population.begin(), population.end(), [](const RatedArmy& a, const RatedArmy& b) {
            return a.elo > b.elo;
        });
    if (population.size() > count) {
        population.resize(count);
    }
    return population;
}

const RatedArmy& selectByEloTournament(
    const std::vector<RatedArmy>& population, int tournamentSize, std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(!population.empty(), "Tournament over an empty population");
    ARMYSEARCH_ASSERT(tournamentSize > 0, "tournamentSize must be positive");

    std::uniform_int_distribution<size_t> pick(0, population.size() - 1);
    const RatedArmy* best = &population[pick(rng)];
    for (int i = 1; i < tournamentSize; ++i) {
        const RatedArmy& competitor = population[pick(rng)];
        if (competitor.elo > best->elo) {
            best = &competitor;
        }
    }
    return *best;
}

EloEvolution::EloEvolution(
    EloEvolutionConfig config,
    SearchSpace space,
    const SimulatorOracle& oracle,
    int workerCount,
    SimulatorOracle::Duration battleTimeout)
    : EloEvolution(
          std::move(config),
          std::move(space),
          std::make_shared<EvaluationPool>(oracle, workerCount),
          battleTimeout)
{}

EloEvolution::EloEvolution(
    EloEvolutionConfig config,
    SearchSpace space,
    std::shared_ptr<EvaluationPool> pool,
    SimulatorOracle::Duration battleTimeout)
    : config_(std::move(config)), space_(std::move(space)), pool_(std::move(pool)),
      battleTimeout_(battleTimeout)
{
    ARMYSEARCH_ASSERT(!config_.mutations.empty(), "EloEvolution needs at least one mutation");
    ARMYSEARCH_ASSERT(config_.parentsPerGeneration > 0, "parentsPerGeneration must be positive");
    ARMYSEARCH_ASSERT(config_.childrenPerGeneration > 0, "childrenPerGeneration must be positive");
    ARMYSEARCH_ASSERT(config_.matchesPerGeneration > 0, "matchesPerGeneration must be positive");
    ARMYSEARCH_ASSERT(config_.kFactor > 0.0, "kFactor must be positive");
    ARMYSEARCH_ASSERT(pool_ != nullptr, "EloEvolution needs an evaluation pool");
}

RatedArmy EloEvolution::rate(Army army) const
{
    const int points = army.points(space_.catalog);
    return RatedArmy{ .army = std::move(army), .points = points, .elo = config_.initialElo };
}

std::vector<RatedArmy> EloEvolution::randomPopulation(std::mt19937& rng) const
{
    std::vector<RatedArmy> population;
    population.reserve(static_cast<size_t>(config_.parentsPerGeneration));
    for (int i = 0; i < config_.parentsPerGeneration; ++i) {
        population.push_back(rate(generateRandomArmy(space_, config_.targetCost, 0, rng)));
    }
    return population;
}

Result<std::vector<RatedArmy>, std::string> EloEvolution::step(
    std::vector<RatedArmy> population, std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(!population.empty(), "EloEvolution::step on an empty population");

    std::uniform_int_distribution<size_t> pickMutation(0, config_.mutations.size() - 1);
    std::vector<RatedArmy> children;
    children.reserve(static_cast<size_t>(config_.childrenPerGeneration));
    for (int i = 0; i < config_.childrenPerGeneration; ++i) {
        const RatedArmy& parent = selectByEloTournament(population, config_.tournamentSize, rng);
        children.push_back(
            rate(applyMutation(config_.mutations[pickMutation(rng)], parent.army, space_, rng)));
    }

    std::uniform_int_distribution<size_t> pickChild(0, children.size() - 1);
    std::uniform_int_distribution<size_t> pickIncumbent(0, population.size() - 1);
    std::vector<std::pair<size_t, size_t>> pairings;
    std::vector<EvaluationPool::Match> matches;
    for (int i = 0; i < config_.matchesPerGeneration; ++i) {
        const size_t child = pickChild(rng);
        const size_t incumbent = pickIncumbent(rng);
        pairings.emplace_back(child, incumbent);
        matches.push_back(EvaluationPool::Match{ .ally = children[child].army,
                                                 .enemy = population[incumbent].army.mirrored() });
    }

    const auto results = pool_->play(matches, battleTimeout_);
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].isError()) {
            return Result<std::vector<RatedArmy>, std::string>::error(
                "Match '" + matches[i].ally.shortDescription() + "' vs '"
                + population[pairings[i].second].army.shortDescription()
                + "': " + results[i].errorValue());
        }
    }

    // Sequential updates: each match sees the ratings left by the ones before it.
    for (size_t i = 0; i < results.size(); ++i) {
        const auto [child, incumbent] = pairings[i];
        updateElo(
            children[child], population[incumbent], results[i].value().outcome, config_.kFactor);
    }

    for (RatedArmy& child : children) {
        population.push_back(std::move(child));
    }
    return Result<std::vector<RatedArmy>, std::string>::okay(
        truncateByElo(std::move(population), static_cast<size_t>(config_.parentsPerGeneration)));
}

Result<EloRunResult, std::string> EloEvolution::run(
    std::vector<RatedArmy> population, int generations, std::mt19937& rng, Deadline deadline)
{
    EloRunResult runResult;
    for (int generation = 0; generation < generations; ++generation) {
        if (deadline.has_value() && std::chrono::steady_clock::now() >= deadline.value()) {
            LOG_INFO(
                Evolution,
                "Deadline reached after {} of {} Elo generations",
                runResult.generationsCompleted,
                generations);
            runResult.timedOut = true;
            break;
        }

        auto next = step(std::move(population), rng);
        if (next.isError()) {
            return Result<EloRunResult, std::string>::error(next.errorValue());
        }
        population = std::move(next).value();
        runResult.generationsCompleted++;

        LOG_INFO(
            Evolution,
            "Elo generation {}: best {:.1f}, median {:.1f}, worst {:.1f}",
            generation + 1,
            population.front().elo,
            medianElo(population),
            population.back().elo);
        LOG_DEBUG(Evolution, "Top army: {}", population.front().toString());
    }

    const size_t size = population.size();
    runResult.population = truncateByElo(std::move(population), size);
    return Result<EloRunResult, std::string>::okay(std::move(runResult));
}

} // namespace ArmySearch
