#include "BalanceSurvey.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/fmt/fmt.h>

namespace ArmySearch {

BalanceSurvey::BalanceSurvey(
    std::vector<Battle> battles,
    EvolutionStrategyConfig strategyConfig,
    SearchSpace space,
    const SimulatorOracle& oracle,
    EvaluationConfig evaluationConfig,
    uint32_t seed)
    : rng_(seed)
{
    ARMYSEARCH_ASSERT(!battles.empty(), "BalanceSurvey needs at least one battle");

    auto pool = std::make_shared<EvaluationPool>(oracle, evaluationConfig.workerCount);
    const SimulatorOracle::Duration timeout(evaluationConfig.battleTimeoutSeconds);

    for (auto& battle : battles) {
        const int targetCost = searchTargetCost(battle);
        LOG_INFO(Balance, "Seeding battle '{}' at {} points", battle.id, targetCost);

        Entry entry{
            .population = Population::random(
                space,
                static_cast<size_t>(strategyConfig.parentsPerGeneration),
                targetCost,
                rng_),
            .strategy = std::make_unique<EvolutionStrategy>(strategyConfig, space),
            .evaluator = std::make_unique<Evaluator>(std::move(battle), pool, timeout),
        };
        entries_.push_back(std::move(entry));
    }
}

const Population& BalanceSurvey::population(size_t battle) const
{
    ARMYSEARCH_ASSERT(battle < entries_.size(), "Battle index out of range");
    return entries_[battle].population;
}

Result<SurveyRound, std::string> BalanceSurvey::runRound()
{
    SurveyRound round;
    round.generation = generation_;

    for (Entry& entry : entries_) {
        const Battle& battle = entry.evaluator->battle();
        if (auto result = entry.evaluator->evaluate(entry.population); result.isError()) {
            return Result<SurveyRound, std::string>::error(
                "Battle '" + battle.id + "': " + result.errorValue());
        }

        const Individual best = entry.population.bestIndividuals().front();
        for (const Placement& placement : best.army().placements()) {
            round.bestUnitCounts[toString(placement.type)]++;
        }
        for (const Placement& placement : battle.enemies.placements()) {
            round.enemyUnitCounts[toString(placement.type)]++;
        }

        const std::optional<Grade> grade = best.fitness().grade;
        round.gradeCounts[grade.has_value() ? toString(grade.value()) : "N/A"]++;
        round.battles.push_back(BattleSurveyEntry{
            .battleId = battle.id,
            .bestDescription = best.shortDescription(),
            .bestFitness = best.fitness(),
            .grade = grade,
        });
        LOG_DEBUG(
            Balance, "{}: {} ({})", battle.id, best.shortDescription(), best.fitness().toString());
    }

    for (Entry& entry : entries_) {
        auto next = entry.strategy->step(entry.population, *entry.evaluator, rng_);
        if (next.isError()) {
            return Result<SurveyRound, std::string>::error(
                "Battle '" + entry.evaluator->battle().id + "': " + next.errorValue());
        }
        entry.population = std::move(next).value();
    }

    generation_++;
    LOG_INFO(Balance, "Survey round {}:\n{}", round.generation, round.toString());
    return Result<SurveyRound, std::string>::okay(std::move(round));
}

std::string SurveyRound::toString() const
{
    std::ostringstream out;
    for (const auto& entry : battles) {
        out << fmt::format(
            "  {:<16} {:<7} {}\n",
            entry.battleId,
            entry.grade.has_value() ? ArmySearch::toString(entry.grade.value()) : "N/A",
            entry.bestDescription);
    }

    out << fmt::format("{:<24} {:<15} {:<15}\n", "Unit type", "Best solutions", "Enemy forces");
    std::map<std::string, std::pair<int, int>> usage;
    for (const auto& [name, count] : bestUnitCounts) {
        usage[name].first = count;
    }
    for (const auto& [name, count] : enemyUnitCounts) {
        usage[name].second = count;
    }
    for (const auto& [name, counts] : usage) {
        out << fmt::format("{:<24} {:<15} {:<15}\n", name, counts.first, counts.second);
    }

    out << "Grades:";
    for (const auto& [grade, count] : gradeCounts) {
        out << " " << grade << "=" << count;
    }
    out << "\n";
    return out.str();
}

void to_json(nlohmann::json& j, const SurveyRound& round)
{
    nlohmann::json battles = nlohmann::json::array();
    for (const auto& entry : round.battles) {
        nlohmann::json item{
            { "battle_id", entry.battleId },
            { "best", entry.bestDescription },
            { "outcome", toString(entry.bestFitness.outcome) },
            { "points", entry.bestFitness.points },
            { "team_health", entry.bestFitness.teamHealth },
            { "enemy_health", entry.bestFitness.enemyHealth },
        };
        if (entry.grade.has_value()) {
            item["grade"] = toString(entry.grade.value());
        }
        battles.push_back(std::move(item));
    }

    j = nlohmann::json{
        { "generation", round.generation },
        { "battles", battles },
        { "best_unit_counts", round.bestUnitCounts },
        { "enemy_unit_counts", round.enemyUnitCounts },
        { "grade_counts", round.gradeCounts },
    };
}

} // namespace ArmySearch
