#pragma once

#include "Evaluator.h"
#include "EvolutionStrategy.h"
#include "Population.h"
#include "SearchConfig.h"

#include <map>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace ArmySearch {

struct BattleSurveyEntry {
    std::string battleId;
    std::string bestDescription;
    Fitness bestFitness;
    std::optional<Grade> grade; // Empty for ungraded battles.
};

struct SurveyRound {
    int generation = 0;
    std::vector<BattleSurveyEntry> battles;
    std::map<std::string, int> bestUnitCounts;  // Over every battle's best solution.
    std::map<std::string, int> enemyUnitCounts; // Over every battle's enemy force.
    std::map<std::string, int> gradeCounts;     // "S".."F", "Failed", "N/A".

    std::string toString() const;
};

void to_json(nlohmann::json& j, const SurveyRound& round);

/**
 * Evolves one population per battle side by side to see which units the current
 * balance favors. Every battle has its own strategy instance; all of them share
 * one evaluation pool.
 */
class BalanceSurvey {
public:
    BalanceSurvey(
        std::vector<Battle> battles,
        EvolutionStrategyConfig strategyConfig,
        SearchSpace space,
        const SimulatorOracle& oracle,
        EvaluationConfig evaluationConfig,
        uint32_t seed);

    size_t battleCount() const { return entries_.size(); }
    const Population& population(size_t battle) const;
    int generation() const { return generation_; }

    // Reports on the current populations, then evolves each one generation.
    Result<SurveyRound, std::string> runRound();

private:
    struct Entry {
        Population population;
        std::unique_ptr<EvolutionStrategy> strategy;
        std::unique_ptr<Evaluator> evaluator;
    };

    std::vector<Entry> entries_;
    std::mt19937 rng_;
    int generation_ = 0;
};

} // namespace ArmySearch
