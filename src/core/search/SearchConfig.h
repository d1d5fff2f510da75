#pragma once

#include "Selection.h"
#include "core/operators/Crossover.h"
#include "core/operators/Mutation.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace ArmySearch {

/**
 * Self-adaptive (mu + lambda) strategy settings.
 */
struct EvolutionStrategyConfig {
    int parentsPerGeneration = 10;
    int childrenPerGeneration = 10;
    double mutationAdaptationRate = 0.1;
    int categoryCap = 3;      // Max survivors sharing one unit-type multiset.
    int mutationsPerChild = 1;
    int maxOffspringAttempts = 10000;
    std::vector<Mutation> mutations = defaultMutations();
    ParentSelector selector = Selectors::Uniform{};
};

/**
 * Generational GA with elitism.
 */
struct ElitistEvolutionConfig {
    int elitismSize = 2;
    double crossoverRate = 0.7;
    double mutationRate = 0.4;
    int maxOffspringAttempts = 10000;
    std::vector<Crossover> crossovers = defaultCrossovers();
    std::vector<Mutation> mutations = defaultMutations();
    ParentSelector selector = Selectors::Tournament{ .tournamentSize = 3 };
};

/**
 * Self-play co-evolution: armies are rated by Elo from matches against each other.
 */
struct EloEvolutionConfig {
    int parentsPerGeneration = 100;
    int childrenPerGeneration = 1;
    int matchesPerGeneration = 30;
    int tournamentSize = 3;
    double kFactor = 32.0;
    double initialElo = 1000.0;
    int targetCost = 200; // Every starting army costs exactly this much.
    std::vector<Mutation> mutations = costPreservingMutations();
};

struct EvaluationConfig {
    int workerCount = 0;              // 0 = auto (use detected core count).
    double battleTimeoutSeconds = 120.0; // Per simulated battle.
};

struct IslandConfig {
    int numIslands = 4;
    int generationsPerEpoch = 15;
    int numEpochs = 3;
    int totalWorkers = 0;                     // Shared across islands. 0 = auto.
    double optimizationTimeoutSeconds = 600.0; // Whole run; <= 0 disables.
    uint32_t seed = 42;
};

struct SearchConfig {
    EvolutionStrategyConfig strategy;
    ElitistEvolutionConfig elitist;
    EloEvolutionConfig elo;
    EvaluationConfig evaluation;
    IslandConfig islands;
    int generations = 20; // Single-population runs.
};

void to_json(nlohmann::json& j, const EvolutionStrategyConfig& config);
void from_json(const nlohmann::json& j, EvolutionStrategyConfig& config);

void to_json(nlohmann::json& j, const ElitistEvolutionConfig& config);
void from_json(const nlohmann::json& j, ElitistEvolutionConfig& config);

void to_json(nlohmann::json& j, const EloEvolutionConfig& config);
void from_json(const nlohmann::json& j, EloEvolutionConfig& config);

void to_json(nlohmann::json& j, const EvaluationConfig& config);
void from_json(const nlohmann::json& j, EvaluationConfig& config);

void to_json(nlohmann::json& j, const IslandConfig& config);
void from_json(const nlohmann::json& j, IslandConfig& config);

// Missing keys keep their defaults; invalid values throw std::invalid_argument.
void to_json(nlohmann::json& j, const SearchConfig& config);
void from_json(const nlohmann::json& j, SearchConfig& config);

} // namespace ArmySearch
