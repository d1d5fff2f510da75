#include "SearchConfig.h"

#include <stdexcept>

namespace ArmySearch {

namespace {

void requirePositive(int value, const char* key)
{
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

void requireProbability(double value, const char* key)
{
    if (value < 0.0 || value > 1.0) {
        throw std::invalid_argument(std::string(key) + " must lie in [0, 1]");
    }
}

nlohmann::json mutationsToJson(const std::vector<Mutation>& mutations)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto& mutation : mutations) {
        list.push_back(mutationToJson(mutation));
    }
    return list;
}

std::vector<Mutation> mutationsFromJson(const nlohmann::json& list)
{
    if (!list.is_array() || list.empty()) {
        throw std::invalid_argument("mutations must be a non-empty array");
    }
    std::vector<Mutation> mutations;
    for (const auto& entry : list) {
        auto result = mutationFromJson(entry);
        if (result.isError()) {
            throw std::invalid_argument(result.errorValue());
        }
        mutations.push_back(result.value());
    }
    return mutations;
}

ParentSelector selectorFromJsonOrThrow(const nlohmann::json& json)
{
    auto result = selectorFromJson(json);
    if (result.isError()) {
        throw std::invalid_argument(result.errorValue());
    }
    return result.value();
}

} // namespace

void to_json(nlohmann::json& j, const EvolutionStrategyConfig& config)
{
    j = nlohmann::json{
        { "parents_per_generation", config.parentsPerGeneration },
        { "children_per_generation", config.childrenPerGeneration },
        { "mutation_adaptation_rate", config.mutationAdaptationRate },
        { "category_cap", config.categoryCap },
        { "mutations_per_child", config.mutationsPerChild },
        { "max_offspring_attempts", config.maxOffspringAttempts },
        { "mutations", mutationsToJson(config.mutations) },
        { "selector", selectorToJson(config.selector) },
    };
}

void from_json(const nlohmann::json& j, EvolutionStrategyConfig& config)
{
    config.parentsPerGeneration = j.value("parents_per_generation", config.parentsPerGeneration);
    config.childrenPerGeneration = j.value("children_per_generation", config.childrenPerGeneration);
    config.mutationAdaptationRate =
        j.value("mutation_adaptation_rate", config.mutationAdaptationRate);
    config.categoryCap = j.value("category_cap", config.categoryCap);
    config.mutationsPerChild = j.value("mutations_per_child", config.mutationsPerChild);
    config.maxOffspringAttempts = j.value("max_offspring_attempts", config.maxOffspringAttempts);
    if (j.contains("mutations")) {
        config.mutations = mutationsFromJson(j["mutations"]);
    }
    if (j.contains("selector")) {
        config.selector = selectorFromJsonOrThrow(j["selector"]);
    }

    requireProbability(config.mutationAdaptationRate, "mutation_adaptation_rate");
    requirePositive(config.parentsPerGeneration, "parents_per_generation");
    requirePositive(config.childrenPerGeneration, "children_per_generation");
    requirePositive(config.categoryCap, "category_cap");
    requirePositive(config.mutationsPerChild, "mutations_per_child");
    requirePositive(config.maxOffspringAttempts, "max_offspring_attempts");
}

void to_json(nlohmann::json& j, const ElitistEvolutionConfig& config)
{
    nlohmann::json crossovers = nlohmann::json::array();
    for (const auto& crossover : config.crossovers) {
        crossovers.push_back(crossoverToJson(crossover));
    }

    j = nlohmann::json{
        { "elitism_size", config.elitismSize },
        { "crossover_rate", config.crossoverRate },
        { "mutation_rate", config.mutationRate },
        { "max_offspring_attempts", config.maxOffspringAttempts },
        { "crossovers", crossovers },
        { "mutations", mutationsToJson(config.mutations) },
        { "selector", selectorToJson(config.selector) },
    };
}

void from_json(const nlohmann::json& j, ElitistEvolutionConfig& config)
{
    config.elitismSize = j.value("elitism_size", config.elitismSize);
    config.crossoverRate = j.value("crossover_rate", config.crossoverRate);
    config.mutationRate = j.value("mutation_rate", config.mutationRate);
    config.maxOffspringAttempts = j.value("max_offspring_attempts", config.maxOffspringAttempts);
    if (j.contains("crossovers")) {
        const auto& list = j["crossovers"];
        if (!list.is_array() || list.empty()) {
            throw std::invalid_argument("crossovers must be a non-empty array");
        }
        config.crossovers.clear();
        for (const auto& entry : list) {
            auto result = crossoverFromJson(entry);
            if (result.isError()) {
                throw std::invalid_argument(result.errorValue());
            }
            config.crossovers.push_back(result.value());
        }
    }
    if (j.contains("mutations")) {
        config.mutations = mutationsFromJson(j["mutations"]);
    }
    if (j.contains("selector")) {
        config.selector = selectorFromJsonOrThrow(j["selector"]);
    }

    if (config.elitismSize < 0) {
        throw std::invalid_argument("elitism_size must not be negative");
    }
    requireProbability(config.crossoverRate, "crossover_rate");
    requireProbability(config.mutationRate, "mutation_rate");
    requirePositive(config.maxOffspringAttempts, "max_offspring_attempts");
}

void to_json(nlohmann::json& j, const EloEvolutionConfig& config)
{
    j = nlohmann::json{
        { "parents_per_generation", config.parentsPerGeneration },
        { "children_per_generation", config.childrenPerGeneration },
        { "matches_per_generation", config.matchesPerGeneration },
        { "tournament_size", config.tournamentSize },
        { "k_factor", config.kFactor },
        { "initial_elo", config.initialElo },
        { "target_cost", config.targetCost },
        { "mutations", mutationsToJson(config.mutations) },
    };
}

void from_json(const nlohmann::json& j, EloEvolutionConfig& config)
{
    config.parentsPerGeneration = j.value("parents_per_generation", config.parentsPerGeneration);
    config.childrenPerGeneration =
        j.value("children_per_generation", config.childrenPerGeneration);
    config.matchesPerGeneration = j.value("matches_per_generation", config.matchesPerGeneration);
    config.tournamentSize = j.value("tournament_size", config.tournamentSize);
    config.kFactor = j.value("k_factor", config.kFactor);
    config.initialElo = j.value("initial_elo", config.initialElo);
    config.targetCost = j.value("target_cost", config.targetCost);
    if (j.contains("mutations")) {
        config.mutations = mutationsFromJson(j["mutations"]);
    }

    requirePositive(config.parentsPerGeneration, "parents_per_generation");
    requirePositive(config.childrenPerGeneration, "children_per_generation");
    requirePositive(config.matchesPerGeneration, "matches_per_generation");
    requirePositive(config.tournamentSize, "tournament_size");
    requirePositive(config.targetCost, "target_cost");
    if (config.kFactor <= 0.0) {
        throw std::invalid_argument("k_factor must be positive");
    }
}

void to_json(nlohmann::json& j, const EvaluationConfig& config)
{
    j = nlohmann::json{
        { "worker_count", config.workerCount },
        { "battle_timeout_seconds", config.battleTimeoutSeconds },
    };
}

void from_json(const nlohmann::json& j, EvaluationConfig& config)
{
    config.workerCount = j.value("worker_count", config.workerCount);
    config.battleTimeoutSeconds = j.value("battle_timeout_seconds", config.battleTimeoutSeconds);
    if (config.battleTimeoutSeconds <= 0.0) {
        throw std::invalid_argument("battle_timeout_seconds must be positive");
    }
}

void to_json(nlohmann::json& j, const IslandConfig& config)
{
    j = nlohmann::json{
        { "num_islands", config.numIslands },
        { "generations_per_epoch", config.generationsPerEpoch },
        { "num_epochs", config.numEpochs },
        { "total_workers", config.totalWorkers },
        { "optimization_timeout_seconds", config.optimizationTimeoutSeconds },
        { "seed", config.seed },
    };
}

void from_json(const nlohmann::json& j, IslandConfig& config)
{
    config.numIslands = j.value("num_islands", config.numIslands);
    config.generationsPerEpoch = j.value("generations_per_epoch", config.generationsPerEpoch);
    config.numEpochs = j.value("num_epochs", config.numEpochs);
    config.totalWorkers = j.value("total_workers", config.totalWorkers);
    config.optimizationTimeoutSeconds =
        j.value("optimization_timeout_seconds", config.optimizationTimeoutSeconds);
    config.seed = j.value("seed", config.seed);

    requirePositive(config.numIslands, "num_islands");
    requirePositive(config.generationsPerEpoch, "generations_per_epoch");
    requirePositive(config.numEpochs, "num_epochs");
}

void to_json(nlohmann::json& j, const SearchConfig& config)
{
    j = nlohmann::json{
        { "strategy", config.strategy },
        { "elitist", config.elitist },
        { "elo", config.elo },
        { "evaluation", config.evaluation },
        { "islands", config.islands },
        { "generations", config.generations },
    };
}

void from_json(const nlohmann::json& j, SearchConfig& config)
{
    if (j.contains("strategy")) {
        from_json(j["strategy"], config.strategy);
    }
    if (j.contains("elitist")) {
        from_json(j["elitist"], config.elitist);
    }
    if (j.contains("elo")) {
        from_json(j["elo"], config.elo);
    }
    if (j.contains("evaluation")) {
        from_json(j["evaluation"], config.evaluation);
    }
    if (j.contains("islands")) {
        from_json(j["islands"], config.islands);
    }
    config.generations = j.value("generations", config.generations);
    requirePositive(config.generations, "generations");
}

} // namespace ArmySearch
