#include "Mutation.h"
#include "RandomArmy.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace ArmySearch {

namespace {

size_t randomIndex(size_t size, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> dist(0, size - 1);
    return dist(rng);
}

std::vector<Placement> mutate(
    const Mutations::AddRandomUnit&,
    std::vector<Placement> placements,
    const SearchSpace& space,
    std::mt19937& rng)
{
    placements.push_back(randomPlacement(space, rng));
    return placements;
}

std::vector<Placement> mutate(
    const Mutations::RemoveRandomUnit&,
    std::vector<Placement> placements,
    const SearchSpace& /*space*/,
    std::mt19937& rng)
{
    if (placements.size() <= 1) {
        return placements;
    }
    const size_t index = randomIndex(placements.size(), rng);
    placements.erase(placements.begin() + static_cast<std::ptrdiff_t>(index));
    return placements;
}

std::vector<Placement> mutate(
    const Mutations::RandomizeUnitPosition&,
    std::vector<Placement> placements,
    const SearchSpace& space,
    std::mt19937& rng)
{
    const size_t index = randomIndex(placements.size(), rng);
    placements[index].position = space.area.randomPosition(rng);
    return placements;
}

std::vector<Placement> mutate(
    const Mutations::RandomizeUnitType& mutation,
    std::vector<Placement> placements,
    const SearchSpace& space,
    std::mt19937& rng)
{
    const size_t index = randomIndex(placements.size(), rng);
    const UnitType current = placements[index].type;
    const int currentCost = space.catalog.cost(current);

    std::vector<UnitType> options;
    for (const UnitType type : space.catalog.allowedTypes()) {
        const int cost = space.catalog.cost(type);
        if (type != current && cost <= currentCost && cost >= currentCost - mutation.maxDecrease) {
            options.push_back(type);
        }
    }
    if (options.empty()) {
        return placements;
    }

    placements[index].type = options[randomIndex(options.size(), rng)];
    return placements;
}

std::vector<Placement> mutate(
    const Mutations::PerturbPosition& mutation,
    std::vector<Placement> placements,
    const SearchSpace& /*space*/,
    std::mt19937& rng)
{
    std::normal_distribution<double> noise(0.0, mutation.noiseScale);
    Placement& placement = placements[randomIndex(placements.size(), rng)];
    placement.position.x += noise(rng);
    placement.position.y += noise(rng);
    return placements;
}

std::vector<Placement> mutate(
    const Mutations::ReplaceSubarmy&,
    std::vector<Placement> placements,
    const SearchSpace& space,
    std::mt19937& rng)
{
    std::shuffle(placements.begin(), placements.end(), rng);
    const size_t keepCount = randomIndex(placements.size(), rng);

    std::vector<Placement> kept(
        placements.begin(), placements.begin() + static_cast<std::ptrdiff_t>(keepCount));
    int droppedCost = 0;
    for (size_t i = keepCount; i < placements.size(); ++i) {
        droppedCost += space.catalog.cost(placements[i].type);
    }

    for (int attempt = 0; attempt < kMaxSubarmyFillAttempts; ++attempt) {
        auto fill = randomExactFill(space, droppedCost, rng);
        if (fill.has_value()) {
            kept.insert(kept.end(), fill->begin(), fill->end());
            return kept;
        }
    }

    // The dropped units themselves always sum to the dropped cost.
    LOG_DEBUG(Operators, "ReplaceSubarmy: no random fill for {} points, re-placing", droppedCost);
    for (size_t i = keepCount; i < placements.size(); ++i) {
        kept.push_back(
            Placement{ .type = placements[i].type, .position = space.area.randomPosition(rng) });
    }
    return kept;
}

std::vector<Placement> mutate(
    const Mutations::MoveNextToAlly& mutation,
    std::vector<Placement> placements,
    const SearchSpace& /*space*/,
    std::mt19937& rng)
{
    const size_t moved = randomIndex(placements.size(), rng);
    const Position anchor = placements[randomIndex(placements.size(), rng)].position;

    std::normal_distribution<double> noiseX(anchor.x, mutation.noiseScale);
    std::normal_distribution<double> noiseY(anchor.y, mutation.noiseScale);
    for (int draw = 0; draw < kMaxMoveNextToAllyDraws; ++draw) {
        const Position candidate{ noiseX(rng), noiseY(rng) };
        if (std::hypot(candidate.x - anchor.x, candidate.y - anchor.y) >= mutation.minDistance) {
            placements[moved].position = candidate;
            return placements;
        }
    }
    return placements;
}

} // namespace

Army applyMutation(
    const Mutation& mutation, const Army& army, const SearchSpace& space, std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(
        !army.empty(), "Mutation " + mutationName(mutation) + " applied to an empty army");

    std::vector<Placement> result = std::visit(
        [&](const auto& m) { return mutate(m, army.placements(), space, rng); }, mutation);

    ARMYSEARCH_ASSERT(
        !result.empty(),
        "Mutation " + mutationName(mutation) + " emptied army '" + army.shortDescription() + "'");
    return Army(std::move(result));
}

std::string mutationName(const Mutation& mutation)
{
    return std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Mutations::AddRandomUnit>) {
                return "AddRandomUnit";
            }
            else if constexpr (std::is_same_v<T, Mutations::RemoveRandomUnit>) {
                return "RemoveRandomUnit";
            }
            else if constexpr (std::is_same_v<T, Mutations::RandomizeUnitPosition>) {
                return "RandomizeUnitPosition";
            }
            else if constexpr (std::is_same_v<T, Mutations::RandomizeUnitType>) {
                return fmt::format("RandomizeUnitType({})", m.maxDecrease);
            }
            else if constexpr (std::is_same_v<T, Mutations::PerturbPosition>) {
                return fmt::format("PerturbPosition({:g})", m.noiseScale);
            }
            else if constexpr (std::is_same_v<T, Mutations::ReplaceSubarmy>) {
                return "ReplaceSubarmy";
            }
            else {
                return fmt::format("MoveNextToAlly({:g})", m.noiseScale);
            }
        },
        mutation);
}

nlohmann::json mutationToJson(const Mutation& mutation)
{
    return std::visit(
        [](const auto& m) -> nlohmann::json {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Mutations::AddRandomUnit>) {
                return { { "type", "AddRandomUnit" } };
            }
            else if constexpr (std::is_same_v<T, Mutations::RemoveRandomUnit>) {
                return { { "type", "RemoveRandomUnit" } };
            }
            else if constexpr (std::is_same_v<T, Mutations::RandomizeUnitPosition>) {
                return { { "type", "RandomizeUnitPosition" } };
            }
            else if constexpr (std::is_same_v<T, Mutations::RandomizeUnitType>) {
                return { { "type", "RandomizeUnitType" }, { "max_decrease", m.maxDecrease } };
            }
            else if constexpr (std::is_same_v<T, Mutations::PerturbPosition>) {
                return { { "type", "PerturbPosition" }, { "noise_scale", m.noiseScale } };
            }
            else if constexpr (std::is_same_v<T, Mutations::ReplaceSubarmy>) {
                return { { "type", "ReplaceSubarmy" } };
            }
            else {
                return { { "type", "MoveNextToAlly" },
                         { "noise_scale", m.noiseScale },
                         { "min_distance", m.minDistance } };
            }
        },
        mutation);
}

Result<Mutation, std::string> mutationFromJson(const nlohmann::json& json)
{
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        return Result<Mutation, std::string>::error("Mutation entry needs a string 'type'");
    }

    try {
        const std::string type = json["type"].get<std::string>();
        if (type == "AddRandomUnit") {
            return Result<Mutation, std::string>::okay(Mutations::AddRandomUnit{});
        }
        if (type == "RemoveRandomUnit") {
            return Result<Mutation, std::string>::okay(Mutations::RemoveRandomUnit{});
        }
        if (type == "RandomizeUnitPosition") {
            return Result<Mutation, std::string>::okay(Mutations::RandomizeUnitPosition{});
        }
        if (type == "RandomizeUnitType") {
            Mutations::RandomizeUnitType m;
            m.maxDecrease = json.value("max_decrease", m.maxDecrease);
            return Result<Mutation, std::string>::okay(m);
        }
        if (type == "PerturbPosition") {
            Mutations::PerturbPosition m;
            m.noiseScale = json.value("noise_scale", m.noiseScale);
            if (m.noiseScale <= 0.0) {
                return Result<Mutation, std::string>::error(
                    "PerturbPosition noise_scale must be positive");
            }
            return Result<Mutation, std::string>::okay(m);
        }
        if (type == "ReplaceSubarmy") {
            return Result<Mutation, std::string>::okay(Mutations::ReplaceSubarmy{});
        }
        if (type == "MoveNextToAlly") {
            Mutations::MoveNextToAlly m;
            m.noiseScale = json.value("noise_scale", m.noiseScale);
            m.minDistance = json.value("min_distance", m.minDistance);
            if (m.noiseScale <= 0.0) {
                return Result<Mutation, std::string>::error(
                    "MoveNextToAlly noise_scale must be positive");
            }
            return Result<Mutation, std::string>::okay(m);
        }
        return Result<Mutation, std::string>::error("Unknown mutation type: " + type);
    }
    catch (const nlohmann::json::exception& e) {
        return Result<Mutation, std::string>::error(
            std::string("Malformed mutation entry: ") + e.what());
    }
}

std::vector<Mutation> defaultMutations()
{
    return {
        Mutations::RemoveRandomUnit{},
        Mutations::PerturbPosition{ .noiseScale = 10.0 },
        Mutations::PerturbPosition{ .noiseScale = 100.0 },
        Mutations::RandomizeUnitPosition{},
        Mutations::ReplaceSubarmy{},
        Mutations::RandomizeUnitType{},
        Mutations::MoveNextToAlly{ .noiseScale = 20.0 },
    };
}

std::vector<Mutation> costPreservingMutations()
{
    return {
        Mutations::RandomizeUnitPosition{},
        Mutations::PerturbPosition{ .noiseScale = 10.0 },
        Mutations::PerturbPosition{ .noiseScale = 100.0 },
        Mutations::RandomizeUnitType{ .maxDecrease = 0 },
        Mutations::MoveNextToAlly{ .noiseScale = 20.0 },
        Mutations::ReplaceSubarmy{},
        Mutations::ReplaceSubarmy{},
        Mutations::ReplaceSubarmy{},
        Mutations::ReplaceSubarmy{},
    };
}

} // namespace ArmySearch
