#include "Selection.h"
#include "core/Assert.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <numeric>
#include <spdlog/fmt/fmt.h>

namespace ArmySearch {

namespace {

const Individual& select(
    const Selectors::Uniform&, const std::vector<Individual>& individuals, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> dist(0, individuals.size() - 1);
    return individuals[dist(rng)];
}

const Individual& select(
    const Selectors::Tournament& selector,
    const std::vector<Individual>& individuals,
    std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(selector.tournamentSize > 0, "Tournament size must be positive");

    // Partial Fisher-Yates: the first k entries become a sample without replacement.
    std::vector<size_t> indices(individuals.size());
    std::iota(indices.begin(), indices.end(), 0);
    const size_t k = std::min(indices.size(), static_cast<size_t>(selector.tournamentSize));
    for (size_t i = 0; i < k; ++i) {
        std::uniform_int_distribution<size_t> dist(i, indices.size() - 1);
        std::swap(indices[i], indices[dist(rng)]);
    }

    size_t bestIdx = indices[0];
    for (size_t i = 1; i < k; ++i) {
        if (individuals[indices[i]].fitness() > individuals[bestIdx].fitness()) {
            bestIdx = indices[i];
        }
    }
    return individuals[bestIdx];
}

} // namespace

const Individual& selectParent(
    const ParentSelector& selector, const std::vector<Individual>& individuals, std::mt19937& rng)
{
    ARMYSEARCH_ASSERT(!individuals.empty(), "Parent selection from an empty population");
    return std::visit(
        [&](const auto& s) -> const Individual& { return select(s, individuals, rng); }, selector);
}

std::string selectorName(const ParentSelector& selector)
{
    if (const auto* tournament = std::get_if<Selectors::Tournament>(&selector)) {
        return fmt::format("Tournament({})", tournament->tournamentSize);
    }
    return "Uniform";
}

nlohmann::json selectorToJson(const ParentSelector& selector)
{
    if (const auto* tournament = std::get_if<Selectors::Tournament>(&selector)) {
        return { { "type", "Tournament" }, { "tournament_size", tournament->tournamentSize } };
    }
    return { { "type", "Uniform" } };
}

Result<ParentSelector, std::string> selectorFromJson(const nlohmann::json& json)
{
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        return Result<ParentSelector, std::string>::error("Selector needs a string 'type'");
    }

    const std::string type = json["type"].get<std::string>();
    if (type == "Uniform") {
        return Result<ParentSelector, std::string>::okay(Selectors::Uniform{});
    }
    if (type == "Tournament") {
        Selectors::Tournament tournament;
        try {
            tournament.tournamentSize = json.value("tournament_size", tournament.tournamentSize);
        }
        catch (const nlohmann::json::exception& e) {
            return Result<ParentSelector, std::string>::error(
                std::string("Malformed tournament selector: ") + e.what());
        }
        if (tournament.tournamentSize <= 0) {
            return Result<ParentSelector, std::string>::error(
                "tournament_size must be positive");
        }
        return Result<ParentSelector, std::string>::okay(tournament);
    }
    return Result<ParentSelector, std::string>::error("Unknown selector type: " + type);
}

} // namespace ArmySearch
