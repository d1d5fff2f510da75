#pragma once

#include "Individual.h"

#include <nlohmann/json_fwd.hpp>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace ArmySearch {

namespace Selectors {

// Any individual, uniformly. Needs no fitness.
struct Uniform {};

// The fittest of tournamentSize distinct individuals drawn uniformly.
struct Tournament {
    int tournamentSize = 3;
};

} // namespace Selectors

using ParentSelector = std::variant<Selectors::Uniform, Selectors::Tournament>;

const Individual& selectParent(
    const ParentSelector& selector, const std::vector<Individual>& individuals, std::mt19937& rng);

std::string selectorName(const ParentSelector& selector);

nlohmann::json selectorToJson(const ParentSelector& selector);
Result<ParentSelector, std::string> selectorFromJson(const nlohmann::json& json);

} // namespace ArmySearch
