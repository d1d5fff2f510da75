#pragma once

#include "core/Result.h"
#include "core/army/Army.h"

#include <nlohmann/json_fwd.hpp>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ArmySearch {

namespace Crossovers {

// Split both parents by one line of random orientation through the midpoint of
// their centroids. Parent one's units on the negative side go to child one,
// parent two's go to child two, and the rest swap over.
struct SpatialSplit {};

// For each unit type present in either parent, a coin decides whether the
// children keep or swap that type's whole group.
struct TypeBucketExchange {};

// Cut each parent at a random index and exchange the tails.
struct SinglePoint {};

// Every placement of both parents lands in either child with probability 1/2.
struct RandomMix {};

} // namespace Crossovers

using Crossover = std::variant<
    Crossovers::SpatialSplit,
    Crossovers::TypeBucketExchange,
    Crossovers::SinglePoint,
    Crossovers::RandomMix>;

inline constexpr int kMaxCrossoverAttempts = 100;

/**
 * Recombines two parents into two children, retrying until both are non-empty.
 * When retries run out an empty child is seeded with one random parent placement.
 * If either parent is empty, both children are copies of the other one.
 */
std::pair<Army, Army> applyCrossover(
    const Crossover& crossover, const Army& first, const Army& second, std::mt19937& rng);

std::string crossoverName(const Crossover& crossover);

nlohmann::json crossoverToJson(const Crossover& crossover);
Result<Crossover, std::string> crossoverFromJson(const nlohmann::json& json);

std::vector<Crossover> defaultCrossovers();

} // namespace ArmySearch
