#pragma once

#include "core/army/Army.h"
#include "core/army/SearchSpace.h"

#include <optional>
#include <random>
#include <vector>

namespace ArmySearch {

// Upper bound on add/remove steps before a cost window is declared unreachable.
inline constexpr int kMaxRandomArmySteps = 100000;

Placement randomPlacement(const SearchSpace& space, std::mt19937& rng);

/**
 * Random walk over armies: add a random allowed unit while below the window,
 * delete a random unit while above it, until the cost lies in
 * [targetCost - maxDecrease, targetCost]. The result is never empty.
 * An unreachable window aborts.
 */
Army generateRandomArmy(
    const SearchSpace& space, int targetCost, int maxDecrease, std::mt19937& rng);

/**
 * Random allowed units at random positions whose costs sum to exactly targetCost,
 * or nullopt if a draw ran into a remainder no allowed unit fits.
 */
std::optional<std::vector<Placement>> randomExactFill(
    const SearchSpace& space, int targetCost, std::mt19937& rng);

} // namespace ArmySearch
