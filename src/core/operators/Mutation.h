#pragma once

#include "core/Result.h"
#include "core/army/Army.h"
#include "core/army/SearchSpace.h"

#include <nlohmann/json_fwd.hpp>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace ArmySearch {

namespace Mutations {

// Append one random allowed unit at a random legal position.
struct AddRandomUnit {};

// Delete one random placement. No-op on a single-unit army.
struct RemoveRandomUnit {};

// Move one random placement to a fresh random legal position.
struct RandomizeUnitPosition {};

// Swap one placement's type for a different allowed type costing at most the
// original and at least (original - maxDecrease). No-op when nothing qualifies.
struct RandomizeUnitType {
    int maxDecrease = 100;
};

// Gaussian jitter of one placement, independently per axis.
struct PerturbPosition {
    double noiseScale = 10.0;
};

// Drop a random shuffled suffix and refill it with random units of exactly the
// dropped cost.
struct ReplaceSubarmy {};

// Move one placement to a Gaussian sample around another (possibly itself), at
// least minDistance away from it.
struct MoveNextToAlly {
    double noiseScale = 20.0;
    double minDistance = 10.0;
};

} // namespace Mutations

using Mutation = std::variant<
    Mutations::AddRandomUnit,
    Mutations::RemoveRandomUnit,
    Mutations::RandomizeUnitPosition,
    Mutations::RandomizeUnitType,
    Mutations::PerturbPosition,
    Mutations::ReplaceSubarmy,
    Mutations::MoveNextToAlly>;

inline constexpr int kMaxSubarmyFillAttempts = 100;
inline constexpr int kMaxMoveNextToAllyDraws = 1000;

/**
 * Applies one mutation to a non-empty army. Aborts, naming the operator and the
 * input army, if the result would be empty.
 */
Army applyMutation(
    const Mutation& mutation, const Army& army, const SearchSpace& space, std::mt19937& rng);

// Stable display name, e.g. "PerturbPosition(10)".
std::string mutationName(const Mutation& mutation);

// {"type": "PerturbPosition", "noise_scale": 10}
nlohmann::json mutationToJson(const Mutation& mutation);
Result<Mutation, std::string> mutationFromJson(const nlohmann::json& json);

// The line-up the search runs with unless configured otherwise.
std::vector<Mutation> defaultMutations();

// Line-up that never changes an army's cost, for searches at a fixed budget.
// ReplaceSubarmy is listed several times to weight the uniform choice.
std::vector<Mutation> costPreservingMutations();

} // namespace ArmySearch
