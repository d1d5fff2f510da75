#pragma once

#include "Fitness.h"
#include "SimulatorOracle.h"
#include "core/army/Army.h"

#include <cstdint>
#include <string>
#include <variant>

namespace ArmySearch {

class UnitCatalog;

/**
 * An Army plus its fitness, which is computed at most once.
 *
 * Fitness is bound to the enemy army it was computed against. Reading it before
 * evaluation, assigning it twice, or re-evaluating against another enemy army are
 * programmer errors and abort.
 */
class Individual {
public:
    struct Unevaluated {};
    struct Evaluated {
        Fitness fitness;
        uint64_t enemyFingerprint = 0;
    };
    using FitnessState = std::variant<Unevaluated, Evaluated>;

    Individual(Army army, const UnitCatalog& catalog);
    Individual(Army army, int points);

    const Army& army() const { return army_; }
    int points() const { return points_; }

    bool needsEvaluation() const { return std::holds_alternative<Unevaluated>(state_); }
    const FitnessState& state() const { return state_; }
    const Fitness& fitness() const;

    // Runs the oracle on the first call, returns the memoized fitness afterwards.
    Result<Fitness, std::string> evaluate(
        const Battle& battle,
        const SimulatorOracle& oracle,
        SimulationContext& context,
        SimulatorOracle::Duration timeout);

    // Convenience overload with a throwaway simulation context.
    Result<Fitness, std::string> evaluate(
        const Battle& battle, const SimulatorOracle& oracle, SimulatorOracle::Duration timeout);

    // Write-once; used by the population after a parallel evaluation pass.
    void setFitness(const Fitness& fitness, uint64_t enemyFingerprint);

    std::string shortDescription() const { return army_.shortDescription(); }

    bool operator==(const Individual& other) const { return army_ == other.army_; }
    bool operator!=(const Individual& other) const { return !(*this == other); }

private:
    Army army_;
    int points_ = 0;
    FitnessState state_;
};

// One oracle call turned into a Fitness. Touches no Individual, so workers can run it.
Result<Fitness, std::string> simulateFitness(
    const Army& army,
    int points,
    const Battle& battle,
    const SimulatorOracle& oracle,
    SimulationContext& context,
    SimulatorOracle::Duration timeout);

} // namespace ArmySearch
