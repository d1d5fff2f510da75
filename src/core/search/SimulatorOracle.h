#pragma once

#include "Battle.h"
#include "core/Result.h"

#include <chrono>
#include <memory>
#include <string>

namespace ArmySearch {

struct BattleResult {
    BattleOutcome outcome = BattleOutcome::Loss;
    double allyRemainingHealth = 0.0;
    double enemyRemainingHealth = 0.0;
};

/**
 * Isolated simulation world. The simulator keeps mutable world state between
 * calls, so every evaluation worker owns exactly one context and never shares it.
 */
class SimulationContext {
public:
    virtual ~SimulationContext() = default;
};

/**
 * The external battle simulator. Implementations must be safe to call
 * concurrently as long as each caller passes its own context.
 */
class SimulatorOracle {
public:
    using Duration = std::chrono::duration<double>;

    virtual ~SimulatorOracle() = default;

    virtual std::unique_ptr<SimulationContext> createContext() const = 0;

    virtual Result<BattleResult, std::string> simulate(
        SimulationContext& context,
        const Army& ally,
        const Army& enemy,
        Duration timeout) const = 0;
};

} // namespace ArmySearch
