#pragma once

#include "EvaluationPool.h"
#include "Population.h"

#include <memory>

namespace ArmySearch {

/**
 * Binds one battle, a worker pool and the per-battle simulation timeout.
 * Every population a strategy evaluates in one run goes through the same
 * Evaluator, so all fitness values share an enemy army. Evaluators of different
 * battles may share one pool.
 */
class Evaluator {
public:
    Evaluator(
        Battle battle,
        const SimulatorOracle& oracle,
        int workerCount,
        SimulatorOracle::Duration battleTimeout);
    Evaluator(
        Battle battle,
        std::shared_ptr<EvaluationPool> pool,
        SimulatorOracle::Duration battleTimeout);

    const Battle& battle() const { return battle_; }
    int workerCount() const { return pool_->workerCount(); }

    Result<size_t, std::string> evaluate(Population& population);

private:
    Battle battle_;
    std::shared_ptr<EvaluationPool> pool_;
    SimulatorOracle::Duration battleTimeout_;
};

} // namespace ArmySearch
