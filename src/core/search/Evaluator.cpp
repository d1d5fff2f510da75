#include "Evaluator.h"

namespace ArmySearch {

Evaluator::Evaluator(
    Battle battle,
    const SimulatorOracle& oracle,
    int workerCount,
    SimulatorOracle::Duration battleTimeout)
    : Evaluator(
          std::move(battle), std::make_shared<EvaluationPool>(oracle, workerCount), battleTimeout)
{}

Evaluator::Evaluator(
    Battle battle, std::shared_ptr<EvaluationPool> pool, SimulatorOracle::Duration battleTimeout)
    : battle_(std::move(battle)), pool_(std::move(pool)), battleTimeout_(battleTimeout)
{}

Result<size_t, std::string> Evaluator::evaluate(Population& population)
{
    return population.evaluate(battle_, *pool_, battleTimeout_);
}

} // namespace ArmySearch
