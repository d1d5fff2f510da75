#include "Individual.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/army/UnitCatalog.h"

namespace ArmySearch {

Individual::Individual(Army army, const UnitCatalog& catalog)
    : army_(std::move(army)), points_(army_.points(catalog)), state_(Unevaluated{})
{}

Individual::Individual(Army army, int points)
    : army_(std::move(army)), points_(points), state_(Unevaluated{})
{}

const Fitness& Individual::fitness() const
{
    const auto* evaluated = std::get_if<Evaluated>(&state_);
    ARMYSEARCH_ASSERT(evaluated != nullptr, "Fitness read before evaluation");
    return evaluated->fitness;
}

void Individual::setFitness(const Fitness& fitness, uint64_t enemyFingerprint)
{
    ARMYSEARCH_ASSERT(needsEvaluation(), "Fitness assigned twice");
    state_ = Evaluated{ .fitness = fitness, .enemyFingerprint = enemyFingerprint };
}

Result<Fitness, std::string> Individual::evaluate(
    const Battle& battle,
    const SimulatorOracle& oracle,
    SimulationContext& context,
    SimulatorOracle::Duration timeout)
{
    const uint64_t enemyFingerprint = battle.enemies.fingerprint();
    if (const auto* evaluated = std::get_if<Evaluated>(&state_)) {
        ARMYSEARCH_ASSERT(
            evaluated->enemyFingerprint == enemyFingerprint,
            "Individual re-evaluated against a different enemy army");
        return Result<Fitness, std::string>::okay(evaluated->fitness);
    }

    auto result = simulateFitness(army_, points_, battle, oracle, context, timeout);
    if (result.isValue()) {
        setFitness(result.value(), enemyFingerprint);
    }
    return result;
}

Result<Fitness, std::string> Individual::evaluate(
    const Battle& battle, const SimulatorOracle& oracle, SimulatorOracle::Duration timeout)
{
    auto context = oracle.createContext();
    return evaluate(battle, oracle, *context, timeout);
}

Result<Fitness, std::string> simulateFitness(
    const Army& army,
    int points,
    const Battle& battle,
    const SimulatorOracle& oracle,
    SimulationContext& context,
    SimulatorOracle::Duration timeout)
{
    auto simulated = oracle.simulate(context, army, battle.enemies, timeout);
    if (simulated.isError()) {
        LOG_ERROR(
            Evaluation,
            "Simulation of '{}' against battle '{}' failed: {}",
            army.shortDescription(),
            battle.id,
            simulated.errorValue());
        return Result<Fitness, std::string>::error(simulated.errorValue());
    }

    const BattleResult& battleResult = simulated.value();
    Fitness fitness{
        .outcome = battleResult.outcome,
        .points = points,
        .teamHealth = battleResult.allyRemainingHealth,
        .enemyHealth = battleResult.enemyRemainingHealth,
        .grade = std::nullopt,
    };
    if (battle.grades.has_value()) {
        fitness.grade = gradeSolution(fitness.outcome, points, battle.grades.value());
    }

    LOG_TRACE(Evaluation, "{} -> {}", army.shortDescription(), fitness.toString());
    return Result<Fitness, std::string>::okay(fitness);
}

} // namespace ArmySearch
