#include "TestOracles.h"
#include "core/search/Individual.h"

#include <gtest/gtest.h>

using namespace ArmySearch;
using namespace ArmySearch::Test;

class IndividualTest : public ::testing::Test {
protected:
    UnitCatalog catalog = UnitCatalog::standard();
    StubOracle oracle;
    Battle battle = testBattle();
    SimulatorOracle::Duration timeout{ 5.0 };

    Army cheapArmy() const
    {
        return Army({ { UnitType::CoreArcher, { -300.0, 0.0 } },
                      { UnitType::CoreSwordsman, { -320.0, 20.0 } } });
    }
};

TEST_F(IndividualTest, StartsUnevaluatedWithCachedPoints)
{
    const Individual individual(cheapArmy(), catalog);

    EXPECT_TRUE(individual.needsEvaluation());
    EXPECT_TRUE(std::holds_alternative<Individual::Unevaluated>(individual.state()));
    EXPECT_EQ(individual.points(), 200);
}

TEST_F(IndividualTest, EvaluateCallsOracleOnce)
{
    Individual individual(cheapArmy(), catalog);
    auto context = oracle.createContext();

    const auto first = individual.evaluate(battle, oracle, *context, timeout);
    const auto second = individual.evaluate(battle, oracle, *context, timeout);

    ASSERT_TRUE(first.isValue());
    ASSERT_TRUE(second.isValue());
    EXPECT_EQ(oracle.calls(), 1);
    EXPECT_EQ(first.value().outcome, BattleOutcome::Win);
    EXPECT_EQ(first.value().points, 200);
    EXPECT_DOUBLE_EQ(first.value().teamHealth, 80.0);
    EXPECT_TRUE(fitnessTies(first.value(), second.value()));
}

TEST_F(IndividualTest, GradedBattleAttachesGrade)
{
    battle.grades = BattleGrades{ .aCutoff = 200, .bCutoff = 300, .cCutoff = 400, .dCutoff = 500 };
    Individual individual(cheapArmy(), catalog);

    const auto fitness = individual.evaluate(battle, oracle, timeout);

    ASSERT_TRUE(fitness.isValue());
    ASSERT_TRUE(fitness.value().grade.has_value());
    EXPECT_EQ(fitness.value().grade.value(), Grade::A);
}

TEST_F(IndividualTest, OracleFailureLeavesIndividualUnevaluated)
{
    const FailingOracle failing(UnitType::CoreArcher);
    Individual individual(cheapArmy(), catalog);

    const auto fitness = individual.evaluate(battle, failing, timeout);

    EXPECT_TRUE(fitness.isError());
    EXPECT_TRUE(individual.needsEvaluation());
}

TEST_F(IndividualTest, EqualityFollowsTheArmy)
{
    Individual evaluated(cheapArmy(), catalog);
    ASSERT_TRUE(evaluated.evaluate(battle, oracle, timeout).isValue());

    EXPECT_EQ(evaluated, Individual(cheapArmy(), catalog));
}

TEST_F(IndividualTest, ReadingFitnessBeforeEvaluationAborts)
{
    const Individual individual(cheapArmy(), catalog);

    EXPECT_DEATH({ (void)individual.fitness(); }, "before evaluation");
}

TEST_F(IndividualTest, AssigningFitnessTwiceAborts)
{
    Individual individual(cheapArmy(), catalog);
    individual.setFitness(Fitness{}, battle.enemies.fingerprint());

    EXPECT_DEATH({ individual.setFitness(Fitness{}, battle.enemies.fingerprint()); }, "twice");
}

TEST_F(IndividualTest, EvaluatingAgainstAnotherEnemyAborts)
{
    Individual individual(cheapArmy(), catalog);
    ASSERT_TRUE(individual.evaluate(battle, oracle, timeout).isValue());

    Battle other = battle;
    other.enemies = Army({ { UnitType::CoreWizard, { 400.0, 0.0 } } });

    EXPECT_DEATH({ (void)individual.evaluate(other, oracle, timeout); }, "different enemy");
}
