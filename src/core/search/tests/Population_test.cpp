#include "TestOracles.h"
#include "core/search/Population.h"

#include <gtest/gtest.h>

using namespace ArmySearch;
using namespace ArmySearch::Test;

class PopulationTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
    SearchSpace space = SearchSpace::standard();
    Battle battle = testBattle();
    SimulatorOracle::Duration timeout{ 5.0 };

    static Individual winner(Army army, int points, double teamHealth)
    {
        Individual individual(std::move(army), points);
        individual.setFitness(
            Fitness{ .outcome = BattleOutcome::Win, .points = points, .teamHealth = teamHealth },
            0);
        return individual;
    }

    static Individual loser(Army army, int points, double enemyHealth)
    {
        Individual individual(std::move(army), points);
        individual.setFitness(
            Fitness{ .outcome = BattleOutcome::Loss, .points = points, .enemyHealth = enemyHealth },
            0);
        return individual;
    }
};

TEST_F(PopulationTest, RejectsPermutedDuplicate)
{
    Population population;
    const Placement archer{ .type = UnitType::CoreArcher, .position = { -300.0, 10.0 } };
    const Placement wizard{ .type = UnitType::CoreWizard, .position = { -400.0, -10.0 } };

    EXPECT_TRUE(population.add(Individual(Army({ archer, wizard }), space.catalog)));
    EXPECT_FALSE(population.add(Individual(Army({ wizard, archer }), space.catalog)));

    EXPECT_EQ(population.size(), 1u);
    EXPECT_TRUE(population.contains(Army({ wizard, archer })));
    ASSERT_NE(population.find(Army({ archer, wizard })), nullptr);
    EXPECT_EQ(population.find(Army({ archer })), nullptr);
}

TEST_F(PopulationTest, RandomPopulationHonorsCostWindow)
{
    const Population population = Population::random(space, 12, 700, rng, 100);

    ASSERT_EQ(population.size(), 12u);
    for (const Individual& individual : population.individuals()) {
        EXPECT_GE(individual.points(), 600);
        EXPECT_LE(individual.points(), 700);
        EXPECT_TRUE(individual.needsEvaluation());
    }
}

TEST_F(PopulationTest, EvaluateSkipsEvaluatedIndividuals)
{
    const StubOracle oracle;
    Population population = Population::random(space, 6, 600, rng);

    const auto first = population.evaluate(battle, oracle, 2, timeout);
    ASSERT_TRUE(first.isValue());
    EXPECT_EQ(first.value(), 6u);
    EXPECT_EQ(oracle.calls(), 6);

    population.add(Individual(
        Army({ { .type = UnitType::CoreArcher, .position = { -500.0, 0.0 } } }), space.catalog));
    const auto second = population.evaluate(battle, oracle, 2, timeout);

    ASSERT_TRUE(second.isValue());
    EXPECT_EQ(second.value(), 1u);
    EXPECT_EQ(oracle.calls(), 7);
    EXPECT_EQ(population.unevaluatedCount(), 0u);
}

TEST_F(PopulationTest, EvaluationFailureKeepsSuccessfulResults)
{
    const FailingOracle oracle(UnitType::CoreWizard);
    Population population;
    population.add(Individual(
        Army({ { .type = UnitType::CoreArcher, .position = { -300.0, 0.0 } } }), space.catalog));
    population.add(Individual(
        Army({ { .type = UnitType::CoreWizard, .position = { -300.0, 0.0 } } }), space.catalog));

    const auto result = population.evaluate(battle, oracle, 2, timeout);

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("simulator crashed"), std::string::npos);
    EXPECT_NE(result.errorValue().find("core_wizard"), std::string::npos);
    EXPECT_FALSE(population[0].needsEvaluation());
    EXPECT_TRUE(population[1].needsEvaluation());
}

TEST_F(PopulationTest, EvaluatingAgainstAnotherEnemyAborts)
{
    const StubOracle oracle;
    Population population;
    population.add(Individual(
        Army({ { .type = UnitType::CoreArcher, .position = { -300.0, 0.0 } } }), space.catalog));
    ASSERT_TRUE(population.evaluate(battle, oracle, 1, timeout).isValue());

    Battle other = testBattle("other");
    other.enemies = Army({ { .type = UnitType::ZombieTank, .position = { 300.0, 0.0 } } });

    EXPECT_DEATH(
        { (void)population.evaluate(other, oracle, 1, timeout); }, "different enemy army");
}

TEST_F(PopulationTest, BestIsNulloptBeforeEvaluation)
{
    const Population population = Population::random(space, 3, 500, rng);

    EXPECT_FALSE(population.best().has_value());
    EXPECT_TRUE(population.sortedByFitness().empty());
}

TEST_F(PopulationTest, BestIndividualsAreCheapestWinnersWithDistinctDescriptions)
{
    Population population;
    population.add(winner(Army({ { UnitType::CoreArcher, { -300.0, 0.0 } } }), 100, 40.0));
    population.add(winner(Army({ { UnitType::CoreArcher, { -310.0, 5.0 } } }), 100, 30.0));
    population.add(winner(Army({ { UnitType::CrusaderDefender, { -300.0, 0.0 } } }), 100, 70.0));
    population.add(winner(Army({ { UnitType::CoreWizard, { -300.0, 0.0 } } }), 300, 90.0));
    population.add(loser(Army({ { UnitType::CrusaderSoldier, { -300.0, 0.0 } } }), 150, 10.0));

    const auto best = population.bestIndividuals();

    ASSERT_EQ(best.size(), 2u);
    EXPECT_EQ(best[0].shortDescription(), "1 crusader_defender");
    EXPECT_EQ(best[1].shortDescription(), "1 core_archer");
    EXPECT_DOUBLE_EQ(best[1].fitness().teamHealth, 40.0);
}

TEST_F(PopulationTest, BestIndividualsFallsBackToTheBestLoser)
{
    Population population;
    population.add(loser(Army({ { UnitType::CoreArcher, { -300.0, 0.0 } } }), 100, 60.0));
    population.add(loser(Army({ { UnitType::CoreWizard, { -300.0, 0.0 } } }), 300, 20.0));

    const auto best = population.bestIndividuals();

    ASSERT_EQ(best.size(), 1u);
    EXPECT_EQ(best[0].shortDescription(), "1 core_wizard");
}

TEST_F(PopulationTest, SummaryCountsOutcomes)
{
    Population population;
    population.add(winner(Army({ { UnitType::CoreArcher, { -300.0, 0.0 } } }), 100, 40.0));
    population.add(winner(Army({ { UnitType::CoreWizard, { -300.0, 0.0 } } }), 300, 90.0));
    population.add(loser(Army({ { UnitType::CrusaderSoldier, { -300.0, 0.0 } } }), 150, 10.0));

    const PopulationSummary summary = population.summarize();

    EXPECT_EQ(summary.size, 3u);
    EXPECT_EQ(summary.evaluated, 3u);
    EXPECT_EQ(summary.wins, 2u);
    EXPECT_EQ(summary.losses, 1u);
    EXPECT_EQ(summary.timeouts, 0u);
    ASSERT_TRUE(summary.winningPointQuantiles.has_value());
    EXPECT_DOUBLE_EQ(summary.winningPointQuantiles->front(), 100.0);
    EXPECT_DOUBLE_EQ(summary.winningPointQuantiles->back(), 300.0);
    EXPECT_EQ(summary.unitCounts.at("crusader_soldier"), 1);
    ASSERT_EQ(summary.bestDescriptions.size(), 1u);
    EXPECT_EQ(summary.bestUnitCounts.at("core_archer"), 1);
}

TEST(QuantilesTest, InterpolatesBetweenRanks)
{
    const auto quantiles = computeQuantiles({ 40.0, 10.0, 30.0, 20.0, 50.0 });

    EXPECT_DOUBLE_EQ(quantiles[0], 10.0);
    EXPECT_DOUBLE_EQ(quantiles[1], 14.0);
    EXPECT_DOUBLE_EQ(quantiles[3], 30.0);
    EXPECT_DOUBLE_EQ(quantiles[5], 50.0);
}
