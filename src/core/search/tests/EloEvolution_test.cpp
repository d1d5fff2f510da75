#include "TestOracles.h"
#include "core/search/EloEvolution.h"

#include <gtest/gtest.h>

using namespace ArmySearch;
using namespace ArmySearch::Test;

namespace {

RatedArmy ratedArcher(double x, double elo)
{
    return RatedArmy{ .army = Army({ { UnitType::CoreArcher, { x, 0.0 } } }),
                      .points = 100,
                      .elo = elo };
}

} // namespace

class EloEvolutionTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
    SearchSpace space = SearchSpace::standard();
    DuelOracle oracle;

    static EloEvolutionConfig smallConfig()
    {
        EloEvolutionConfig config;
        config.parentsPerGeneration = 4;
        config.childrenPerGeneration = 2;
        config.matchesPerGeneration = 6;
        config.targetCost = 200;
        return config;
    }

    EloEvolution createEvolution(EloEvolutionConfig config)
    {
        return EloEvolution(
            std::move(config), space, oracle, 2, SimulatorOracle::Duration(5.0));
    }
};

TEST(EloRatingTest, WinBetweenEqualRatingsMovesHalfTheKFactor)
{
    RatedArmy first = ratedArcher(-300.0, 1000.0);
    RatedArmy second = ratedArcher(-320.0, 1000.0);

    updateElo(first, second, BattleOutcome::Win, 32.0);

    EXPECT_DOUBLE_EQ(first.elo, 1016.0);
    EXPECT_DOUBLE_EQ(second.elo, 984.0);
    EXPECT_EQ(first.wins, 1);
    EXPECT_EQ(second.losses, 1);
    EXPECT_EQ(first.matchesPlayed(), 1);
    EXPECT_EQ(second.matchesPlayed(), 1);
}

TEST(EloRatingTest, TimeoutCountsAsDraw)
{
    RatedArmy even = ratedArcher(-300.0, 1000.0);
    RatedArmy evenOpponent = ratedArcher(-320.0, 1000.0);
    updateElo(even, evenOpponent, BattleOutcome::Timeout, 32.0);

    EXPECT_DOUBLE_EQ(even.elo, 1000.0);
    EXPECT_DOUBLE_EQ(evenOpponent.elo, 1000.0);
    EXPECT_EQ(even.draws, 1);
    EXPECT_EQ(evenOpponent.draws, 1);
    EXPECT_EQ(even.wins + even.losses, 0);

    // A draw against a weaker side costs the favourite rating.
    RatedArmy favourite = ratedArcher(-300.0, 1200.0);
    RatedArmy underdog = ratedArcher(-320.0, 1000.0);
    updateElo(favourite, underdog, BattleOutcome::Timeout, 32.0);

    EXPECT_NEAR(favourite.elo, 1191.69, 0.01);
    EXPECT_NEAR(underdog.elo, 1008.31, 0.01);
    EXPECT_DOUBLE_EQ(favourite.elo + underdog.elo, 2200.0);
}

TEST(EloRatingTest, LossIsScoredFromTheFirstSide)
{
    RatedArmy first = ratedArcher(-300.0, 1000.0);
    RatedArmy second = ratedArcher(-320.0, 1000.0);

    updateElo(first, second, BattleOutcome::Loss, 20.0);

    EXPECT_DOUBLE_EQ(first.elo, 990.0);
    EXPECT_DOUBLE_EQ(second.elo, 1010.0);
    EXPECT_EQ(first.losses, 1);
    EXPECT_EQ(second.wins, 1);
}

TEST(EloRatingTest, MedianOfOddAndEvenPopulations)
{
    std::vector<RatedArmy> population = { ratedArcher(-300.0, 900.0),
                                          ratedArcher(-310.0, 1100.0),
                                          ratedArcher(-320.0, 1000.0) };
    EXPECT_DOUBLE_EQ(medianElo(population), 1000.0);

    population.push_back(ratedArcher(-330.0, 1050.0));
    EXPECT_DOUBLE_EQ(medianElo(population), 1025.0);
}

TEST(EloRatingTest, TruncationKeepsHighestRatedInOrder)
{
    const std::vector<RatedArmy> population = { ratedArcher(-300.0, 1000.0),
                                                ratedArcher(-310.0, 1100.0),
                                                ratedArcher(-320.0, 900.0),
                                                ratedArcher(-330.0, 1100.0),
                                                ratedArcher(-340.0, 950.0) };

    const auto survivors = truncateByElo(population, 3);

    ASSERT_EQ(survivors.size(), 3u);
    EXPECT_EQ(survivors[0].army, population[1].army);
    EXPECT_EQ(survivors[1].army, population[3].army);
    EXPECT_EQ(survivors[2].army, population[0].army);
    EXPECT_EQ(truncateByElo(population, 10).size(), population.size());
}

TEST(EloRatingTest, LargeTournamentPicksTheTopRating)
{
    std::mt19937 rng{ 42 };
    const std::vector<RatedArmy> population = { ratedArcher(-300.0, 1000.0),
                                                ratedArcher(-310.0, 1300.0),
                                                ratedArcher(-320.0, 900.0) };

    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(selectByEloTournament(population, 60, rng).army, population[1].army);
    }
}

TEST_F(EloEvolutionTest, RandomPopulationStartsAtTargetCostAndInitialRating)
{
    const EloEvolution evolution = createEvolution(smallConfig());

    const auto population = evolution.randomPopulation(rng);

    ASSERT_EQ(population.size(), 4u);
    for (const RatedArmy& rated : population) {
        EXPECT_EQ(rated.points, 200);
        EXPECT_EQ(rated.army.points(space.catalog), 200);
        EXPECT_DOUBLE_EQ(rated.elo, 1000.0);
        EXPECT_EQ(rated.matchesPlayed(), 0);
    }
}

TEST_F(EloEvolutionTest, StepPlaysEveryMatchAndKeepsParentCount)
{
    EloEvolution evolution = createEvolution(smallConfig());

    // DuelOracle rejects an enemy on the ally side, so success means incumbents were mirrored.
    const auto next = evolution.step(evolution.randomPopulation(rng), rng);

    ASSERT_TRUE(next.isValue()) << next.errorValue();
    EXPECT_EQ(oracle.calls(), 6);
    ASSERT_EQ(next.value().size(), 4u);
    for (size_t i = 1; i < next.value().size(); i++) {
        EXPECT_GE(next.value()[i - 1].elo, next.value()[i].elo);
    }
}

TEST_F(EloEvolutionTest, StrongerChildRisesToTheTop)
{
    EloEvolutionConfig config = smallConfig();
    config.childrenPerGeneration = 1;
    config.matchesPerGeneration = 4;
    // Every child costs more than its parent and so beats every incumbent.
    config.mutations = { Mutations::AddRandomUnit{} };
    EloEvolution evolution = createEvolution(config);

    const auto next = evolution.step(evolution.randomPopulation(rng), rng);

    ASSERT_TRUE(next.isValue());
    const RatedArmy& top = next.value().front();
    EXPECT_GT(top.points, 200);
    EXPECT_EQ(top.wins, 4);
    EXPECT_GT(top.elo, 1000.0);
    for (size_t i = 1; i < next.value().size(); i++) {
        EXPECT_LE(next.value()[i].elo, 1000.0);
    }
}

TEST_F(EloEvolutionTest, SimulatorFailureFailsTheStep)
{
    const FailingOracle failing(UnitType::CoreArcher);
    EloEvolutionConfig config = smallConfig();
    config.mutations = { Mutations::PerturbPosition{ .noiseScale = 10.0 } };
    EloEvolution evolution(config, space, failing, 1, SimulatorOracle::Duration(5.0));
    const std::vector<RatedArmy> population = { ratedArcher(-300.0, 1000.0),
                                                ratedArcher(-310.0, 1000.0) };

    const auto next = evolution.step(population, rng);

    ASSERT_TRUE(next.isError());
    EXPECT_NE(next.errorValue().find("simulator crashed"), std::string::npos);
}

TEST_F(EloEvolutionTest, RunCompletesRequestedGenerations)
{
    EloEvolution evolution = createEvolution(smallConfig());

    const auto result = evolution.run(evolution.randomPopulation(rng), 3, rng);

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().generationsCompleted, 3);
    EXPECT_FALSE(result.value().timedOut);
    EXPECT_EQ(result.value().population.size(), 4u);
    EXPECT_EQ(oracle.calls(), 18);
}

TEST_F(EloEvolutionTest, ExpiredDeadlinePlaysNoMatches)
{
    EloEvolution evolution = createEvolution(smallConfig());
    const Deadline past = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    const auto result = evolution.run(evolution.randomPopulation(rng), 3, rng, past);

    ASSERT_TRUE(result.isValue());
    EXPECT_TRUE(result.value().timedOut);
    EXPECT_EQ(result.value().generationsCompleted, 0);
    EXPECT_EQ(result.value().population.size(), 4u);
    EXPECT_EQ(oracle.calls(), 0);
}
