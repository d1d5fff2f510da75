#include "TestOracles.h"
#include "core/search/EvaluationPool.h"
#include "core/search/Evaluator.h"

#include <gtest/gtest.h>

using namespace ArmySearch;
using namespace ArmySearch::Test;

namespace {

std::vector<EvaluationPool::Task> archerTasks(size_t count)
{
    const UnitCatalog catalog = UnitCatalog::standard();
    std::vector<EvaluationPool::Task> tasks;
    for (size_t i = 0; i < count; i++) {
        std::vector<Placement> placements;
        for (size_t unit = 0; unit <= i; unit++) {
            placements.push_back(
                { UnitType::CoreArcher, { -300.0, static_cast<double>(unit) * 10.0 } });
        }
        Army army(std::move(placements));
        const int points = army.points(catalog);
        tasks.push_back({ .index = i, .army = std::move(army), .points = points });
    }
    return tasks;
}

} // namespace

TEST(EvaluationPoolTest, ResolvesAutoWorkerCount)
{
    EXPECT_GE(resolveWorkerCount(0), 1);
    EXPECT_EQ(resolveWorkerCount(3), 3);
    EXPECT_EQ(resolveWorkerCount(8, 2), 2);
    EXPECT_EQ(resolveWorkerCount(-4, 1), 1);
}

TEST(EvaluationPoolTest, EachWorkerOwnsOneContext)
{
    const StubOracle oracle;
    {
        EvaluationPool pool(oracle, 3);
        const auto results =
            pool.evaluate(testBattle(), archerTasks(12), SimulatorOracle::Duration(5.0));
        EXPECT_EQ(results.size(), 12u);
        EXPECT_EQ(pool.workerCount(), 3);
    }

    EXPECT_EQ(oracle.contextsCreated(), 3);
    EXPECT_EQ(oracle.calls(), 12);
}

TEST(EvaluationPoolTest, ResultsComeBackInTaskOrder)
{
    const StubOracle oracle;
    EvaluationPool pool(oracle, 4);

    const auto results =
        pool.evaluate(testBattle(), archerTasks(8), SimulatorOracle::Duration(5.0));

    ASSERT_EQ(results.size(), 8u);
    for (size_t i = 0; i < results.size(); i++) {
        EXPECT_EQ(results[i].index, i);
        ASSERT_TRUE(results[i].fitness.isValue());
        EXPECT_EQ(results[i].fitness.value().points, 100 * static_cast<int>(i + 1));
    }
    // Five or more archers cost more than the stub's win threshold.
    EXPECT_TRUE(results[4].fitness.value().isWin());
    EXPECT_FALSE(results[5].fitness.value().isWin());
}

TEST(EvaluationPoolTest, PoolIsReusableAcrossCalls)
{
    const StubOracle oracle;
    {
        EvaluationPool pool(oracle, 2);
        const SimulatorOracle::Duration timeout(5.0);

        EXPECT_EQ(pool.evaluate(testBattle(), archerTasks(3), timeout).size(), 3u);
        EXPECT_EQ(pool.evaluate(testBattle(), archerTasks(5), timeout).size(), 5u);
    }

    EXPECT_EQ(oracle.contextsCreated(), 2);
    EXPECT_EQ(oracle.calls(), 8);
}

TEST(EvaluationPoolTest, FailuresAreReportedPerTask)
{
    const FailingOracle oracle(UnitType::CoreWizard);
    EvaluationPool pool(oracle, 2);
    std::vector<EvaluationPool::Task> tasks;
    tasks.push_back({ .index = 0,
                      .army = Army({ { UnitType::CoreWizard, { -300.0, 0.0 } } }),
                      .points = 300 });
    tasks.push_back({ .index = 1,
                      .army = Army({ { UnitType::CoreArcher, { -300.0, 0.0 } } }),
                      .points = 100 });

    const auto results =
        pool.evaluate(testBattle(), std::move(tasks), SimulatorOracle::Duration(5.0));

    ASSERT_EQ(results.size(), 2u);
    ASSERT_TRUE(results[0].fitness.isError());
    EXPECT_EQ(results[0].fitness.errorValue(), "simulator crashed");
    EXPECT_TRUE(results[1].fitness.isValue());
}

TEST(EvaluationPoolTest, PlayReturnsOutcomesInMatchOrder)
{
    const DuelOracle oracle;
    EvaluationPool pool(oracle, 3);
    const Army one({ { UnitType::CoreArcher, { -300.0, 0.0 } } });
    const Army two({ { UnitType::CoreArcher, { -300.0, 0.0 } },
                     { UnitType::CoreArcher, { -320.0, 0.0 } } });

    const auto results = pool.play(
        { { .ally = two, .enemy = one.mirrored() },
          { .ally = one, .enemy = two.mirrored() },
          { .ally = one, .enemy = one.mirrored() },
          { .ally = one, .enemy = two } },
        SimulatorOracle::Duration(5.0));

    ASSERT_EQ(results.size(), 4u);
    ASSERT_TRUE(results[0].isValue());
    EXPECT_EQ(results[0].value().outcome, BattleOutcome::Win);
    ASSERT_TRUE(results[1].isValue());
    EXPECT_EQ(results[1].value().outcome, BattleOutcome::Loss);
    ASSERT_TRUE(results[2].isValue());
    EXPECT_EQ(results[2].value().outcome, BattleOutcome::Timeout);
    ASSERT_TRUE(results[3].isError());
    EXPECT_EQ(oracle.calls(), 4);
}

TEST(EvaluationPoolTest, PlayingNoMatchesReturnsImmediately)
{
    const DuelOracle oracle;
    EvaluationPool pool(oracle, 2);

    EXPECT_TRUE(pool.play({}, SimulatorOracle::Duration(5.0)).empty());
    EXPECT_EQ(oracle.calls(), 0);
}

TEST(EvaluatorTest, EvaluatorsShareOnePool)
{
    const StubOracle oracle;
    std::mt19937 rng{ 42 };
    const SearchSpace space = SearchSpace::standard();
    Population a = Population::random(space, 4, 400, rng);
    Population b = Population::random(space, 4, 400, rng);
    {
        auto pool = std::make_shared<EvaluationPool>(oracle, 2);
        Evaluator first(testBattle("first"), pool, SimulatorOracle::Duration(5.0));
        Evaluator second(testBattle("second"), pool, SimulatorOracle::Duration(5.0));

        ASSERT_TRUE(first.evaluate(a).isValue());
        ASSERT_TRUE(second.evaluate(b).isValue());
        EXPECT_EQ(first.battle().id, "first");
        EXPECT_EQ(first.workerCount(), 2);
    }

    EXPECT_EQ(oracle.contextsCreated(), 2);
    EXPECT_EQ(a.unevaluatedCount(), 0u);
    EXPECT_EQ(b.unevaluatedCount(), 0u);
}
