#include "core/army/Army.h"
#include "core/army/UnitCatalog.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <random>

using namespace ArmySearch;

class ArmyTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    std::vector<Placement> samplePlacements()
    {
        return {
            { UnitType::CoreArcher, { -300.0, 10.0 } },
            { UnitType::ZombieTank, { -250.0, -40.0 } },
            { UnitType::CoreArcher, { -310.0, 5.5 } },
            { UnitType::CrusaderSoldier, { -400.0, 120.0 } },
            { UnitType::CoreArcher, { -300.0, 10.0 } },
        };
    }
};

TEST_F(ArmyTest, PermutationsCanonicalizeToEqualArmies)
{
    auto placements = samplePlacements();
    const Army reference(placements);

    for (int i = 0; i < 50; i++) {
        std::shuffle(placements.begin(), placements.end(), rng);
        const Army shuffled(placements);

        EXPECT_EQ(shuffled, reference);
        EXPECT_EQ(shuffled.fingerprint(), reference.fingerprint());
        EXPECT_EQ(ArmyHash{}(shuffled), ArmyHash{}(reference));
    }
}

TEST_F(ArmyTest, DifferentPositionsAreDifferentArmies)
{
    auto placements = samplePlacements();
    const Army reference(placements);
    placements[0].position.x += 1.0;
    const Army moved(placements);

    EXPECT_NE(moved, reference);
    EXPECT_NE(moved.fingerprint(), reference.fingerprint());
    EXPECT_EQ(moved.composition(), reference.composition());
}

TEST_F(ArmyTest, NegativeZeroHashesLikeZero)
{
    const Army a({ { UnitType::CoreArcher, { 0.0, -0.0 } } });
    const Army b({ { UnitType::CoreArcher, { -0.0, 0.0 } } });

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.fingerprint(), b.fingerprint());
}

TEST_F(ArmyTest, PointsSumCatalogCosts)
{
    const UnitCatalog catalog = UnitCatalog::standard();
    const Army army(samplePlacements());

    // 3 archers at 100, one tank at 300, one soldier at 150.
    EXPECT_EQ(army.points(catalog), 750);
}

TEST_F(ArmyTest, ShortDescriptionIsOrderedByUnitType)
{
    const Army army(samplePlacements());

    EXPECT_EQ(army.shortDescription(), "3 core_archer, 1 crusader_soldier, 1 zombie_tank");
}

TEST_F(ArmyTest, CompositionCountsEachType)
{
    const Army army(samplePlacements());
    const CompositionKey expected = {
        { UnitType::CoreArcher, 3 },
        { UnitType::CrusaderSoldier, 1 },
        { UnitType::ZombieTank, 1 },
    };

    EXPECT_EQ(army.composition(), expected);
}

TEST_F(ArmyTest, CentroidIsMeanPosition)
{
    const Army army({ { UnitType::CoreArcher, { -100.0, 0.0 } },
                      { UnitType::CoreArcher, { -300.0, 40.0 } } });

    EXPECT_DOUBLE_EQ(army.centroid().x, -200.0);
    EXPECT_DOUBLE_EQ(army.centroid().y, 20.0);
    EXPECT_EQ(Army().centroid(), Position{});
}

TEST_F(ArmyTest, MirroredArmyStandsOnTheEnemySide)
{
    const Army army(samplePlacements());

    const Army mirrored = army.mirrored();

    ASSERT_EQ(mirrored.size(), army.size());
    for (const Placement& placement : mirrored.placements()) {
        EXPECT_GT(placement.position.x, 0.0);
    }
    EXPECT_EQ(mirrored.composition(), army.composition());
    EXPECT_EQ(mirrored.mirrored(), army);
}

TEST(UnitCatalogTest, StandardCatalogExcludesEnemyOnlyUnits)
{
    const UnitCatalog catalog = UnitCatalog::standard();
    const auto& allowed = catalog.allowedTypes();

    EXPECT_EQ(allowed.size(), 21u);
    EXPECT_EQ(std::count(allowed.begin(), allowed.end(), UnitType::CrusaderCommander), 0);
    EXPECT_EQ(std::count(allowed.begin(), allowed.end(), UnitType::ZombieBasicZombie), 0);
    EXPECT_TRUE(catalog.hasCost(UnitType::ZombieBasicZombie));
    EXPECT_EQ(catalog.cost(UnitType::ZombieBasicZombie), 50);
}

TEST(UnitCatalogTest, WithAllowedTypesKeepsCosts)
{
    const UnitCatalog catalog =
        UnitCatalog::standard().withAllowedTypes({ UnitType::CoreWizard });

    ASSERT_EQ(catalog.allowedTypes().size(), 1u);
    EXPECT_EQ(catalog.cost(UnitType::CoreArcher), 100);
}

TEST(UnitCatalogTest, MissingCostAborts)
{
    const UnitCatalog catalog({ { UnitType::CoreArcher, 100 } }, { UnitType::CoreArcher });

    EXPECT_DEATH({ (void)catalog.cost(UnitType::ZombieTank); }, "No point cost");
}

TEST(UnitTypeTest, NamesRoundTrip)
{
    for (int i = 0; i < kUnitTypeCount; i++) {
        const auto type = static_cast<UnitType>(i);
        EXPECT_TRUE(unitTypeFromString(toString(type)) == type) << toString(type);
    }
    EXPECT_FALSE(unitTypeFromString("dragon").has_value());
}
