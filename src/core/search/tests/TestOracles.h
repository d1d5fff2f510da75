#pragma once

#include "core/army/UnitCatalog.h"
#include "core/search/SimulatorOracle.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace ArmySearch {
namespace Test {

class CountingContext : public SimulationContext {
public:
    int simulations = 0;
};

/**
 * Deterministic stand-in for the battle simulator: any army costing at most
 * winThreshold wins with 100 - points/10 health left, anything dearer loses.
 * A non-zero delay makes every simulation take at least that long.
 */
class StubOracle : public SimulatorOracle {
public:
    explicit StubOracle(
        UnitCatalog catalog = UnitCatalog::standard(),
        int winThreshold = 500,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : catalog_(std::move(catalog)), winThreshold_(winThreshold), delay_(delay)
    {}

    std::unique_ptr<SimulationContext> createContext() const override
    {
        contextsCreated_++;
        return std::make_unique<CountingContext>();
    }

    Result<BattleResult, std::string> simulate(
        SimulationContext& context,
        const Army& ally,
        const Army& /*enemy*/,
        Duration /*timeout*/) const override
    {
        static_cast<CountingContext&>(context).simulations++;
        calls_++;
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        const int points = ally.points(catalog_);
        if (points <= winThreshold_) {
            return Result<BattleResult, std::string>::okay(BattleResult{
                .outcome = BattleOutcome::Win,
                .allyRemainingHealth = 100.0 - points / 10.0,
                .enemyRemainingHealth = 0.0,
            });
        }
        return Result<BattleResult, std::string>::okay(BattleResult{
            .outcome = BattleOutcome::Loss,
            .allyRemainingHealth = 0.0,
            .enemyRemainingHealth = 100.0,
        });
    }

    int calls() const { return calls_.load(); }
    int contextsCreated() const { return contextsCreated_.load(); }

private:
    UnitCatalog catalog_;
    int winThreshold_;
    std::chrono::milliseconds delay_;
    mutable std::atomic<int> calls_{ 0 };
    mutable std::atomic<int> contextsCreated_{ 0 };
};

// Reports a simulator failure for every army that contains failingType.
class FailingOracle : public SimulatorOracle {
public:
    explicit FailingOracle(UnitType failingType) : failingType_(failingType) {}

    std::unique_ptr<SimulationContext> createContext() const override
    {
        return std::make_unique<CountingContext>();
    }

    Result<BattleResult, std::string> simulate(
        SimulationContext& /*context*/,
        const Army& ally,
        const Army& /*enemy*/,
        Duration /*timeout*/) const override
    {
        for (const Placement& placement : ally.placements()) {
            if (placement.type == failingType_) {
                return Result<BattleResult, std::string>::error("simulator crashed");
            }
        }
        return Result<BattleResult, std::string>::okay(BattleResult{
            .outcome = BattleOutcome::Win,
            .allyRemainingHealth = 50.0,
            .enemyRemainingHealth = 0.0,
        });
    }

private:
    UnitType failingType_;
};

/**
 * Army against army by cost: the dearer side wins, equal costs time out.
 * An enemy unit standing on the ally side is reported as an error.
 */
class DuelOracle : public SimulatorOracle {
public:
    explicit DuelOracle(UnitCatalog catalog = UnitCatalog::standard())
        : catalog_(std::move(catalog))
    {}

    std::unique_ptr<SimulationContext> createContext() const override
    {
        return std::make_unique<CountingContext>();
    }

    Result<BattleResult, std::string> simulate(
        SimulationContext& context,
        const Army& ally,
        const Army& enemy,
        Duration /*timeout*/) const override
    {
        static_cast<CountingContext&>(context).simulations++;
        calls_++;

        for (const Placement& placement : enemy.placements()) {
            if (placement.position.x <= 0.0) {
                return Result<BattleResult, std::string>::error("enemy on the ally side");
            }
        }

        const int allyPoints = ally.points(catalog_);
        const int enemyPoints = enemy.points(catalog_);
        if (allyPoints > enemyPoints) {
            return Result<BattleResult, std::string>::okay(BattleResult{
                .outcome = BattleOutcome::Win,
                .allyRemainingHealth = 50.0,
                .enemyRemainingHealth = 0.0,
            });
        }
        return Result<BattleResult, std::string>::okay(BattleResult{
            .outcome = allyPoints < enemyPoints ? BattleOutcome::Loss : BattleOutcome::Timeout,
            .allyRemainingHealth = allyPoints < enemyPoints ? 0.0 : 50.0,
            .enemyRemainingHealth = 50.0,
        });
    }

    int calls() const { return calls_.load(); }

private:
    UnitCatalog catalog_;
    mutable std::atomic<int> calls_{ 0 };
};

inline Battle testBattle(std::string id = "test_battle")
{
    return Battle{
        .id = std::move(id),
        .enemies = Army({ Placement{ .type = UnitType::ZombieBasicZombie, .position = { 300, 0 } },
                          Placement{ .type = UnitType::ZombieTank, .position = { 350, 50 } } }),
        .grades = std::nullopt,
    };
}

} // namespace Test
} // namespace ArmySearch
