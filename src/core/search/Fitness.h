#pragma once

#include "Battle.h"

#include <optional>
#include <string>

namespace ArmySearch {

/**
 * Outcome summary of one simulated battle, ordered by an outcome-dependent
 * decision tree rather than a weighted sum:
 *  1. A win outranks every non-win.
 *  2. Between wins: fewer points, then more remaining ally health.
 *  3. Between non-wins: less remaining enemy health, then fewer points.
 * A timeout ranks exactly like a loss.
 */
struct Fitness {
    BattleOutcome outcome = BattleOutcome::Loss;
    int points = 0;
    double teamHealth = 0.0;
    double enemyHealth = 0.0;
    std::optional<Grade> grade; // Informational; never part of the ordering.

    bool isWin() const { return outcome == BattleOutcome::Win; }

    std::string toString() const;
};

// Negative when a ranks below b, zero when tied, positive when a ranks above b.
int compareFitness(const Fitness& a, const Fitness& b);

inline bool operator<(const Fitness& a, const Fitness& b)
{
    return compareFitness(a, b) < 0;
}

inline bool operator>(const Fitness& a, const Fitness& b)
{
    return compareFitness(a, b) > 0;
}

inline bool fitnessTies(const Fitness& a, const Fitness& b)
{
    return compareFitness(a, b) == 0;
}

} // namespace ArmySearch
