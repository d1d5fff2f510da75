#pragma once

#include "core/army/Army.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ArmySearch {

enum class Grade : uint8_t {
    S = 0,
    A,
    B,
    C,
    D,
    F,
    Failed,
};

const char* toString(Grade grade);

// Point cutoffs for a battle's letter grades.
struct BattleGrades {
    int aCutoff = 0;
    int bCutoff = 0;
    int cCutoff = 0;
    int dCutoff = 0;
};

/**
 * The fixed opposing force an evaluation runs against.
 */
struct Battle {
    std::string id;
    Army enemies;
    std::optional<BattleGrades> grades;
};

inline constexpr int kUngradedTargetCost = 900;

// Starting budget for a search on this battle: the D cutoff, or a flat default.
int searchTargetCost(const Battle& battle);

enum class BattleOutcome : uint8_t {
    Win = 0,
    Loss,
    Timeout,
};

const char* toString(BattleOutcome outcome);

// Failed for any non-win; otherwise S beats the A cutoff, then A..F by cutoff.
Grade gradeSolution(BattleOutcome outcome, int points, const BattleGrades& grades);

} // namespace ArmySearch
