#include "Battle.h"

namespace ArmySearch {

const char* toString(Grade grade)
{
    switch (grade) {
        case Grade::S:
            return "S";
        case Grade::A:
            return "A";
        case Grade::B:
            return "B";
        case Grade::C:
            return "C";
        case Grade::D:
            return "D";
        case Grade::F:
            return "F";
        case Grade::Failed:
            return "Failed";
    }
    return "?";
}

const char* toString(BattleOutcome outcome)
{
    switch (outcome) {
        case BattleOutcome::Win:
            return "Win";
        case BattleOutcome::Loss:
            return "Loss";
        case BattleOutcome::Timeout:
            return "Timeout";
    }
    return "?";
}

int searchTargetCost(const Battle& battle)
{
    return battle.grades.has_value() ? battle.grades->dCutoff : kUngradedTargetCost;
}

Grade gradeSolution(BattleOutcome outcome, int points, const BattleGrades& grades)
{
    if (outcome != BattleOutcome::Win) {
        return Grade::Failed;
    }

    if (points < grades.aCutoff) {
        return Grade::S;
    }
    if (points <= grades.aCutoff) {
        return Grade::A;
    }
    if (points <= grades.bCutoff) {
        return Grade::B;
    }
    if (points <= grades.cCutoff) {
        return Grade::C;
    }
    if (points <= grades.dCutoff) {
        return Grade::D;
    }
    return Grade::F;
}

} // namespace ArmySearch
