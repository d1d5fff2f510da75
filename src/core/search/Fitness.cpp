#include "Fitness.h"

#include <spdlog/fmt/fmt.h>
#include <tuple>

namespace ArmySearch {

namespace {
// Larger tuples rank higher.
std::tuple<int, double, double> orderingKey(const Fitness& fitness)
{
    if (fitness.isWin()) {
        return { 1, -static_cast<double>(fitness.points), fitness.teamHealth };
    }
    return { 0, -fitness.enemyHealth, -static_cast<double>(fitness.points) };
}
} // namespace

int compareFitness(const Fitness& a, const Fitness& b)
{
    const auto keyA = orderingKey(a);
    const auto keyB = orderingKey(b);
    if (keyA < keyB) {
        return -1;
    }
    if (keyB < keyA) {
        return 1;
    }
    return 0;
}

std::string Fitness::toString() const
{
    return fmt::format(
        "Outcome: {}, Points: {} ({}), Team Health: {}, Enemy Health: {}",
        ArmySearch::toString(outcome),
        points,
        grade.has_value() ? ArmySearch::toString(grade.value()) : "N/A",
        teamHealth,
        enemyHealth);
}

} // namespace ArmySearch
