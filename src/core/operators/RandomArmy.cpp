#include "RandomArmy.h"
#include "core/Assert.h"

#include <spdlog/fmt/fmt.h>

namespace ArmySearch {

Placement randomPlacement(const SearchSpace& space, std::mt19937& rng)
{
    const auto& allowed = space.catalog.allowedTypes();
    std::uniform_int_distribution<size_t> typeDist(0, allowed.size() - 1);
    const UnitType type = allowed[typeDist(rng)];
    return Placement{ .type = type, .position = space.area.randomPosition(rng) };
}

Army generateRandomArmy(
    const SearchSpace& space, int targetCost, int maxDecrease, std::mt19937& rng)
{
    std::vector<Placement> placements;
    int cost = 0;

    for (int step = 0; step < kMaxRandomArmySteps; ++step) {
        const bool inWindow = cost >= targetCost - maxDecrease && cost <= targetCost;
        if (inWindow && !placements.empty()) {
            return Army(std::move(placements));
        }

        if (cost > targetCost) {
            std::uniform_int_distribution<size_t> indexDist(0, placements.size() - 1);
            const size_t index = indexDist(rng);
            cost -= space.catalog.cost(placements[index].type);
            placements.erase(placements.begin() + static_cast<std::ptrdiff_t>(index));
        }
        else {
            placements.push_back(randomPlacement(space, rng));
            cost += space.catalog.cost(placements.back().type);
        }
    }

    ARMYSEARCH_ASSERT(
        false,
        fmt::format(
            "Cost window [{}, {}] unreachable with the allowed unit roster",
            targetCost - maxDecrease,
            targetCost));
    return Army();
}

std::optional<std::vector<Placement>> randomExactFill(
    const SearchSpace& space, int targetCost, std::mt19937& rng)
{
    std::vector<Placement> placements;
    int remaining = targetCost;
    std::vector<UnitType> fitting;

    while (remaining > 0) {
        fitting.clear();
        for (const UnitType type : space.catalog.allowedTypes()) {
            if (space.catalog.cost(type) <= remaining) {
                fitting.push_back(type);
            }
        }
        if (fitting.empty()) {
            return std::nullopt;
        }

        std::uniform_int_distribution<size_t> typeDist(0, fitting.size() - 1);
        const UnitType type = fitting[typeDist(rng)];
        placements.push_back(Placement{ .type = type, .position = space.area.randomPosition(rng) });
        remaining -= space.catalog.cost(type);
    }

    return placements;
}

} // namespace ArmySearch
