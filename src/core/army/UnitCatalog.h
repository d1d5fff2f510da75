#pragma once

#include "UnitType.h"

#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace ArmySearch {

/**
 * Point-cost lookup table plus the unit types the search may draw from.
 *
 * Supplied alongside the simulator oracle; the search never changes it.
 */
class UnitCatalog {
public:
    UnitCatalog(
        const std::vector<std::pair<UnitType, int>>& costs, std::vector<UnitType> allowedTypes);

    // The game's shipped costs and the default allowed roster.
    static UnitCatalog standard();

    bool hasCost(UnitType type) const { return costs_[static_cast<size_t>(type)].has_value(); }
    int cost(UnitType type) const;

    const std::vector<UnitType>& allowedTypes() const { return allowedTypes_; }

    // Same costs, different roster.
    UnitCatalog withAllowedTypes(std::vector<UnitType> allowedTypes) const;

private:
    std::array<std::optional<int>, kUnitTypeCount> costs_{};
    std::vector<UnitType> allowedTypes_;
};

} // namespace ArmySearch
