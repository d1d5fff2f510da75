#pragma once

#include "PlacementArea.h"
#include "UnitCatalog.h"

namespace ArmySearch {

/**
 * What the operators may build armies from: unit costs plus the allowed roster,
 * and the region placements are drawn from.
 */
struct SearchSpace {
    UnitCatalog catalog;
    PlacementArea area;

    static SearchSpace standard()
    {
        return SearchSpace{ .catalog = UnitCatalog::standard(),
                            .area = PlacementArea::standardAllySide() };
    }
};

} // namespace ArmySearch
