#include "PlacementArea.h"

#include "core/Assert.h"

#include <algorithm>
#include <cmath>

namespace ArmySearch {

PlacementArea::PlacementArea(std::vector<Position> vertices) : vertices_(std::move(vertices))
{
    ARMYSEARCH_ASSERT(vertices_.size() >= 3, "PlacementArea polygon needs at least 3 vertices");

    minX_ = maxX_ = vertices_.front().x;
    minY_ = maxY_ = vertices_.front().y;
    for (const Position& v : vertices_) {
        minX_ = std::min(minX_, v.x);
        maxX_ = std::max(maxX_, v.x);
        minY_ = std::min(minY_, v.y);
        maxY_ = std::max(maxY_, v.y);
    }
}

PlacementArea PlacementArea::rectangle(double minX, double minY, double maxX, double maxY)
{
    return PlacementArea({ { minX, minY }, { maxX, minY }, { maxX, maxY }, { minX, maxY } });
}

PlacementArea PlacementArea::standardAllySide(double hexSize, double noMansLandWidth)
{
    // Pointy-top hexagon centred on the origin; the ally side is x <= -noMansLandWidth / 2.
    const double halfWidth = hexSize * std::sqrt(3.0) / 2.0;
    const double innerX = -noMansLandWidth / 2.0;
    ARMYSEARCH_ASSERT(-innerX < halfWidth, "No-man's land is wider than the battlefield");

    // Top edge runs from (0, hexSize) down to (-halfWidth, hexSize / 2).
    const double slope = (hexSize / 2.0) / halfWidth;
    const double innerTop = hexSize - slope * (-innerX);

    return PlacementArea({
        { innerX, innerTop },
        { -halfWidth, hexSize / 2.0 },
        { -halfWidth, -hexSize / 2.0 },
        { innerX, -innerTop },
    });
}

bool PlacementArea::contains(const Position& position) const
{
    // Even-odd ray casting.
    bool inside = false;
    const size_t count = vertices_.size();
    for (size_t i = 0, j = count - 1; i < count; j = i++) {
        const Position& a = vertices_[i];
        const Position& b = vertices_[j];
        if ((a.y > position.y) != (b.y > position.y)) {
            const double crossX = (b.x - a.x) * (position.y - a.y) / (b.y - a.y) + a.x;
            if (position.x < crossX) {
                inside = !inside;
            }
        }
    }
    return inside;
}

Position PlacementArea::randomPosition(std::mt19937& rng) const
{
    std::uniform_real_distribution<double> xDist(minX_, maxX_);
    std::uniform_real_distribution<double> yDist(minY_, maxY_);

    for (int attempt = 0; attempt < kMaxSamplingAttempts; ++attempt) {
        const Position candidate{ xDist(rng), yDist(rng) };
        if (contains(candidate)) {
            return candidate;
        }
    }

    ARMYSEARCH_ASSERT(false, "PlacementArea rejection sampling exhausted; polygon is degenerate");
    return {};
}

} // namespace ArmySearch
