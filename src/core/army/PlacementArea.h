#pragma once

#include "Position.h"

#include <random>
#include <vector>

namespace ArmySearch {

/**
 * Legal placement region for the searching team: a simple polygon.
 * Random positions are drawn by rejection sampling from the bounding box.
 */
class PlacementArea {
public:
    explicit PlacementArea(std::vector<Position> vertices);

    // Axis-aligned rectangle [minX, maxX] x [minY, maxY].
    static PlacementArea rectangle(double minX, double minY, double maxX, double maxY);

    // Ally half of the hex battlefield, with the no-man's-land strip removed.
    static PlacementArea standardAllySide(
        double hexSize = kStandardHexSize, double noMansLandWidth = kStandardNoMansLandWidth);

    bool contains(const Position& position) const;
    Position randomPosition(std::mt19937& rng) const;

    const std::vector<Position>& vertices() const { return vertices_; }
    Position minCorner() const { return { minX_, minY_ }; }
    Position maxCorner() const { return { maxX_, maxY_ }; }

    static constexpr double kStandardHexSize = 1000.0;
    static constexpr double kStandardNoMansLandWidth = 200.0;
    static constexpr int kMaxSamplingAttempts = 10000;

private:
    std::vector<Position> vertices_;
    double minX_ = 0.0;
    double minY_ = 0.0;
    double maxX_ = 0.0;
    double maxY_ = 0.0;
};

} // namespace ArmySearch
