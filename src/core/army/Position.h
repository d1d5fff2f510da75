#pragma once

#include <tuple>

namespace ArmySearch {

struct Position {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Position& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Position& other) const { return !(*this == other); }
    bool operator<(const Position& other) const
    {
        return std::tie(x, y) < std::tie(other.x, other.y);
    }
};

} // namespace ArmySearch
