#pragma once

#include "Position.h"
#include "UnitType.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ArmySearch {

class UnitCatalog;

struct Placement {
    UnitType type = UnitType::CoreArcher;
    Position position;

    bool operator==(const Placement& other) const
    {
        return type == other.type && position == other.position;
    }
    bool operator!=(const Placement& other) const { return !(*this == other); }
    bool operator<(const Placement& other) const
    {
        if (type != other.type) {
            return type < other.type;
        }
        return position < other.position;
    }
};

// Multiset of unit types, sorted by type: the composition-shape category of an army.
using CompositionKey = std::vector<std::pair<UnitType, int>>;

/**
 * Candidate solution: a multiset of placements, kept sorted so that armies built
 * from permutations of the same placements compare and hash equal.
 */
class Army {
public:
    Army() = default;
    explicit Army(std::vector<Placement> placements);

    const std::vector<Placement>& placements() const { return placements_; }
    const Placement& operator[](size_t index) const { return placements_[index]; }
    size_t size() const { return placements_.size(); }
    bool empty() const { return placements_.empty(); }

    int points(const UnitCatalog& catalog) const;

    // Mean position; the origin for an empty army.
    Position centroid() const;

    // Reflected across x = 0, which puts an ally-side army on the enemy side.
    Army mirrored() const;

    CompositionKey composition() const;

    // "2 core_archer, 1 zombie_tank", ordered by unit type.
    std::string shortDescription() const;

    // FNV-1a over the canonical placements.
    uint64_t fingerprint() const;

    bool operator==(const Army& other) const { return placements_ == other.placements_; }
    bool operator!=(const Army& other) const { return !(*this == other); }

private:
    std::vector<Placement> placements_;
};

struct ArmyHash {
    std::size_t operator()(const Army& army) const noexcept
    {
        return static_cast<std::size_t>(army.fingerprint());
    }
};

std::string describeComposition(const CompositionKey& key);

} // namespace ArmySearch
