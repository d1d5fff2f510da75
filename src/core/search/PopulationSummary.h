#pragma once

#include <array>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ArmySearch {

inline constexpr std::array<double, 6> kSummaryQuantiles = { 0.0, 0.1, 0.25, 0.5, 0.75, 1.0 };

// Linear interpolation between closest ranks, one value per kSummaryQuantiles entry.
std::array<double, kSummaryQuantiles.size()> computeQuantiles(std::vector<double> values);

/**
 * Snapshot of one population for progress logs and reports.
 */
struct PopulationSummary {
    size_t size = 0;
    size_t evaluated = 0;
    size_t wins = 0;
    size_t losses = 0;
    size_t timeouts = 0;

    std::optional<std::array<double, kSummaryQuantiles.size()>> winningPointQuantiles;
    std::optional<std::array<double, kSummaryQuantiles.size()>> losingEnemyHealthQuantiles;

    // Keyed by unit type name.
    std::map<std::string, int> unitCounts;
    std::map<std::string, int> bestUnitCounts;

    std::vector<std::string> bestDescriptions;

    std::string toString() const;
};

void to_json(nlohmann::json& j, const PopulationSummary& summary);

} // namespace ArmySearch
