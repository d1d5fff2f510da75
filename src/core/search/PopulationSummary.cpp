#include "PopulationSummary.h"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/fmt/fmt.h>

namespace ArmySearch {

std::array<double, kSummaryQuantiles.size()> computeQuantiles(std::vector<double> values)
{
    std::array<double, kSummaryQuantiles.size()> result{};
    if (values.empty()) {
        return result;
    }

    std::sort(values.begin(), values.end());
    const double last = static_cast<double>(values.size() - 1);
    for (size_t i = 0; i < kSummaryQuantiles.size(); ++i) {
        const double rank = kSummaryQuantiles[i] * last;
        const auto lo = static_cast<size_t>(std::floor(rank));
        const auto hi = static_cast<size_t>(std::ceil(rank));
        const double frac = rank - static_cast<double>(lo);
        result[i] = values[lo] + (values[hi] - values[lo]) * frac;
    }
    return result;
}

namespace {

std::string formatQuantiles(const std::array<double, kSummaryQuantiles.size()>& q)
{
    return fmt::format(
        "[{:.0f} {:.0f} {:.0f} {:.0f} {:.0f} {:.0f}]", q[0], q[1], q[2], q[3], q[4], q[5]);
}

std::vector<std::pair<std::string, int>> byCountDescending(
    const std::map<std::string, int>& counts)
{
    std::vector<std::pair<std::string, int>> sorted(counts.begin(), counts.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    return sorted;
}

} // namespace

std::string PopulationSummary::toString() const
{
    std::ostringstream out;
    out << "Best individuals:\n";
    for (const auto& description : bestDescriptions) {
        out << "  " << description << "\n";
    }

    out << "Winning: " << wins << "\n";
    if (winningPointQuantiles.has_value()) {
        out << "Winning point quantiles: " << formatQuantiles(winningPointQuantiles.value())
            << "\n";
    }
    out << "Losing: " << losses << "\n";
    if (losingEnemyHealthQuantiles.has_value()) {
        out << "Losing enemy health quantiles: "
            << formatQuantiles(losingEnemyHealthQuantiles.value()) << "\n";
    }
    out << "Timed out: " << timeouts << "\n";

    out << "Units in population:\n";
    for (const auto& [name, count] : byCountDescending(unitCounts)) {
        out << fmt::format("  {:<24}: {}\n", name, count);
    }
    out << "Units in best individuals:\n";
    for (const auto& [name, count] : byCountDescending(bestUnitCounts)) {
        out << fmt::format("  {:<24}: {}\n", name, count);
    }
    return out.str();
}

void to_json(nlohmann::json& j, const PopulationSummary& summary)
{
    j = nlohmann::json{
        { "size", summary.size },
        { "evaluated", summary.evaluated },
        { "wins", summary.wins },
        { "losses", summary.losses },
        { "timeouts", summary.timeouts },
        { "unit_counts", summary.unitCounts },
        { "best_unit_counts", summary.bestUnitCounts },
        { "best", summary.bestDescriptions },
    };
    j["quantiles"] = kSummaryQuantiles;
    if (summary.winningPointQuantiles.has_value()) {
        j["winning_point_quantiles"] = summary.winningPointQuantiles.value();
    }
    if (summary.losingEnemyHealthQuantiles.has_value()) {
        j["losing_enemy_health_quantiles"] = summary.losingEnemyHealthQuantiles.value();
    }
}

} // namespace ArmySearch
