#include "Crossover.h"
#include "core/LoggingChannels.h"

#include <cmath>
#include <map>
#include <nlohmann/json.hpp>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace ArmySearch {

namespace {

using Children = std::pair<std::vector<Placement>, std::vector<Placement>>;

Children recombine(
    const Crossovers::SpatialSplit&, const Army& first, const Army& second, std::mt19937& rng)
{
    const Position c1 = first.centroid();
    const Position c2 = second.centroid();
    const Position midpoint{ .x = (c1.x + c2.x) / 2.0, .y = (c1.y + c2.y) / 2.0 };

    std::uniform_real_distribution<double> angle(0.0, M_PI);
    const double theta = angle(rng);
    const double normalX = std::cos(theta);
    const double normalY = std::sin(theta);
    const auto below = [&](const Position& pos) {
        return (pos.x - midpoint.x) * normalX + (pos.y - midpoint.y) * normalY < 0.0;
    };

    Children children;
    for (const Placement& p : first.placements()) {
        (below(p.position) ? children.first : children.second).push_back(p);
    }
    for (const Placement& p : second.placements()) {
        (below(p.position) ? children.second : children.first).push_back(p);
    }
    return children;
}

Children recombine(
    const Crossovers::TypeBucketExchange&, const Army& first, const Army& second, std::mt19937& rng)
{
    std::map<UnitType, std::pair<std::vector<Placement>, std::vector<Placement>>> buckets;
    for (const Placement& p : first.placements()) {
        buckets[p.type].first.push_back(p);
    }
    for (const Placement& p : second.placements()) {
        buckets[p.type].second.push_back(p);
    }

    Children children;
    std::bernoulli_distribution keep(0.5);
    for (const auto& [type, bucket] : buckets) {
        const auto& [fromFirst, fromSecond] = bucket;
        auto& toFirst = keep(rng) ? children.first : children.second;
        auto& toSecond = (&toFirst == &children.first) ? children.second : children.first;
        toFirst.insert(toFirst.end(), fromFirst.begin(), fromFirst.end());
        toSecond.insert(toSecond.end(), fromSecond.begin(), fromSecond.end());
    }
    return children;
}

Children recombine(
    const Crossovers::SinglePoint&, const Army& first, const Army& second, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> cutFirst(0, first.size());
    std::uniform_int_distribution<size_t> cutSecond(0, second.size());
    const auto a = static_cast<std::ptrdiff_t>(cutFirst(rng));
    const auto b = static_cast<std::ptrdiff_t>(cutSecond(rng));
    const auto& p1 = first.placements();
    const auto& p2 = second.placements();

    Children children;
    children.first.assign(p1.begin(), p1.begin() + a);
    children.first.insert(children.first.end(), p2.begin() + b, p2.end());
    children.second.assign(p2.begin(), p2.begin() + b);
    children.second.insert(children.second.end(), p1.begin() + a, p1.end());
    return children;
}

Children recombine(
    const Crossovers::RandomMix&, const Army& first, const Army& second, std::mt19937& rng)
{
    Children children;
    std::bernoulli_distribution toFirst(0.5);
    for (const Army* parent : { &first, &second }) {
        for (const Placement& p : parent->placements()) {
            (toFirst(rng) ? children.first : children.second).push_back(p);
        }
    }
    return children;
}

Placement randomParentPlacement(const Army& first, const Army& second, std::mt19937& rng)
{
    std::uniform_int_distribution<size_t> dist(0, first.size() + second.size() - 1);
    const size_t index = dist(rng);
    return index < first.size() ? first[index] : second[index - first.size()];
}

} // namespace

std::pair<Army, Army> applyCrossover(
    const Crossover& crossover, const Army& first, const Army& second, std::mt19937& rng)
{
    if (first.empty() || second.empty()) {
        const Army& source = first.empty() ? second : first;
        return { source, source };
    }

    Children children;
    for (int attempt = 0; attempt < kMaxCrossoverAttempts; ++attempt) {
        children = std::visit(
            [&](const auto& c) { return recombine(c, first, second, rng); }, crossover);
        if (!children.first.empty() && !children.second.empty()) {
            return { Army(std::move(children.first)), Army(std::move(children.second)) };
        }
    }

    LOG_DEBUG(
        Operators,
        "{}: no split with two non-empty children after {} attempts",
        crossoverName(crossover),
        kMaxCrossoverAttempts);
    if (children.first.empty()) {
        children.first.push_back(randomParentPlacement(first, second, rng));
    }
    if (children.second.empty()) {
        children.second.push_back(randomParentPlacement(first, second, rng));
    }
    return { Army(std::move(children.first)), Army(std::move(children.second)) };
}

std::string crossoverName(const Crossover& crossover)
{
    return std::visit(
        [](const auto& c) -> std::string {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, Crossovers::SpatialSplit>) {
                return "SpatialSplit";
            }
            else if constexpr (std::is_same_v<T, Crossovers::TypeBucketExchange>) {
                return "TypeBucketExchange";
            }
            else if constexpr (std::is_same_v<T, Crossovers::SinglePoint>) {
                return "SinglePoint";
            }
            else {
                return "RandomMix";
            }
        },
        crossover);
}

nlohmann::json crossoverToJson(const Crossover& crossover)
{
    return { { "type", crossoverName(crossover) } };
}

Result<Crossover, std::string> crossoverFromJson(const nlohmann::json& json)
{
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        return Result<Crossover, std::string>::error("Crossover entry needs a string 'type'");
    }

    const std::string type = json["type"].get<std::string>();
    for (const Crossover& candidate : defaultCrossovers()) {
        if (crossoverName(candidate) == type) {
            return Result<Crossover, std::string>::okay(candidate);
        }
    }
    return Result<Crossover, std::string>::error("Unknown crossover type: " + type);
}

std::vector<Crossover> defaultCrossovers()
{
    return {
        Crossovers::SpatialSplit{},
        Crossovers::TypeBucketExchange{},
        Crossovers::SinglePoint{},
        Crossovers::RandomMix{},
    };
}

} // namespace ArmySearch
