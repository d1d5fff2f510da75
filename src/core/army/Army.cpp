#include "Army.h"

#include "UnitCatalog.h"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace ArmySearch {

namespace {
constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
constexpr uint64_t kPrime = 1099511628211ull;

uint64_t fnv1aAppendBytes(uint64_t hash, const void* data, size_t len)
{
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < len; ++i) {
        hash ^= static_cast<uint64_t>(bytes[i]);
        hash *= kPrime;
    }
    return hash;
}

uint64_t fnv1aAppendDouble(uint64_t hash, double value)
{
    // Fold -0.0 onto 0.0 so equal armies hash equal.
    if (value == 0.0) {
        value = 0.0;
    }
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return fnv1aAppendBytes(hash, &bits, sizeof(bits));
}
} // namespace

Army::Army(std::vector<Placement> placements) : placements_(std::move(placements))
{
    std::sort(placements_.begin(), placements_.end());
}

int Army::points(const UnitCatalog& catalog) const
{
    int total = 0;
    for (const Placement& placement : placements_) {
        total += catalog.cost(placement.type);
    }
    return total;
}

Position Army::centroid() const
{
    if (placements_.empty()) {
        return {};
    }

    double sumX = 0.0;
    double sumY = 0.0;
    for (const Placement& placement : placements_) {
        sumX += placement.position.x;
        sumY += placement.position.y;
    }
    const double count = static_cast<double>(placements_.size());
    return { sumX / count, sumY / count };
}

Army Army::mirrored() const
{
    std::vector<Placement> reflected = placements_;
    for (Placement& placement : reflected) {
        placement.position.x = -placement.position.x;
    }
    return Army(std::move(reflected));
}

CompositionKey Army::composition() const
{
    // Placements are sorted by type, so equal types are adjacent.
    CompositionKey key;
    for (const Placement& placement : placements_) {
        if (!key.empty() && key.back().first == placement.type) {
            key.back().second++;
        }
        else {
            key.emplace_back(placement.type, 1);
        }
    }
    return key;
}

std::string Army::shortDescription() const
{
    return describeComposition(composition());
}

uint64_t Army::fingerprint() const
{
    uint64_t hash = kOffsetBasis;
    for (const Placement& placement : placements_) {
        const auto type = static_cast<uint8_t>(placement.type);
        hash = fnv1aAppendBytes(hash, &type, sizeof(type));
        hash = fnv1aAppendDouble(hash, placement.position.x);
        hash = fnv1aAppendDouble(hash, placement.position.y);
    }
    return hash;
}

std::string describeComposition(const CompositionKey& key)
{
    std::ostringstream out;
    bool first = true;
    for (const auto& [type, count] : key) {
        if (!first) {
            out << ", ";
        }
        out << count << " " << toString(type);
        first = false;
    }
    return out.str();
}

} // namespace ArmySearch
