#include "UnitCatalog.h"

#include "core/Assert.h"

#include <string>

namespace ArmySearch {

UnitCatalog::UnitCatalog(
    const std::vector<std::pair<UnitType, int>>& costs, std::vector<UnitType> allowedTypes)
    : allowedTypes_(std::move(allowedTypes))
{
    for (const auto& [type, points] : costs) {
        ARMYSEARCH_ASSERT(points > 0, std::string("Unit cost must be positive: ") + toString(type));
        costs_[static_cast<size_t>(type)] = points;
    }

    ARMYSEARCH_ASSERT(!allowedTypes_.empty(), "UnitCatalog needs at least one allowed unit type");
    for (const UnitType type : allowedTypes_) {
        ARMYSEARCH_ASSERT(
            hasCost(type), std::string("Allowed unit has no cost: ") + toString(type));
    }
}

UnitCatalog UnitCatalog::standard()
{
    const std::vector<std::pair<UnitType, int>> costs = {
        { UnitType::CoreArcher, 100 },
        { UnitType::CoreBarbarian, 300 },
        { UnitType::CoreCavalry, 100 },
        { UnitType::CoreDuelist, 200 },
        { UnitType::CoreSwordsman, 100 },
        { UnitType::CoreWizard, 300 },
        { UnitType::CrusaderBannerBearer, 100 },
        { UnitType::CrusaderBlackKnight, 300 },
        { UnitType::CrusaderCatapult, 300 },
        { UnitType::CrusaderCleric, 200 },
        { UnitType::CrusaderCommander, 200 },
        { UnitType::CrusaderCrossbowman, 200 },
        { UnitType::CrusaderDefender, 100 },
        { UnitType::CrusaderGoldKnight, 300 },
        { UnitType::CrusaderGuardianAngel, 100 },
        { UnitType::CrusaderLongbowman, 200 },
        { UnitType::CrusaderPaladin, 300 },
        { UnitType::CrusaderPikeman, 100 },
        { UnitType::CrusaderRedKnight, 200 },
        { UnitType::CrusaderSoldier, 150 },
        { UnitType::Werebear, 100 },
        { UnitType::ZombieBasicZombie, 50 },
        { UnitType::ZombieJumper, 200 },
        { UnitType::ZombieSpitter, 200 },
        { UnitType::ZombieTank, 300 },
    };

    // Commander, red knight, werebear and basic zombie are enemy-only.
    std::vector<UnitType> allowed = {
        UnitType::CoreArcher,           UnitType::CoreBarbarian,
        UnitType::CoreCavalry,          UnitType::CoreDuelist,
        UnitType::CoreSwordsman,        UnitType::CoreWizard,
        UnitType::CrusaderBannerBearer, UnitType::CrusaderBlackKnight,
        UnitType::CrusaderCatapult,     UnitType::CrusaderCleric,
        UnitType::CrusaderCrossbowman,  UnitType::CrusaderDefender,
        UnitType::CrusaderGoldKnight,   UnitType::CrusaderGuardianAngel,
        UnitType::CrusaderLongbowman,   UnitType::CrusaderPaladin,
        UnitType::CrusaderPikeman,      UnitType::CrusaderSoldier,
        UnitType::ZombieJumper,         UnitType::ZombieSpitter,
        UnitType::ZombieTank,
    };

    return UnitCatalog(costs, std::move(allowed));
}

int UnitCatalog::cost(UnitType type) const
{
    const auto& entry = costs_[static_cast<size_t>(type)];
    ARMYSEARCH_ASSERT(
        entry.has_value(), std::string("No point cost for unit type ") + toString(type));
    return entry.value();
}

UnitCatalog UnitCatalog::withAllowedTypes(std::vector<UnitType> allowedTypes) const
{
    UnitCatalog copy = *this;
    copy.allowedTypes_ = std::move(allowedTypes);
    ARMYSEARCH_ASSERT(
        !copy.allowedTypes_.empty(), "UnitCatalog needs at least one allowed unit type");
    for (const UnitType type : copy.allowedTypes_) {
        ARMYSEARCH_ASSERT(
            copy.hasCost(type), std::string("Allowed unit has no cost: ") + toString(type));
    }
    return copy;
}

} // namespace ArmySearch
