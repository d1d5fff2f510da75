#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ArmySearch {

enum class UnitType : uint8_t {
    CoreArcher = 0,
    CoreBarbarian,
    CoreCavalry,
    CoreDuelist,
    CoreSwordsman,
    CoreWizard,
    CrusaderBannerBearer,
    CrusaderBlackKnight,
    CrusaderCatapult,
    CrusaderCleric,
    CrusaderCommander,
    CrusaderCrossbowman,
    CrusaderDefender,
    CrusaderGoldKnight,
    CrusaderGuardianAngel,
    CrusaderLongbowman,
    CrusaderPaladin,
    CrusaderPikeman,
    CrusaderRedKnight,
    CrusaderSoldier,
    Werebear,
    ZombieBasicZombie,
    ZombieJumper,
    ZombieSpitter,
    ZombieTank,
};

inline constexpr int kUnitTypeCount = static_cast<int>(UnitType::ZombieTank) + 1;

// Stable lower-snake-case names, e.g. "core_archer".
const char* toString(UnitType type);
std::optional<UnitType> unitTypeFromString(std::string_view name);

} // namespace ArmySearch
