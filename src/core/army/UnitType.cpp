#include "UnitType.h"

#include <array>

namespace ArmySearch {

namespace {
constexpr std::array<const char*, kUnitTypeCount> kUnitTypeNames = {
    "core_archer",
    "core_barbarian",
    "core_cavalry",
    "core_duelist",
    "core_swordsman",
    "core_wizard",
    "crusader_banner_bearer",
    "crusader_black_knight",
    "crusader_catapult",
    "crusader_cleric",
    "crusader_commander",
    "crusader_crossbowman",
    "crusader_defender",
    "crusader_gold_knight",
    "crusader_guardian_angel",
    "crusader_longbowman",
    "crusader_paladin",
    "crusader_pikeman",
    "crusader_red_knight",
    "crusader_soldier",
    "werebear",
    "zombie_basic_zombie",
    "zombie_jumper",
    "zombie_spitter",
    "zombie_tank",
};
} // namespace

const char* toString(UnitType type)
{
    const auto index = static_cast<size_t>(type);
    if (index >= kUnitTypeNames.size()) {
        return "unknown";
    }
    return kUnitTypeNames[index];
}

std::optional<UnitType> unitTypeFromString(std::string_view name)
{
    for (size_t i = 0; i < kUnitTypeNames.size(); ++i) {
        if (name == kUnitTypeNames[i]) {
            return static_cast<UnitType>(i);
        }
    }
    return std::nullopt;
}

} // namespace ArmySearch
