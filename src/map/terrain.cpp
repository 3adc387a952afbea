#include "map/terrain.hpp"
#include "core/string_util.hpp"

#include <array>

namespace eldor::map {

namespace {

// Indexed by TerrainType. Costs follow the HOMM3 movement table, 100 = normal.
constexpr std::array<TerrainInfo, 11> TERRAIN_TABLE = {{
    {"Dirt", 100, true, false},
    {"Sand", 150, true, false},
    {"Grass", 100, true, false},
    {"Snow", 150, true, false},
    {"Swamp", 175, true, false},
    {"Rough", 125, true, false},
    {"Subterranean", 100, true, false},
    {"Lava", 100, true, false},
    {"Water", 100, true, true},
    {"Rock", NO_CONNECTION, false, false},
    {"Border", NO_CONNECTION, false, false},
}};

} // namespace

const TerrainInfo& terrain_info(TerrainType type) {
    return TERRAIN_TABLE[static_cast<size_t>(type)];
}

std::optional<TerrainType> terrain_from_name(std::string_view name) {
    for (size_t i = 0; i < TERRAIN_TABLE.size(); ++i) {
        if (iequals(TERRAIN_TABLE[i].name, name))
            return static_cast<TerrainType>(i);
    }
    return std::nullopt;
}

} // namespace eldor::map
