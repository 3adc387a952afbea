#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace eldor::map {

enum class TerrainType : u8 {
    Dirt = 0,
    Sand = 1,
    Grass = 2,
    Snow = 3,
    Swamp = 4,
    Rough = 5,
    Subterranean = 6,
    Lava = 7,
    Water = 8,
    Rock = 9,   // impassable
    Border = 10 // impassable, map edge filler
};

/// Static gameplay properties of a terrain type.
struct TerrainInfo {
    const char* name;
    i32 movement_cost; // NO_CONNECTION when impassable
    bool passable;
    bool water;
};

const TerrainInfo& terrain_info(TerrainType type);

inline const char* terrain_name(TerrainType type) { return terrain_info(type).name; }
inline i32 terrain_movement_cost(TerrainType type) { return terrain_info(type).movement_cost; }
inline bool terrain_passable(TerrainType type) { return terrain_info(type).passable; }
inline bool terrain_is_water(TerrainType type) { return terrain_info(type).water; }

/// Case-insensitive lookup by name ("Grass", "swamp", ...).
std::optional<TerrainType> terrain_from_name(std::string_view name);

} // namespace eldor::map
