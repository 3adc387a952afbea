#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "map/position.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace eldor::map {
class GameMap;
}

namespace eldor::lua {

class LuaState;

/// Everything from a scenario's MapInfo table that is not part of the map.
struct ScenarioMetadata {
    std::string name;
    std::string description;
    i32 width = 0;
    i32 height = 0;
    std::vector<map::Position> spawns; // hero start positions
    u32 terrain_rects = 0;
    u32 objects_placed = 0;
    u32 objects_skipped = 0; // entries with an unknown kind
};

struct Scenario {
    ScenarioMetadata meta;
    std::unique_ptr<map::GameMap> map;
};

/// Builds a GameMap from a Lua scenario script. The script must set a
/// global `MapInfo` table with `size = {w, h}` and optional `name`,
/// `description`, `terrain`, `objects` and `spawns` lists.
class ScenarioLoader {
public:
    /// Run a scenario file in `state` and build its map.
    Result<Scenario> load_file(LuaState& state, const fs::path& path);

    /// Same, for scenario source held in memory.
    Result<Scenario> load_string(LuaState& state, std::string_view code);

private:
    Result<Scenario> build(LuaState& state);
};

} // namespace eldor::lua
