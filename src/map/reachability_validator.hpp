#pragma once

#include "core/types.hpp"
#include "map/game_map.hpp"
#include "map/position.hpp"

#include <optional>
#include <unordered_set>
#include <vector>

namespace eldor::map {

struct ReachabilityResult {
    u32 total_reachable_tiles = 0;
    u32 total_unreachable_objects = 0;
    u32 objects_relocated = 0;
    u32 objects_removed = 0;
};

struct ReachabilityStats {
    u32 total_tiles = 0;
    u32 passable_tiles = 0;
    u32 reachable_tiles = 0;
    u32 unreachable_tiles = 0; // passable but not reachable
    u32 total_objects = 0;
    u32 unreachable_objects = 0;
    f32 reachable_fraction = 0.0f; // reachable / passable
};

/// Checks a generated map for objects a hero can never get to, starting
/// from the given spawn points, and optionally repairs the map.
class ReachabilityValidator {
public:
    explicit ReachabilityValidator(GameMap& map) : map_(map) {}

    /// 8-directional flood fill over passable terrain. Objects do not stop
    /// the fill. Starts outside the map or on impassable terrain are
    /// ignored.
    std::unordered_set<Position> find_reachable_tiles(
        const std::vector<Position>& starts) const;

    /// Objects whose anchor is unreachable, plus visitable objects with no
    /// reachable visitable cell. Ids in placement order.
    std::vector<ObjectId> find_unreachable_objects(
        const std::vector<Position>& starts) const;

    /// Returns the number of objects removed.
    u32 remove_unreachable_objects(const std::vector<Position>& starts);

    /// Moves each unreachable object to the nearest reachable clear tile
    /// within `max_radius` (Manhattan rings), removing it if there is none.
    /// Relocated objects get a new instance id.
    ReachabilityResult fix_unreachable_objects(const std::vector<Position>& starts,
                                               i32 max_radius = 5);

    ReachabilityStats calculate_stats(const std::vector<Position>& starts) const;

private:
    std::vector<ObjectId> unreachable_objects(
        const std::unordered_set<Position>& reachable) const;
    std::optional<Position> nearest_reachable(
        const Position& target, const std::unordered_set<Position>& reachable,
        i32 max_radius) const;

    GameMap& map_;
};

} // namespace eldor::map
