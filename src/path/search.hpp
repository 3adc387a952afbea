#pragma once

#include "core/types.hpp"
#include "map/game_map.hpp"
#include "map/position.hpp"

#include <optional>
#include <vector>

namespace eldor::path {

using map::GameMap;
using map::Position;

/// A* from `start` to `end` over 8-connected tiles, Manhattan heuristic.
/// The returned path includes both endpoints. nullopt if either end is out
/// of bounds, `end` is impassable, or no route exists.
std::optional<std::vector<Position>> find_path(const GameMap& map,
                                               const Position& start,
                                               const Position& end);

/// Sum of per-step movement costs along `path`. 0 for fewer than two
/// positions. A step that is not a legal move contributes NO_CONNECTION,
/// so the total saturates at NO_CONNECTION.
i32 calculate_path_cost(const GameMap& map, const std::vector<Position>& path);

/// Every tile enterable from `start` with at most `budget` movement
/// points, each once, cheapest first. `start` itself is excluded.
std::vector<Position> reachable_positions(const GameMap& map,
                                          const Position& start,
                                          i32 budget);

} // namespace eldor::path
