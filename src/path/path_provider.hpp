#pragma once

#include "core/types.hpp"
#include "map/game_map.hpp"
#include "map/position.hpp"

#include <optional>
#include <vector>

namespace eldor::path {

/// Pluggable replacement for the built-in search. Each hook may decline by
/// returning nullopt (or a negative cost), in which case the Pathfinder
/// falls back to its own engine. The defaults decline everything, so a
/// provider overrides only what it implements.
class PathProvider {
public:
    virtual ~PathProvider() = default;

    virtual std::optional<std::vector<map::Position>> find_path(
        const map::GameMap& /*map*/, const map::Position& /*start*/,
        const map::Position& /*end*/) const {
        return std::nullopt;
    }

    virtual std::optional<std::vector<map::Position>> reachable_positions(
        const map::GameMap& /*map*/, const map::Position& /*start*/,
        i32 /*budget*/) const {
        return std::nullopt;
    }

    /// Negative means "not available".
    virtual i32 calculate_path_cost(
        const map::GameMap& /*map*/,
        const std::vector<map::Position>& /*path*/) const {
        return -1;
    }
};

} // namespace eldor::path
