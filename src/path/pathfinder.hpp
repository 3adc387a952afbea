#pragma once

#include "core/types.hpp"
#include "map/game_map.hpp"
#include "map/position.hpp"

#include <array>
#include <optional>
#include <vector>

namespace eldor::path {

class PathProvider;

/// Entry point for hero movement queries. Delegates to an optional
/// PathProvider and falls back to the built-in A*/Dijkstra search when the
/// provider declines. All queries accept a null map and return an empty
/// result for it.
class Pathfinder {
public:
    /// `provider` is not owned and must outlive the Pathfinder.
    explicit Pathfinder(const PathProvider* provider = nullptr);

    void set_provider(const PathProvider* provider) { provider_ = provider; }
    const PathProvider* provider() const { return provider_; }

    std::optional<std::vector<map::Position>> find_path(
        const map::GameMap* map, const map::Position& start,
        const map::Position& end) const;

    std::vector<map::Position> reachable_positions(const map::GameMap* map,
                                                   const map::Position& start,
                                                   i32 movement_points) const;

    i32 calculate_path_cost(const map::GameMap* map,
                            const std::vector<map::Position>& path) const;

    /// True if a path to `target` exists and costs at most
    /// `movement_points`.
    bool can_reach_position(const map::GameMap* map, const map::Position& start,
                            i32 movement_points,
                            const map::Position& target) const;

    static bool is_adjacent(const map::Position& a, const map::Position& b);
    /// All 8 neighbours, without bounds filtering.
    static std::array<map::Position, 8> adjacent_positions(const map::Position& pos);
    static i32 manhattan_distance(const map::Position& a, const map::Position& b);
    static i32 chebyshev_distance(const map::Position& a, const map::Position& b);

private:
    const PathProvider* provider_;
};

} // namespace eldor::path
