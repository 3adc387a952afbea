#include "path/pathfinder.hpp"
#include "path/path_provider.hpp"
#include "path/search.hpp"

#include <spdlog/spdlog.h>

namespace eldor::path {

Pathfinder::Pathfinder(const PathProvider* provider) : provider_(provider) {}

std::optional<std::vector<map::Position>> Pathfinder::find_path(
    const map::GameMap* map, const map::Position& start,
    const map::Position& end) const {
    if (!map) return std::nullopt;
    if (!map->is_in_bounds(start) || !map->is_in_bounds(end)) return std::nullopt;
    if (start == end) return std::vector<map::Position>{start};

    if (provider_) {
        auto path = provider_->find_path(*map, start, end);
        if (path && !path->empty()) return path;
        spdlog::debug("Pathfinder: provider declined path query, using A*");
    }
    return path::find_path(*map, start, end);
}

std::vector<map::Position> Pathfinder::reachable_positions(
    const map::GameMap* map, const map::Position& start,
    i32 movement_points) const {
    if (!map || !map->is_in_bounds(start) || movement_points <= 0) return {};

    if (provider_) {
        if (auto tiles = provider_->reachable_positions(*map, start, movement_points))
            return std::move(*tiles);
    }
    return path::reachable_positions(*map, start, movement_points);
}

i32 Pathfinder::calculate_path_cost(const map::GameMap* map,
                                    const std::vector<map::Position>& path) const {
    if (!map || path.size() < 2) return 0;

    if (provider_) {
        i32 cost = provider_->calculate_path_cost(*map, path);
        if (cost >= 0) return cost;
    }
    return path::calculate_path_cost(*map, path);
}

bool Pathfinder::can_reach_position(const map::GameMap* map,
                                    const map::Position& start,
                                    i32 movement_points,
                                    const map::Position& target) const {
    if (!map || !map->is_in_bounds(target) || movement_points <= 0) return false;

    auto path = find_path(map, start, target);
    if (!path) return false;
    return calculate_path_cost(map, *path) <= movement_points;
}

bool Pathfinder::is_adjacent(const map::Position& a, const map::Position& b) {
    return map::is_adjacent(a, b);
}

std::array<map::Position, 8> Pathfinder::adjacent_positions(const map::Position& pos) {
    std::array<map::Position, 8> result;
    for (size_t i = 0; i < map::NEIGHBOUR_OFFSETS.size(); ++i)
        result[i] = pos + map::NEIGHBOUR_OFFSETS[i];
    return result;
}

i32 Pathfinder::manhattan_distance(const map::Position& a, const map::Position& b) {
    return map::manhattan_distance(a, b);
}

i32 Pathfinder::chebyshev_distance(const map::Position& a, const map::Position& b) {
    return map::chebyshev_distance(a, b);
}

} // namespace eldor::path
