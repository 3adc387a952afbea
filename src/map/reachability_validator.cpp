#include "map/reachability_validator.hpp"

#include <cstdlib>
#include <deque>
#include <spdlog/spdlog.h>

namespace eldor::map {

std::unordered_set<Position> ReachabilityValidator::find_reachable_tiles(
    const std::vector<Position>& starts) const {
    std::unordered_set<Position> reachable;
    std::deque<Position> queue;

    for (const auto& start : starts) {
        if (map_.is_passable(start) && reachable.insert(start).second)
            queue.push_back(start);
    }

    while (!queue.empty()) {
        Position cur = queue.front();
        queue.pop_front();
        for (const auto& n : map_.adjacent_positions(cur)) {
            if (!map_.is_passable(n)) continue;
            if (reachable.insert(n).second) queue.push_back(n);
        }
    }
    return reachable;
}

std::vector<ObjectId> ReachabilityValidator::unreachable_objects(
    const std::unordered_set<Position>& reachable) const {
    std::vector<ObjectId> result;
    map_.for_each_object([&](const MapObject& obj) {
        if (!reachable.count(obj.position())) {
            result.push_back(obj.instance_id());
            return;
        }
        if (!obj.is_visitable()) return;
        for (const auto& pos : obj.visitable_positions()) {
            if (reachable.count(pos)) return;
        }
        result.push_back(obj.instance_id());
    });
    return result;
}

std::vector<ObjectId> ReachabilityValidator::find_unreachable_objects(
    const std::vector<Position>& starts) const {
    return unreachable_objects(find_reachable_tiles(starts));
}

u32 ReachabilityValidator::remove_unreachable_objects(
    const std::vector<Position>& starts) {
    u32 removed = 0;
    for (ObjectId id : find_unreachable_objects(starts)) {
        if (map_.remove_object(id)) ++removed;
    }
    if (removed > 0)
        spdlog::info("Reachability: removed {} unreachable objects", removed);
    return removed;
}

std::optional<Position> ReachabilityValidator::nearest_reachable(
    const Position& target, const std::unordered_set<Position>& reachable,
    i32 max_radius) const {
    for (i32 radius = 1; radius <= max_radius; ++radius) {
        for (i32 dx = -radius; dx <= radius; ++dx) {
            for (i32 dy = -radius; dy <= radius; ++dy) {
                if (std::abs(dx) + std::abs(dy) != radius) continue;
                Position candidate{target.x + dx, target.y + dy};
                if (reachable.count(candidate) && map_.is_clear(candidate))
                    return candidate;
            }
        }
    }
    return std::nullopt;
}

ReachabilityResult ReachabilityValidator::fix_unreachable_objects(
    const std::vector<Position>& starts, i32 max_radius) {
    auto reachable = find_reachable_tiles(starts);
    auto unreachable = unreachable_objects(reachable);

    ReachabilityResult result;
    result.total_reachable_tiles = static_cast<u32>(reachable.size());
    result.total_unreachable_objects = static_cast<u32>(unreachable.size());

    for (ObjectId id : unreachable) {
        const MapObject* obj = map_.object(id);
        if (!obj) continue;

        auto target = nearest_reachable(obj->position(), reachable, max_radius);
        if (target) {
            MapObject moved = obj->relocated(*target);
            map_.remove_object(id);
            ObjectId new_id = map_.add_object(std::move(moved));
            spdlog::debug("Reachability: moved #{} to ({}, {}) as #{}", id,
                          target->x, target->y, new_id);
            ++result.objects_relocated;
        } else {
            map_.remove_object(id);
            ++result.objects_removed;
        }
    }

    spdlog::info("Reachability: {} unreachable objects, {} relocated, {} removed",
                 result.total_unreachable_objects, result.objects_relocated,
                 result.objects_removed);
    return result;
}

ReachabilityStats ReachabilityValidator::calculate_stats(
    const std::vector<Position>& starts) const {
    auto reachable = find_reachable_tiles(starts);

    ReachabilityStats stats;
    stats.total_tiles = static_cast<u32>(map_.width()) * static_cast<u32>(map_.height());
    for (i32 y = 0; y < map_.height(); ++y) {
        for (i32 x = 0; x < map_.width(); ++x) {
            if (map_.is_passable({x, y})) ++stats.passable_tiles;
        }
    }
    stats.reachable_tiles = static_cast<u32>(reachable.size());
    stats.unreachable_tiles = stats.passable_tiles - stats.reachable_tiles;
    stats.total_objects = static_cast<u32>(map_.object_count());
    stats.unreachable_objects = static_cast<u32>(unreachable_objects(reachable).size());
    if (stats.passable_tiles > 0)
        stats.reachable_fraction = static_cast<f32>(stats.reachable_tiles) /
                                   static_cast<f32>(stats.passable_tiles);
    return stats;
}

} // namespace eldor::map
