#include "path/search.hpp"
#include "path/priority_queue.hpp"
#include "path/search_node.hpp"

#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace eldor::path {

namespace {

/// Flat per-cell state for one search over one map.
class Search {
public:
    explicit Search(const GameMap& map)
        : map_(map),
          nodes_(static_cast<size_t>(map.width()) * static_cast<size_t>(map.height())),
          open_(NodeOrder{&nodes_}) {}

    u32 index(const Position& p) const {
        return static_cast<u32>(p.y) * static_cast<u32>(map_.width()) +
               static_cast<u32>(p.x);
    }
    Position position(u32 idx) const {
        auto w = static_cast<u32>(map_.width());
        return {static_cast<i32>(idx % w), static_cast<i32>(idx / w)};
    }

    /// Runs the search from `start`. With a goal, stops when it is dequeued
    /// and returns true. Without one, drains the frontier, calling
    /// `on_settle` for each dequeued cell; moves costing more than
    /// `budget` in total are never taken.
    template <typename OnSettle>
    bool run(const Position& start, const std::optional<Position>& goal,
             i32 budget, OnSettle&& on_settle) {
        u32 start_idx = index(start);
        SearchNode& s = nodes_[start_idx];
        s.g = 0;
        s.h = goal ? map::manhattan_distance(start, *goal) : 0;
        s.seen = true;
        open_.enqueue(start_idx);

        while (!open_.empty()) {
            u32 cur_idx = open_.dequeue();
            Position cur = position(cur_idx);
            if (goal && cur == *goal) return true;

            nodes_[cur_idx].closed = true;
            ++settled_;
            on_settle(cur_idx);

            for (const auto& off : map::NEIGHBOUR_OFFSETS) {
                Position n = cur + off;
                if (!map_.is_in_bounds(n)) continue;

                u32 n_idx = index(n);
                SearchNode& node = nodes_[n_idx];
                if (node.closed) continue;
                if (!map_.tile(n).is_passable()) continue;
                if (!map_.can_move_between(cur, n)) continue;

                i32 tentative = nodes_[cur_idx].g + map_.movement_cost(cur, n);
                if (tentative > budget) continue;

                if (!node.seen) {
                    node.seen = true;
                    node.g = tentative;
                    node.h = goal ? map::manhattan_distance(n, *goal) : 0;
                    node.parent = cur_idx;
                    open_.enqueue(n_idx);
                } else if (tentative < node.g) {
                    node.g = tentative;
                    node.parent = cur_idx;
                    open_.update_priority(n_idx);
                }
            }
        }
        return false;
    }

    std::vector<Position> reconstruct(const Position& goal) const {
        std::vector<Position> path;
        for (u32 cur = index(goal); cur != NO_PARENT; cur = nodes_[cur].parent)
            path.push_back(position(cur));
        std::reverse(path.begin(), path.end());
        return path;
    }

    const SearchNode& node(u32 idx) const { return nodes_[idx]; }
    u32 settled() const { return settled_; }

private:
    const GameMap& map_;
    std::vector<SearchNode> nodes_;
    PriorityQueue<u32, NodeOrder> open_;
    u32 settled_ = 0;
};

} // namespace

std::optional<std::vector<Position>> find_path(const GameMap& map,
                                               const Position& start,
                                               const Position& end) {
    if (!map.is_in_bounds(start) || !map.is_in_bounds(end)) return std::nullopt;
    if (start == end) return std::vector<Position>{start};
    if (!map.tile(end).is_passable()) {
        spdlog::debug("Pathfinder: goal ({}, {}) is impassable", end.x, end.y);
        return std::nullopt;
    }

    Search search(map);
    bool found = search.run(start, end, std::numeric_limits<i32>::max(),
                            [](u32) {});
    if (!found) {
        spdlog::debug("Pathfinder: no path from ({},{}) to ({},{}), {} nodes settled",
                      start.x, start.y, end.x, end.y, search.settled());
        return std::nullopt;
    }

    auto path = search.reconstruct(end);
    spdlog::debug("Pathfinder: path ({},{}) -> ({},{}) has {} steps",
                  start.x, start.y, end.x, end.y, path.size() - 1);
    return path;
}

i32 calculate_path_cost(const GameMap& map, const std::vector<Position>& path) {
    if (path.size() < 2) return 0;

    i64 total = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        total += map.movement_cost(path[i - 1], path[i]);
        if (total >= NO_CONNECTION) return NO_CONNECTION;
    }
    return static_cast<i32>(total);
}

std::vector<Position> reachable_positions(const GameMap& map,
                                          const Position& start,
                                          i32 budget) {
    std::vector<Position> result;
    if (!map.is_in_bounds(start) || budget <= 0) return result;

    Search search(map);
    search.run(start, std::nullopt, budget, [&](u32 idx) {
        Position p = search.position(idx);
        if (p != start) result.push_back(p);
    });

    spdlog::debug("Pathfinder: {} tiles reachable from ({},{}) with {} points",
                  result.size(), start.x, start.y, budget);
    return result;
}

} // namespace eldor::path
