#include <catch2/catch_test_macros.hpp>

#include "map/game_map.hpp"
#include "path/priority_queue.hpp"
#include "path/search.hpp"
#include "path/search_node.hpp"

#include <algorithm>
#include <unordered_set>

using namespace eldor;
using namespace eldor::map;
using namespace eldor::path;

namespace {

void check_connected(const std::vector<Position>& path) {
    for (size_t i = 1; i < path.size(); ++i)
        CHECK(is_adjacent(path[i - 1], path[i]));
}

bool contains(const std::vector<Position>& path, const Position& p) {
    return std::find(path.begin(), path.end(), p) != path.end();
}

/// 10x10 grass with a rock wall at x = 5, open only at y = 9.
GameMap walled_map() {
    GameMap map(10, 10);
    for (i32 y = 0; y < 9; ++y)
        map.set_terrain({5, y}, TerrainType::Rock);
    return map;
}

} // namespace

TEST_CASE("Path to self is a single position", "[search]") {
    GameMap map(5, 5);
    auto path = find_path(map, {2, 2}, {2, 2});
    REQUIRE(path.has_value());
    CHECK(*path == std::vector<Position>{{2, 2}});
    CHECK(calculate_path_cost(map, *path) == 0);

    map.set_terrain({2, 2}, TerrainType::Rock);
    map.set_terrain({4, 4}, TerrainType::Border);
    for (const Position p : {Position{2, 2}, Position{4, 4}}) {
        auto blocked = find_path(map, p, p);
        REQUIRE(blocked.has_value());
        CHECK(*blocked == std::vector<Position>{p});
    }
}

TEST_CASE("Straight path on open grass", "[search]") {
    GameMap map(10, 10);
    auto path = find_path(map, {0, 0}, {3, 0});
    REQUIRE(path.has_value());
    REQUIRE(path->size() == 4);
    CHECK(path->front() == Position{0, 0});
    CHECK(path->back() == Position{3, 0});
    check_connected(*path);
    CHECK(calculate_path_cost(map, *path) == 300);
}

TEST_CASE("Diagonal steps cost the same as straight ones", "[search]") {
    GameMap map(10, 10);
    auto path = find_path(map, {0, 0}, {4, 4});
    REQUIRE(path.has_value());
    CHECK(path->size() == 5);
    CHECK(calculate_path_cost(map, *path) == 400);
}

TEST_CASE("Path goes around a rock wall", "[search]") {
    auto map = walled_map();
    auto path = find_path(map, {2, 2}, {8, 2});
    REQUIRE(path.has_value());
    check_connected(*path);
    CHECK(contains(*path, {5, 9}));
    for (const auto& p : *path)
        CHECK(map.is_passable(p));
    CHECK(calculate_path_cost(map, *path) == 1400);
}

TEST_CASE("Path prefers grass over a cheaper-looking swamp line", "[search]") {
    GameMap map(5, 3);
    for (i32 x = 1; x <= 3; ++x)
        map.set_terrain({x, 1}, TerrainType::Swamp);

    auto path = find_path(map, {0, 1}, {4, 1});
    REQUIRE(path.has_value());
    CHECK(calculate_path_cost(map, *path) == 400);
    for (i32 x = 1; x <= 3; ++x)
        CHECK_FALSE(contains(*path, {x, 1}));
}

TEST_CASE("Path fails for impassable, enclosed or off-map goals", "[search]") {
    GameMap map(10, 10);
    map.set_terrain({7, 7}, TerrainType::Rock);
    CHECK_FALSE(find_path(map, {0, 0}, {7, 7}).has_value());
    CHECK_FALSE(find_path(map, {0, 0}, {10, 3}).has_value());
    CHECK_FALSE(find_path(map, {-1, 0}, {3, 3}).has_value());

    // Ring of rock around (2, 2).
    for (const auto& off : NEIGHBOUR_OFFSETS)
        map.set_terrain(Position{2, 2} + off, TerrainType::Rock);
    CHECK_FALSE(find_path(map, {8, 8}, {2, 2}).has_value());
    CHECK_FALSE(find_path(map, {2, 2}, {8, 8}).has_value());
}

TEST_CASE("Path never enters a blocked tile", "[search]") {
    GameMap map(6, 6);
    MineConfig cfg;
    cfg.position = {3, 3};
    map.add_object(make_mine(cfg));

    CHECK_FALSE(find_path(map, {0, 0}, {3, 3}).has_value());

    auto path = find_path(map, {2, 3}, {4, 3});
    REQUIRE(path.has_value());
    CHECK_FALSE(contains(*path, {3, 3}));
    CHECK(calculate_path_cost(map, *path) == 200);
}

TEST_CASE("Path cost of short or illegal paths", "[search]") {
    GameMap map(10, 10);
    map.set_terrain({2, 0}, TerrainType::Rough);

    CHECK(calculate_path_cost(map, {}) == 0);
    CHECK(calculate_path_cost(map, {{4, 4}}) == 0);
    CHECK(calculate_path_cost(map, {{0, 0}, {1, 0}, {2, 0}}) == 225);
    CHECK(calculate_path_cost(map, {{0, 0}, {2, 0}}) == NO_CONNECTION);
    CHECK(calculate_path_cost(map, {{0, 0}, {0, 2}, {0, 3}}) == NO_CONNECTION);
}

TEST_CASE("Reachable set on open grass", "[search]") {
    GameMap map(10, 10);

    auto one_step = reachable_positions(map, {5, 5}, 100);
    CHECK(one_step.size() == 8);
    CHECK_FALSE(contains(one_step, {5, 5}));

    auto two_steps = reachable_positions(map, {5, 5}, 200);
    CHECK(two_steps.size() == 24);
    for (size_t i = 0; i < 8; ++i)
        CHECK(is_adjacent(two_steps[i], {5, 5}));

    CHECK(reachable_positions(map, {5, 5}, 99).empty());
    CHECK(reachable_positions(map, {5, 5}, 0).empty());
    CHECK(reachable_positions(map, {5, 5}, -10).empty());
    CHECK(reachable_positions(map, {10, 5}, 500).empty());
}

TEST_CASE("Reachable set respects terrain cost and rock", "[search]") {
    GameMap map(10, 10);
    map.set_terrain({6, 5}, TerrainType::Swamp);
    map.set_terrain({4, 5}, TerrainType::Rock);

    auto tiles = reachable_positions(map, {5, 5}, 150);
    CHECK(tiles.size() == 6);
    CHECK_FALSE(contains(tiles, {6, 5}));
    CHECK_FALSE(contains(tiles, {4, 5}));

    auto more = reachable_positions(map, {5, 5}, 175);
    CHECK(contains(more, {6, 5}));
    CHECK_FALSE(contains(more, {4, 5}));
}

TEST_CASE("Reachable set matches shortest path costs", "[search]") {
    auto map = walled_map();
    map.set_terrain({3, 3}, TerrainType::Swamp);
    map.set_terrain({2, 6}, TerrainType::Sand);
    map.set_terrain({6, 8}, TerrainType::Snow);

    const Position start{3, 5};
    const i32 budget = 450;
    auto tiles = reachable_positions(map, start, budget);
    std::unordered_set<Position> set(tiles.begin(), tiles.end());
    CHECK(set.size() == tiles.size());

    for (i32 y = 0; y < map.height(); ++y) {
        for (i32 x = 0; x < map.width(); ++x) {
            Position p{x, y};
            if (p == start) continue;
            auto path = find_path(map, start, p);
            bool within = path && calculate_path_cost(map, *path) <= budget;
            CHECK(set.count(p) == (within ? 1u : 0u));
        }
    }
}

TEST_CASE("Open list prefers lower f, then lower h", "[search]") {
    std::vector<SearchNode> nodes(4);
    nodes[0].g = 300; nodes[0].h = 5;  // f 305
    nodes[1].g = 280; nodes[1].h = 25; // f 305, further from the goal
    nodes[2].g = 290; nodes[2].h = 15; // f 305
    nodes[3].g = 200; nodes[3].h = 30; // f 230

    PriorityQueue<u32, NodeOrder> open(NodeOrder{&nodes});
    for (u32 i : {1u, 2u, 0u, 3u})
        open.enqueue(i);

    CHECK(open.dequeue() == 3u);
    CHECK(open.dequeue() == 0u);
    CHECK(open.dequeue() == 2u);
    CHECK(open.dequeue() == 1u);
}

TEST_CASE("Relaxed node moves ahead in the open list", "[search]") {
    std::vector<SearchNode> nodes(5);
    for (u32 i = 0; i < nodes.size(); ++i) {
        nodes[i].g = 400 + 100 * static_cast<i32>(i);
        nodes[i].h = 3;
        nodes[i].parent = 0;
    }

    PriorityQueue<u32, NodeOrder> open(NodeOrder{&nodes});
    for (u32 i = 0; i < nodes.size(); ++i)
        open.enqueue(i);

    // Node 4 is reached again through node 1 at a lower cost.
    nodes[4].g = 325;
    nodes[4].parent = 1;
    open.update_priority(4u);

    REQUIRE(open.size() == 5);
    CHECK(open.dequeue() == 4u);
    CHECK(nodes[4].parent == 1u);
    CHECK(open.dequeue() == 0u);
    CHECK(open.dequeue() == 1u);
    CHECK(open.dequeue() == 2u);
    CHECK(open.dequeue() == 3u);
}

TEST_CASE("Path choice is stable and cheapest across equal-cost routes", "[search]") {
    // Two equal routes around a rock block; either side costs the same.
    GameMap map(7, 5);
    for (i32 y = 1; y <= 3; ++y)
        map.set_terrain({3, y}, TerrainType::Rock);
    map.set_terrain({2, 0}, TerrainType::Rough);
    map.set_terrain({2, 4}, TerrainType::Rough);

    auto first = find_path(map, {0, 2}, {6, 2});
    auto second = find_path(map, {0, 2}, {6, 2});
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
    check_connected(*first);
    CHECK(calculate_path_cost(map, *first) == 600);
}
