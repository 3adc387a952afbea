#include <catch2/catch_test_macros.hpp>

#include "map/game_map.hpp"
#include "path/path_provider.hpp"
#include "path/pathfinder.hpp"

using namespace eldor;
using namespace eldor::map;
using namespace eldor::path;

namespace {

/// Provider with canned answers; counts how often each hook is asked.
class FakeProvider : public PathProvider {
public:
    std::optional<std::vector<Position>> path;
    std::optional<std::vector<Position>> reachable;
    i32 cost = -1;

    mutable int path_calls = 0;
    mutable int reachable_calls = 0;
    mutable int cost_calls = 0;

    std::optional<std::vector<Position>> find_path(
        const GameMap&, const Position&, const Position&) const override {
        ++path_calls;
        return path;
    }

    std::optional<std::vector<Position>> reachable_positions(
        const GameMap&, const Position&, i32) const override {
        ++reachable_calls;
        return reachable;
    }

    i32 calculate_path_cost(const GameMap&,
                            const std::vector<Position>&) const override {
        ++cost_calls;
        return cost;
    }
};

/// Overrides nothing: every query falls through to the built-in search.
class SilentProvider : public PathProvider {};

} // namespace

TEST_CASE("Pathfinder without provider uses the built-in search", "[pathfinder]") {
    GameMap map(10, 10);
    Pathfinder pf;

    auto path = pf.find_path(&map, {0, 0}, {0, 5});
    REQUIRE(path.has_value());
    CHECK(path->size() == 6);
    CHECK(pf.calculate_path_cost(&map, *path) == 500);
    CHECK(pf.reachable_positions(&map, {5, 5}, 100).size() == 8);
}

TEST_CASE("Pathfinder handles a null map", "[pathfinder]") {
    Pathfinder pf;
    CHECK_FALSE(pf.find_path(nullptr, {0, 0}, {1, 1}).has_value());
    CHECK(pf.reachable_positions(nullptr, {0, 0}, 500).empty());
    CHECK(pf.calculate_path_cost(nullptr, {{0, 0}, {1, 1}}) == 0);
    CHECK_FALSE(pf.can_reach_position(nullptr, {0, 0}, 500, {1, 1}));
}

TEST_CASE("Pathfinder short-circuits before asking the provider", "[pathfinder]") {
    GameMap map(10, 10);
    FakeProvider provider;
    provider.path = std::vector<Position>{{9, 9}};
    Pathfinder pf(&provider);

    auto self = pf.find_path(&map, {3, 3}, {3, 3});
    REQUIRE(self.has_value());
    CHECK(*self == std::vector<Position>{{3, 3}});
    CHECK_FALSE(pf.find_path(&map, {3, 3}, {10, 10}).has_value());
    CHECK(pf.reachable_positions(&map, {3, 3}, 0).empty());
    CHECK(pf.calculate_path_cost(&map, {{3, 3}}) == 0);

    CHECK(provider.path_calls == 0);
    CHECK(provider.reachable_calls == 0);
    CHECK(provider.cost_calls == 0);
}

TEST_CASE("Pathfinder prefers a provider path", "[pathfinder]") {
    GameMap map(10, 10);
    FakeProvider provider;
    provider.path = std::vector<Position>{{0, 0}, {1, 0}, {2, 0}};
    Pathfinder pf(&provider);

    auto path = pf.find_path(&map, {0, 0}, {2, 0});
    REQUIRE(path.has_value());
    CHECK(*path == *provider.path);
    CHECK(provider.path_calls == 1);
}

TEST_CASE("Pathfinder ignores an absent or empty provider path", "[pathfinder]") {
    GameMap map(10, 10);
    FakeProvider provider;
    Pathfinder pf(&provider);

    auto absent = pf.find_path(&map, {0, 0}, {4, 0});
    REQUIRE(absent.has_value());
    CHECK(absent->size() == 5);

    provider.path = std::vector<Position>{};
    auto empty = pf.find_path(&map, {0, 0}, {4, 0});
    REQUIRE(empty.has_value());
    CHECK(empty->size() == 5);
    CHECK(provider.path_calls == 2);
}

TEST_CASE("Pathfinder accepts an empty provider reachable set", "[pathfinder]") {
    GameMap map(10, 10);
    FakeProvider provider;
    Pathfinder pf(&provider);

    CHECK(pf.reachable_positions(&map, {5, 5}, 100).size() == 8);

    provider.reachable = std::vector<Position>{};
    CHECK(pf.reachable_positions(&map, {5, 5}, 100).empty());

    provider.reachable = std::vector<Position>{{1, 1}};
    CHECK(pf.reachable_positions(&map, {5, 5}, 100) == std::vector<Position>{{1, 1}});
}

TEST_CASE("Pathfinder uses a provider cost only when non-negative", "[pathfinder]") {
    GameMap map(10, 10);
    FakeProvider provider;
    Pathfinder pf(&provider);
    std::vector<Position> path = {{0, 0}, {1, 1}, {2, 2}};

    CHECK(pf.calculate_path_cost(&map, path) == 200);
    provider.cost = 0;
    CHECK(pf.calculate_path_cost(&map, path) == 0);
    provider.cost = 1234;
    CHECK(pf.calculate_path_cost(&map, path) == 1234);
}

TEST_CASE("Provider base class declines every query", "[pathfinder]") {
    GameMap map(10, 10);
    SilentProvider provider;
    Pathfinder pf(&provider);

    auto path = pf.find_path(&map, {0, 0}, {2, 2});
    REQUIRE(path.has_value());
    CHECK(pf.calculate_path_cost(&map, *path) == 200);
    CHECK(pf.reachable_positions(&map, {0, 0}, 100).size() == 3);
}

TEST_CASE("Pathfinder can_reach_position checks the budget", "[pathfinder]") {
    GameMap map(10, 10);
    map.set_terrain({9, 9}, TerrainType::Rock);
    Pathfinder pf;

    CHECK(pf.can_reach_position(&map, {0, 0}, 300, {3, 3}));
    CHECK_FALSE(pf.can_reach_position(&map, {0, 0}, 299, {3, 3}));
    CHECK_FALSE(pf.can_reach_position(&map, {0, 0}, 5000, {9, 9}));
    CHECK_FALSE(pf.can_reach_position(&map, {0, 0}, 5000, {10, 0}));
    CHECK_FALSE(pf.can_reach_position(&map, {0, 0}, 0, {1, 1}));
    CHECK(pf.can_reach_position(&map, {4, 4}, 1, {4, 4}));
}

TEST_CASE("Pathfinder static helpers", "[pathfinder]") {
    CHECK(Pathfinder::is_adjacent({1, 1}, {2, 2}));
    CHECK_FALSE(Pathfinder::is_adjacent({1, 1}, {1, 1}));
    CHECK(Pathfinder::manhattan_distance({0, 0}, {3, -4}) == 7);
    CHECK(Pathfinder::chebyshev_distance({0, 0}, {3, -4}) == 4);

    auto around = Pathfinder::adjacent_positions({0, 0});
    CHECK(around[0] == Position{-1, -1});
    CHECK(around[7] == Position{1, 1});
}
