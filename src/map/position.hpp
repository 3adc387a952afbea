#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <string>

namespace eldor::map {

/// Tile coordinate on the adventure map. x grows east, y grows south.
struct Position {
    i32 x = 0;
    i32 y = 0;

    constexpr Position() = default;
    constexpr Position(i32 px, i32 py) : x(px), y(py) {}

    friend constexpr bool operator==(const Position& a, const Position& b) {
        return a.x == b.x && a.y == b.y;
    }
    friend constexpr bool operator!=(const Position& a, const Position& b) {
        return !(a == b);
    }

    Position operator+(const Position& o) const { return {x + o.x, y + o.y}; }
};

/// Offsets of the 8 neighbours, in the order the search expands them:
/// NW, N, NE, W, E, SW, S, SE.
inline constexpr std::array<Position, 8> NEIGHBOUR_OFFSETS = {{
    {-1, -1}, {0, -1}, {1, -1},
    {-1, 0},           {1, 0},
    {-1, 1},  {0, 1},  {1, 1},
}};

inline i32 manhattan_distance(const Position& a, const Position& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline i32 chebyshev_distance(const Position& a, const Position& b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

inline f32 euclidean_distance(const Position& a, const Position& b) {
    f32 dx = static_cast<f32>(a.x - b.x);
    f32 dy = static_cast<f32>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

/// True for the 8 cells around `a` (a cell is not adjacent to itself).
inline bool is_adjacent(const Position& a, const Position& b) {
    return chebyshev_distance(a, b) == 1;
}

inline std::string to_string(const Position& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

} // namespace eldor::map

template <>
struct std::hash<eldor::map::Position> {
    size_t operator()(const eldor::map::Position& p) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32) |
                           static_cast<uint32_t>(p.y);
        return std::hash<uint64_t>{}(packed);
    }
};
