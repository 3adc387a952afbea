#pragma once

#include "core/types.hpp"

#include <limits>
#include <vector>

namespace eldor::path {

inline constexpr u32 NO_PARENT = std::numeric_limits<u32>::max();

/// Per-cell search state, indexed by y * width + x.
struct SearchNode {
    i32 g = NO_CONNECTION;
    i32 h = 0;
    u32 parent = NO_PARENT;
    bool seen = false;
    bool closed = false;

    i32 f() const { return g + h; }
};

/// Open-list order over cell indices: lower f first, then lower h.
struct NodeOrder {
    const std::vector<SearchNode>* nodes = nullptr;

    bool operator()(u32 a, u32 b) const {
        const SearchNode& na = (*nodes)[a];
        const SearchNode& nb = (*nodes)[b];
        if (na.f() != nb.f()) return na.f() < nb.f();
        return na.h < nb.h;
    }
};

} // namespace eldor::path
