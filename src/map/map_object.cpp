#include "map/map_object.hpp"

#include <algorithm>

namespace eldor::map {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// Cells covered by an object anchored at `anchor`, whether or not it blocks.
std::vector<Position> footprint(const Position& anchor,
                                const ObjectPayload& payload) {
    return std::visit(
        overloaded{
            [&](const GenericObject& g) {
                std::vector<Position> cells;
                u32 w = std::max<u32>(g.footprint_width, 1);
                u32 h = std::max<u32>(g.footprint_height, 1);
                cells.reserve(w * h);
                for (u32 dy = 0; dy < h; ++dy) {
                    for (u32 dx = 0; dx < w; ++dx) {
                        cells.push_back({anchor.x - static_cast<i32>(dx),
                                         anchor.y - static_cast<i32>(dy)});
                    }
                }
                return cells;
            },
            [&](const ResourcePile&) { return std::vector<Position>{anchor}; },
            [&](const Mine&) { return std::vector<Position>{anchor}; },
            [&](const Dwelling&) { return std::vector<Position>{anchor}; },
        },
        payload);
}

bool contains(const std::vector<Position>& cells, const Position& p) {
    return std::find(cells.begin(), cells.end(), p) != cells.end();
}

} // namespace

bool Dwelling::recruit(i32 count) {
    if (count < 0 || !can_recruit(count)) return false;
    available_count -= count;
    return true;
}

MapObject::MapObject(MapObjectType type, Position pos, ObjectPayload payload)
    : type_(type), position_(pos), payload_(std::move(payload)) {}

std::vector<Position> MapObject::blocked_positions() const {
    if (!blocks_movement_) return {};
    return footprint(position_, payload_);
}

std::vector<Position> MapObject::visitable_positions() const {
    if (!visitable_) return {};
    if (!blocked_visitable_) return {position_};

    // Ring of cells touching the footprint, excluding the footprint itself.
    auto cells = footprint(position_, payload_);
    std::vector<Position> ring;
    for (const auto& cell : cells) {
        for (const auto& off : NEIGHBOUR_OFFSETS) {
            Position n = cell + off;
            if (!contains(cells, n) && !contains(ring, n))
                ring.push_back(n);
        }
    }
    return ring;
}

bool MapObject::is_blocking_at(const Position& pos) const {
    return contains(blocked_positions(), pos);
}

bool MapObject::is_visitable_at(const Position& pos) const {
    return contains(visitable_positions(), pos);
}

MapObject MapObject::relocated(const Position& pos) const {
    MapObject copy = *this;
    copy.position_ = pos;
    copy.instance_id_ = 0;
    return copy;
}

std::string MapObject::describe() const {
    std::string name = instance_name_.empty()
                           ? std::string(map_object_type_name(type_))
                           : instance_name_;
    return name + " at " + to_string(position_) + " (Owner: " +
           player_color_name(owner_) + ")";
}

MapObject make_generic(const GenericConfig& cfg) {
    MapObject obj(cfg.type, cfg.position,
                  GenericObject{cfg.footprint_width, cfg.footprint_height});
    obj.blocks_movement_ = cfg.blocks_movement;
    obj.visitable_ = cfg.visitable;
    obj.blocked_visitable_ = cfg.blocked_visitable;
    obj.removable_ = cfg.removable;
    obj.owner_ = cfg.owner;
    obj.instance_name_ = cfg.name;
    return obj;
}

MapObject make_resource(const ResourceConfig& cfg) {
    MapObject obj(MapObjectType::Resource, cfg.position,
                  ResourcePile{cfg.resource, cfg.amount});
    obj.blocks_movement_ = false;
    obj.visitable_ = true;
    obj.blocked_visitable_ = false; // hero steps onto the pile
    obj.removable_ = true;
    obj.instance_name_ = cfg.name;
    return obj;
}

MapObject make_mine(const MineConfig& cfg) {
    MapObject obj(MapObjectType::Mine, cfg.position,
                  Mine{cfg.resource, cfg.daily_production});
    obj.blocks_movement_ = true;
    obj.visitable_ = true;
    obj.blocked_visitable_ = true;
    obj.removable_ = false;
    obj.owner_ = cfg.owner;
    obj.instance_name_ = cfg.name;
    return obj;
}

MapObject make_dwelling(const DwellingConfig& cfg) {
    MapObject obj(MapObjectType::Dwelling, cfg.position,
                  Dwelling{cfg.creature_id, cfg.initial_count, cfg.weekly_growth});
    obj.blocks_movement_ = true;
    obj.visitable_ = true;
    obj.blocked_visitable_ = true;
    obj.removable_ = false;
    obj.owner_ = cfg.owner;
    obj.instance_name_ = cfg.name;
    return obj;
}

} // namespace eldor::map
