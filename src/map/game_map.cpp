#include "map/game_map.hpp"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace eldor::map {

GameMap::GameMap(i32 width, i32 height, std::string name)
    : width_(width), height_(height), name_(std::move(name)) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Map dimensions must be positive, got " +
                                    std::to_string(width) + "x" +
                                    std::to_string(height));
    }
    tiles_.assign(static_cast<size_t>(width) * static_cast<size_t>(height),
                  MapTile(TerrainType::Grass));
}

const MapTile& GameMap::tile(const Position& pos) const {
    if (!is_in_bounds(pos))
        throw std::out_of_range("Position " + to_string(pos) +
                                " is outside map bounds");
    return tiles_[index(pos)];
}

void GameMap::set_terrain(const Position& pos, TerrainType terrain) {
    if (!is_in_bounds(pos))
        throw std::out_of_range("Position " + to_string(pos) +
                                " is outside map bounds");
    tile_mut(pos).set_terrain(terrain);
}

ObjectId GameMap::add_object(MapObject obj) {
    if (!is_in_bounds(obj.position()))
        throw std::out_of_range("Object position " + to_string(obj.position()) +
                                " is outside map bounds");

    ObjectId id = next_id_++;
    obj.instance_id_ = id;

    for (const auto& pos : obj.blocked_positions()) {
        if (is_in_bounds(pos)) tile_mut(pos).add_blocking(id);
    }
    for (const auto& pos : obj.visitable_positions()) {
        if (is_in_bounds(pos)) tile_mut(pos).add_visitable(id);
    }

    spdlog::debug("GameMap: added {} #{} at ({}, {})",
                  map_object_type_name(obj.type()), id,
                  obj.position().x, obj.position().y);
    objects_.emplace(id, std::move(obj));
    return id;
}

bool GameMap::remove_object(ObjectId id) {
    auto it = objects_.find(id);
    if (it == objects_.end()) return false;

    const MapObject& obj = it->second;
    for (const auto& pos : obj.blocked_positions()) {
        if (is_in_bounds(pos)) tile_mut(pos).remove_blocking(id);
    }
    for (const auto& pos : obj.visitable_positions()) {
        if (is_in_bounds(pos)) tile_mut(pos).remove_visitable(id);
    }

    spdlog::debug("GameMap: removed {} #{}", map_object_type_name(obj.type()), id);
    objects_.erase(it);
    return true;
}

MapObject* GameMap::object(ObjectId id) {
    auto it = objects_.find(id);
    return it != objects_.end() ? &it->second : nullptr;
}

const MapObject* GameMap::object(ObjectId id) const {
    auto it = objects_.find(id);
    return it != objects_.end() ? &it->second : nullptr;
}

std::vector<const MapObject*> GameMap::objects_at(const Position& pos) const {
    std::vector<const MapObject*> result;
    if (!is_in_bounds(pos)) return result;

    const MapTile& t = tiles_[index(pos)];
    for (ObjectId id : t.visitable_ids()) {
        if (const MapObject* obj = object(id)) result.push_back(obj);
    }
    for (ObjectId id : t.blocking_ids()) {
        const MapObject* obj = object(id);
        if (obj && std::find(result.begin(), result.end(), obj) == result.end())
            result.push_back(obj);
    }
    return result;
}

std::vector<const MapObject*> GameMap::objects_by_type(MapObjectType type) const {
    std::vector<const MapObject*> result;
    for (const auto& [id, obj] : objects_) {
        if (obj.type() == type) result.push_back(&obj);
    }
    return result;
}

bool GameMap::can_move_between(const Position& from, const Position& to) const {
    if (!is_in_bounds(from) || !is_in_bounds(to)) return false;
    if (!is_adjacent(from, to)) return false;

    const MapTile& dest = tiles_[index(to)];
    return dest.is_passable() && !dest.is_blocked();
}

i32 GameMap::movement_cost(const Position& from, const Position& to) const {
    if (!can_move_between(from, to)) return NO_CONNECTION;
    return tiles_[index(to)].movement_cost();
}

std::vector<Position> GameMap::adjacent_positions(const Position& pos) const {
    std::vector<Position> result;
    result.reserve(NEIGHBOUR_OFFSETS.size());
    for (const auto& off : NEIGHBOUR_OFFSETS) {
        Position n = pos + off;
        if (is_in_bounds(n)) result.push_back(n);
    }
    return result;
}

bool GameMap::is_passable(const Position& pos) const {
    return is_in_bounds(pos) && tiles_[index(pos)].is_passable();
}

bool GameMap::is_clear(const Position& pos) const {
    return is_in_bounds(pos) && tiles_[index(pos)].is_clear();
}

void GameMap::calculate_coastal_tiles() {
    u32 coastal = 0;
    for (i32 y = 0; y < height_; ++y) {
        for (i32 x = 0; x < width_; ++x) {
            Position pos{x, y};
            MapTile& t = tile_mut(pos);
            if (t.is_water()) {
                t.set_coastal(false);
                continue;
            }
            bool near_water = false;
            for (const auto& n : adjacent_positions(pos)) {
                if (tiles_[index(n)].is_water()) {
                    near_water = true;
                    break;
                }
            }
            t.set_coastal(near_water);
            if (near_water) ++coastal;
        }
    }
    spdlog::debug("GameMap: {} coastal tiles", coastal);
}

void GameMap::apply_weekly_growth() {
    for (auto& [id, obj] : objects_) {
        if (auto* dwelling = obj.as<Dwelling>())
            dwelling->add_weekly_growth();
    }
}

} // namespace eldor::map
