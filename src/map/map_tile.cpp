#include "map/map_tile.hpp"

#include <algorithm>

namespace eldor::map {

namespace {

bool contains(const std::vector<ObjectId>& ids, ObjectId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void erase_id(std::vector<ObjectId>& ids, ObjectId id) {
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it != ids.end()) ids.erase(it);
}

} // namespace

MapTile::MapTile(TerrainType terrain)
    : terrain_(terrain), movement_cost_(terrain_movement_cost(terrain)) {}

void MapTile::set_terrain(TerrainType terrain) {
    terrain_ = terrain;
    movement_cost_ = terrain_movement_cost(terrain);
}

std::optional<ObjectId> MapTile::top_visitable_id() const {
    if (visitable_ids_.empty()) return std::nullopt;
    return visitable_ids_.back();
}

bool MapTile::has_visitable(ObjectId id) const {
    return contains(visitable_ids_, id);
}

bool MapTile::has_blocking(ObjectId id) const {
    return contains(blocking_ids_, id);
}

void MapTile::add_visitable(ObjectId id) {
    if (!contains(visitable_ids_, id)) visitable_ids_.push_back(id);
}

void MapTile::add_blocking(ObjectId id) {
    if (!contains(blocking_ids_, id)) blocking_ids_.push_back(id);
}

void MapTile::remove_visitable(ObjectId id) {
    erase_id(visitable_ids_, id);
}

void MapTile::remove_blocking(ObjectId id) {
    erase_id(blocking_ids_, id);
}

void MapTile::set_flag(TileFlag flag, bool on) {
    flags_ = on ? (flags_ | flag) : (flags_ & ~flag);
}

} // namespace eldor::map
