#pragma once

#include "core/types.hpp"
#include "map/map_object.hpp"
#include "map/map_tile.hpp"
#include "map/position.hpp"

#include <map>
#include <string>
#include <vector>

namespace eldor::map {

/// The authoritative adventure map: a width x height grid of tiles plus the
/// objects placed on it. GameMap is the only thing that links objects to
/// tiles; tiles and objects are handed out read-only (objects may have
/// their owner, name and dwelling stock changed).
///
/// Not thread-safe. Searches read the map while running, so mutation and
/// pathfinding must happen on the same thread.
class GameMap {
public:
    /// Throws std::invalid_argument if either dimension is not positive.
    GameMap(i32 width, i32 height, std::string name = "Untitled Map");

    i32 width() const { return width_; }
    i32 height() const { return height_; }

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }
    const std::string& description() const { return description_; }
    void set_description(std::string d) { description_ = std::move(d); }

    bool is_in_bounds(const Position& pos) const {
        return pos.x >= 0 && pos.x < width_ && pos.y >= 0 && pos.y < height_;
    }

    /// Throws std::out_of_range outside the map.
    const MapTile& tile(const Position& pos) const;

    /// Throws std::out_of_range outside the map. Coastal flags are not
    /// updated; call calculate_coastal_tiles() after a batch of edits.
    void set_terrain(const Position& pos, TerrainType terrain);

    /// Places an object and returns its new instance id. Throws
    /// std::out_of_range if the anchor is outside the map. Blocked or
    /// visitable cells that fall outside the map are ignored.
    ObjectId add_object(MapObject obj);

    /// Detaches the object from all tiles and destroys it. Returns false
    /// for an unknown id.
    bool remove_object(ObjectId id);

    MapObject* object(ObjectId id);
    const MapObject* object(ObjectId id) const;

    size_t object_count() const { return objects_.size(); }

    /// Visitable objects first (in visiting order), then blockers not
    /// already listed. Empty outside the map.
    std::vector<const MapObject*> objects_at(const Position& pos) const;

    std::vector<const MapObject*> objects_by_type(MapObjectType type) const;

    /// All objects whose payload is T, in placement order.
    template <typename T>
    std::vector<const MapObject*> objects_of() const {
        std::vector<const MapObject*> result;
        for (const auto& entry : objects_) {
            if (entry.second.template holds<T>()) result.push_back(&entry.second);
        }
        return result;
    }

    template <typename F>
    void for_each_object(F&& fn) const {
        for (const auto& [id, obj] : objects_)
            fn(obj);
    }

    /// A move is legal between 8-adjacent in-bounds cells when the
    /// destination is passable and not blocked. Diagonal steps between two
    /// blocked orthogonal cells are allowed.
    bool can_move_between(const Position& from, const Position& to) const;

    /// Cost of entering `to` from `from`, or NO_CONNECTION if the move is
    /// not legal.
    i32 movement_cost(const Position& from, const Position& to) const;

    /// In-bounds cells among the 8 neighbours of `pos`.
    std::vector<Position> adjacent_positions(const Position& pos) const;

    bool is_passable(const Position& pos) const;
    bool is_clear(const Position& pos) const;

    /// Full-grid pass: every non-water tile touching water becomes coastal,
    /// every other tile loses the flag.
    void calculate_coastal_tiles();

    /// Start-of-week growth for every dwelling on the map.
    void apply_weekly_growth();

private:
    size_t index(const Position& pos) const {
        return static_cast<size_t>(pos.y) * static_cast<size_t>(width_) +
               static_cast<size_t>(pos.x);
    }
    MapTile& tile_mut(const Position& pos) { return tiles_[index(pos)]; }

    i32 width_;
    i32 height_;
    std::string name_;
    std::string description_;
    std::vector<MapTile> tiles_; // row-major [y * width + x]
    // Ids are handed out in increasing order, so iteration is placement order.
    std::map<ObjectId, MapObject> objects_;
    ObjectId next_id_ = 0;
};

} // namespace eldor::map
