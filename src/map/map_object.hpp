#pragma once

#include "core/types.hpp"
#include "map/game_types.hpp"
#include "map/position.hpp"

#include <string>
#include <variant>
#include <vector>

namespace eldor::map {

// ---------------------------------------------------------------------------
// Per-variant payloads
// ---------------------------------------------------------------------------

/// Scenery, obstacles and every object without extra state. The footprint
/// extends from the anchor towards -x and -y (the anchor is the
/// bottom-right cell, as in the HOMM3 object format).
struct GenericObject {
    u32 footprint_width = 1;
    u32 footprint_height = 1;
};

/// Resource pile, picked up once and then removed.
struct ResourcePile {
    ResourceType resource = ResourceType::Gold;
    i32 amount = 0;
};

/// Mine producing resources daily for its owner.
struct Mine {
    ResourceType resource = ResourceType::Ore;
    i32 daily_production = 1;
};

/// Creature dwelling with weekly growth.
struct Dwelling {
    i32 creature_id = 0;
    i32 available_count = 0;
    i32 weekly_growth = 0;

    void add_weekly_growth() { available_count += weekly_growth; }
    bool can_recruit(i32 count) const { return count <= available_count; }

    /// Takes `count` creatures. Returns false and changes nothing if fewer
    /// are available.
    bool recruit(i32 count);
};

using ObjectPayload = std::variant<GenericObject, ResourcePile, Mine, Dwelling>;

// ---------------------------------------------------------------------------
// Construction configs, one per variant
// ---------------------------------------------------------------------------

struct GenericConfig {
    MapObjectType type = MapObjectType::Obstacle;
    Position position;
    u32 footprint_width = 1;
    u32 footprint_height = 1;
    bool blocks_movement = true;
    bool visitable = false;
    bool blocked_visitable = false;
    bool removable = false;
    PlayerColor owner = PlayerColor::Neutral;
    std::string name;
};

struct ResourceConfig {
    Position position;
    ResourceType resource = ResourceType::Gold;
    i32 amount = 0;
    std::string name;
};

struct MineConfig {
    Position position;
    ResourceType resource = ResourceType::Ore;
    i32 daily_production = 1;
    PlayerColor owner = PlayerColor::Neutral;
    std::string name;
};

struct DwellingConfig {
    Position position;
    i32 creature_id = 0;
    i32 initial_count = 0;
    i32 weekly_growth = 0;
    PlayerColor owner = PlayerColor::Neutral;
    std::string name;
};

// ---------------------------------------------------------------------------
// MapObject
// ---------------------------------------------------------------------------

/// An object placed on the adventure map. Common state lives here; the
/// variant-specific state is in the payload. Position is fixed for the
/// lifetime of the object, so the tiles a GameMap attached it to can always
/// be recomputed from it.
class MapObject {
public:
    ObjectId instance_id() const { return instance_id_; }
    MapObjectType type() const { return type_; }
    const Position& position() const { return position_; }

    PlayerColor owner() const { return owner_; }
    void set_owner(PlayerColor owner) { owner_ = owner; }

    const std::string& instance_name() const { return instance_name_; }
    void set_instance_name(std::string name) { instance_name_ = std::move(name); }

    bool blocks_movement() const { return blocks_movement_; }
    bool is_visitable() const { return visitable_; }
    /// Visited from an adjacent tile only; a hero never stands on it.
    bool blocked_visitable() const { return blocked_visitable_; }
    bool is_removable() const { return removable_; }

    const ObjectPayload& payload() const { return payload_; }

    template <typename T>
    bool holds() const { return std::holds_alternative<T>(payload_); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload_); }

    template <typename T>
    T* as() { return std::get_if<T>(&payload_); }

    /// Cells this object occupies. Empty for non-blocking objects.
    std::vector<Position> blocked_positions() const;

    /// Cells from which the object can be interacted with.
    std::vector<Position> visitable_positions() const;

    bool is_blocking_at(const Position& pos) const;
    bool is_visitable_at(const Position& pos) const;

    /// Same object anchored elsewhere, not yet placed on a map.
    MapObject relocated(const Position& pos) const;

    std::string describe() const;

private:
    MapObject(MapObjectType type, Position pos, ObjectPayload payload);

    friend class GameMap;
    friend MapObject make_generic(const GenericConfig& cfg);
    friend MapObject make_resource(const ResourceConfig& cfg);
    friend MapObject make_mine(const MineConfig& cfg);
    friend MapObject make_dwelling(const DwellingConfig& cfg);

    ObjectId instance_id_ = 0;
    MapObjectType type_;
    Position position_;
    PlayerColor owner_ = PlayerColor::Neutral;
    std::string instance_name_;
    bool blocks_movement_ = true;
    bool visitable_ = false;
    bool blocked_visitable_ = false;
    bool removable_ = false;
    ObjectPayload payload_;
};

MapObject make_generic(const GenericConfig& cfg);
MapObject make_resource(const ResourceConfig& cfg);
MapObject make_mine(const MineConfig& cfg);
MapObject make_dwelling(const DwellingConfig& cfg);

} // namespace eldor::map
