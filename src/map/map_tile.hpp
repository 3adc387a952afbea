#pragma once

#include "core/types.hpp"
#include "map/terrain.hpp"

#include <optional>
#include <vector>

namespace eldor::map {

/// Bit flags for derived per-tile state.
enum class TileFlag : u8 {
    None           = 0,
    Coastal        = 1 << 0, // land tile next to water (ship landing)
    FavorableWinds = 1 << 1, // spell effect active on this tile
};

inline TileFlag operator|(TileFlag a, TileFlag b) {
    return static_cast<TileFlag>(static_cast<u8>(a) | static_cast<u8>(b));
}
inline TileFlag operator&(TileFlag a, TileFlag b) {
    return static_cast<TileFlag>(static_cast<u8>(a) & static_cast<u8>(b));
}
inline TileFlag operator~(TileFlag a) {
    return static_cast<TileFlag>(~static_cast<u8>(a));
}
inline bool has_flag(TileFlag flags, TileFlag test) {
    return (static_cast<u8>(flags) & static_cast<u8>(test)) != 0;
}

/// One cell of the adventure map: terrain plus the ids of the objects
/// that block it or can be visited from it.
class MapTile {
public:
    explicit MapTile(TerrainType terrain = TerrainType::Grass);

    TerrainType terrain() const { return terrain_; }
    i32 movement_cost() const { return movement_cost_; }
    u8 visual_variant() const { return visual_variant_; }
    void set_visual_variant(u8 v) { visual_variant_ = v; }

    /// Replace the terrain and recompute cost. Flags are left alone.
    void set_terrain(TerrainType terrain);

    bool is_passable() const { return terrain_passable(terrain_); }
    bool is_water() const { return terrain_is_water(terrain_); }
    bool is_land() const { return is_passable() && !is_water(); }
    bool is_blocked() const { return !blocking_ids_.empty(); }
    bool is_visitable() const { return !visitable_ids_.empty(); }
    bool is_clear() const { return is_passable() && !is_blocked(); }

    TileFlag flags() const { return flags_; }
    bool is_coastal() const { return has_flag(flags_, TileFlag::Coastal); }
    void set_coastal(bool coastal) { set_flag(TileFlag::Coastal, coastal); }
    bool has_favorable_winds() const { return has_flag(flags_, TileFlag::FavorableWinds); }
    void set_favorable_winds(bool on) { set_flag(TileFlag::FavorableWinds, on); }

    /// Visitable ids in insertion order; the last one is on top.
    const std::vector<ObjectId>& visitable_ids() const { return visitable_ids_; }
    const std::vector<ObjectId>& blocking_ids() const { return blocking_ids_; }

    /// Id of the object a hero interacts with first, if any.
    std::optional<ObjectId> top_visitable_id() const;

    bool has_visitable(ObjectId id) const;
    bool has_blocking(ObjectId id) const;

    // Adding an id that is already present is a no-op.
    void add_visitable(ObjectId id);
    void add_blocking(ObjectId id);
    void remove_visitable(ObjectId id);
    void remove_blocking(ObjectId id);

private:
    void set_flag(TileFlag flag, bool on);

    TerrainType terrain_;
    i32 movement_cost_;
    u8 visual_variant_ = 0;
    TileFlag flags_ = TileFlag::None;
    std::vector<ObjectId> visitable_ids_;
    std::vector<ObjectId> blocking_ids_;
};

} // namespace eldor::map
