#include "lua/scenario_loader.hpp"
#include "lua/lua_state.hpp"
#include "core/log.hpp"
#include "core/string_util.hpp"
#include "map/game_map.hpp"
#include "map/game_types.hpp"
#include "map/map_object.hpp"
#include "map/terrain.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace eldor::lua {

namespace {

constexpr i32 MAX_MAP_SIDE = 1024;

/// Restores the Lua stack height on scope exit, so early error returns
/// never leak table references.
class StackGuard {
public:
    explicit StackGuard(lua_State* L) : L_(L), top_(lua_gettop(L)) {}
    ~StackGuard() { lua_settop(L_, top_); }
    StackGuard(const StackGuard&) = delete;
    StackGuard& operator=(const StackGuard&) = delete;

private:
    lua_State* L_;
    int top_;
};

Error invalid(std::string msg) {
    return Error(ErrorKind::Invalid, std::move(msg));
}

/// Read a string field from the table at the given stack index.
/// Returns nullopt if the field doesn't exist or isn't a string.
std::optional<std::string> read_string_field(lua_State* L, int table_idx,
                                             const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::optional<std::string> result;
    if (lua_type(L, -1) == LUA_TSTRING) {
        result = lua_tostring(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

/// Whole numbers in i32 range only. NaN, fractions and huge values fail.
Result<i32> to_int(lua_Number n, const std::string& what) {
    constexpr auto lo = static_cast<lua_Number>(std::numeric_limits<i32>::min());
    constexpr auto hi = static_cast<lua_Number>(std::numeric_limits<i32>::max());
    if (!(n >= lo && n <= hi) || std::floor(n) != n)
        return invalid(what + " must be a whole number, got " + std::to_string(n));
    return static_cast<i32>(n);
}

/// Read an integer field from the table at the given stack index.
/// A missing or non-numeric field gives `default_val`.
Result<i32> read_int_field(lua_State* L, int table_idx, const char* key,
                           i32 default_val = 0) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    Result<i32> result = default_val;
    if (lua_isnumber(L, -1)) {
        result = to_int(lua_tonumber(L, -1), key);
    }
    lua_pop(L, 1);
    return result;
}

bool read_bool_field(lua_State* L, int table_idx, const char* key,
                     bool default_val) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    bool result = default_val;
    if (lua_isboolean(L, -1)) {
        result = lua_toboolean(L, -1) != 0;
    }
    lua_pop(L, 1);
    return result;
}

/// Push t[i] for a 1-based array index.
void push_index(lua_State* L, int table_idx, int i) {
    lua_pushnumber(L, i);
    lua_gettable(L, table_idx);
}

/// Read {x, y} from the array table at the top of the stack.
Result<map::Position> read_pair(lua_State* L, const std::string& what) {
    int idx = lua_gettop(L);
    push_index(L, idx, 1);
    auto x = to_int(lua_tonumber(L, -1), what + "[1]");
    lua_pop(L, 1);
    if (!x) return x.error();
    push_index(L, idx, 2);
    auto y = to_int(lua_tonumber(L, -1), what + "[2]");
    lua_pop(L, 1);
    if (!y) return y.error();
    return map::Position{x.value(), y.value()};
}

/// Looks up an optional enum-valued string field. Absent gives `fallback`,
/// an unknown name gives an Invalid error.
template <typename E, typename Lookup>
Result<E> read_enum_field(lua_State* L, int table_idx, const char* key,
                          E fallback, Lookup lookup) {
    auto name = read_string_field(L, table_idx, key);
    if (!name) return fallback;
    auto value = lookup(*name);
    if (!value) return invalid("Unknown " + std::string(key) + " '" + *name + "'");
    return *value;
}

/// Iterate the array stored at field `key` of the table at `table_idx`,
/// calling fn(index) with each element pushed on the stack. Stops at the
/// first nil. Returns the first error fn reports.
template <typename Fn>
Result<void> for_each_entry(lua_State* L, int table_idx, const char* key, Fn&& fn) {
    StackGuard guard(L);
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    if (lua_isnil(L, -1)) return {};
    if (!lua_istable(L, -1))
        return invalid(std::string("MapInfo.") + key + " must be a table");
    int list_idx = lua_gettop(L);

    for (int i = 1; ; i++) {
        push_index(L, list_idx, i);
        if (lua_isnil(L, -1)) break;
        if (!lua_istable(L, -1))
            return invalid(std::string("MapInfo.") + key + "[" +
                           std::to_string(i) + "] must be a table");
        auto result = fn(i);
        if (!result) return result;
        lua_pop(L, 1);
    }
    return {};
}

Result<void> apply_terrain_rect(lua_State* L, map::GameMap& gm, int i) {
    int idx = lua_gettop(L);
    auto type_name = read_string_field(L, idx, "type");
    if (!type_name)
        return invalid("terrain[" + std::to_string(i) + "] has no type");
    auto terrain = map::terrain_from_name(*type_name);
    if (!terrain) return invalid("Unknown terrain '" + *type_name + "'");

    auto rx = read_int_field(L, idx, "x");
    auto ry = read_int_field(L, idx, "y");
    auto rw = read_int_field(L, idx, "w", 1);
    auto rh = read_int_field(L, idx, "h", 1);
    for (const auto* field : {&rx, &ry, &rw, &rh}) {
        if (!*field) return field->error();
    }
    i32 x = rx.value();
    i32 y = ry.value();
    i32 w = rw.value();
    i32 h = rh.value();

    // Far corner in i64; w and h may be anything up to INT32_MAX.
    i64 x_end = static_cast<i64>(x) + w;
    i64 y_end = static_cast<i64>(y) + h;
    if (w <= 0 || h <= 0 || !gm.is_in_bounds({x, y}) ||
        x_end > gm.width() || y_end > gm.height()) {
        return invalid("terrain[" + std::to_string(i) + "] rectangle (" +
                       std::to_string(x) + ", " + std::to_string(y) + ", " +
                       std::to_string(w) + "x" + std::to_string(h) +
                       ") is outside the map");
    }

    for (i32 ty = y; ty < y + h; ++ty)
        for (i32 tx = x; tx < x + w; ++tx)
            gm.set_terrain({tx, ty}, *terrain);
    return {};
}

/// Builds the object described by the table at the top of the stack.
/// nullopt means the entry has an unrecognised kind.
Result<std::optional<map::MapObject>> read_object(lua_State* L, const map::Position& pos) {
    int idx = lua_gettop(L);
    std::string kind = read_string_field(L, idx, "kind").value_or("");
    std::string name = read_string_field(L, idx, "name").value_or("");

    auto owner = read_enum_field(L, idx, "owner", map::PlayerColor::Neutral,
                                 map::player_color_from_name);
    if (!owner) return owner.error();

    if (iequals(kind, "mine")) {
        auto res = read_enum_field(L, idx, "resource", map::ResourceType::Ore,
                                   map::resource_type_from_name);
        if (!res) return res.error();
        map::MineConfig cfg;
        cfg.position = pos;
        cfg.resource = res.value();
        auto production = read_int_field(L, idx, "production", 1);
        if (!production) return production.error();
        cfg.daily_production = production.value();
        cfg.owner = owner.value();
        cfg.name = name;
        return std::optional<map::MapObject>(map::make_mine(cfg));
    }
    if (iequals(kind, "resource")) {
        auto res = read_enum_field(L, idx, "resource", map::ResourceType::Gold,
                                   map::resource_type_from_name);
        if (!res) return res.error();
        map::ResourceConfig cfg;
        cfg.position = pos;
        cfg.resource = res.value();
        auto amount = read_int_field(L, idx, "amount");
        if (!amount) return amount.error();
        cfg.amount = amount.value();
        cfg.name = name;
        return std::optional<map::MapObject>(map::make_resource(cfg));
    }
    if (iequals(kind, "dwelling")) {
        auto creature = read_int_field(L, idx, "creature");
        auto count = read_int_field(L, idx, "count");
        auto growth = read_int_field(L, idx, "growth");
        if (!creature) return creature.error();
        if (!count) return count.error();
        if (!growth) return growth.error();

        map::DwellingConfig cfg;
        cfg.position = pos;
        cfg.creature_id = creature.value();
        cfg.initial_count = count.value();
        cfg.weekly_growth = growth.value();
        cfg.owner = owner.value();
        cfg.name = name;
        return std::optional<map::MapObject>(map::make_dwelling(cfg));
    }
    if (iequals(kind, "generic")) {
        auto type = read_enum_field(L, idx, "type", map::MapObjectType::Obstacle,
                                    map::map_object_type_from_name);
        if (!type) return type.error();
        auto w = read_int_field(L, idx, "w", 1);
        auto h = read_int_field(L, idx, "h", 1);
        if (!w) return w.error();
        if (!h) return h.error();
        if (w.value() <= 0 || h.value() <= 0)
            return invalid("Object footprint must be positive");

        map::GenericConfig cfg;
        cfg.type = type.value();
        cfg.position = pos;
        cfg.footprint_width = static_cast<u32>(w.value());
        cfg.footprint_height = static_cast<u32>(h.value());
        cfg.blocks_movement = read_bool_field(L, idx, "blocks", true);
        cfg.visitable = read_bool_field(L, idx, "visitable", false);
        cfg.blocked_visitable = read_bool_field(L, idx, "blocked_visitable", false);
        cfg.removable = read_bool_field(L, idx, "removable", false);
        cfg.owner = owner.value();
        cfg.name = name;
        return std::optional<map::MapObject>(map::make_generic(cfg));
    }

    spdlog::warn("Scenario: skipping object with unknown kind '{}' at ({}, {})",
                 kind, pos.x, pos.y);
    return std::optional<map::MapObject>();
}

} // namespace

Result<Scenario> ScenarioLoader::load_file(LuaState& state, const fs::path& path) {
    spdlog::info("Loading scenario: {}", path.string());

    log::register_script_functions(state.raw());

    auto exec = state.do_file(path);
    if (!exec) {
        return Error(exec.error().kind,
                     "Failed to execute scenario: " + exec.error().message);
    }
    return build(state);
}

Result<Scenario> ScenarioLoader::load_string(LuaState& state, std::string_view code) {
    log::register_script_functions(state.raw());

    auto exec = state.do_buffer(code.data(), code.size(), "=scenario");
    if (!exec) {
        return Error(exec.error().kind,
                     "Failed to execute scenario: " + exec.error().message);
    }
    return build(state);
}

Result<Scenario> ScenarioLoader::build(LuaState& state) {
    lua_State* L = state.raw();
    StackGuard guard(L);

    lua_getglobal(L, "MapInfo");
    if (!lua_istable(L, -1)) {
        return invalid("MapInfo global not set by scenario file");
    }
    int info_idx = lua_gettop(L);

    ScenarioMetadata meta;
    meta.name = read_string_field(L, info_idx, "name").value_or("Untitled Map");
    meta.description = read_string_field(L, info_idx, "description").value_or("");

    // size = {width, height}
    lua_pushstring(L, "size");
    lua_gettable(L, info_idx);
    if (!lua_istable(L, -1)) {
        return invalid("MapInfo.size must be a {width, height} table");
    }
    auto size = read_pair(L, "MapInfo.size");
    lua_pop(L, 1);
    if (!size) return size.error();
    meta.width = size.value().x;
    meta.height = size.value().y;
    if (meta.width <= 0 || meta.height <= 0 ||
        meta.width > MAX_MAP_SIDE || meta.height > MAX_MAP_SIDE) {
        return invalid("Map size must be 1.." + std::to_string(MAX_MAP_SIDE) +
                       " per side, got " + std::to_string(meta.width) + "x" +
                       std::to_string(meta.height));
    }

    Scenario scenario;
    try {
        scenario.map = std::make_unique<map::GameMap>(meta.width, meta.height, meta.name);
        map::GameMap& gm = *scenario.map;
        gm.set_description(meta.description);

        auto terrain = for_each_entry(L, info_idx, "terrain", [&](int i) {
            ++meta.terrain_rects;
            return apply_terrain_rect(L, gm, i);
        });
        if (!terrain) return terrain.error();
        gm.calculate_coastal_tiles();

        auto objects = for_each_entry(L, info_idx, "objects", [&](int i) -> Result<void> {
            int idx = lua_gettop(L);
            auto x = read_int_field(L, idx, "x");
            auto y = read_int_field(L, idx, "y");
            if (!x) return x.error();
            if (!y) return y.error();
            map::Position pos{x.value(), y.value()};
            if (!gm.is_in_bounds(pos))
                return invalid("objects[" + std::to_string(i) + "] at " +
                               map::to_string(pos) + " is outside the map");

            auto obj = read_object(L, pos);
            if (!obj) return obj.error();
            if (!obj.value()) {
                ++meta.objects_skipped;
                return {};
            }
            gm.add_object(std::move(*obj.value()));
            ++meta.objects_placed;
            return {};
        });
        if (!objects) return objects.error();
    } catch (const std::invalid_argument& e) {
        return invalid(e.what());
    } catch (const std::out_of_range& e) {
        return invalid(e.what());
    }

    auto spawns = for_each_entry(L, info_idx, "spawns", [&](int i) -> Result<void> {
        auto entry = read_pair(L, "spawns[" + std::to_string(i) + "]");
        if (!entry) return entry.error();
        map::Position pos = entry.value();
        if (!scenario.map->is_in_bounds(pos))
            return invalid("spawns[" + std::to_string(i) + "] at " +
                           map::to_string(pos) + " is outside the map");
        meta.spawns.push_back(pos);
        return {};
    });
    if (!spawns) return spawns.error();

    spdlog::info("  Map: {} ({}x{}), {} terrain rects, {} objects, {} spawns",
                 meta.name, meta.width, meta.height, meta.terrain_rects,
                 meta.objects_placed, meta.spawns.size());
    if (meta.objects_skipped > 0)
        spdlog::warn("  Skipped {} objects with unknown kind", meta.objects_skipped);

    scenario.meta = std::move(meta);
    return std::move(scenario);
}

} // namespace eldor::lua
