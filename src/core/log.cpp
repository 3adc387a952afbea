#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace eldor::log {

void init(const std::filesystem::path& log_file,
          spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file.string(), true);

    auto logger = std::make_shared<spdlog::logger>(
        "eldor", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);
    // Warnings and errors go to the file immediately.
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

void shutdown() {
    spdlog::shutdown();
}

void register_script_functions(lua_State* L) {
    lua_register(L, "LOG", l_LOG);
    lua_register(L, "WARN", l_WARN);
    lua_register(L, "SPEW", l_SPEW);
    lua_register(L, "ALERT", l_ALERT);
}

/// "scenario.lua:12" for the script line that called into C, or an empty
/// string when Lua cannot tell.
static std::string script_location(lua_State* L) {
    lua_Debug ar;
    if (!lua_getstack(L, 1, &ar) || !lua_getinfo(L, "Sl", &ar)) return {};
    if (ar.currentline <= 0) return ar.short_src;
    return std::string(ar.short_src) + ":" + std::to_string(ar.currentline);
}

/// Concatenate all Lua arguments into a single line, so that scenario
/// scripts can call LOG("placed ", n, " mines").
static std::string concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        int type = lua_type(L, i);
        if (type == LUA_TSTRING || type == LUA_TNUMBER) {
            result += lua_tostring(L, i);
        } else if (type == LUA_TNIL) {
            result += "nil";
        } else if (type == LUA_TBOOLEAN) {
            result += lua_toboolean(L, i) ? "true" : "false";
        } else {
            result += lua_typename(L, type);
        }
    }
    return result;
}

static void emit(lua_State* L, spdlog::level::level_enum level) {
    auto where = script_location(L);
    if (where.empty())
        spdlog::log(level, "script: {}", concat_args(L));
    else
        spdlog::log(level, "script [{}]: {}", where, concat_args(L));
}

int l_LOG(lua_State* L) {
    emit(L, spdlog::level::info);
    return 0;
}

int l_WARN(lua_State* L) {
    emit(L, spdlog::level::warn);
    return 0;
}

int l_SPEW(lua_State* L) {
    emit(L, spdlog::level::debug);
    return 0;
}

int l_ALERT(lua_State* L) {
    emit(L, spdlog::level::err);
    return 0;
}

} // namespace eldor::log
