#include "lua/lua_state.hpp"

#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace eldor::lua {

LuaState::LuaState() {
    L_ = luaL_newstate();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }
    luaL_openlibs(L_);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

std::optional<std::string> LuaState::global_string(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<std::string> result;
    if (lua_type(L_, -1) == LUA_TSTRING) result = lua_tostring(L_, -1);
    lua_pop(L_, 1);
    return result;
}

Result<void> LuaState::pop_error() {
    const char* msg = lua_tostring(L_, -1);
    std::string err = msg ? msg : "unknown Lua error";
    lua_pop(L_, 1);
    return Error(ErrorKind::Script, std::move(err));
}

Result<void> LuaState::do_string(std::string_view code) {
    return do_buffer(code.data(), code.size(), "=string");
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error(ErrorKind::NotFound, "Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return Error(ErrorKind::NotFound, "Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                  const char* name) {
    if (!L_) return Error(ErrorKind::Script, "Lua state is not initialised");

    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    if (luaL_loadbuffer(L_, buf, len, name) != 0) return pop_error();
    if (lua_pcall(L_, 0, 0, 0) != 0) return pop_error();
    return {};
}

} // namespace eldor::lua
