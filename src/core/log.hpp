#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace eldor::log {

/// Install the "eldor" default logger: colour console plus a file that is
/// truncated on every run.
void init(const std::filesystem::path& log_file = "eldor.log",
          spdlog::level::level_enum level = spdlog::level::info);

/// Flush and shutdown logging.
void shutdown();

/// Expose LOG, WARN, SPEW and ALERT as globals in a scenario script.
void register_script_functions(lua_State* L);

// Script-facing logging functions. Arguments are concatenated; messages
// are tagged with the calling chunk and line.
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace eldor::log
