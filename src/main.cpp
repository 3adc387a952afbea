#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/lua_state.hpp"
#include "lua/scenario_loader.hpp"
#include "map/game_map.hpp"
#include "map/reachability_validator.hpp"
#include "path/pathfinder.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>

namespace {

struct ToolConfig {
    eldor::fs::path map_file;
    eldor::fs::path log_file = "eldor.log";
    std::optional<eldor::map::Position> from;
    std::optional<eldor::map::Position> to;
    std::optional<eldor::i32> budget;
    bool validate = false;
    bool verbose = false;
};

void print_usage() {
    std::cout << "eldor_pathtool v0.1.0\n"
              << "Hero movement queries for Realms of Eldor scenario files\n\n"
              << "Usage:\n"
              << "  eldor_pathtool --map <file> [options]\n\n"
              << "Options:\n"
              << "  --map <file>       Lua scenario defining MapInfo (required)\n"
              << "  --from x,y         Hero position (default: first spawn)\n"
              << "  --to x,y           Find a path and its cost to this tile\n"
              << "  --budget <n>       List tiles reachable with n movement points\n"
              << "  --validate         Report objects unreachable from the spawns\n"
              << "  --log-file <path>  Log file (default: eldor.log)\n"
              << "  --verbose          Enable debug logging\n"
              << "  --help             Show this help message\n";
}

std::optional<eldor::map::Position> parse_position(const char* text) {
    char* end = nullptr;
    long x = std::strtol(text, &end, 10);
    if (end == text || *end != ',') return std::nullopt;
    const char* y_text = end + 1;
    long y = std::strtol(y_text, &end, 10);
    if (end == y_text || *end != '\0') return std::nullopt;
    return eldor::map::Position{static_cast<eldor::i32>(x),
                                static_cast<eldor::i32>(y)};
}

/// Returns nullopt after printing the problem if the arguments are unusable.
std::optional<ToolConfig> parse_args(int argc, char* argv[]) {
    ToolConfig config;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--map") == 0 && i + 1 < argc) {
            config.map_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if ((std::strcmp(argv[i], "--from") == 0 ||
                    std::strcmp(argv[i], "--to") == 0) && i + 1 < argc) {
            bool is_from = std::strcmp(argv[i], "--from") == 0;
            auto pos = parse_position(argv[++i]);
            if (!pos) {
                std::cerr << "Invalid position '" << argv[i] << "', expected x,y\n";
                return std::nullopt;
            }
            (is_from ? config.from : config.to) = pos;
        } else if (std::strcmp(argv[i], "--budget") == 0 && i + 1 < argc) {
            char* end = nullptr;
            long val = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || val <= 0 || val > 1'000'000) {
                std::cerr << "Invalid --budget value: " << argv[i] << "\n";
                return std::nullopt;
            }
            config.budget = static_cast<eldor::i32>(val);
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            config.validate = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
            return std::nullopt;
        }
    }

    if (config.map_file.empty()) {
        std::cerr << "--map is required\n";
        return std::nullopt;
    }
    return config;
}

void run_path_query(const eldor::path::Pathfinder& pathfinder,
                    const eldor::map::GameMap& map,
                    const eldor::map::Position& from,
                    const eldor::map::Position& to) {
    auto path = pathfinder.find_path(&map, from, to);
    if (!path) {
        spdlog::info("No path from {} to {}", eldor::map::to_string(from),
                     eldor::map::to_string(to));
        return;
    }

    std::string steps;
    for (const auto& p : *path) {
        if (!steps.empty()) steps += " -> ";
        steps += eldor::map::to_string(p);
    }
    spdlog::info("Path {} -> {}: {} steps, cost {}", eldor::map::to_string(from),
                 eldor::map::to_string(to), path->size() - 1,
                 pathfinder.calculate_path_cost(&map, *path));
    spdlog::info("  {}", steps);
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);
    if (!config) {
        print_usage();
        return 1;
    }

    eldor::log::init(config->log_file, config->verbose ? spdlog::level::debug
                                                       : spdlog::level::info);

    eldor::lua::LuaState state;
    eldor::lua::ScenarioLoader loader;
    auto loaded = loader.load_file(state, config->map_file);
    if (!loaded) {
        spdlog::error("Scenario load failed ({}): {}",
                      eldor::error_kind_name(loaded.error().kind),
                      loaded.error().message);
        eldor::log::shutdown();
        return 1;
    }

    auto& scenario = loaded.value();
    const eldor::map::GameMap& map = *scenario.map;
    eldor::path::Pathfinder pathfinder;

    std::optional<eldor::map::Position> from = config->from;
    if (!from && !scenario.meta.spawns.empty()) from = scenario.meta.spawns.front();

    if ((config->to || config->budget) && !from) {
        spdlog::error("No --from given and the scenario defines no spawns");
        eldor::log::shutdown();
        return 1;
    }

    if (config->to) run_path_query(pathfinder, map, *from, *config->to);

    if (config->budget) {
        auto tiles = pathfinder.reachable_positions(&map, *from, *config->budget);
        spdlog::info("{} tiles reachable from {} with {} movement points",
                     tiles.size(), eldor::map::to_string(*from), *config->budget);
    }

    if (config->validate) {
        std::vector<eldor::map::Position> starts = scenario.meta.spawns;
        if (config->from) starts.push_back(*config->from);

        eldor::map::ReachabilityValidator validator(*scenario.map);
        auto stats = validator.calculate_stats(starts);
        spdlog::info("Reachability: {}/{} passable tiles reachable ({:.1f}%), "
                     "{} of {} objects unreachable",
                     stats.reachable_tiles, stats.passable_tiles,
                     stats.reachable_fraction * 100.0f,
                     stats.unreachable_objects, stats.total_objects);
        for (auto id : validator.find_unreachable_objects(starts)) {
            if (const auto* obj = map.object(id))
                spdlog::warn("  unreachable: {}", obj->describe());
        }
    }

    eldor::log::shutdown();
    return 0;
}
