#include "map/game_types.hpp"
#include "core/string_util.hpp"

#include <array>

namespace eldor::map {

namespace {

constexpr std::array<ResourceType, 7> ALL_RESOURCES = {
    ResourceType::Wood, ResourceType::Mercury, ResourceType::Ore,
    ResourceType::Sulfur, ResourceType::Crystal, ResourceType::Gems,
    ResourceType::Gold,
};

constexpr std::array<PlayerColor, 9> ALL_COLORS = {
    PlayerColor::Red, PlayerColor::Blue, PlayerColor::Tan,
    PlayerColor::Green, PlayerColor::Orange, PlayerColor::Purple,
    PlayerColor::Teal, PlayerColor::Pink, PlayerColor::Neutral,
};

constexpr std::array<MapObjectType, 16> ALL_OBJECT_TYPES = {
    MapObjectType::Hero, MapObjectType::Town, MapObjectType::Monster,
    MapObjectType::Resource, MapObjectType::Mine, MapObjectType::Artifact,
    MapObjectType::TreasureChest, MapObjectType::Shrine,
    MapObjectType::Dwelling, MapObjectType::Garrison,
    MapObjectType::Lighthouse, MapObjectType::University,
    MapObjectType::Shipyard, MapObjectType::Obelisk, MapObjectType::Event,
    MapObjectType::Obstacle,
};

template <typename Enum, size_t N>
std::optional<Enum> find_by_name(const std::array<Enum, N>& values,
                                 const char* (*name_of)(Enum),
                                 std::string_view name) {
    for (Enum v : values) {
        if (iequals(name_of(v), name)) return v;
    }
    return std::nullopt;
}

} // namespace

const char* resource_type_name(ResourceType type) {
    switch (type) {
    case ResourceType::Wood: return "Wood";
    case ResourceType::Mercury: return "Mercury";
    case ResourceType::Ore: return "Ore";
    case ResourceType::Sulfur: return "Sulfur";
    case ResourceType::Crystal: return "Crystal";
    case ResourceType::Gems: return "Gems";
    case ResourceType::Gold: return "Gold";
    }
    return "Unknown";
}

const char* player_color_name(PlayerColor color) {
    switch (color) {
    case PlayerColor::Red: return "Red";
    case PlayerColor::Blue: return "Blue";
    case PlayerColor::Tan: return "Tan";
    case PlayerColor::Green: return "Green";
    case PlayerColor::Orange: return "Orange";
    case PlayerColor::Purple: return "Purple";
    case PlayerColor::Teal: return "Teal";
    case PlayerColor::Pink: return "Pink";
    case PlayerColor::Neutral: return "Neutral";
    }
    return "Unknown";
}

const char* map_object_type_name(MapObjectType type) {
    switch (type) {
    case MapObjectType::Hero: return "Hero";
    case MapObjectType::Town: return "Town";
    case MapObjectType::Monster: return "Monster";
    case MapObjectType::Resource: return "Resource";
    case MapObjectType::Mine: return "Mine";
    case MapObjectType::Artifact: return "Artifact";
    case MapObjectType::TreasureChest: return "TreasureChest";
    case MapObjectType::Shrine: return "Shrine";
    case MapObjectType::Dwelling: return "Dwelling";
    case MapObjectType::Garrison: return "Garrison";
    case MapObjectType::Lighthouse: return "Lighthouse";
    case MapObjectType::University: return "University";
    case MapObjectType::Shipyard: return "Shipyard";
    case MapObjectType::Obelisk: return "Obelisk";
    case MapObjectType::Event: return "Event";
    case MapObjectType::Obstacle: return "Obstacle";
    }
    return "Unknown";
}

std::optional<ResourceType> resource_type_from_name(std::string_view name) {
    return find_by_name(ALL_RESOURCES, &resource_type_name, name);
}

std::optional<PlayerColor> player_color_from_name(std::string_view name) {
    return find_by_name(ALL_COLORS, &player_color_name, name);
}

std::optional<MapObjectType> map_object_type_from_name(std::string_view name) {
    return find_by_name(ALL_OBJECT_TYPES, &map_object_type_name, name);
}

} // namespace eldor::map
