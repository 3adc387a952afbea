#pragma once

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace eldor::map {

enum class ResourceType : u8 {
    Wood = 0,
    Mercury = 1,
    Ore = 2,
    Sulfur = 3,
    Crystal = 4,
    Gems = 5,
    Gold = 6,
};

enum class PlayerColor : u8 {
    Red = 0,
    Blue = 1,
    Tan = 2,
    Green = 3,
    Orange = 4,
    Purple = 5,
    Teal = 6,
    Pink = 7,
    Neutral = 255,
};

enum class MapObjectType : u8 {
    Hero,
    Town,
    Monster,
    Resource,
    Mine,
    Artifact,
    TreasureChest,
    Shrine,
    Dwelling,
    Garrison,
    Lighthouse,
    University,
    Shipyard,
    Obelisk,
    Event,
    Obstacle,
};

const char* resource_type_name(ResourceType type);
const char* player_color_name(PlayerColor color);
const char* map_object_type_name(MapObjectType type);

// Case-insensitive reverse lookups for scenario files.
std::optional<ResourceType> resource_type_from_name(std::string_view name);
std::optional<PlayerColor> player_color_from_name(std::string_view name);
std::optional<MapObjectType> map_object_type_from_name(std::string_view name);

} // namespace eldor::map
