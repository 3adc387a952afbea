#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>

namespace eldor {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

/// Instance id of an object placed on a GameMap.
using ObjectId = u32;

/// Movement cost between two tiles that are not connected.
constexpr i32 NO_CONNECTION = std::numeric_limits<i32>::max();

} // namespace eldor
