#pragma once

/// @file map_loader.hpp
/// @brief Load MapGeometry from a YAML (or JSON) map description.
///
/// Document layout:
/// @code
///   metadata:
///     name: Split
///     map-size: [64, 48]
///   map-areas:
///     Mid: {x: 20, y: 10, w: 24, h: 28, z: 0}
///   walls:
///     MidWall: {x: 30, y: 20, w: 1, h: 8}          # height_z defaults to 10
///   objects:
///     Crate: {x: 25, y: 12, w: 2, h: 2}            # height_z defaults to 2
///   ramps:
///     ARamp: {x: 4, y: 20, w: 4, h: 8, z_start: 0, z_end: 3, direction: north}
///   stairs:
///     BStairs: {x: 50, y: 20, w: 4, h: 6, z: 0, height_z: 2, direction: east, steps: 4}
///   bomb-sites:
///     A: {x: 2, y: 30, w: 10, h: 10}
///   spawns:
///     attackers: [[30, 2], [32, 2, 0]]
///     defenders: [[30, 44]]
///   adjacency:
///     Mid: [A Main, B Main]
/// @endcode

#include <filesystem>
#include <memory>
#include <string_view>

#include "rse/foundation/game_result.hpp"
#include "rse/game/map_geometry.hpp"

namespace rse::game {

/// Read and validate a map description file.
/// @return MapLoadFailed when the file cannot be read or parsed,
///         InvalidGeometry/UnknownArea/NoWalkableArea for bad content.
[[nodiscard]] foundation::GameResult<std::shared_ptr<const MapGeometry>>
LoadMapFile(const std::filesystem::path& path);

/// Parse and validate a map description held in memory.
[[nodiscard]] foundation::GameResult<std::shared_ptr<const MapGeometry>>
LoadMapFromString(std::string_view document);

}  // namespace rse::game
