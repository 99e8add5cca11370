/// @file map_loader.cpp
/// @brief yaml-cpp based map description loader.

#include "rse/game/map_loader.hpp"

#include <functional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "rse/foundation/game_logger.hpp"

namespace rse::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

using MapResult = GameResult<std::shared_ptr<const MapGeometry>>;

namespace {

constexpr double kDefaultMapSize = 32.0;
constexpr double kDefaultWallHeight = 10.0;
constexpr double kDefaultObjectHeight = 2.0;

MapResult fail(ErrorCode code, std::string message) {
    return MapResult::err(GameError(code, std::move(message)));
}

/// Read the x/y/w/h footprint common to every boundary entry.
Boundary readBox(BoundaryType type, const std::string& name, const YAML::Node& node,
                 double defaultHeightZ) {
    return Boundary::Box(type, name,
                         node["x"].as<double>(), node["y"].as<double>(),
                         node["w"].as<double>(), node["h"].as<double>(),
                         node["z"].as<double>(0.0),
                         node["height_z"].as<double>(defaultHeightZ));
}

GameResult<Direction> readDirection(const std::string& name, const YAML::Node& node) {
    auto text = node["direction"].as<std::string>();
    auto dir = ParseDirection(text);
    if (!dir) {
        return GameResult<Direction>::err(GameError(
            ErrorCode::InvalidGeometry,
            "'" + name + "' has unknown direction '" + text + "'", name));
    }
    return GameResult<Direction>::ok(*dir);
}

Vector3 readSpawn(const YAML::Node& node, const MapGeometry& map) {
    const double x = node[0].as<double>();
    const double y = node[1].as<double>();
    const double z = node.size() > 2 ? node[2].as<double>() : map.ElevationAt(x, y);
    return {x, y, z};
}

/// Convert the parsed document into a validated MapGeometry.
/// yaml-cpp conversion errors propagate to the caller as exceptions.
MapResult buildMap(const YAML::Node& root) {
    if (!root.IsMap()) {
        return fail(ErrorCode::MapLoadFailed, "map document must be a mapping");
    }

    const auto metadata = root["metadata"];
    std::string name = "Unknown Map";
    double width = kDefaultMapSize;
    double height = kDefaultMapSize;
    if (metadata) {
        name = metadata["name"].as<std::string>(name);
        if (const auto size = metadata["map-size"]) {
            if (!size.IsSequence() || size.size() != 2) {
                return fail(ErrorCode::InvalidGeometry, "metadata.map-size must be [width, height]");
            }
            width = size[0].as<double>();
            height = size[1].as<double>();
        }
    }
    if (width <= 0.0 || height <= 0.0) {
        return fail(ErrorCode::InvalidGeometry, "map size must be positive");
    }

    auto map = std::make_shared<MapGeometry>(name, width, height);

    const auto addAll = [&](const char* key, BoundaryType type,
                            double defaultHeightZ) -> GameResult<void> {
        for (const auto& entry : root[key]) {
            auto added = map->AddBoundary(
                readBox(type, entry.first.as<std::string>(), entry.second, defaultHeightZ));
            if (!added) {
                return added;
            }
        }
        return GameResult<void>::ok();
    };

    if (auto r = addAll("map-areas", BoundaryType::Area, 0.0); !r) {
        return MapResult::err(r.error());
    }
    if (auto r = addAll("walls", BoundaryType::Wall, kDefaultWallHeight); !r) {
        return MapResult::err(r.error());
    }
    if (auto r = addAll("objects", BoundaryType::Object, kDefaultObjectHeight); !r) {
        return MapResult::err(r.error());
    }
    if (auto r = addAll("bomb-sites", BoundaryType::BombSite, 0.0); !r) {
        return MapResult::err(r.error());
    }

    for (const auto& entry : root["ramps"]) {
        const auto rampName = entry.first.as<std::string>();
        const auto& node = entry.second;
        auto dir = readDirection(rampName, node);
        if (!dir) {
            return MapResult::err(dir.error());
        }
        auto added = map->AddBoundary(Boundary::Ramp(
            rampName, node["x"].as<double>(), node["y"].as<double>(),
            node["w"].as<double>(), node["h"].as<double>(),
            node["z_start"].as<double>(), node["z_end"].as<double>(), dir.value()));
        if (!added) {
            return MapResult::err(added.error());
        }
    }

    for (const auto& entry : root["stairs"]) {
        const auto stairName = entry.first.as<std::string>();
        const auto& node = entry.second;
        auto dir = readDirection(stairName, node);
        if (!dir) {
            return MapResult::err(dir.error());
        }
        auto added = map->AddBoundary(Boundary::Stairs(
            stairName, node["x"].as<double>(), node["y"].as<double>(),
            node["w"].as<double>(), node["h"].as<double>(),
            node["z"].as<double>(0.0), node["height_z"].as<double>(),
            dir.value(), node["steps"].as<int32_t>()));
        if (!added) {
            return MapResult::err(added.error());
        }
    }

    if (const auto spawns = root["spawns"]) {
        for (const auto& s : spawns["attackers"]) {
            map->AddAttackerSpawn(readSpawn(s, *map));
        }
        for (const auto& s : spawns["defenders"]) {
            map->AddDefenderSpawn(readSpawn(s, *map));
        }
    }

    for (const auto& entry : root["adjacency"]) {
        map->SetAdjacency(entry.first.as<std::string>(),
                          entry.second.as<std::vector<std::string>>());
    }

    if (auto valid = map->Validate(); !valid) {
        return MapResult::err(valid.error());
    }

    RSE_LOG_INFO(LogCategory::Map,
                 "Loaded map '" + map->Name() + "' with " +
                     std::to_string(map->Areas().size()) + " areas, " +
                     std::to_string(map->Walls().size()) + " walls, " +
                     std::to_string(map->BombSites().size()) + " bomb sites");
    return MapResult::ok(std::move(map));
}

MapResult parseChecked(const std::function<YAML::Node()>& parse, const std::string& source) {
    try {
        auto result = buildMap(parse());
        if (!result) {
            RSE_LOG_ERROR(LogCategory::Map,
                          "Rejected map " + source + ": " + std::string(result.error().message()));
        }
        return result;
    } catch (const YAML::BadFile&) {
        return fail(ErrorCode::MapLoadFailed, "failed to open map file: " + source);
    } catch (const YAML::ParserException& e) {
        return fail(ErrorCode::MapLoadFailed, "map parse error in " + source + ": " + e.what());
    } catch (const YAML::Exception& e) {
        // Missing required fields or values of the wrong type.
        return fail(ErrorCode::MapLoadFailed, "malformed map " + source + ": " + e.what());
    }
}

}  // namespace

MapResult LoadMapFile(const std::filesystem::path& path) {
    return parseChecked([&] { return YAML::LoadFile(path.string()); }, path.string());
}

MapResult LoadMapFromString(std::string_view document) {
    return parseChecked([&] { return YAML::Load(std::string(document)); }, "<memory>");
}

}  // namespace rse::game
