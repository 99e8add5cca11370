/// @file map_geometry_test.cpp
/// @brief MapGeometry queries, the YAML map loader and path finding.

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "rse/game/map_geometry.hpp"
#include "rse/game/map_loader.hpp"
#include "rse/game/math_types.hpp"
#include "rse/game/pathing.hpp"

using namespace rse::game;
using rse::foundation::ErrorCode;

namespace {

/// 40x40 floor with a divider wall, a crate, a north ramp, a raised
/// balcony and one bomb site.  Mirrors tests/data/maps/range.yaml.
std::shared_ptr<MapGeometry> makeRange() {
    auto map = std::make_shared<MapGeometry>("Range", 40.0, 40.0);
    EXPECT_TRUE(map->AddBoundary(Boundary::Box(BoundaryType::Area, "Floor", 0, 0, 40, 40)).hasValue());
    EXPECT_TRUE(
        map->AddBoundary(Boundary::Box(BoundaryType::Area, "Balcony", 0, 35, 10, 5, 3.0)).hasValue());
    EXPECT_TRUE(
        map->AddBoundary(Boundary::Box(BoundaryType::Wall, "Divider", 19, 0, 2, 15, 0, 10)).hasValue());
    EXPECT_TRUE(
        map->AddBoundary(Boundary::Box(BoundaryType::Object, "Crate", 30, 30, 2, 2, 0, 1)).hasValue());
    EXPECT_TRUE(
        map->AddBoundary(Boundary::Ramp("Ramp", 5, 20, 4, 10, 0.0, 2.0, Direction::North)).hasValue());
    EXPECT_TRUE(map->AddBoundary(Boundary::Box(BoundaryType::BombSite, "A", 30, 5, 8, 8)).hasValue());
    map->SetAdjacency("Floor", {"Balcony"});
    return map;
}

std::string dataPath(const std::string& relative) {
    return std::string(RSE_TEST_DATA_DIR) + "/" + relative;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Boundary
// ═══════════════════════════════════════════════════════════════════════════

TEST(BoundaryTest, RampRisesTowardNamedSide) {
    auto north = Boundary::Ramp("N", 0, 0, 4, 10, 0.0, 2.0, Direction::North);
    EXPECT_DOUBLE_EQ(north.SurfaceElevation(2, 0), 0.0);
    EXPECT_DOUBLE_EQ(north.SurfaceElevation(2, 5), 1.0);
    EXPECT_DOUBLE_EQ(north.SurfaceElevation(2, 10), 2.0);

    auto south = Boundary::Ramp("S", 0, 0, 4, 10, 0.0, 2.0, Direction::South);
    EXPECT_DOUBLE_EQ(south.SurfaceElevation(2, 0), 2.0);
    EXPECT_DOUBLE_EQ(south.SurfaceElevation(2, 10), 0.0);

    auto east = Boundary::Ramp("E", 0, 0, 8, 4, 1.0, 3.0, Direction::East);
    EXPECT_DOUBLE_EQ(east.SurfaceElevation(0, 2), 1.0);
    EXPECT_DOUBLE_EQ(east.SurfaceElevation(4, 2), 2.0);

    auto west = Boundary::Ramp("W", 0, 0, 8, 4, 1.0, 3.0, Direction::West);
    EXPECT_DOUBLE_EQ(west.SurfaceElevation(0, 2), 3.0);
}

TEST(BoundaryTest, StairsRiseInDiscreteSteps) {
    auto stairs = Boundary::Stairs("St", 0, 0, 8, 4, 0.0, 2.0, Direction::East, 4);
    EXPECT_DOUBLE_EQ(stairs.SurfaceElevation(1.0, 2), 0.0);
    EXPECT_DOUBLE_EQ(stairs.SurfaceElevation(3.0, 2), 0.5);
    EXPECT_DOUBLE_EQ(stairs.SurfaceElevation(5.0, 2), 1.0);
    EXPECT_DOUBLE_EQ(stairs.SurfaceElevation(7.9, 2), 1.5);
}

TEST(BoundaryTest, FootprintInclusiveVersusHalfOpen) {
    auto box = Boundary::Box(BoundaryType::Area, "Box", 0, 0, 10, 10);
    EXPECT_TRUE(box.ContainsXY(10, 10));
    EXPECT_FALSE(box.FootprintContains(10, 10));
    EXPECT_TRUE(box.FootprintContains(0, 0));
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction and validation
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeometryTest, RejectsDegenerateBoundaries) {
    MapGeometry map("bad", 20, 20);

    auto flat = map.AddBoundary(Boundary::Box(BoundaryType::Wall, "Flat", 0, 0, 0, 5, 0, 10));
    ASSERT_TRUE(flat.hasError());
    EXPECT_EQ(flat.error().code(), ErrorCode::InvalidGeometry);

    auto inverted = map.AddBoundary(Boundary::Ramp("Down", 0, 0, 4, 4, 2.0, 0.0, Direction::North));
    ASSERT_TRUE(inverted.hasError());
    EXPECT_EQ(inverted.error().code(), ErrorCode::InvalidGeometry);

    auto oneStep = map.AddBoundary(Boundary::Stairs("Step", 0, 0, 4, 4, 0.0, 1.0, Direction::East, 1));
    ASSERT_TRUE(oneStep.hasError());
    EXPECT_EQ(oneStep.error().code(), ErrorCode::InvalidGeometry);
}

TEST(MapGeometryTest, DuplicateNamesWithinOneType) {
    MapGeometry map("dup", 20, 20);
    ASSERT_TRUE(map.AddBoundary(Boundary::Box(BoundaryType::Area, "Mid", 0, 0, 10, 10)).hasValue());

    auto again = map.AddBoundary(Boundary::Box(BoundaryType::Area, "Mid", 5, 5, 10, 10));
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);

    // Same name in a different bucket is fine.
    EXPECT_TRUE(map.AddBoundary(Boundary::Box(BoundaryType::Wall, "Mid", 12, 0, 1, 5, 0, 5)).hasValue());
}

TEST(MapGeometryTest, ValidateRequiresAreasAndKnownAdjacency) {
    MapGeometry empty("empty", 20, 20);
    auto noAreas = empty.Validate();
    ASSERT_TRUE(noAreas.hasError());
    EXPECT_EQ(noAreas.error().code(), ErrorCode::NoWalkableArea);

    auto map = makeRange();
    EXPECT_TRUE(map->Validate().hasValue());
    map->SetAdjacency("Floor", {"Balcony", "Nowhere"});
    auto unknown = map->Validate();
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::UnknownArea);
}

// ═══════════════════════════════════════════════════════════════════════════
// Elevation
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeometryTest, ElevationOnRampIsContinuous) {
    auto map = makeRange();
    EXPECT_NEAR(map->ElevationAt(7, 20.0), 0.0, 1e-9);
    EXPECT_NEAR(map->ElevationAt(7, 25.0), 1.0, 1e-9);

    double previous = map->ElevationAt(7, 20.0);
    for (double y = 20.1; y < 30.0; y += 0.1) {
        const double z = map->ElevationAt(7, y);
        EXPECT_GE(z, previous - 1e-9);
        EXPECT_LE(z - previous, 0.021);
        previous = z;
    }
    EXPECT_NEAR(previous, 2.0, 0.03);
}

TEST(MapGeometryTest, ElevationFromAreasAndObjects) {
    auto map = makeRange();
    EXPECT_DOUBLE_EQ(map->ElevationAt(15, 25), 0.0);
    EXPECT_DOUBLE_EQ(map->ElevationAt(5, 37), 3.0);
    EXPECT_DOUBLE_EQ(map->ElevationAt(31, 31), 1.0);
    EXPECT_DOUBLE_EQ(map->MaxTopHeight(), 3.0);
}

TEST(MapGeometryTest, AreaAndSiteLookup) {
    auto map = makeRange();
    EXPECT_EQ(map->AreaAt(5, 37, 3.0), "Balcony");
    EXPECT_EQ(map->AreaAt(5, 37, 0.0), "Floor");
    EXPECT_FALSE(map->AreaAt(50, 50, 0.0).has_value());

    EXPECT_EQ(map->BombSiteAt(34, 9, 0.0), "A");
    EXPECT_FALSE(map->BombSiteAt(10, 10, 0.0).has_value());
    EXPECT_NE(map->FindBombSite("A"), nullptr);
    EXPECT_EQ(map->FindBombSite("B"), nullptr);
    EXPECT_TRUE(map->IsOnRampOrStairs(7, 25));
    EXPECT_FALSE(map->IsOnRampOrStairs(7, 30));
}

// ═══════════════════════════════════════════════════════════════════════════
// Collision
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeometryTest, ValidPositions) {
    auto map = makeRange();
    EXPECT_TRUE(map->IsValidPosition(10, 10, 0));
    EXPECT_FALSE(map->IsValidPosition(20, 5, 0));    // inside the divider
    EXPECT_FALSE(map->IsValidPosition(18.7, 5, 0));  // body overlaps the divider
    EXPECT_FALSE(map->IsValidPosition(0.2, 10, 0));  // body leaves the map
    EXPECT_FALSE(map->IsValidPosition(31, 31, 0));   // inside the crate
    EXPECT_TRUE(map->IsValidPosition(31, 31, 1.0));  // standing on the crate
    EXPECT_FALSE(map->IsValidPosition(5, 37, 0.0));  // under the balcony
    EXPECT_TRUE(map->IsValidPosition(5, 37, 3.0));
}

TEST(MapGeometryTest, CanMove) {
    auto map = makeRange();
    EXPECT_TRUE(map->CanMove({10, 10, 0}, {10, 12, 0}));
    EXPECT_FALSE(map->CanMove({17, 5, 0}, {23, 5, 0}));
    // No climbing onto the crate without a slope.
    EXPECT_FALSE(map->CanMove({28, 31, 0}, {31, 31, 1}));
    // Walking onto the ramp is allowed.
    EXPECT_TRUE(map->CanMove({7, 19.5, 0}, {7, 22, map->ElevationAt(7, 22)}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Raycast and line of sight
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapGeometryTest, RaycastHitsNearestFace) {
    auto map = makeRange();
    auto hit = map->Raycast({5, 5, 1}, {2, 0, 0}, 50.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->t, 14.0, 1e-9);
    EXPECT_NEAR(hit->point.x, 19.0, 1e-9);
    EXPECT_DOUBLE_EQ(hit->normal.x, -1.0);
    ASSERT_NE(hit->boundary, nullptr);
    EXPECT_EQ(hit->boundary->name, "Divider");
}

TEST(MapGeometryTest, RaycastRespectsRangeAndMisses) {
    auto map = makeRange();
    EXPECT_FALSE(map->Raycast({5, 5, 1}, {1, 0, 0}, 10.0).has_value());
    EXPECT_FALSE(map->Raycast({5, 20, 1}, {1, 0, 0}, 50.0).has_value());
    EXPECT_FALSE(map->Raycast({5, 5, 1}, {0, 0, 0}, 50.0).has_value());
}

TEST(MapGeometryTest, RaycastDownOntoObjectTop) {
    auto map = makeRange();
    auto hit = map->Raycast({31, 31, 5}, {0, 0, -1}, 10.0);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->t, 4.0, 1e-9);
    EXPECT_DOUBLE_EQ(hit->normal.z, 1.0);
    EXPECT_EQ(hit->boundary->name, "Crate");
}

TEST(MapGeometryTest, LineOfSightWallsObjectsAndSmokes) {
    auto map = makeRange();
    EXPECT_FALSE(map->LineOfSight({5, 5, 1}, {30, 5, 1}));
    EXPECT_TRUE(map->LineOfSight({5, 22, 1}, {30, 22, 1}));

    // Low crate blocks at knee height, not over its top.
    EXPECT_FALSE(map->LineOfSight({25, 31, 0.5}, {35, 31, 0.5}));
    EXPECT_TRUE(map->LineOfSight({25, 31, 1.5}, {35, 31, 1.5}));

    std::vector<SmokeVolume> smoke{{{15, 22, 1}, 2.0}};
    EXPECT_FALSE(map->LineOfSight({5, 22, 1}, {30, 22, 1}, smoke));
    std::vector<SmokeVolume> offPath{{{15, 26, 1}, 2.0}};
    EXPECT_TRUE(map->LineOfSight({5, 22, 1}, {30, 22, 1}, offPath));
}

// ═══════════════════════════════════════════════════════════════════════════
// Loader
// ═══════════════════════════════════════════════════════════════════════════

TEST(MapLoaderTest, LoadsRangeFile) {
    auto loaded = LoadMapFile(dataPath("maps/range.yaml"));
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    const auto& map = *loaded.value();

    EXPECT_EQ(map.Name(), "Range");
    EXPECT_DOUBLE_EQ(map.Width(), 40.0);
    EXPECT_EQ(map.Areas().size(), 2u);
    EXPECT_EQ(map.Walls().size(), 1u);
    EXPECT_DOUBLE_EQ(map.Walls()[0].heightZ, 10.0);
    EXPECT_EQ(map.Objects().size(), 1u);
    EXPECT_EQ(map.Ramps().size(), 1u);
    EXPECT_EQ(map.BombSites().size(), 1u);

    ASSERT_EQ(map.DefenderSpawns().size(), 2u);
    EXPECT_DOUBLE_EQ(map.DefenderSpawns()[1].z, 1.0);  // spawn on the crate
    EXPECT_EQ(map.Adjacency().at("Floor"), (std::vector<std::string>{"Balcony"}));
}

TEST(MapLoaderTest, MissingFile) {
    auto loaded = LoadMapFile(dataPath("maps/does_not_exist.yaml"));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::MapLoadFailed);
}

TEST(MapLoaderTest, MalformedDocuments) {
    auto parse = LoadMapFromString("map-areas: [unterminated");
    ASSERT_TRUE(parse.hasError());
    EXPECT_EQ(parse.error().code(), ErrorCode::MapLoadFailed);

    auto missingField = LoadMapFromString("map-areas:\n  Floor: {x: 0, y: 0, w: 10}\n");
    ASSERT_TRUE(missingField.hasError());
    EXPECT_EQ(missingField.error().code(), ErrorCode::MapLoadFailed);

    auto scalar = LoadMapFromString("just a string");
    ASSERT_TRUE(scalar.hasError());
    EXPECT_EQ(scalar.error().code(), ErrorCode::MapLoadFailed);
}

TEST(MapLoaderTest, InvalidContent) {
    auto badDirection = LoadMapFromString(R"(
map-areas:
  Floor: {x: 0, y: 0, w: 10, h: 10}
ramps:
  R: {x: 1, y: 1, w: 2, h: 4, z_start: 0, z_end: 1, direction: up}
)");
    ASSERT_TRUE(badDirection.hasError());
    EXPECT_EQ(badDirection.error().code(), ErrorCode::InvalidGeometry);

    auto badSize = LoadMapFromString("metadata:\n  map-size: [10]\n");
    ASSERT_TRUE(badSize.hasError());
    EXPECT_EQ(badSize.error().code(), ErrorCode::InvalidGeometry);

    auto negativeWall = LoadMapFromString(R"(
map-areas:
  Floor: {x: 0, y: 0, w: 10, h: 10}
walls:
  W: {x: 1, y: 1, w: -2, h: 4}
)");
    ASSERT_TRUE(negativeWall.hasError());
    EXPECT_EQ(negativeWall.error().code(), ErrorCode::InvalidGeometry);

    auto noAreas = LoadMapFromString("walls:\n  W: {x: 1, y: 1, w: 2, h: 4}\n");
    ASSERT_TRUE(noAreas.hasError());
    EXPECT_EQ(noAreas.error().code(), ErrorCode::NoWalkableArea);

    auto unknownArea = LoadMapFromString(R"(
map-areas:
  Floor: {x: 0, y: 0, w: 10, h: 10}
adjacency:
  Floor: [Attic]
)");
    ASSERT_TRUE(unknownArea.hasError());
    EXPECT_EQ(unknownArea.error().code(), ErrorCode::UnknownArea);
}

// ═══════════════════════════════════════════════════════════════════════════
// Path finding
// ═══════════════════════════════════════════════════════════════════════════

class PathingTest : public ::testing::Test {
protected:
    std::shared_ptr<MapGeometry> map_ = makeRange();
    NavigationGrid grid_ = NavigationGrid::Build(*map_);
};

TEST_F(PathingTest, GridSamplesMap) {
    EXPECT_EQ(grid_.Columns(), 40);
    EXPECT_EQ(grid_.Rows(), 40);
    EXPECT_TRUE(grid_.IsWalkable(grid_.CellAt(10, 10)));
    EXPECT_FALSE(grid_.IsWalkable(grid_.CellAt(20, 5)));
    EXPECT_FALSE(grid_.IsWalkable({-1, 3}));
    EXPECT_TRUE(grid_.IsSlope(grid_.CellAt(7, 25)));
    EXPECT_NEAR(grid_.ElevationOf(grid_.CellAt(7, 25)), 1.1, 1e-9);
    EXPECT_DOUBLE_EQ(grid_.ElevationOf(grid_.CellAt(5, 37)), 3.0);
}

TEST_F(PathingTest, PathRoutesAroundWall) {
    PathFinder finder(grid_);
    const Vector3 goal{30, 5, 0};
    auto path = finder.FindPath({10, 5, 0}, goal);

    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.back(), goal);
    bool passedAbove = false;
    for (const auto& p : path) {
        EXPECT_TRUE(map_->IsValidPosition(p.x, p.y, p.z)) << p.x << "," << p.y;
        if (p.x > 19.0 && p.x < 21.0) {
            EXPECT_GT(p.y, 15.0);
            passedAbove = true;
        }
    }
    EXPECT_TRUE(passedAbove);
}

TEST_F(PathingTest, UnreachableOrBlockedEnds) {
    PathFinder finder(grid_);
    // The balcony is too high to step onto from the floor.
    EXPECT_TRUE(finder.FindPath({15, 25, 0}, {5, 37, 3}).empty());
    // Start inside a wall.
    EXPECT_TRUE(finder.FindPath({20, 5, 0}, {10, 10, 0}).empty());
}

TEST_F(PathingTest, SameCellReturnsGoal) {
    PathFinder finder(grid_);
    auto path = finder.FindPath({10.2, 10.2, 0}, {10.7, 10.6, 0});
    ASSERT_EQ(path.size(), 1u);
    EXPECT_DOUBLE_EQ(path[0].x, 10.7);
}

TEST_F(PathingTest, IterationCapGivesUp) {
    PathFinderOptions options;
    options.maxIterations = 5;
    PathFinder finder(grid_, options);
    EXPECT_TRUE(finder.FindPath({2, 2, 0}, {38, 25, 0}).empty());
}

TEST(AreaGraphTest, BidirectionalRoutes) {
    auto loaded = LoadMapFromString(R"(
map-areas:
  Spawn: {x: 0, y: 0, w: 10, h: 10}
  Main: {x: 10, y: 0, w: 10, h: 10}
  Site: {x: 20, y: 0, w: 10, h: 10}
  Closet: {x: 0, y: 20, w: 5, h: 5}
adjacency:
  Spawn: [Main]
  Site: [Main]
)");
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    AreaGraph graph(*loaded.value());

    EXPECT_EQ(graph.Neighbors("Main").size(), 2u);
    EXPECT_EQ(graph.FindRoute("Spawn", "Site"),
              (std::vector<std::string>{"Spawn", "Main", "Site"}));
    EXPECT_EQ(graph.FindRoute("Site", "Site"), (std::vector<std::string>{"Site"}));
    EXPECT_TRUE(graph.FindRoute("Spawn", "Closet").empty());
    EXPECT_TRUE(graph.FindRoute("Spawn", "Attic").empty());
    EXPECT_TRUE(graph.Neighbors("Attic").empty());
}
