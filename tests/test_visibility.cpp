// Tests for line of sight and the visibility matrix

#include <doctest/doctest.h>
#include "TestLevels.h"
#include "level_populator/Errors.h"
#include "level_populator/Visibility.h"

using namespace level_populator;

// ============================================================================
// isTileVisible Tests
// ============================================================================

TEST_SUITE("isTileVisible") {
    TEST_CASE("wall between axis-aligned tiles blocks sight") {
        auto grid = TileGrid::fromRows({"r", "w", "r"});
        CHECK_FALSE(isTileVisible(grid, 0, 0, 2, 0));

        auto row = TileGrid::fromRows({"rwr"});
        CHECK_FALSE(isTileVisible(row, 0, 0, 0, 2));
    }

    TEST_CASE("neighbours always see each other") {
        auto grid = TileGrid::fromRows({"rw", "wr"});
        CHECK(isTileVisible(grid, 0, 0, 0, 1));
        CHECK(isTileVisible(grid, 0, 0, 1, 0));
    }

    TEST_CASE("sloped lines sample the grid") {
        auto grid = TileGrid::fromRows({"rrr", "rwr", "rrr"});
        CHECK_FALSE(isTileVisible(grid, 0, 0, 2, 2));
        CHECK(isTileVisible(grid, 0, 0, 2, 1));
        CHECK(isTileVisible(grid, 0, 0, 1, 2));
    }

    TEST_CASE("visibility is symmetric") {
        auto grid = test_levels::ringGrid();
        for (int x1 = 0; x1 < grid.width(); ++x1) {
            for (int y1 = 0; y1 < grid.height(); ++y1) {
                if (grid.isWall(x1, y1)) continue;
                for (int x2 = 0; x2 < grid.width(); ++x2) {
                    for (int y2 = 0; y2 < grid.height(); ++y2) {
                        if (grid.isWall(x2, y2)) continue;
                        if (isTileVisible(grid, x1, y1, x2, y2) != isTileVisible(grid, x2, y2, x1, y1)) {
                            FAIL("asymmetric pair [" << x1 << "," << y1 << "] [" << x2 << "," << y2 << "]");
                        }
                    }
                }
            }
        }
    }
}

// ============================================================================
// computeVisibilityMatrix Tests
// ============================================================================

TEST_SUITE("VisibilityMatrix") {
    TEST_CASE("counts and min-max normalization") {
        auto grid = TileGrid::fromRows({"rrrrrr", "wwwwww", "rrrwww"});
        auto matrix = computeVisibilityMatrix(grid);

        CHECK(matrix.minCount == 2);
        CHECK(matrix.maxCount == 5);
        CHECK(matrix.countAt(0, 0) == 5);
        CHECK(matrix.countAt(2, 1) == 2);
        CHECK(matrix.at(0, 3) == doctest::Approx(1.0));
        CHECK(matrix.at(2, 2) == doctest::Approx(0.0));
        CHECK(matrix.at(1, 1) == 0.0);  // wall
    }

    TEST_CASE("values stay in [0, 1] and reach both ends") {
        auto grid = test_levels::ringGrid();
        auto matrix = computeVisibilityMatrix(grid);

        bool sawZero = false;
        bool sawOne = false;
        for (int x = 0; x < grid.width(); ++x) {
            for (int y = 0; y < grid.height(); ++y) {
                if (grid.isWall(x, y)) continue;
                double v = matrix.at(x, y);
                CHECK(v >= 0.0);
                CHECK(v <= 1.0);
                sawZero = sawZero || v == 0.0;
                sawOne = sawOne || v == 1.0;
            }
        }
        CHECK(sawZero);
        CHECK(sawOne);
    }

    TEST_CASE("normalization keeps full double precision") {
        auto grid = test_levels::ringGrid();
        auto matrix = computeVisibilityMatrix(grid);
        const double range = static_cast<double>(matrix.maxCount - matrix.minCount);

        for (int x = 0; x < grid.width(); ++x) {
            for (int y = 0; y < grid.height(); ++y) {
                if (grid.isWall(x, y)) continue;
                CHECK(matrix.at(x, y) == static_cast<double>(matrix.countAt(x, y) - matrix.minCount) / range);
            }
        }
    }

    TEST_CASE("open room has a degenerate visibility range") {
        CHECK_THROWS_AS(computeVisibilityMatrix(TileGrid(3, 3, kFloorTile)), ConfigurationError);
    }

    TEST_CASE("map without walkable tiles is rejected") {
        CHECK_THROWS_AS(computeVisibilityMatrix(TileGrid(3, 3, kWallTile)), ConfigurationError);
    }

    TEST_CASE("visibility graph links mutually visible tiles") {
        auto grid = TileGrid::fromRows({"rrrrrr", "wwwwww", "rrrwww"});
        auto matrix = computeVisibilityMatrix(grid);
        auto graph = buildVisibilityGraph(grid, matrix);

        // Two cliques: 6 tiles in row 0, 3 in row 2
        CHECK(graph.nodes.size() == 9);
        CHECK(graph.edges.size() == 15 + 3);
        CHECK(graph.nodes[graph.indexOf(0, 0)].visibility == doctest::Approx(1.0));
    }
}
