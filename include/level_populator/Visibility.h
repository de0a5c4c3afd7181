#pragma once

#include "TileGraphs.h"
#include "TileGrid.h"
#include <cstdint>
#include <vector>

namespace level_populator {

// Straight line of sight between two tiles. Axis-aligned segments test every
// tile strictly between the endpoints; sloped segments step along the longer
// axis and sample the other coordinate from the line equation, truncated
// toward zero. The endpoints are put in a fixed order first, so the test is
// symmetric. Samples outside the grid block the line.
bool isTileVisible(const TileGrid& grid, int x1, int y1, int x2, int y2);

struct VisibilityMatrix {
    int width = 0;
    int height = 0;
    std::vector<uint32_t> counts;  // Other non-wall tiles visible from each tile
    std::vector<double> values;    // Min-max normalized over non-wall tiles, walls are 0
    uint32_t minCount = 0;
    uint32_t maxCount = 0;

    double at(int x, int y) const { return values[static_cast<size_t>(x) * height + y]; }
    uint32_t countAt(int x, int y) const { return counts[static_cast<size_t>(x) * height + y]; }
};

// Throws ConfigurationError when every non-wall tile sees the same number of
// tiles (normalization would divide by zero) or there are no non-wall tiles.
VisibilityMatrix computeVisibilityMatrix(const TileGrid& grid);

// One node per non-wall tile carrying its normalized visibility, one edge per
// mutually visible pair
TileGraph buildVisibilityGraph(const TileGrid& grid, const VisibilityMatrix& matrix);

} // namespace level_populator
