#pragma once

#include "Room.h"
#include "TileGrid.h"
#include <cstddef>
#include <utility>
#include <vector>

namespace level_populator {

struct TileNode {
    int x;
    int y;
    char symbol;
    double visibility = 0.0;  // Normalized; only filled for visibility graphs
};

// Unweighted graph over non-wall tiles
struct TileGraph {
    int width = 0;
    int height = 0;
    std::vector<TileNode> nodes;
    std::vector<std::pair<size_t, size_t>> edges;
    std::vector<long> tileToNode;  // width * height, -1 for walls

    // Node index for a tile, or -1 for walls / out of range
    long indexOf(int x, int y) const {
        if (x < 0 || x >= width || y < 0 || y >= height) return -1;
        return tileToNode[static_cast<size_t>(x) * height + y];
    }
};

// Nodes for every non-wall tile, no edges
TileGraph tileNodes(const TileGrid& grid);

// King-move adjacency between non-wall tiles
TileGraph buildReachabilityGraph(const TileGrid& grid);

// Corner nodes of every room joined in a closed loop
struct OutlineGraph {
    struct Corner {
        int x;
        int y;
    };
    std::vector<Corner> corners;
    std::vector<std::pair<size_t, size_t>> edges;
};

OutlineGraph buildOutlineGraph(const std::vector<Room>& rooms);

} // namespace level_populator
