#include "level_populator/TileGraphs.h"
#include <SDL3/SDL_log.h>

namespace level_populator {

// Forward half of the king-move neighbourhood, so every pair is visited once
static const int dxForward[4] = {1, 1, 0, -1};
static const int dyForward[4] = {0, 1, 1,  1};

TileGraph tileNodes(const TileGrid& grid) {
    TileGraph graph;
    graph.width = grid.width();
    graph.height = grid.height();
    graph.tileToNode.assign(static_cast<size_t>(grid.width()) * grid.height(), -1);

    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            if (grid.isWall(x, y)) continue;
            graph.tileToNode[static_cast<size_t>(x) * grid.height() + y] = static_cast<long>(graph.nodes.size());
            graph.nodes.push_back(TileNode{x, y, grid.at(x, y)});
        }
    }
    return graph;
}

TileGraph buildReachabilityGraph(const TileGrid& grid) {
    TileGraph graph = tileNodes(grid);

    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        const TileNode& node = graph.nodes[i];
        for (int dir = 0; dir < 4; ++dir) {
            long neighbor = graph.indexOf(node.x + dxForward[dir], node.y + dyForward[dir]);
            if (neighbor >= 0) {
                graph.edges.push_back({i, static_cast<size_t>(neighbor)});
            }
        }
    }

    SDL_Log("Reachability graph: %zu nodes, %zu edges", graph.nodes.size(), graph.edges.size());
    return graph;
}

OutlineGraph buildOutlineGraph(const std::vector<Room>& rooms) {
    OutlineGraph graph;
    graph.corners.reserve(rooms.size() * 4);
    graph.edges.reserve(rooms.size() * 4);

    for (const Room& room : rooms) {
        size_t first = graph.corners.size();
        graph.corners.push_back({room.originX, room.originY});
        graph.corners.push_back({room.endX, room.originY});
        graph.corners.push_back({room.endX, room.endY});
        graph.corners.push_back({room.originX, room.endY});

        graph.edges.push_back({first, first + 1});
        graph.edges.push_back({first + 1, first + 2});
        graph.edges.push_back({first + 2, first + 3});
        graph.edges.push_back({first + 3, first});
    }
    return graph;
}

} // namespace level_populator
