#pragma once

#include "Room.h"
#include "TileGrid.h"
#include "WeightedGraph.h"
#include <glm/glm.hpp>
#include <variant>
#include <vector>

namespace level_populator {

// A room or corridor rectangle
struct AreaNode {
    size_t roomIndex;
    Room room;
};

// A placed gameplay object
struct ResourceNode {
    int x;
    int y;
    char symbol;
};

using RoomGraphNode = std::variant<AreaNode, ResourceNode>;

inline bool isArea(const RoomGraphNode& node) {
    return std::holds_alternative<AreaNode>(node);
}

inline bool isResource(const RoomGraphNode& node) {
    return std::holds_alternative<ResourceNode>(node);
}

// Room center for areas, tile position for resources
glm::dvec2 nodePosition(const RoomGraphNode& node);

/**
 * RoomGraph - area nodes (one per room/corridor) linked when their rectangles
 * touch or overlap, weighted by center distance. After construction the graph
 * only grows by resource nodes, each linked to every area containing its tile.
 */
class RoomGraph {
public:
    explicit RoomGraph(const std::vector<Room>& rooms);

    // Rooms plus one resource node per resource tile already on the grid
    static RoomGraph fromPopulatedGrid(const std::vector<Room>& rooms, const TileGrid& grid);

    // Returns the new node index
    size_t addResource(int x, int y, char symbol);

    const WeightedGraph& graph() const { return graph_; }
    const RoomGraphNode& node(size_t index) const { return nodes_[index]; }
    size_t nodeCount() const { return nodes_.size(); }
    size_t areaCount() const { return areaCount_; }
    size_t resourceCount() const { return nodes_.size() - areaCount_; }

    // Area nodes always occupy indices [0, areaCount())
    const Room& area(size_t index) const { return std::get<AreaNode>(nodes_[index]).room; }

private:
    WeightedGraph graph_;
    std::vector<RoomGraphNode> nodes_;
    size_t areaCount_ = 0;
};

} // namespace level_populator
