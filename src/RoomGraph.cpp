#include "level_populator/RoomGraph.h"
#include <SDL3/SDL_log.h>

namespace level_populator {

glm::dvec2 nodePosition(const RoomGraphNode& node) {
    if (const AreaNode* area = std::get_if<AreaNode>(&node)) {
        return area->room.center();
    }
    const ResourceNode& resource = std::get<ResourceNode>(node);
    return glm::dvec2(resource.x, resource.y);
}

RoomGraph::RoomGraph(const std::vector<Room>& rooms) {
    for (size_t i = 0; i < rooms.size(); ++i) {
        graph_.addNode();
        nodes_.push_back(AreaNode{i, rooms[i]});
    }
    areaCount_ = rooms.size();

    for (size_t i = 0; i < rooms.size(); ++i) {
        for (size_t j = i + 1; j < rooms.size(); ++j) {
            if (rooms[i].isAdjacentTo(rooms[j])) {
                graph_.addEdge(i, j, glm::distance(rooms[i].center(), rooms[j].center()));
            }
        }
    }
}

RoomGraph RoomGraph::fromPopulatedGrid(const std::vector<Room>& rooms, const TileGrid& grid) {
    RoomGraph roomGraph(rooms);
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            if (grid.isResource(x, y)) {
                roomGraph.addResource(x, y, grid.at(x, y));
            }
        }
    }

    SDL_Log("Room graph: %zu areas, %zu resources, %zu edges",
            roomGraph.areaCount(), roomGraph.resourceCount(), roomGraph.graph().edgeCount());
    return roomGraph;
}

size_t RoomGraph::addResource(int x, int y, char symbol) {
    size_t index = graph_.addNode();
    nodes_.push_back(ResourceNode{x, y, symbol});

    const glm::dvec2 tile(x, y);
    for (size_t i = 0; i < areaCount_; ++i) {
        const Room& room = area(i);
        if (room.containsTile(x, y)) {
            graph_.addEdge(i, index, glm::distance(room.center(), tile));
        }
    }
    return index;
}

} // namespace level_populator
