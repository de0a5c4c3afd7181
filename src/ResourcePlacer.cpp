#include "level_populator/ResourcePlacer.h"
#include "level_populator/Errors.h"
#include "level_populator/GraphMetrics.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace level_populator {

LevelContext::LevelContext(TileGrid tiles, std::vector<Room> reducedRooms)
    : grid(std::move(tiles))
    , rooms(std::move(reducedRooms))
    , graph(rooms) {
    clearedResources = grid.clearResources();
    if (clearedResources > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Removed %d pre-existing objects", clearedResources);
    }
    visibility = computeVisibilityMatrix(grid);
}

double LevelContext::mapDiagonal() const {
    return std::sqrt(static_cast<double>(grid.width()) * grid.width() +
                     static_cast<double>(grid.height()) * grid.height());
}

ResourcePlacer::ResourcePlacer(PlacementConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

std::vector<std::pair<int, int>> ResourcePlacer::candidateTiles(const LevelContext& level, const Room& room,
                                                                const ResourceRecipe& recipe) {
    const int lastX = recipe.includeFarEdge ? room.endX : room.endX - 1;
    const int lastY = recipe.includeFarEdge ? room.endY : room.endY - 1;

    std::vector<std::pair<int, int>> tiles;
    for (int x = room.originX; x <= lastX; ++x) {
        for (int y = room.originY; y <= lastY; ++y) {
            if (level.grid.inBounds(x, y) && level.grid.isFloor(x, y)) {
                tiles.push_back({x, y});
            }
        }
    }
    return tiles;
}

double ResourcePlacer::roomFitness(const LevelContext& level, size_t node, const ResourceRecipe& recipe,
                                   double degreeFit, double diameter) const {
    const RoomGraph& roomGraph = level.graph;

    std::set<char> proximitySymbols;
    for (ResourceKind kind : recipe.proximityKinds) {
        proximitySymbols.insert(config_.recipe(kind).symbol);
    }

    // Distance to the nearest resource of the proximity kinds. An unreachable
    // resource counts as distance 0.
    double nearest = std::numeric_limits<double>::infinity();
    std::vector<double> distances;
    for (size_t i = roomGraph.areaCount(); i < roomGraph.nodeCount(); ++i) {
        const ResourceNode& resource = std::get<ResourceNode>(roomGraph.node(i));
        if (proximitySymbols.count(resource.symbol) == 0) continue;

        if (distances.empty()) {
            distances = roomGraph.graph().shortestPaths(node);
        }
        double d = std::isfinite(distances[i]) ? distances[i] : 0.0;
        nearest = std::min(nearest, d);
    }

    double proximity = 0.0;
    if (std::isfinite(nearest) && diameter > 0.0) {
        proximity = nearest / diameter;
    }

    // Penalize rooms already holding this resource
    double redundancy = 0.0;
    if (recipe.count > 0) {
        for (const WeightedGraph::Link& link : roomGraph.graph().neighbors(node)) {
            const RoomGraphNode& neighbor = roomGraph.node(link.node);
            if (isResource(neighbor) && std::get<ResourceNode>(neighbor).symbol == recipe.symbol) {
                redundancy += 1.0 / recipe.count;
            }
        }
    }

    return degreeFit + proximity * recipe.proximityWeight - redundancy;
}

double ResourcePlacer::tileFitness(const ResourceRecipe& recipe, int x, int y, const Room& room, double visibility,
                                   const std::vector<PlacedObject>& placed, double mapDiagonal) {
    double objectDistance = 0.0;
    if (!placed.empty() && mapDiagonal > 0.0) {
        double nearest = std::numeric_limits<double>::infinity();
        for (const PlacedObject& object : placed) {
            nearest = std::min(nearest, std::hypot(static_cast<double>(x - object.x),
                                                   static_cast<double>(y - object.y)));
        }
        objectDistance = nearest / mapDiagonal;
    }

    const int wallDistance = std::min(std::abs(room.originX - x), std::abs(room.endX - x)) +
                             std::min(std::abs(room.originY - y), std::abs(room.endY - y));
    const double halfExtent = (room.endX - room.originX) / 2.0 + (room.endY - room.originY) / 2.0;
    const double wallTerm = halfExtent > 0.0 ? wallDistance / halfExtent * recipe.wallWeight : 0.0;

    double visibilityTerm = 0.0;
    switch (recipe.visibility) {
        case VisibilityPreference::Low:  visibilityTerm = 1.0 - visibility; break;
        case VisibilityPreference::Mid:  visibilityTerm = 1.0 - std::abs(0.5 - visibility) * 2.0; break;
        case VisibilityPreference::High: visibilityTerm = visibility; break;
    }

    return visibilityTerm + wallTerm + objectDistance * recipe.objectWeight;
}

void ResourcePlacer::commit(LevelContext& level, int x, int y, char symbol) {
    level.grid.set(x, y, symbol);
    level.graph.addResource(x, y, symbol);
    level.placed.push_back(PlacedObject{x, y, symbol});
}

Placement ResourcePlacer::placeUnit(LevelContext& level, ResourceKind kind, const std::vector<double>& degreeFit,
                                    double diameter, uint32_t unitIndex) {
    const ResourceRecipe& recipe = config_.recipe(kind);

    // Room selection, first best wins
    long bestRoom = -1;
    double bestRoomScore = -std::numeric_limits<double>::infinity();
    std::vector<std::pair<int, int>> bestTiles;

    for (size_t node = 0; node < level.graph.areaCount(); ++node) {
        std::vector<std::pair<int, int>> tiles = candidateTiles(level, level.graph.area(node), recipe);
        if (tiles.empty()) continue;

        double score = roomFitness(level, node, recipe, degreeFit[node], diameter);
        if (score > bestRoomScore) {
            bestRoomScore = score;
            bestRoom = static_cast<long>(node);
            bestTiles = std::move(tiles);
        }
    }

    if (bestRoom < 0) {
        throw ConfigurationError(std::string("No room can take ") + getResourceKindName(kind) + " #" +
                                 std::to_string(unitIndex) + " ('" + recipe.symbol +
                                 "'): every room is saturated");
    }

    // Tile selection, first best wins
    const Room& room = level.graph.area(static_cast<size_t>(bestRoom));
    const double diagonal = level.mapDiagonal();
    std::pair<int, int> bestTile = bestTiles.front();
    double bestTileScore = -std::numeric_limits<double>::infinity();

    for (const auto& [x, y] : bestTiles) {
        double score = tileFitness(recipe, x, y, room, level.visibility.at(x, y), level.placed, diagonal);
        if (score > bestTileScore) {
            bestTileScore = score;
            bestTile = {x, y};
        }
    }

    commit(level, bestTile.first, bestTile.second, recipe.symbol);

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Placed %s #%u in %s at [%d, %d] (room %.3f, tile %.3f)",
                 getResourceKindName(kind), unitIndex, room.describe().c_str(),
                 bestTile.first, bestTile.second, bestRoomScore, bestTileScore);

    return Placement{kind, static_cast<size_t>(bestRoom), bestTile.first, bestTile.second,
                     bestRoomScore, bestTileScore};
}

std::vector<Placement> ResourcePlacer::populate(LevelContext& level) {
    if (level.graph.areaCount() == 0) {
        throw ConfigurationError("The level has no rooms to place resources in");
    }

    // Free floor tiles covered by at least one room
    std::set<std::pair<int, int>> freeTiles;
    for (size_t node = 0; node < level.graph.areaCount(); ++node) {
        const Room& room = level.graph.area(node);
        for (int x = room.originX; x <= room.endX; ++x) {
            for (int y = room.originY; y <= room.endY; ++y) {
                if (level.grid.inBounds(x, y) && level.grid.isFloor(x, y)) {
                    freeTiles.insert({x, y});
                }
            }
        }
    }
    if (config_.totalCount() > freeTiles.size()) {
        throw ConfigurationError("Requested " + std::to_string(config_.totalCount()) + " resources but the rooms hold only " +
                                 std::to_string(freeTiles.size()) + " free tiles");
    }

    const double diameter = weightedDiameter(level.graph.graph());
    const std::vector<double> degree = normalizedDegree(level.graph.graph());
    SDL_Log("Room graph: %zu nodes, %zu edges, diameter %.2f",
            level.graph.nodeCount(), level.graph.graph().edgeCount(), diameter);

    std::vector<Placement> placements;
    placements.reserve(config_.totalCount());

    for (size_t k = 0; k < static_cast<size_t>(ResourceKind::Count); ++k) {
        const ResourceKind kind = static_cast<ResourceKind>(k);
        const ResourceRecipe& recipe = config_.recipe(kind);
        SDL_Log("Placing %u %s ('%c')", recipe.count, getResourceKindName(kind), recipe.symbol);

        const size_t intervals = recipe.degreeIntervals.size();
        uint32_t unitIndex = 0;
        for (size_t i = 0; i < intervals; ++i) {
            const DegreeInterval& interval = recipe.degreeIntervals[i];
            const std::vector<double> fit = intervalFit(degree, interval.lo, interval.hi);

            const uint32_t share = static_cast<uint32_t>(recipe.count * (i + 1) / intervals -
                                                         recipe.count * i / intervals);
            for (uint32_t u = 0; u < share; ++u) {
                placements.push_back(placeUnit(level, kind, fit, diameter, unitIndex++));
            }
        }
    }

    SDL_Log("Placed %zu resources", placements.size());
    return placements;
}

} // namespace level_populator
