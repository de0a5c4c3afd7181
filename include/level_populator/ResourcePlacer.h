#pragma once

#include "PlacementConfig.h"
#include "Room.h"
#include "RoomGraph.h"
#include "TileGrid.h"
#include "Visibility.h"
#include <cstddef>
#include <utility>
#include <vector>

namespace level_populator {

struct PlacedObject {
    int x;
    int y;
    char symbol;

    bool operator==(const PlacedObject& other) const {
        return x == other.x && y == other.y && symbol == other.symbol;
    }
};

/**
 * LevelContext - everything a placement run reads and mutates.
 * Construction clears pre-existing resources from the grid, then builds the
 * room graph and the visibility matrix from the cleared grid.
 */
struct LevelContext {
    LevelContext(TileGrid tiles, std::vector<Room> reducedRooms);

    TileGrid grid;
    std::vector<Room> rooms;
    RoomGraph graph;
    VisibilityMatrix visibility;
    std::vector<PlacedObject> placed;
    int clearedResources = 0;

    double mapDiagonal() const;
};

struct Placement {
    ResourceKind kind;
    size_t roomNode;
    int x;
    int y;
    double roomScore;
    double tileScore;
};

/**
 * ResourcePlacer - greedy placement of spawn points, medkits and ammo.
 * For every unit it picks the best scoring room, then the best tile in it,
 * and commits the resource to the grid, the room graph and the placed list.
 */
class ResourcePlacer {
public:
    explicit ResourcePlacer(PlacementConfig config);

    // Throws ConfigurationError when a unit has no candidate room or tile.
    // Placements committed before the failure stay in the context.
    std::vector<Placement> populate(LevelContext& level);

    // Free floor tiles of a room for the recipe's scan range, row-major
    static std::vector<std::pair<int, int>> candidateTiles(const LevelContext& level, const Room& room,
                                                           const ResourceRecipe& recipe);

    double roomFitness(const LevelContext& level, size_t node, const ResourceRecipe& recipe,
                       double degreeFit, double diameter) const;

    static double tileFitness(const ResourceRecipe& recipe, int x, int y, const Room& room, double visibility,
                              const std::vector<PlacedObject>& placed, double mapDiagonal);

    const PlacementConfig& config() const { return config_; }

private:
    Placement placeUnit(LevelContext& level, ResourceKind kind, const std::vector<double>& degreeFit,
                        double diameter, uint32_t unitIndex);
    void commit(LevelContext& level, int x, int y, char symbol);

    PlacementConfig config_;
};

} // namespace level_populator
