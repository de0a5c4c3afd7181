#pragma once

#include "ResourcePlacer.h"
#include <glm/glm.hpp>
#include <string>

namespace level_populator {

struct SVGOptions {
    float tileSize = 12.0f;
    float padding = 10.0f;

    const char* backgroundColor = "#1e1e1e";
    const char* wallColor = "#3a3a3a";
    glm::vec3 lowVisibilityColor{0.0f, 0.0f, 1.0f};
    glm::vec3 highVisibilityColor{1.0f, 0.0f, 0.0f};
    const char* roomOutlineColor = "#f0f0f0";
    const char* corridorOutlineColor = "#a0a0a0";
    const char* edgeColor = "#f44242";
    const char* resourceColor = "#0079a2";

    bool showVisibility = true;
    bool showRooms = true;
    bool showRoomGraph = true;
    bool showResources = true;
};

// Tile grid shaded by visibility, room rectangles, room graph and resources
void writeLevelSVG(const std::string& filename, const LevelContext& level,
                   const SVGOptions& options = SVGOptions{});

// Room graph (with resources), reachability graph and visibility graph as JSON
void writeGraphsJson(const std::string& filename, const LevelContext& level);

} // namespace level_populator
