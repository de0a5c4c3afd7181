#include "level_populator/LevelExport.h"
#include "level_populator/TileGraphs.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace level_populator {

// Floor tile color on the low-to-high visibility ramp
static std::string visibilityColor(const SVGOptions& options, double visibility) {
    glm::vec3 c = glm::mix(options.lowVisibilityColor, options.highVisibilityColor, static_cast<float>(visibility));
    glm::ivec3 rgb = glm::ivec3(glm::clamp(c, 0.0f, 1.0f) * 255.0f + 0.5f);

    std::ostringstream ss;
    ss << "rgb(" << rgb.r << "," << rgb.g << "," << rgb.b << ")";
    return ss.str();
}

void writeLevelSVG(const std::string& filename, const LevelContext& level, const SVGOptions& options) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    // Map lines run down the page: tile (x, y) is drawn at column y, row x
    const float tile = options.tileSize;
    const float padding = options.padding;
    const float width = level.grid.height() * tile + padding * 2;
    const float height = level.grid.width() * tile + padding * 2;

    auto px = [&](double y) { return padding + static_cast<float>(y) * tile; };
    auto py = [&](double x) { return padding + static_cast<float>(x) * tile; };

    file << std::fixed << std::setprecision(2);
    file << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    file << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
         << "width=\"" << width << "\" height=\"" << height << "\" "
         << "viewBox=\"0 0 " << width << " " << height << "\">\n";
    file << "  <!-- Generated by level_populator -->\n\n";

    file << "  <rect width=\"100%\" height=\"100%\" fill=\"" << options.backgroundColor << "\"/>\n\n";

    file << "  <g id=\"tiles\">\n";
    for (int x = 0; x < level.grid.width(); ++x) {
        for (int y = 0; y < level.grid.height(); ++y) {
            std::string fill;
            if (level.grid.isWall(x, y)) {
                fill = options.wallColor;
            } else if (options.showVisibility) {
                fill = visibilityColor(options, level.visibility.at(x, y));
            } else {
                continue;
            }
            file << "    <rect x=\"" << px(y) << "\" y=\"" << py(x) << "\" width=\"" << tile
                 << "\" height=\"" << tile << "\" fill=\"" << fill << "\"/>\n";
        }
    }
    file << "  </g>\n\n";

    if (options.showRooms) {
        file << "  <g id=\"rooms\" fill=\"none\" stroke-width=\"1\">\n";
        for (const Room& room : level.rooms) {
            file << "    <rect x=\"" << px(room.originY) << "\" y=\"" << py(room.originX)
                 << "\" width=\"" << room.sizeY() * tile << "\" height=\"" << room.sizeX() * tile
                 << "\" stroke=\"" << (room.isCorridor ? options.corridorOutlineColor : options.roomOutlineColor)
                 << "\"" << (room.isCorridor ? " stroke-dasharray=\"4,2\"" : "") << "/>\n";
        }
        file << "  </g>\n\n";
    }

    // Node positions are tile coordinates; shift to tile centers
    const RoomGraph& roomGraph = level.graph;
    if (options.showRoomGraph) {
        file << "  <g id=\"room-graph\" stroke=\"" << options.edgeColor << "\" stroke-width=\"1.5\">\n";
        for (const auto& [endpoints, weight] : roomGraph.graph().edges()) {
            glm::dvec2 a = nodePosition(roomGraph.node(endpoints.first)) + 0.5;
            glm::dvec2 b = nodePosition(roomGraph.node(endpoints.second)) + 0.5;
            file << "    <line x1=\"" << px(a.y) << "\" y1=\"" << py(a.x) << "\" x2=\"" << px(b.y)
                 << "\" y2=\"" << py(b.x) << "\"/>\n";
        }
        for (size_t i = 0; i < roomGraph.areaCount(); ++i) {
            glm::dvec2 c = nodePosition(roomGraph.node(i)) + 0.5;
            file << "    <rect x=\"" << px(c.y) - 3.0f << "\" y=\"" << py(c.x) - 3.0f
                 << "\" width=\"6\" height=\"6\" fill=\"" << options.edgeColor << "\"/>\n";
        }
        file << "  </g>\n\n";
    }

    if (options.showResources) {
        file << "  <g id=\"resources\" font-family=\"monospace\" font-size=\"" << tile * 0.8f
             << "\" text-anchor=\"middle\">\n";
        for (const PlacedObject& object : level.placed) {
            float cx = px(object.y + 0.5);
            float cy = py(object.x + 0.5);
            file << "    <circle cx=\"" << cx << "\" cy=\"" << cy << "\" r=\"" << tile * 0.45f
                 << "\" fill=\"" << options.resourceColor << "\"/>\n";
            file << "    <text x=\"" << cx << "\" y=\"" << cy + tile * 0.3f << "\" fill=\"#ffffff\">"
                 << object.symbol << "</text>\n";
        }
        file << "  </g>\n";
    }

    file << "</svg>\n";
    SDL_Log("Wrote SVG %s", filename.c_str());
}

static nlohmann::json tileGraphToJson(const TileGraph& graph, bool withVisibility) {
    nlohmann::json gj;
    gj["nodes"] = nlohmann::json::array();
    for (const TileNode& node : graph.nodes) {
        nlohmann::json nj = {{"x", node.x}, {"y", node.y}, {"symbol", std::string(1, node.symbol)}};
        if (withVisibility) {
            nj["visibility"] = node.visibility;
        }
        gj["nodes"].push_back(nj);
    }
    gj["edges"] = nlohmann::json::array();
    for (const auto& [a, b] : graph.edges) {
        gj["edges"].push_back({a, b});
    }
    return gj;
}

void writeGraphsJson(const std::string& filename, const LevelContext& level) {
    nlohmann::json j;

    nlohmann::json rooms;
    rooms["nodes"] = nlohmann::json::array();
    for (size_t i = 0; i < level.graph.nodeCount(); ++i) {
        const RoomGraphNode& node = level.graph.node(i);
        if (const AreaNode* area = std::get_if<AreaNode>(&node)) {
            rooms["nodes"].push_back({
                {"id", i},
                {"originX", area->room.originX}, {"originY", area->room.originY},
                {"endX", area->room.endX}, {"endY", area->room.endY},
                {"isCorridor", area->room.isCorridor}
            });
        } else {
            const ResourceNode& resource = std::get<ResourceNode>(node);
            rooms["nodes"].push_back({
                {"id", i}, {"x", resource.x}, {"y", resource.y},
                {"resource", std::string(1, resource.symbol)}
            });
        }
    }
    rooms["edges"] = nlohmann::json::array();
    for (const auto& [endpoints, weight] : level.graph.graph().edges()) {
        rooms["edges"].push_back({{"a", endpoints.first}, {"b", endpoints.second}, {"weight", weight}});
    }
    j["roomGraph"] = rooms;

    j["reachabilityGraph"] = tileGraphToJson(buildReachabilityGraph(level.grid), false);
    j["visibilityGraph"] = tileGraphToJson(buildVisibilityGraph(level.grid, level.visibility), true);

    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file << j.dump(2);
    SDL_Log("Wrote graphs %s", filename.c_str());
}

} // namespace level_populator
