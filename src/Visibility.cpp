#include "level_populator/Visibility.h"
#include "level_populator/Errors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cstdlib>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace level_populator {

static bool blocksSight(const TileGrid& grid, int x, int y) {
    return !grid.inBounds(x, y) || grid.isWall(x, y);
}

bool isTileVisible(const TileGrid& grid, int x1, int y1, int x2, int y2) {
    if (x1 > x2 || (x1 == x2 && y1 > y2)) {
        std::swap(x1, x2);
        std::swap(y1, y2);
    }

    const int dx = x2 - x1;
    const int dy = y2 - y1;

    if (dx == 0) {
        for (int y = std::min(y1, y2) + 1; y < std::max(y1, y2); ++y) {
            if (blocksSight(grid, x1, y)) return false;
        }
        return true;
    }

    if (dy == 0) {
        for (int x = std::min(x1, x2) + 1; x < std::max(x1, x2); ++x) {
            if (blocksSight(grid, x, y1)) return false;
        }
        return true;
    }

    // Coarse sampling along the longer axis, other coordinate truncated toward zero
    const double m = static_cast<double>(dy) / dx;
    const double c = y1 - m * x1;

    if (std::abs(dx) > std::abs(dy)) {
        for (int x = std::min(x1, x2); x < std::max(x1, x2); ++x) {
            int y = static_cast<int>(c + m * x);
            if (blocksSight(grid, x, y)) return false;
        }
    } else {
        for (int y = std::min(y1, y2); y < std::max(y1, y2); ++y) {
            int x = static_cast<int>(y / m - c / m);
            if (blocksSight(grid, x, y)) return false;
        }
    }
    return true;
}

VisibilityMatrix computeVisibilityMatrix(const TileGrid& grid) {
    VisibilityMatrix matrix;
    matrix.width = grid.width();
    matrix.height = grid.height();
    matrix.counts.assign(static_cast<size_t>(grid.width()) * grid.height(), 0);
    matrix.values.assign(matrix.counts.size(), 0.0);

    std::vector<std::pair<int, int>> tiles;
    for (int x = 0; x < grid.width(); ++x) {
        for (int y = 0; y < grid.height(); ++y) {
            if (!grid.isWall(x, y)) tiles.push_back({x, y});
        }
    }

    if (tiles.empty()) {
        throw ConfigurationError("Visibility: the map has no walkable tiles");
    }

    // Each tile's count is independent, results land in fixed slots
    const int tileCount = static_cast<int>(tiles.size());
    std::vector<uint32_t> visible(tiles.size(), 0);

    #pragma omp parallel for schedule(dynamic, 16)
    for (int i = 0; i < tileCount; ++i) {
        uint32_t count = 0;
        for (int j = 0; j < tileCount; ++j) {
            if (i == j) continue;
            if (isTileVisible(grid, tiles[i].first, tiles[i].second, tiles[j].first, tiles[j].second)) {
                ++count;
            }
        }
        visible[i] = count;
    }

    matrix.minCount = *std::min_element(visible.begin(), visible.end());
    matrix.maxCount = *std::max_element(visible.begin(), visible.end());

    if (matrix.maxCount == matrix.minCount) {
        throw ConfigurationError("Visibility: every walkable tile sees " + std::to_string(matrix.maxCount) +
                                 " tiles, the visibility range is degenerate");
    }

    const double range = static_cast<double>(matrix.maxCount - matrix.minCount);
    for (size_t i = 0; i < tiles.size(); ++i) {
        size_t cell = static_cast<size_t>(tiles[i].first) * grid.height() + tiles[i].second;
        matrix.counts[cell] = visible[i];
        matrix.values[cell] = static_cast<double>(visible[i] - matrix.minCount) / range;
    }

    SDL_Log("Visibility: %zu tiles, %u-%u visible tiles per tile", tiles.size(), matrix.minCount, matrix.maxCount);
    return matrix;
}

TileGraph buildVisibilityGraph(const TileGrid& grid, const VisibilityMatrix& matrix) {
    TileGraph graph = tileNodes(grid);

    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        TileNode& node = graph.nodes[i];
        node.visibility = matrix.at(node.x, node.y);
        for (size_t j = i + 1; j < graph.nodes.size(); ++j) {
            const TileNode& other = graph.nodes[j];
            if (isTileVisible(grid, node.x, node.y, other.x, other.y)) {
                graph.edges.push_back({i, j});
            }
        }
    }

    SDL_Log("Visibility graph: %zu nodes, %zu edges", graph.nodes.size(), graph.edges.size());
    return graph;
}

} // namespace level_populator
