#include "level_populator/TileGrid.h"
#include <algorithm>
#include <stdexcept>

namespace level_populator {

TileGrid::TileGrid(int width, int height, char fill)
    : width_(width)
    , height_(height)
    , cells_(static_cast<size_t>(width) * height, fill) {}

TileGrid TileGrid::fromRows(const std::vector<std::string>& rows) {
    if (rows.empty()) {
        return TileGrid();
    }

    const size_t rowLength = rows[0].size();
    TileGrid grid(static_cast<int>(rows.size()), static_cast<int>(rowLength));

    for (size_t x = 0; x < rows.size(); ++x) {
        if (rows[x].size() != rowLength) {
            throw std::runtime_error("Map row " + std::to_string(x) + " has length " +
                                     std::to_string(rows[x].size()) + ", expected " +
                                     std::to_string(rowLength));
        }
        for (size_t y = 0; y < rowLength; ++y) {
            grid.set(static_cast<int>(x), static_cast<int>(y), rows[x][y]);
        }
    }
    return grid;
}

int TileGrid::clearResources() {
    int cleared = 0;
    for (char& c : cells_) {
        if (c != kWallTile && c != kFloorTile) {
            c = kFloorTile;
            ++cleared;
        }
    }
    return cleared;
}

size_t TileGrid::count(char symbol) const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), symbol));
}

size_t TileGrid::nonWallCount() const {
    return cells_.size() - count(kWallTile);
}

std::string TileGrid::toString() const {
    std::string out;
    out.reserve(cells_.size() + width_);
    for (int x = 0; x < width_; ++x) {
        out.append(cells_.begin() + static_cast<size_t>(x) * height_,
                   cells_.begin() + static_cast<size_t>(x + 1) * height_);
        if (x < width_ - 1) {
            out += '\n';
        }
    }
    return out;
}

} // namespace level_populator
