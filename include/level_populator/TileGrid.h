#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace level_populator {

constexpr char kWallTile = 'w';
constexpr char kFloorTile = 'r';

// Character grid of the level. x indexes the lines of the map file,
// y the characters within a line: width() is the line count.
class TileGrid {
public:
    TileGrid() = default;
    TileGrid(int width, int height, char fill = kWallTile);

    // Rows must all have the same length; throws std::runtime_error otherwise.
    static TileGrid fromRows(const std::vector<std::string>& rows);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return cells_.empty(); }

    bool inBounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    char at(int x, int y) const { return cells_[index(x, y)]; }
    void set(int x, int y, char symbol) { cells_[index(x, y)] = symbol; }

    bool isWall(int x, int y) const { return at(x, y) == kWallTile; }
    bool isFloor(int x, int y) const { return at(x, y) == kFloorTile; }
    bool isResource(int x, int y) const { return !isWall(x, y) && !isFloor(x, y); }

    // Reset every resource tile to floor. Returns the number of tiles cleared.
    int clearResources();

    size_t count(char symbol) const;
    size_t nonWallCount() const;

    // Rows joined by '\n', no trailing line break
    std::string toString() const;

    bool operator==(const TileGrid& other) const {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }

private:
    size_t index(int x, int y) const { return static_cast<size_t>(x) * height_ + y; }

    int width_ = 0;
    int height_ = 0;
    std::vector<char> cells_;
};

} // namespace level_populator
