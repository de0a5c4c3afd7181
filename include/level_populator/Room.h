#pragma once

#include <glm/glm.hpp>
#include <string>

namespace level_populator {

// Axis-aligned rectangle of tiles, bounds inclusive.
// Corridors share the shape; their minor dimension is 3 tiles.
struct Room {
    int originX = 0;
    int originY = 0;
    int endX = 0;
    int endY = 0;
    bool isCorridor = false;

    int sizeX() const { return endX - originX + 1; }
    int sizeY() const { return endY - originY + 1; }

    bool isValid() const { return originX <= endX && originY <= endY; }

    glm::dvec2 center() const {
        return glm::dvec2(originX / 2.0 + endX / 2.0, originY / 2.0 + endY / 2.0);
    }

    bool containsTile(int x, int y) const {
        return x >= originX && x <= endX && y >= originY && y <= endY;
    }

    // Fully contains (or equals) other
    bool contains(const Room& other) const {
        return originX <= other.originX && originY <= other.originY &&
               endX >= other.endX && endY >= other.endY;
    }

    // Rectangles touch or overlap on both axes
    bool isAdjacentTo(const Room& other) const {
        auto gap = [](int from, int to) { return static_cast<long long>(from) - to; };
        bool separatedX = gap(originX, other.endX) > 1 || gap(other.originX, endX) > 1;
        bool separatedY = gap(originY, other.endY) > 1 || gap(other.originY, endY) > 1;
        return !separatedX && !separatedY;
    }

    bool operator==(const Room& other) const {
        return originX == other.originX && originY == other.originY &&
               endX == other.endX && endY == other.endY && isCorridor == other.isCorridor;
    }

    bool operator!=(const Room& other) const {
        return !(*this == other);
    }

    std::string describe() const {
        return std::string(isCorridor ? "corridor" : "room") + " <" + std::to_string(originX) + "," +
               std::to_string(originY) + ">-<" + std::to_string(endX) + "," + std::to_string(endY) + ">";
    }
};

} // namespace level_populator
