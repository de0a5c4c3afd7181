#include "level_populator/RoomReducer.h"
#include "level_populator/Errors.h"
#include <SDL3/SDL_log.h>

namespace level_populator {

namespace {

// First room in list order that continues a along x, or -1
long findHorizontalContinuation(const std::vector<Room>& rooms, const Room& a) {
    for (size_t j = 0; j < rooms.size(); ++j) {
        const Room& b = rooms[j];
        if (b.originX > a.originX && b.originX - 1 <= a.endX &&
            b.originY == a.originY && b.endY == a.endY) {
            return static_cast<long>(j);
        }
    }
    return -1;
}

// First room in list order that continues a along y, or -1
long findVerticalContinuation(const std::vector<Room>& rooms, const Room& a) {
    for (size_t j = 0; j < rooms.size(); ++j) {
        const Room& b = rooms[j];
        if (b.originY > a.originY && b.originY - 1 <= a.endY &&
            b.originX == a.originX && b.endX == a.endX) {
            return static_cast<long>(j);
        }
    }
    return -1;
}

} // namespace

int mergePass(std::vector<Room>& rooms) {
    int merged = 0;

    for (size_t i = 0; i < rooms.size(); ++i) {
        if (rooms[i].isCorridor) continue;

        // Only the first continuation counts; a corridor there blocks the axis
        long j = findHorizontalContinuation(rooms, rooms[i]);
        if (j < 0 || rooms[j].isCorridor) {
            j = findVerticalContinuation(rooms, rooms[i]);
            if (j < 0 || rooms[j].isCorridor) continue;
        }

        rooms[i].endX = rooms[j].endX;
        rooms[i].endY = rooms[j].endY;
        rooms.erase(rooms.begin() + j);
        ++merged;
    }

    return merged;
}

int mergeRooms(std::vector<Room>& rooms) {
    // Every productive pass removes a room
    const size_t maxPasses = rooms.size() + 1;

    int total = 0;
    for (size_t pass = 0; pass < maxPasses; ++pass) {
        int merged = mergePass(rooms);
        if (merged == 0) {
            return total;
        }
        total += merged;
    }

    throw GeometryError("Room merging did not converge after " + std::to_string(maxPasses) + " passes");
}

std::vector<Room> removeContainedRooms(const std::vector<Room>& rooms) {
    std::vector<bool> removed(rooms.size(), false);

    for (size_t i = 0; i < rooms.size(); ++i) {
        for (size_t j = 0; j < rooms.size(); ++j) {
            if (i != j && rooms[i].contains(rooms[j])) {
                removed[j] = true;
            }
        }
    }

    std::vector<Room> kept;
    kept.reserve(rooms.size());
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (!removed[i]) {
            kept.push_back(rooms[i]);
        }
    }
    return kept;
}

std::vector<Room> reduceRooms(std::vector<Room> rooms) {
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (!rooms[i].isValid()) {
            throw GeometryError("Zero-area " + rooms[i].describe() + " at index " + std::to_string(i));
        }
    }

    size_t parsed = rooms.size();
    int merges = mergeRooms(rooms);
    std::vector<Room> reduced = removeContainedRooms(rooms);

    SDL_Log("Rooms: %zu parsed, %d merges, %zu after pruning", parsed, merges, reduced.size());
    return reduced;
}

} // namespace level_populator
