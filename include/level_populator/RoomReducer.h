#pragma once

#include "Room.h"
#include <vector>

namespace level_populator {

// One scan over the list in order. When a room merges with an earlier entry,
// erasing that entry shifts the list under the scan index and the room after
// the current one is skipped until the next pass. Returns the merges performed.
int mergePass(std::vector<Room>& rooms);

// Merge adjacent non-corridor rooms sharing a full side until a pass performs
// no merge. Order dependent: the first match in list order wins.
// Returns the number of merges performed.
int mergeRooms(std::vector<Room>& rooms);

// Remove every room fully contained in (or equal to) another room.
// Two rooms with identical bounds remove each other.
std::vector<Room> removeContainedRooms(const std::vector<Room>& rooms);

// Validate, merge, then prune. Throws GeometryError on inverted/zero-area rooms.
std::vector<Room> reduceRooms(std::vector<Room> rooms);

} // namespace level_populator
