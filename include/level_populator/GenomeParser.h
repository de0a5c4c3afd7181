#pragma once

#include "Room.h"
#include <string>
#include <vector>

namespace level_populator {

// AB genome grammar:
//   ("<" X "," Y "," SIZE ">")* ("|" ("<" X "," Y "," LEN ">")*)?
// Square rooms come first, corridors after the separator. A positive LEN is a
// horizontal corridor LEN tiles long, zero or negative LEN a vertical one.
// Trailing whitespace is accepted, anything else throws ParseError.
std::vector<Room> parseGenome(const std::string& genome);

// Inverse of parseGenome. Throws GeometryError for rooms that are not square
// or corridors without a 3-tile minor dimension.
std::string serializeGenome(const std::vector<Room>& rooms);

} // namespace level_populator
