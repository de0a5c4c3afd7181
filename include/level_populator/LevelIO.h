#pragma once

#include "TileGrid.h"
#include <string>

namespace level_populator {

struct LevelFiles {
    std::string mapPath;     // <name>_map.txt
    std::string genomePath;  // <name>_AB.txt
};

// Throws std::runtime_error if either file is missing
LevelFiles findLevelFiles(const std::string& inputDir, const std::string& mapName);

TileGrid readTileGrid(const std::string& path);
std::string readGenome(const std::string& path);
void writeTileGrid(const std::string& path, const TileGrid& grid);

} // namespace level_populator
