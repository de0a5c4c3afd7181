#include "level_populator/LevelIO.h"
#include <SDL3/SDL_log.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace level_populator {

static void stripLineEnding(std::string& line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

LevelFiles findLevelFiles(const std::string& inputDir, const std::string& mapName) {
    LevelFiles files;
    files.mapPath = (fs::path(inputDir) / (mapName + "_map.txt")).string();
    files.genomePath = (fs::path(inputDir) / (mapName + "_AB.txt")).string();

    if (!fs::is_regular_file(files.mapPath)) {
        throw std::runtime_error("Map file not found: " + files.mapPath);
    }
    if (!fs::is_regular_file(files.genomePath)) {
        throw std::runtime_error("AB file not found: " + files.genomePath);
    }
    return files;
}

TileGrid readTileGrid(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open map file: " + path);
    }

    std::vector<std::string> rows;
    std::string line;
    while (std::getline(file, line)) {
        stripLineEnding(line);
        if (line.empty()) continue;
        rows.push_back(line);
    }

    TileGrid grid = TileGrid::fromRows(rows);
    SDL_Log("Read map %s: %d x %d tiles", path.c_str(), grid.width(), grid.height());
    return grid;
}

std::string readGenome(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open AB file: " + path);
    }

    std::string genome;
    std::getline(file, genome);
    stripLineEnding(genome);
    return genome;
}

void writeTileGrid(const std::string& path, const TileGrid& grid) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    file << grid.toString();
    if (!file) {
        throw std::runtime_error("Error writing to file: " + path);
    }
    SDL_Log("Wrote map %s", path.c_str());
}

} // namespace level_populator
