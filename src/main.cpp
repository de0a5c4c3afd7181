#include "level_populator/Errors.h"
#include "level_populator/GenomeParser.h"
#include "level_populator/LevelExport.h"
#include "level_populator/LevelIO.h"
#include "level_populator/ResourcePlacer.h"
#include "level_populator/RoomReducer.h"
#include <SDL3/SDL_log.h>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace level_populator;

void printUsage(const char* program) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
        "Usage: %s <MAPNAME> [options]\n"
        "\n"
        "Reads MAPNAME_map.txt and MAPNAME_AB.txt, places spawn points, medkits\n"
        "and ammo, and writes the populated map to <output>/MAPNAME_map.txt.\n"
        "\n"
        "Options:\n"
        "  -i, --input <dir>       Input directory (default: ./Input)\n"
        "  -o, --output <dir>      Output directory (default: ./Output)\n"
        "  -c, --config <file>     Placement config JSON (default: s x5, h x4, a x4)\n"
        "  --svg                   Also write MAPNAME.svg (visibility, rooms, graph)\n"
        "  --json                  Also write MAPNAME_graphs.json\n"
        "  -v, --verbose           Log every placement\n"
        "  -h, --help              Show this help message\n",
        program);
}

int main(int argc, char* argv[]) {
    std::string mapName;
    std::string inputDir = "./Input";
    std::string outputDir = "./Output";
    std::string configPath;
    bool writeSvg = false;
    bool writeJson = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-i" || arg == "--input" || arg == "-o" || arg == "--output" ||
                   arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: %s requires an argument", arg.c_str());
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "-i" || arg == "--input") inputDir = value;
            else if (arg == "-o" || arg == "--output") outputDir = value;
            else configPath = value;
        } else if (arg == "--svg") {
            writeSvg = true;
        } else if (arg == "--json") {
            writeJson = true;
        } else if (arg == "-v" || arg == "--verbose") {
            SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
        } else if (arg[0] == '-') {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: Unknown option: %s", arg.c_str());
            printUsage(argv[0]);
            return 1;
        } else {
            mapName = arg;
        }
    }

    if (mapName.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: No map name specified");
        printUsage(argv[0]);
        return 1;
    }

    try {
        PlacementConfig config = configPath.empty() ? defaultPlacementConfig() : loadPlacementConfig(configPath);

        LevelFiles files = findLevelFiles(inputDir, mapName);
        TileGrid grid = readTileGrid(files.mapPath);
        std::vector<Room> rooms = reduceRooms(parseGenome(readGenome(files.genomePath)));

        LevelContext level(std::move(grid), std::move(rooms));
        ResourcePlacer placer(config);
        placer.populate(level);

        fs::create_directories(outputDir);
        writeTileGrid((fs::path(outputDir) / (mapName + "_map.txt")).string(), level.grid);

        if (writeSvg) {
            writeLevelSVG((fs::path(outputDir) / (mapName + ".svg")).string(), level);
        }
        if (writeJson) {
            writeGraphsJson((fs::path(outputDir) / (mapName + "_graphs.json")).string(), level);
        }
    } catch (const ParseError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "AB genome error: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Error: %s", e.what());
        return 1;
    }

    SDL_Log("Done! Output written to: %s", outputDir.c_str());
    return 0;
}
