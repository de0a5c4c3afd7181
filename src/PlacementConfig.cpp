#include "level_populator/PlacementConfig.h"
#include "level_populator/Errors.h"
#include "level_populator/TileGrid.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <set>

using json = nlohmann::json;

namespace level_populator {

const char* getResourceKindName(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Spawn:  return "spawn";
        case ResourceKind::Medkit: return "medkit";
        case ResourceKind::Ammo:   return "ammo";
        default:                   return "unknown";
    }
}

static ResourceKind parseResourceKind(const std::string& name) {
    if (name == "spawn") return ResourceKind::Spawn;
    if (name == "medkit") return ResourceKind::Medkit;
    if (name == "ammo") return ResourceKind::Ammo;
    throw ConfigurationError("Unknown resource kind: " + name);
}

static VisibilityPreference parseVisibilityPreference(const std::string& name) {
    if (name == "low") return VisibilityPreference::Low;
    if (name == "mid") return VisibilityPreference::Mid;
    if (name == "high") return VisibilityPreference::High;
    throw ConfigurationError("Unknown visibility preference: " + name);
}

uint64_t PlacementConfig::totalCount() const {
    uint64_t total = 0;
    for (const ResourceRecipe& recipe : recipes) {
        total += recipe.count;
    }
    return total;
}

void PlacementConfig::validate() const {
    std::set<char> symbols;
    for (size_t i = 0; i < recipes.size(); ++i) {
        const ResourceRecipe& r = recipes[i];
        const char* name = getResourceKindName(static_cast<ResourceKind>(i));

        if (r.symbol == kWallTile || r.symbol == kFloorTile) {
            throw ConfigurationError(std::string("Resource ") + name + " uses reserved symbol '" + r.symbol + "'");
        }
        if (!symbols.insert(r.symbol).second) {
            throw ConfigurationError(std::string("Resource ") + name + " reuses symbol '" + r.symbol + "'");
        }
        if (r.degreeIntervals.empty()) {
            throw ConfigurationError(std::string("Resource ") + name + " has no degree interval");
        }
        for (const DegreeInterval& interval : r.degreeIntervals) {
            if (interval.lo > interval.hi) {
                throw ConfigurationError(std::string("Resource ") + name + " has an inverted degree interval");
            }
        }
    }
}

PlacementConfig defaultPlacementConfig() {
    PlacementConfig config;

    ResourceRecipe& spawn = config.recipe(ResourceKind::Spawn);
    spawn.symbol = 's';
    spawn.count = 5;
    spawn.degreeIntervals = {{0.1, 0.3}};
    spawn.proximityKinds = {ResourceKind::Spawn};
    spawn.visibility = VisibilityPreference::Low;
    spawn.wallWeight = 0.5;
    spawn.includeFarEdge = true;

    ResourceRecipe& medkit = config.recipe(ResourceKind::Medkit);
    medkit.symbol = 'h';
    medkit.count = 4;
    medkit.degreeIntervals = {{0.3, 0.5}};
    medkit.proximityKinds = {ResourceKind::Spawn, ResourceKind::Medkit};
    medkit.visibility = VisibilityPreference::Mid;
    medkit.wallWeight = 0.25;
    medkit.includeFarEdge = false;

    // Half the ammo goes to poorly connected rooms, half to hubs
    ResourceRecipe& ammo = config.recipe(ResourceKind::Ammo);
    ammo.symbol = 'a';
    ammo.count = 4;
    ammo.degreeIntervals = {{0.2, 0.4}, {0.8, 0.9}};
    ammo.proximityKinds = {ResourceKind::Medkit, ResourceKind::Ammo};
    ammo.visibility = VisibilityPreference::High;
    ammo.wallWeight = 0.25;
    ammo.includeFarEdge = false;

    return config;
}

static void applyRecipeOverrides(ResourceRecipe& recipe, const json& j) {
    if (j.contains("symbol")) {
        std::string symbol = j["symbol"].get<std::string>();
        if (symbol.size() != 1) {
            throw ConfigurationError("Resource symbol must be a single character: \"" + symbol + "\"");
        }
        recipe.symbol = symbol[0];
    }
    if (j.contains("count")) {
        long long count = j["count"].get<long long>();
        if (count < 0 || count > static_cast<long long>(UINT32_MAX)) {
            throw ConfigurationError("Resource count out of range: " + std::to_string(count));
        }
        recipe.count = static_cast<uint32_t>(count);
    }

    if (j.contains("degreeIntervals")) {
        recipe.degreeIntervals.clear();
        for (const auto& interval : j["degreeIntervals"]) {
            if (!interval.is_array() || interval.size() != 2) {
                throw ConfigurationError("Degree intervals must be [lo, hi] pairs");
            }
            recipe.degreeIntervals.push_back({interval[0].get<double>(), interval[1].get<double>()});
        }
    }
    if (j.contains("proximityKinds")) {
        recipe.proximityKinds.clear();
        for (const auto& kind : j["proximityKinds"]) {
            recipe.proximityKinds.push_back(parseResourceKind(kind.get<std::string>()));
        }
    }
    recipe.proximityWeight = j.value("proximityWeight", recipe.proximityWeight);

    if (j.contains("visibility")) {
        recipe.visibility = parseVisibilityPreference(j["visibility"].get<std::string>());
    }
    recipe.wallWeight = j.value("wallWeight", recipe.wallWeight);
    recipe.objectWeight = j.value("objectWeight", recipe.objectWeight);
    recipe.includeFarEdge = j.value("includeFarEdge", recipe.includeFarEdge);
}

PlacementConfig parsePlacementConfig(const std::string& jsonText) {
    PlacementConfig config = defaultPlacementConfig();

    try {
        json j = json::parse(jsonText);
        for (const auto& item : j.items()) {
            const std::string& key = item.key();
            if (key != "spawn" && key != "medkit" && key != "ammo") {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring unknown placement config key: %s", key.c_str());
            }
        }
        for (size_t i = 0; i < config.recipes.size(); ++i) {
            const char* name = getResourceKindName(static_cast<ResourceKind>(i));
            if (j.contains(name)) {
                applyRecipeOverrides(config.recipes[i], j[name]);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid placement config: ") + e.what());
    }

    config.validate();
    return config;
}

PlacementConfig loadPlacementConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open placement config: " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    PlacementConfig config = parsePlacementConfig(content);

    SDL_Log("Placement config %s: spawn '%c' x%u, medkit '%c' x%u, ammo '%c' x%u", path.c_str(),
            config.recipe(ResourceKind::Spawn).symbol, config.recipe(ResourceKind::Spawn).count,
            config.recipe(ResourceKind::Medkit).symbol, config.recipe(ResourceKind::Medkit).count,
            config.recipe(ResourceKind::Ammo).symbol, config.recipe(ResourceKind::Ammo).count);
    return config;
}

} // namespace level_populator
