#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace level_populator {

enum class ResourceKind : uint8_t {
    Spawn = 0,
    Medkit = 1,
    Ammo = 2,
    Count
};

const char* getResourceKindName(ResourceKind kind);

// Which visibility a resource's tile should have
enum class VisibilityPreference : uint8_t {
    Low,   // 1 - v
    Mid,   // 1 - |0.5 - v| * 2
    High   // v
};

struct DegreeInterval {
    double lo = 0.0;
    double hi = 1.0;
};

struct ResourceRecipe {
    char symbol = '?';
    uint32_t count = 0;

    // Units are split evenly across the intervals in order, earlier intervals
    // rounding down: two intervals give floor(count/2) then ceil(count/2).
    std::vector<DegreeInterval> degreeIntervals;

    // Room fitness
    std::vector<ResourceKind> proximityKinds;  // Distance is measured to the nearest of these
    double proximityWeight = 0.25;

    // Tile fitness
    VisibilityPreference visibility = VisibilityPreference::Low;
    double wallWeight = 0.5;
    double objectWeight = 0.5;
    bool includeFarEdge = true;  // Scan [origin, end] rather than [origin, end)
};

struct PlacementConfig {
    std::array<ResourceRecipe, static_cast<size_t>(ResourceKind::Count)> recipes;

    ResourceRecipe& recipe(ResourceKind kind) { return recipes[static_cast<size_t>(kind)]; }
    const ResourceRecipe& recipe(ResourceKind kind) const { return recipes[static_cast<size_t>(kind)]; }

    // Summed in 64 bits so large per-kind counts cannot wrap
    uint64_t totalCount() const;

    // Throws ConfigurationError on reserved or repeated symbols, empty interval
    // lists or inverted intervals
    void validate() const;
};

// spawn ('s', 5), medkit ('h', 4), ammo ('a', 4) with the reference fitness recipes
PlacementConfig defaultPlacementConfig();

// Overrides defaults with the keys present in a JSON document.
// Throws ConfigurationError on malformed JSON or invalid values.
PlacementConfig parsePlacementConfig(const std::string& jsonText);
PlacementConfig loadPlacementConfig(const std::string& path);

} // namespace level_populator
