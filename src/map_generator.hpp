#pragma once

#include "hex_map.hpp"
#include "terrain_layers.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

enum class GenerationMode : uint8_t {
    Random = 0, // weighted random per layer, constraints respected
    Noise,      // height/climate/moisture noise fields
};

const char* generationModeName(GenerationMode m);

// A noise value below `max` maps to `id`. Tiers are checked in order; the last
// tier also takes everything at or above its own max.
struct NoiseTier {
    std::string id;
    double max = 1.0;
};

struct GenerationOptions {
    uint32_t seed = 42;
    GenerationMode mode = GenerationMode::Noise;
    HexOrientation orientation = HexOrientation::Pointy;

    // Radial falloff pushing the map border toward water.
    bool island = false;

    // Frequencies are per offset column/row.
    double heightFrequency = 0.08;
    double climateFrequency = 0.05;
    double moistureFrequency = 0.12;
    int octaves = 4;
    double persistence = 0.5;

    // Share of the climate value taken from latitude (warm at the vertical center).
    double latitudeBlend = 0.4;

    std::vector<NoiseTier> heightTiers = {
        { "deep_water", 0.30 },
        { "shallow_water", 0.40 },
        { "lowlands", 0.65 },
        { "hills", 0.80 },
        { "mountains", 1.00 },
    };
    std::vector<NoiseTier> climateTiers = {
        { "cold", 0.33 },
        { "moderate", 0.66 },
        { "hot", 1.00 },
    };
};

struct GenerationStats {
    size_t cells = 0;
    // Assignments where the layer fallback replaced the preferred value.
    int fallbacks = 0;
    std::array<int, LAYER_KIND_COUNT> fallbacksPerLayer{};
};

// Index of the first tier whose max exceeds v (the last tier if none does).
size_t pickTier(const std::vector<NoiseTier>& tiers, double v);

// Candidate whose moisture preference is closest to `moisture`; ties go to the
// earlier candidate. NO_VALUE if `candidates` is empty.
ValueIndex nearestMoistureValue(const TerrainModel& model, LayerKind layer, const std::vector<ValueIndex>& candidates,
                                double moisture);

// Latitude warmth in [0,1]: 1 on the middle row, 0 on the first and last rows.
double latitudeWarmth(int row, int height);

// Island multiplier in [0,1]: 1 at the center, 0 on the outermost rows/columns.
double islandFalloff(int col, int row, int width, int height);

// Builds a complete width x height grid (offset coordinates converted to axial)
// and swaps it into `out` only once it is finished. Returns false (and leaves
// `out` untouched) on invalid arguments; problems are appended to outErrors.
bool generateMap(HexMap& out, const TerrainModel& model, int width, int height, float cellSize,
                 const GenerationOptions& options, GenerationStats* outStats = nullptr,
                 std::string* outErrors = nullptr);
