#include "map_generator.hpp"

#include "rng.hpp"
#include "simplex_noise.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace {

// Fixed offsets decorrelate the channels sampled from one noise field.
constexpr double kHeightOffset = 0.0;
constexpr double kClimateOffset = 1000.0;
constexpr double kMoistureOffset = 2000.0;

void addError(std::string* out, const std::string& msg) {
    if (out) *out += msg + "\n";
}

bool validateTiers(const TerrainModel& model, LayerKind layer, const std::vector<NoiseTier>& tiers,
                   std::string* outErrors) {
    const char* name = layerName(layer);
    if (tiers.empty()) {
        addError(outErrors, std::string("No noise tiers for layer ") + name);
        return false;
    }

    bool ok = true;
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (model.indexOf(layer, tiers[i].id) == NO_VALUE) {
            addError(outErrors, std::string("Noise tier references unknown ") + name + " value '" + tiers[i].id + "'");
            ok = false;
        }
        if (i > 0 && !(tiers[i].max > tiers[i - 1].max)) {
            addError(outErrors, std::string("Noise tiers for ") + name + " must have increasing thresholds");
            ok = false;
        }
    }
    return ok;
}

struct CellSamples {
    double height = 0.0;
    double climate = 0.0;
    double moisture = 0.0;
};

class LayerPicker {
public:
    LayerPicker(const TerrainModel& model, const GenerationOptions& opt, GenerationStats& stats)
        : model_(model), opt_(opt), stats_(stats), rng_(hashCombine(opt.seed, tag32("LAYERS"))) {
        for (const NoiseTier& t : opt.heightTiers) heightIdx_.push_back(model.indexOf(LayerKind::Height, t.id));
        for (const NoiseTier& t : opt.climateTiers) climateIdx_.push_back(model.indexOf(LayerKind::Climate, t.id));
    }

    LayerValues pickRandom() {
        LayerValues v;
        for (LayerKind k : model_.generationOrder()) {
            const std::vector<ValueIndex> cands = model_.validValuesFor(k, v);
            if (cands.empty()) {
                v.set(k, useFallback(k));
            } else {
                v.set(k, model_.weightedRandomValue(k, cands, rng_));
            }
        }
        return v;
    }

    LayerValues pickNoise(const CellSamples& s) {
        LayerValues v;
        for (LayerKind k : model_.generationOrder()) {
            if (k == LayerKind::Height || k == LayerKind::Climate) {
                const bool isHeight = (k == LayerKind::Height);
                const auto& tiers = isHeight ? opt_.heightTiers : opt_.climateTiers;
                const auto& idx = isHeight ? heightIdx_ : climateIdx_;
                const ValueIndex preferred = idx[pickTier(tiers, isHeight ? s.height : s.climate)];
                v.set(k, model_.isValueValid(k, preferred, v) ? preferred : useFallback(k));
            } else {
                const std::vector<ValueIndex> cands = model_.validValuesFor(k, v);
                if (cands.empty()) {
                    v.set(k, useFallback(k));
                } else {
                    v.set(k, nearestMoistureValue(model_, k, cands, s.moisture));
                }
            }
        }
        return v;
    }

private:
    ValueIndex useFallback(LayerKind k) {
        ++stats_.fallbacks;
        ++stats_.fallbacksPerLayer[static_cast<size_t>(k)];
        return model_.fallback(k);
    }

    const TerrainModel& model_;
    const GenerationOptions& opt_;
    GenerationStats& stats_;
    RNG rng_;
    std::vector<ValueIndex> heightIdx_;
    std::vector<ValueIndex> climateIdx_;
};

} // namespace

const char* generationModeName(GenerationMode m) {
    switch (m) {
        case GenerationMode::Random: return "random";
        case GenerationMode::Noise:  return "noise";
        default:                     return "unknown";
    }
}

size_t pickTier(const std::vector<NoiseTier>& tiers, double v) {
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (v < tiers[i].max) return i;
    }
    return tiers.empty() ? 0 : tiers.size() - 1;
}

ValueIndex nearestMoistureValue(const TerrainModel& model, LayerKind layer, const std::vector<ValueIndex>& candidates,
                                double moisture) {
    ValueIndex best = NO_VALUE;
    double bestDist = 0.0;
    for (ValueIndex idx : candidates) {
        const ValueDef* v = model.value(layer, idx);
        if (!v) continue;
        const double d = std::fabs(static_cast<double>(v->moisture) - moisture);
        if (best == NO_VALUE || d < bestDist) {
            best = idx;
            bestDist = d;
        }
    }
    return best;
}

double latitudeWarmth(int row, int height) {
    const double center = (static_cast<double>(height) - 1.0) * 0.5;
    if (center <= 0.0) return 1.0;
    const double d = std::fabs(static_cast<double>(row) - center) / center;
    return std::clamp(1.0 - d, 0.0, 1.0);
}

double islandFalloff(int col, int row, int width, int height) {
    const double nx = (width > 1) ? (2.0 * col / (width - 1) - 1.0) : 0.0;
    const double ny = (height > 1) ? (2.0 * row / (height - 1) - 1.0) : 0.0;
    const double d = std::min(1.0, std::max(std::fabs(nx), std::fabs(ny)));
    return 1.0 - d * d;
}

bool generateMap(HexMap& out, const TerrainModel& model, int width, int height, float cellSize,
                 const GenerationOptions& options, GenerationStats* outStats, std::string* outErrors) {
    if (!model.loaded()) {
        addError(outErrors, "Terrain model is not loaded");
        return false;
    }
    if (width <= 0 || height <= 0) {
        addError(outErrors, "Map dimensions must be positive");
        return false;
    }
    if (!(cellSize > 0.0f)) {
        addError(outErrors, "Cell size must be positive");
        return false;
    }
    if (options.mode == GenerationMode::Noise) {
        const bool okH = validateTiers(model, LayerKind::Height, options.heightTiers, outErrors);
        const bool okC = validateTiers(model, LayerKind::Climate, options.climateTiers, outErrors);
        if (!okH || !okC) return false;
    }

    HexLayout layout;
    layout.orientation = options.orientation;
    layout.size = cellSize;

    HexMap map(width, height, layout);
    GenerationStats stats;
    LayerPicker picker(model, options, stats);
    SimplexNoise noise(options.seed);

    for (int row = 0; row < height; ++row) {
        for (int col = 0; col < width; ++col) {
            Cell cell;
            cell.coord = offsetToAxial(OffsetCoord{ col, row }, options.orientation);

            if (options.mode == GenerationMode::Random) {
                cell.layers = picker.pickRandom();
            } else {
                const double x = static_cast<double>(col);
                const double y = static_cast<double>(row);

                CellSamples s;
                s.height = noise.octaveSampleNormalized(x + kHeightOffset, y + kHeightOffset, options.octaves,
                                                        options.persistence, options.heightFrequency);
                if (options.island) s.height *= islandFalloff(col, row, width, height);

                const double climateNoise = noise.octaveSampleNormalized(x + kClimateOffset, y + kClimateOffset,
                                                                         options.octaves, options.persistence,
                                                                         options.climateFrequency);
                const double blend = std::clamp(options.latitudeBlend, 0.0, 1.0);
                s.climate = (1.0 - blend) * climateNoise + blend * latitudeWarmth(row, height);

                s.moisture = noise.octaveSampleNormalized(x + kMoistureOffset, y + kMoistureOffset, options.octaves,
                                                          options.persistence, options.moistureFrequency);

                cell.layers = picker.pickNoise(s);
            }

            cell.terrain = model.resolveComposite(cell.layers);
            map.setCell(cell);
        }
    }

    stats.cells = map.size();

    std::cout << "[mapgen] " << width << "x" << height << " " << generationModeName(options.mode)
              << (options.island ? " island" : "") << " seed=" << options.seed << ": " << stats.cells << " cells";
    if (stats.fallbacks > 0) std::cout << ", " << stats.fallbacks << " fallback assignments";
    std::cout << "\n";

    out = std::move(map);
    if (outStats) *outStats = stats;
    return true;
}
