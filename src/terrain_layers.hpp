#pragma once

#include "common.hpp"
#include "rng.hpp"
#include "terrain_config.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Index of a value inside its layer's declaration order.
using ValueIndex = uint8_t;
constexpr ValueIndex NO_VALUE = 0xFF;

// Values above this count cannot be represented in a constraint mask.
constexpr int MAX_LAYER_VALUES = 64;

// One chosen value per layer. Unassigned layers hold NO_VALUE while a cell is
// being generated; a placed cell always has every layer set.
struct LayerValues {
    std::array<ValueIndex, LAYER_KIND_COUNT> v{ { NO_VALUE, NO_VALUE, NO_VALUE } };

    ValueIndex get(LayerKind k) const { return v[static_cast<size_t>(k)]; }
    void set(LayerKind k, ValueIndex idx) { v[static_cast<size_t>(k)] = idx; }
    bool has(LayerKind k) const { return get(k) != NO_VALUE; }

    bool complete() const {
        for (ValueIndex i : v) {
            if (i == NO_VALUE) return false;
        }
        return true;
    }
};

inline bool operator==(const LayerValues& a, const LayerValues& b) { return a.v == b.v; }
inline bool operator!=(const LayerValues& a, const LayerValues& b) { return !(a == b); }

// Derived render/gameplay descriptor. Always recomputable from LayerValues.
struct CompositeTerrain {
    std::string id;
    std::string name;
    std::string description;
    Color color{ 0xcc, 0xcc, 0xcc, 255 };
    bool walkable = true;
    bool buildable = true;
    bool water = false;
    float movementCost = 1.0f;
};

bool operator==(const CompositeTerrain& a, const CompositeTerrain& b);
inline bool operator!=(const CompositeTerrain& a, const CompositeTerrain& b) { return !(a == b); }

// Validated, index-resolved form of a TerrainConfig. All queries after load()
// work on small integer indices and bit masks; string ids only appear at the
// edges (config, persistence, UI).
class TerrainModel {
public:
    // Validates `cfg` and builds the lookup tables. On failure every problem is
    // appended to outErrors (one per line) and the model stays unloaded.
    bool load(const TerrainConfig& cfg, std::string* outErrors = nullptr);

    bool loaded() const { return loaded_; }
    const TerrainConfig& config() const { return cfg_; }

    int valueCount(LayerKind k) const;
    const ValueDef* value(LayerKind k, ValueIndex idx) const;
    ValueIndex indexOf(LayerKind k, const std::string& id) const;
    // Empty string for NO_VALUE / out of range.
    const std::string& idOf(LayerKind k, ValueIndex idx) const;
    ValueIndex fallback(LayerKind k) const { return fallback_[static_cast<size_t>(k)]; }

    // Layers ordered so that every layer comes after the layers its constraints reference.
    const std::array<LayerKind, LAYER_KIND_COUNT>& generationOrder() const { return order_; }

    // Checks every constraint of `idx` against the partial assignment `chosen`.
    bool isValueValid(LayerKind k, ValueIndex idx, const LayerValues& chosen) const;

    // All values of `k` valid given `chosen`, in declaration order.
    std::vector<ValueIndex> validValuesFor(LayerKind k, const LayerValues& chosen) const;

    // Weighted pick among `candidates`; the layer fallback when the list is empty.
    ValueIndex weightedRandomValue(LayerKind k, const std::vector<ValueIndex>& candidates, RNG& rng) const;

    CompositeTerrain resolveComposite(const LayerValues& values) const;

    // Resolves string ids for all layers. Returns false if any id is unknown.
    bool valuesFromIds(const std::string& height, const std::string& climate, const std::string& vegetation,
                       LayerValues& out) const;

    static CompositeTerrain defaultComposite();

private:
    struct Clause {
        LayerKind layer = LayerKind::Height;
        uint64_t mask = 0; // bit i set = value index i listed
    };

    struct Constraint {
        ConstraintKind kind = ConstraintKind::RequireOneOf;
        std::vector<Clause> clauses;
    };

    struct Layer {
        size_t defIndex = 0; // into cfg_.layers
        // Constraints per value, parallel to the LayerDef's values.
        std::vector<std::vector<Constraint>> constraints;
    };

    const LayerDef& layerDef(LayerKind k) const { return cfg_.layers[layers_[static_cast<size_t>(k)].defIndex]; }
    bool constraintSatisfied(const Constraint& c, const LayerValues& chosen) const;

    TerrainConfig cfg_;
    std::array<Layer, LAYER_KIND_COUNT> layers_{};
    std::array<ValueIndex, LAYER_KIND_COUNT> fallback_{ { NO_VALUE, NO_VALUE, NO_VALUE } };
    std::array<LayerKind, LAYER_KIND_COUNT> order_{ { LayerKind::Height, LayerKind::Climate, LayerKind::Vegetation } };
    bool loaded_ = false;
};
