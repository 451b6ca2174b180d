#include "terrain_layers.hpp"

#include <cmath>
#include <limits>
#include <unordered_set>

namespace {

const std::string kEmpty;

void addError(std::string* out, const std::string& msg) {
    if (out) *out += msg + "\n";
}

uint8_t blendChannel(uint8_t base, uint8_t tint) {
    const double v = std::floor(static_cast<double>(base) * 0.8 + static_cast<double>(tint) * 0.2 + 0.5);
    return static_cast<uint8_t>(clampi(static_cast<int>(v), 0, 255));
}

uint8_t lighten(uint8_t c, int amount) {
    return static_cast<uint8_t>(clampi(static_cast<int>(c) + amount, 0, 255));
}

std::string lowerCopy(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

} // namespace

bool operator==(const CompositeTerrain& a, const CompositeTerrain& b) {
    return a.id == b.id && a.name == b.name && a.description == b.description && a.color == b.color &&
           a.walkable == b.walkable && a.buildable == b.buildable && a.water == b.water &&
           a.movementCost == b.movementCost;
}

bool TerrainModel::load(const TerrainConfig& cfg, std::string* outErrors) {
    loaded_ = false;
    cfg_ = cfg;
    layers_ = {};
    fallback_ = { { NO_VALUE, NO_VALUE, NO_VALUE } };

    bool ok = true;
    std::array<bool, LAYER_KIND_COUNT> present{};

    for (size_t i = 0; i < cfg_.layers.size(); ++i) {
        const LayerDef& l = cfg_.layers[i];
        LayerKind k;
        if (!parseLayerName(l.name, k)) {
            addError(outErrors, "Unknown layer: " + l.name);
            ok = false;
            continue;
        }
        if (present[static_cast<size_t>(k)]) {
            addError(outErrors, "Layer declared twice: " + l.name);
            ok = false;
            continue;
        }
        present[static_cast<size_t>(k)] = true;
        layers_[static_cast<size_t>(k)].defIndex = i;
    }

    for (int i = 0; i < LAYER_KIND_COUNT; ++i) {
        if (!present[static_cast<size_t>(i)]) {
            addError(outErrors, std::string("Missing required layer: ") + layerName(static_cast<LayerKind>(i)));
            ok = false;
        }
    }
    if (!ok) return false;

    // Per-layer checks: values, ids, weights, fallback.
    for (int i = 0; i < LAYER_KIND_COUNT; ++i) {
        const LayerKind k = static_cast<LayerKind>(i);
        const LayerDef& l = layerDef(k);

        if (l.values.empty()) {
            addError(outErrors, "Layer " + l.name + " has no values");
            ok = false;
            continue;
        }
        if (l.values.size() > static_cast<size_t>(MAX_LAYER_VALUES)) {
            addError(outErrors, "Layer " + l.name + " has more than " + std::to_string(MAX_LAYER_VALUES) + " values");
            ok = false;
            continue;
        }

        std::unordered_set<std::string> ids;
        for (const ValueDef& v : l.values) {
            if (v.id.empty()) {
                addError(outErrors, "Layer " + l.name + " has a value with an empty id");
                ok = false;
            } else if (!ids.insert(v.id).second) {
                addError(outErrors, "Duplicate value id " + l.name + "." + v.id);
                ok = false;
            }
            if (!std::isfinite(v.weight) || v.weight < 0.0) {
                addError(outErrors, "Invalid weight for " + l.name + "." + v.id + " (must be finite and >= 0)");
                ok = false;
            }
        }

        const ValueIndex fb = indexOf(k, l.fallback);
        if (fb == NO_VALUE) {
            addError(outErrors, "Layer " + l.name + " fallback '" + l.fallback + "' is not one of its values");
            ok = false;
        }
        fallback_[static_cast<size_t>(i)] = fb;
    }
    if (!ok) return false;

    // Resolve constraints to masks and build the layer dependency graph.
    std::array<std::array<bool, LAYER_KIND_COUNT>, LAYER_KIND_COUNT> dependsOn{};

    for (int i = 0; i < LAYER_KIND_COUNT; ++i) {
        const LayerKind k = static_cast<LayerKind>(i);
        const LayerDef& l = layerDef(k);
        Layer& layer = layers_[static_cast<size_t>(i)];
        layer.constraints.assign(l.values.size(), {});

        for (size_t vi = 0; vi < l.values.size(); ++vi) {
            const ValueDef& v = l.values[vi];
            for (const ConstraintDef& cd : v.constraints) {
                Constraint c;
                c.kind = cd.kind;
                const std::string where = l.name + "." + v.id;

                if (cd.clauses.empty()) {
                    addError(outErrors, "Empty constraint on " + where);
                    ok = false;
                    continue;
                }

                for (const ConstraintClause& cc : cd.clauses) {
                    LayerKind ref;
                    if (!parseLayerName(cc.layer, ref)) {
                        addError(outErrors, "Constraint on " + where + " references unknown layer '" + cc.layer + "'");
                        ok = false;
                        continue;
                    }
                    if (ref == k) {
                        addError(outErrors, "Constraint on " + where + " references its own layer");
                        ok = false;
                        continue;
                    }

                    Clause clause;
                    clause.layer = ref;
                    for (const std::string& id : cc.ids) {
                        const ValueIndex idx = indexOf(ref, id);
                        if (idx == NO_VALUE) {
                            addError(outErrors, "Constraint on " + where + " references unknown value '" + cc.layer +
                                                    "." + id + "'");
                            ok = false;
                            continue;
                        }
                        clause.mask |= (uint64_t{ 1 } << idx);
                    }
                    dependsOn[static_cast<size_t>(i)][static_cast<size_t>(ref)] = true;
                    c.clauses.push_back(clause);
                }
                layer.constraints[vi].push_back(std::move(c));
            }
        }
    }
    if (!ok) return false;

    // Kahn's algorithm; ties go to the lowest layer index so the default order is stable.
    std::array<bool, LAYER_KIND_COUNT> placed{};
    for (int slot = 0; slot < LAYER_KIND_COUNT; ++slot) {
        int pick = -1;
        for (int i = 0; i < LAYER_KIND_COUNT && pick < 0; ++i) {
            if (placed[static_cast<size_t>(i)]) continue;
            bool ready = true;
            for (int j = 0; j < LAYER_KIND_COUNT; ++j) {
                if (dependsOn[static_cast<size_t>(i)][static_cast<size_t>(j)] && !placed[static_cast<size_t>(j)]) {
                    ready = false;
                    break;
                }
            }
            if (ready) pick = i;
        }
        if (pick < 0) {
            addError(outErrors, "Layer constraints form a dependency cycle");
            return false;
        }
        placed[static_cast<size_t>(pick)] = true;
        order_[static_cast<size_t>(slot)] = static_cast<LayerKind>(pick);
    }

    loaded_ = true;
    return true;
}

int TerrainModel::valueCount(LayerKind k) const {
    if (cfg_.layers.empty()) return 0;
    return static_cast<int>(layerDef(k).values.size());
}

const ValueDef* TerrainModel::value(LayerKind k, ValueIndex idx) const {
    if (idx == NO_VALUE || static_cast<int>(idx) >= valueCount(k)) return nullptr;
    return &layerDef(k).values[idx];
}

ValueIndex TerrainModel::indexOf(LayerKind k, const std::string& id) const {
    if (cfg_.layers.empty()) return NO_VALUE;
    const LayerDef& l = layerDef(k);
    for (size_t i = 0; i < l.values.size() && i < static_cast<size_t>(MAX_LAYER_VALUES); ++i) {
        if (l.values[i].id == id) return static_cast<ValueIndex>(i);
    }
    return NO_VALUE;
}

const std::string& TerrainModel::idOf(LayerKind k, ValueIndex idx) const {
    const ValueDef* v = value(k, idx);
    return v ? v->id : kEmpty;
}

bool TerrainModel::constraintSatisfied(const Constraint& c, const LayerValues& chosen) const {
    // Constraints only look backward: an unassigned layer cannot veto.
    for (const Clause& cl : c.clauses) {
        if (!chosen.has(cl.layer)) return true;
    }

    if (c.kind == ConstraintKind::RequireOneOf) {
        for (const Clause& cl : c.clauses) {
            if ((cl.mask & (uint64_t{ 1 } << chosen.get(cl.layer))) == 0) return false;
        }
        return true;
    }

    for (const Clause& cl : c.clauses) {
        if ((cl.mask & (uint64_t{ 1 } << chosen.get(cl.layer))) == 0) return true;
    }
    return false;
}

bool TerrainModel::isValueValid(LayerKind k, ValueIndex idx, const LayerValues& chosen) const {
    if (!loaded_ || idx == NO_VALUE || static_cast<int>(idx) >= valueCount(k)) return false;
    for (const Constraint& c : layers_[static_cast<size_t>(k)].constraints[idx]) {
        if (!constraintSatisfied(c, chosen)) return false;
    }
    return true;
}

std::vector<ValueIndex> TerrainModel::validValuesFor(LayerKind k, const LayerValues& chosen) const {
    std::vector<ValueIndex> out;
    const int n = valueCount(k);
    for (int i = 0; i < n; ++i) {
        if (isValueValid(k, static_cast<ValueIndex>(i), chosen)) out.push_back(static_cast<ValueIndex>(i));
    }
    return out;
}

ValueIndex TerrainModel::weightedRandomValue(LayerKind k, const std::vector<ValueIndex>& candidates, RNG& rng) const {
    if (candidates.empty()) return fallback(k);

    double total = 0.0;
    for (ValueIndex idx : candidates) {
        const ValueDef* v = value(k, idx);
        if (v) total += v->weight;
    }
    if (total <= 0.0) return candidates.front();

    double roll = rng.next01() * total;
    for (ValueIndex idx : candidates) {
        const ValueDef* v = value(k, idx);
        roll -= v ? v->weight : 0.0;
        if (roll <= 0.0) return idx;
    }
    return candidates.back();
}

CompositeTerrain TerrainModel::defaultComposite() {
    CompositeTerrain t;
    t.id = "default";
    t.name = "Unknown";
    t.description = "Unknown terrain";
    t.color = rgb(0xcccccc);
    return t;
}

CompositeTerrain TerrainModel::resolveComposite(const LayerValues& values) const {
    const ValueDef* height = value(LayerKind::Height, values.get(LayerKind::Height));
    const ValueDef* climate = value(LayerKind::Climate, values.get(LayerKind::Climate));
    const ValueDef* veg = value(LayerKind::Vegetation, values.get(LayerKind::Vegetation));
    if (!height || !climate || !veg) return defaultComposite();

    CompositeTerrain t;

    // Water ignores vegetation and climate entirely.
    if (height->water) {
        t.id = height->id;
        t.name = height->name;
        t.description = height->description;
        t.color = height->color ? *height->color : rgb(0xcccccc);
        t.walkable = height->walkable;
        t.buildable = height->buildable;
        t.water = true;
        t.movementCost = height->walkable ? 3.0f : std::numeric_limits<float>::infinity();
        return t;
    }

    t.id = height->id + "_" + climate->id + "_" + veg->id;

    t.name.clear();
    if (climate->tint) t.name += climate->name + " ";
    t.name += veg->name;
    if (height->elevation > 0) t.name += " (" + height->name + ")";

    t.description = height->description + ", " + lowerCopy(climate->description) + ", " + lowerCopy(veg->description);

    if (!veg->color) {
        t.color = rgb(0xcccccc);
    } else {
        Color c = *veg->color;
        if (climate->tint) {
            c.r = blendChannel(c.r, climate->tint->r);
            c.g = blendChannel(c.g, climate->tint->g);
            c.b = blendChannel(c.b, climate->tint->b);
        }
        if (height->elevation > 0) {
            const int amount = height->elevation * 15;
            c.r = lighten(c.r, amount);
            c.g = lighten(c.g, amount);
            c.b = lighten(c.b, amount);
        }
        t.color = c;
    }

    t.walkable = height->walkable;
    t.buildable = height->buildable && veg->buildable;
    t.water = false;
    t.movementCost = veg->movementCost + 0.5f * static_cast<float>(height->elevation);
    return t;
}

bool TerrainModel::valuesFromIds(const std::string& height, const std::string& climate, const std::string& vegetation,
                                 LayerValues& out) const {
    LayerValues v;
    v.set(LayerKind::Height, indexOf(LayerKind::Height, height));
    v.set(LayerKind::Climate, indexOf(LayerKind::Climate, climate));
    v.set(LayerKind::Vegetation, indexOf(LayerKind::Vegetation, vegetation));
    if (!v.complete()) return false;
    out = v;
    return true;
}
