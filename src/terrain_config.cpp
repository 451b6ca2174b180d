#include "terrain_config.hpp"

#include "ini_utils.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <unordered_set>

namespace {

ValueDef makeValue(const char* id, const char* name, double weight, const char* description) {
    ValueDef v;
    v.id = id;
    v.name = name;
    v.weight = weight;
    v.description = description;
    return v;
}

ConstraintDef require(std::initializer_list<ConstraintClause> clauses) {
    ConstraintDef c;
    c.kind = ConstraintKind::RequireOneOf;
    c.clauses = clauses;
    return c;
}

ConstraintDef exclude(std::initializer_list<ConstraintClause> clauses) {
    ConstraintDef c;
    c.kind = ConstraintKind::ExcludeIfAnyOf;
    c.clauses = clauses;
    return c;
}

LayerDef defaultHeightLayer() {
    LayerDef l;
    l.name = "height";
    l.fallback = "lowlands";

    ValueDef deep = makeValue("deep_water", "Deep Water", 15.0, "Deep water, impassable without boats");
    deep.elevation = -2;
    deep.color = rgb(0x4a90e2);
    deep.walkable = false;
    deep.buildable = false;
    deep.water = true;

    ValueDef shallow = makeValue("shallow_water", "Shallow Water", 8.0, "Shallow water that can be waded through");
    shallow.elevation = -1;
    shallow.color = rgb(0x7cb9e8);
    shallow.buildable = false;
    shallow.water = true;

    ValueDef low = makeValue("lowlands", "Lowlands", 50.0, "Low-lying flat terrain");

    ValueDef hills = makeValue("hills", "Hills", 20.0, "Rolling hills");
    hills.elevation = 1;
    hills.overlay = OverlayStyle::Hills;

    ValueDef mountains = makeValue("mountains", "Mountains", 7.0, "Tall mountains");
    mountains.elevation = 2;
    mountains.color = rgb(0x8b7355);
    mountains.buildable = false;
    mountains.overlay = OverlayStyle::Mountains;

    l.values = { deep, shallow, low, hills, mountains };
    return l;
}

LayerDef defaultClimateLayer() {
    LayerDef l;
    l.name = "climate";
    l.fallback = "moderate";

    ValueDef hot = makeValue("hot", "Hot", 25.0, "Hot climate zone");
    hot.tint = rgb(0xffaa77);
    ValueDef moderate = makeValue("moderate", "Moderate", 50.0, "Temperate climate zone");
    ValueDef cold = makeValue("cold", "Cold", 25.0, "Cold climate zone");
    cold.tint = rgb(0xaaccff);

    l.values = { hot, moderate, cold };
    return l;
}

LayerDef defaultVegetationLayer() {
    LayerDef l;
    l.name = "vegetation";
    l.fallback = "none";

    auto veg = [](const char* id, const char* name, uint32_t color, float cost, bool buildable, double weight,
                  float moisture, const char* description) {
        ValueDef v = makeValue(id, name, weight, description);
        v.color = rgb(color);
        v.movementCost = cost;
        v.buildable = buildable;
        v.moisture = moisture;
        return v;
    };

    ValueDef none = veg("none", "Barren", 0xb8a896, 1.0f, true, 5.0, 0.0f, "Barren rocky ground");

    ValueDef grass = veg("grassland", "Grassland", 0x7ec850, 1.0f, true, 40.0, 0.45f, "Open grassland");
    grass.constraints.push_back(require({ { "height", { "lowlands", "hills", "mountains" } } }));
    grass.constraints.push_back(exclude({ { "height", { "mountains" } }, { "climate", { "hot", "cold" } } }));

    ValueDef forest = veg("forest", "Forest", 0x228b22, 2.0f, false, 25.0, 0.68f, "Dense forest");
    forest.constraints.push_back(require({ { "height", { "lowlands", "hills" } } }));
    forest.constraints.push_back(require({ { "climate", { "hot", "moderate" } } }));
    forest.constraints.push_back(exclude({ { "height", { "hills" } }, { "climate", { "hot" } } }));

    ValueDef desert = veg("desert", "Desert", 0xf4e4a6, 1.5f, true, 10.0, 0.1f, "Arid desert");
    desert.constraints.push_back(require({ { "height", { "lowlands", "hills" } } }));
    desert.constraints.push_back(require({ { "climate", { "hot" } } }));

    ValueDef tundra = veg("tundra", "Tundra", 0xb8d4e0, 1.8f, true, 8.0, 0.3f, "Frozen tundra");
    tundra.constraints.push_back(require({ { "height", { "lowlands", "hills", "mountains" } } }));
    tundra.constraints.push_back(require({ { "climate", { "cold" } } }));

    ValueDef swamp = veg("swamp", "Swamp", 0x4a5d3e, 2.5f, false, 12.0, 0.88f, "Marshy swampland");
    swamp.constraints.push_back(require({ { "height", { "lowlands" } } }));
    swamp.constraints.push_back(require({ { "climate", { "moderate", "cold" } } }));

    l.values = { none, grass, forest, desert, tundra, swamp };
    return l;
}

bool parseOverlay(const std::string& raw, OverlayStyle& out) {
    const std::string s = toLower(trim(raw));
    if (s == "none" || s.empty()) { out = OverlayStyle::None; return true; }
    if (s == "hills") { out = OverlayStyle::Hills; return true; }
    if (s == "mountains") { out = OverlayStyle::Mountains; return true; }
    return false;
}

// Joins the remaining dotted tokens back together ("forest+hills" has no dots, but
// art keys may still be written with them in hand-edited files).
std::string joinFrom(const std::vector<std::string>& toks, size_t from) {
    std::string out;
    for (size_t i = from; i < toks.size(); ++i) {
        if (!out.empty()) out += ".";
        out += toks[i];
    }
    return out;
}

} // namespace

const char* layerName(LayerKind k) {
    switch (k) {
        case LayerKind::Height:     return "height";
        case LayerKind::Climate:    return "climate";
        case LayerKind::Vegetation: return "vegetation";
        default:                    return "unknown";
    }
}

bool parseLayerName(const std::string& name, LayerKind& out) {
    const std::string s = toLower(trim(name));
    for (int i = 0; i < LAYER_KIND_COUNT; ++i) {
        const LayerKind k = static_cast<LayerKind>(i);
        if (s == layerName(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

ValueDef* LayerDef::findValue(const std::string& id) {
    for (auto& v : values) {
        if (v.id == id) return &v;
    }
    return nullptr;
}

const ValueDef* LayerDef::findValue(const std::string& id) const {
    for (const auto& v : values) {
        if (v.id == id) return &v;
    }
    return nullptr;
}

LayerDef* TerrainConfig::findLayer(const std::string& name) {
    for (auto& l : layers) {
        if (l.name == name) return &l;
    }
    return nullptr;
}

const LayerDef* TerrainConfig::findLayer(const std::string& name) const {
    for (const auto& l : layers) {
        if (l.name == name) return &l;
    }
    return nullptr;
}

std::vector<std::string> TerrainConfig::imagePaths() const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& p) {
        if (p.empty()) return;
        if (seen.insert(p).second) out.push_back(p);
    };

    // Hash maps iterate in an unspecified order; sort keys so load order is stable.
    auto addTable = [&](const std::unordered_map<std::string, std::string>& table) {
        std::vector<std::string> keys;
        keys.reserve(table.size());
        for (const auto& kv : table) keys.push_back(kv.first);
        std::sort(keys.begin(), keys.end());
        for (const auto& k : keys) add(table.at(k));
    };

    addTable(sprites);
    addTable(textures);
    add(borderImage);
    add(cornerNarrowImage);
    add(cornerWideImage);
    return out;
}

TerrainConfig defaultTerrainConfig() {
    TerrainConfig cfg;
    cfg.layers.push_back(defaultHeightLayer());
    cfg.layers.push_back(defaultClimateLayer());
    cfg.layers.push_back(defaultVegetationLayer());
    return cfg;
}

bool parseConstraintClauses(const std::string& text, std::vector<ConstraintClause>& out) {
    out.clear();
    const std::string s = trim(text);
    if (s.empty()) return false;

    for (const std::string& part : splitList(s, ',')) {
        if (part.empty()) return false;
        const size_t colon = part.find(':');
        if (colon == std::string::npos) return false;

        ConstraintClause clause;
        clause.layer = toLower(trim(part.substr(0, colon)));
        if (clause.layer.empty()) return false;

        for (const std::string& id : splitList(part.substr(colon + 1), '|')) {
            if (id.empty()) return false;
            clause.ids.push_back(toLower(id));
        }
        out.push_back(std::move(clause));
    }
    return !out.empty();
}

void applyTerrainConfigText(const std::string& text, TerrainConfig& cfg, std::string* outWarnings) {
    std::istringstream iss(text);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    // The first require/exclude line for a value replaces its built-in constraints
    // instead of piling onto them.
    std::unordered_set<std::string> constraintsReset;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);

        line = trim(stripIniComment(line));
        if (line.empty()) continue;

        std::string key;
        std::string val;
        if (!splitIniLine(line, key, val)) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }
        if (key.empty()) {
            appendWarning(warnings, lineNo, "Empty key", warnCount);
            continue;
        }

        const std::vector<std::string> toks = splitDot(key);
        if (toks.empty()) continue;
        const std::string& head = toks[0];

        if (head == "layer") {
            if (toks.size() != 3 || toks[2] != "fallback") {
                appendWarning(warnings, lineNo, "Layer key should be layer.<layer>.fallback", warnCount);
                continue;
            }
            LayerDef* layer = cfg.findLayer(toks[1]);
            if (!layer) {
                appendWarning(warnings, lineNo, "Unknown layer: " + toks[1], warnCount);
                continue;
            }
            layer->fallback = toLower(val);
            continue;
        }

        if (head == "value") {
            if (toks.size() != 4) {
                appendWarning(warnings, lineNo, "Value key should be value.<layer>.<id>.<field>", warnCount);
                continue;
            }
            LayerDef* layer = cfg.findLayer(toks[1]);
            if (!layer) {
                appendWarning(warnings, lineNo, "Unknown layer: " + toks[1], warnCount);
                continue;
            }

            const std::string& id = toks[2];
            ValueDef* v = layer->findValue(id);
            if (!v) {
                ValueDef fresh;
                fresh.id = id;
                fresh.name = id;
                layer->values.push_back(fresh);
                v = &layer->values.back();
            }

            const std::string& field = toks[3];
            bool ok = true;

            if (field == "name") {
                v->name = val;
            } else if (field == "description") {
                v->description = val;
            } else if (field == "weight") {
                ok = parseDouble(val, v->weight);
            } else if (field == "color" || field == "tint") {
                std::optional<Color>& dst = (field == "color") ? v->color : v->tint;
                if (toLower(val) == "none") {
                    dst.reset();
                } else {
                    Color c;
                    ok = parseColor(val, c);
                    if (ok) dst = c;
                }
            } else if (field == "elevation") {
                ok = parseInt(val, v->elevation);
            } else if (field == "walkable") {
                ok = parseBool(val, v->walkable);
            } else if (field == "buildable") {
                ok = parseBool(val, v->buildable);
            } else if (field == "water") {
                ok = parseBool(val, v->water);
            } else if (field == "movement_cost") {
                ok = parseFloat(val, v->movementCost);
            } else if (field == "moisture") {
                ok = parseFloat(val, v->moisture);
            } else if (field == "overlay") {
                ok = parseOverlay(val, v->overlay);
            } else if (field == "require" || field == "exclude") {
                const std::string resetKey = layer->name + "." + id;
                if (constraintsReset.insert(resetKey).second) v->constraints.clear();

                if (toLower(val) == "none") continue;

                ConstraintDef c;
                c.kind = (field == "require") ? ConstraintKind::RequireOneOf : ConstraintKind::ExcludeIfAnyOf;
                ok = parseConstraintClauses(val, c.clauses);
                if (ok) v->constraints.push_back(std::move(c));
            } else {
                appendWarning(warnings, lineNo, "Unknown value field: " + field, warnCount);
                continue;
            }

            if (!ok) appendWarning(warnings, lineNo, "Invalid " + field + " value: " + val, warnCount);
            continue;
        }

        if (head == "sprite" || head == "texture") {
            const std::string artKey = joinFrom(toks, 1);
            if (artKey.empty()) {
                appendWarning(warnings, lineNo, "Missing art key after " + head + ".", warnCount);
                continue;
            }
            auto& table = (head == "sprite") ? cfg.sprites : cfg.textures;
            if (val.empty()) {
                table.erase(artKey);
            } else {
                table[artKey] = val;
            }
            continue;
        }

        if (head == "border") {
            const std::string field = joinFrom(toks, 1);
            if (field == "image") {
                cfg.borderImage = val;
            } else if (field == "corner_narrow") {
                cfg.cornerNarrowImage = val;
            } else if (field == "corner_wide") {
                cfg.cornerWideImage = val;
            } else if (field == "thickness") {
                float t = 0.0f;
                if (parseFloat(val, t) && t > 0.0f && t <= 2.0f) {
                    cfg.borderThickness = t;
                } else {
                    appendWarning(warnings, lineNo, "Invalid border thickness: " + val, warnCount);
                }
            } else {
                appendWarning(warnings, lineNo, "Unknown border key: " + key, warnCount);
            }
            continue;
        }

        appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
    }

    if (outWarnings) *outWarnings += warnings;
}

bool loadTerrainConfigIni(const std::string& path, TerrainConfig& inOut, std::string* outWarnings) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (outWarnings) *outWarnings += "Could not open terrain file: " + path + "\n";
        return false;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    applyTerrainConfigText(oss.str(), inOut, outWarnings);
    return true;
}
