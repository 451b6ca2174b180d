#pragma once

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Terrain layers are a closed set: every cell carries exactly one value per layer.
enum class LayerKind : uint8_t {
    Height = 0,
    Climate,
    Vegetation,
};

constexpr int LAYER_KIND_COUNT = 3;

const char* layerName(LayerKind k);
bool parseLayerName(const std::string& name, LayerKind& out);

enum class ConstraintKind : uint8_t {
    RequireOneOf = 0,
    ExcludeIfAnyOf,
};

// One `layer -> allowed ids` entry of a constraint.
struct ConstraintClause {
    std::string layer;
    std::vector<std::string> ids;
};

// A constraint is the conjunction of its clauses.
//  - RequireOneOf fails when any clause's layer value is outside its ids.
//  - ExcludeIfAnyOf fails when every clause's layer value is inside its ids.
// A clause on a layer that has no value yet satisfies the whole constraint.
struct ConstraintDef {
    ConstraintKind kind = ConstraintKind::RequireOneOf;
    std::vector<ConstraintClause> clauses;
};

// Procedural decoration drawn over a cell when no texture image is configured.
enum class OverlayStyle : uint8_t {
    None = 0,
    Hills,
    Mountains,
};

struct ValueDef {
    std::string id;
    std::string name;
    std::string description;

    // Relative probability mass for weighted-random generation.
    double weight = 1.0;

    std::optional<Color> color; // base color (vegetation on land, water color for water heights)
    std::optional<Color> tint;  // climate tint blended over land colors

    int elevation = 0; // height tier; positive tiers lighten land and raise movement cost
    bool walkable = true;
    bool buildable = true;
    bool water = false;
    float movementCost = 1.0f;

    // Vegetation: the moisture level this value prefers, in [0,1].
    float moisture = 0.5f;

    OverlayStyle overlay = OverlayStyle::None;

    std::vector<ConstraintDef> constraints;
};

struct LayerDef {
    std::string name;
    std::string fallback; // value id assigned when no candidate satisfies the constraints
    std::vector<ValueDef> values;

    ValueDef* findValue(const std::string& id);
    const ValueDef* findValue(const std::string& id) const;
};

struct TerrainConfig {
    std::vector<LayerDef> layers;

    // Art lookup tables keyed by "veg+climate+height", "veg+height", "veg+climate",
    // "veg", "height" or "climate" (value ids joined with '+').
    std::unordered_map<std::string, std::string> sprites;
    std::unordered_map<std::string, std::string> textures;

    std::string borderImage;
    std::string cornerNarrowImage;
    std::string cornerWideImage;

    // Coast decoration thickness as a fraction of the cell size.
    float borderThickness = 0.28f;

    LayerDef* findLayer(const std::string& name);
    const LayerDef* findLayer(const std::string& name) const;

    // Every sprite/texture/border path, deduplicated, in a stable order.
    std::vector<std::string> imagePaths() const;
};

// Built-in height/climate/vegetation tables.
TerrainConfig defaultTerrainConfig();

// Apply a user-editable INI-ish override file on top of `inOut`.
//
// Keys:
//   layer.<layer>.fallback = <id>
//   value.<layer>.<id>.<field> = ...   (new ids are appended to the layer)
//   sprite.<key> = <path>, texture.<key> = <path>
//   border.image / border.corner_narrow / border.corner_wide = <path>
//   border.thickness = <fraction of cell size>
//
// Returns false only if the file could not be read. Unknown keys and bad values are
// reported in outWarnings. Semantic validation happens in TerrainModel::load.
bool loadTerrainConfigIni(const std::string& path, TerrainConfig& inOut, std::string* outWarnings = nullptr);

// Same as loadTerrainConfigIni, reading from an in-memory string (tests, tooling).
void applyTerrainConfigText(const std::string& text, TerrainConfig& inOut, std::string* outWarnings = nullptr);

// Parses "height:lowlands|hills, climate:hot" into clauses. Returns false on syntax errors.
bool parseConstraintClauses(const std::string& text, std::vector<ConstraintClause>& out);
