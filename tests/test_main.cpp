#include "asset_registry.hpp"
#include "camera.hpp"
#include "coast_stitch.hpp"
#include "hex_map.hpp"
#include "hex_math.hpp"
#include "ini_utils.hpp"
#include "map_generator.hpp"
#include "map_io.hpp"
#include "render_modes.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "simplex_noise.hpp"
#include "terrain_config.hpp"
#include "terrain_layers.hpp"
#include "terrain_sprites.hpp"
#include "viewport_cull.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool near(float a, float b, float eps = 1e-3f) {
    return std::fabs(a - b) <= eps;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TerrainModel defaultModel() {
    TerrainModel m;
    std::string errors;
    const bool ok = m.load(defaultTerrainConfig(), &errors);
    expect(ok, "default terrain config should load: " + errors);
    return m;
}

LayerValues valuesOf(const TerrainModel& m, const std::string& h, const std::string& c, const std::string& v) {
    LayerValues out;
    expect(m.valuesFromIds(h, c, v, out), "unknown ids " + h + "/" + c + "/" + v);
    return out;
}

ValueIndex idx(const TerrainModel& m, LayerKind k, const std::string& id) {
    return m.indexOf(k, id);
}

Cell makeCell(const TerrainModel& m, int q, int r, const std::string& h, const std::string& c, const std::string& v) {
    Cell cell;
    cell.coord = { q, r };
    cell.layers = valuesOf(m, h, c, v);
    cell.terrain = m.resolveComposite(cell.layers);
    return cell;
}

HexMap generated(const TerrainModel& m, int w, int h, GenerationOptions opt, GenerationStats* stats = nullptr) {
    HexMap map;
    std::string errors;
    expect(generateMap(map, m, w, h, 30.0f, opt, stats, &errors), "generateMap failed: " + errors);
    return map;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    for (int i = 0; i < 1000; ++i) {
        const double d = rng.next01();
        expect(d >= 0.0 && d < 1.0, "RNG next01() out of [0,1)");
    }
}

void test_hex_math() {
    const HexCoord origin{ 0, 0 };

    expect(hexDistance(origin, { 3, -1 }) == 3, "hexDistance (3,-1)");
    expect(hexDistance({ -2, 5 }, { -2, 5 }) == 0, "hexDistance to self");
    expect(HexCoord{ 2, -5 }.s() == 3, "cube s coordinate");

    for (const HexCoord& n : hexNeighbors(origin)) {
        expect(hexDistance(origin, n) == 1, "neighbor at distance 1");
    }
    expect(hexNeighbor(origin, 0) == HexCoord{ 1, 0 }, "direction 0 is east");
    expect(hexNeighbor(origin, 6) == hexNeighbor(origin, 0), "direction wraps");

    const auto ring = hexRing({ 1, 1 }, 2);
    expect(ring.size() == 12, "ring of radius 2 has 12 cells");
    for (const HexCoord& h : ring) expect(hexDistance({ 1, 1 }, h) == 2, "ring cell at radius");
    expect(hexRing(origin, 0).size() == 1, "ring of radius 0 is the center");

    const auto range = hexRange(origin, 2);
    expect(range.size() == 19, "range of radius 2 has 19 cells");

    const auto line = hexLine({ 0, 0 }, { 4, -2 });
    expect(line.size() == 5, "line length is distance + 1");
    expect(line.front() == HexCoord{ 0, 0 } && line.back() == HexCoord{ 4, -2 }, "line endpoints");
    for (size_t i = 1; i < line.size(); ++i) {
        expect(hexDistance(line[i - 1], line[i]) == 1, "line steps are adjacent");
    }

    for (HexOrientation o : { HexOrientation::Pointy, HexOrientation::Flat }) {
        HexLayout layout;
        layout.orientation = o;
        layout.size = 30.0f;

        for (int q = -6; q <= 6; ++q) {
            for (int r = -6; r <= 6; ++r) {
                const HexCoord h{ q, r };
                expect(pixelToHex(layout, hexToPixel(layout, h)) == h, "pixel round trip");

                const auto corners = hexCorners(layout, hexToPixel(layout, h));
                for (const Vec2f& c : corners) {
                    expect(near(distance(c, hexToPixel(layout, h)), 30.0f, 1e-2f), "corner at cell size");
                }
            }
        }

        for (int row = -4; row < 8; ++row) {
            for (int col = -4; col < 8; ++col) {
                const OffsetCoord oc{ col, row };
                const OffsetCoord back = axialToOffset(offsetToAxial(oc, o), o);
                expect(back.col == col && back.row == row, "offset round trip");
            }
        }
    }

    HexLayout pointy;
    const Vec2f he = hexHalfExtents(pointy);
    expect(near(he.x, 30.0f * 0.8660254f) && near(he.y, 30.0f), "pointy half extents");

    expect(hexKey({ 1, -1 }) != hexKey({ -1, 1 }), "hexKey distinguishes sign");
    expect(hexKey({ 2147483647, -2147483647 - 1 }) != hexKey({ -2147483647 - 1, 2147483647 }), "hexKey full range");
}

void test_hex_map_queries() {
    const TerrainModel m = defaultModel();
    HexMap map(5, 5, HexLayout{});

    for (const HexCoord& h : hexRange({ 0, 0 }, 2)) {
        map.setCell(makeCell(m, h.q, h.r, "lowlands", "moderate", "grassland"));
    }
    expect(map.size() == 19, "radius-2 map has 19 cells");

    expect(map.neighbors({ 0, 0 }).size() == 6, "center has six neighbors");
    expect(!map.isMapEdge({ 0, 0 }), "center is not a map edge");
    expect(map.isMapEdge({ 2, 0 }), "ring cell is a map edge");
    expect(map.neighbors({ 2, -2 }).size() == 3, "corner cell has three neighbors");
    expect(!map.isMapEdge({ 9, 9 }), "absent cell is not a map edge");

    expect(map.find({ 5, 5 }) == nullptr, "absent cell lookup returns nullptr");
    expect(map.find({ 1, -1 }) != nullptr, "present cell lookup");

    expect(map.inRadius({ 0, 0 }, 1).size() == 7, "inRadius 1");
    expect(map.inRegion(0, 2, -2, 0).size() == 9, "inRegion");

    const HexBounds b = map.bounds();
    expect(b.minQ == -2 && b.maxQ == 2 && b.minR == -2 && b.maxR == 2, "bounds");

    const size_t evens = map.filter([](const Cell& c) { return c.coord.q % 2 == 0; }).size();
    expect(evens == 11, "filter by predicate");

    const uint64_t rev = map.revision();
    expect(map.remove({ 0, 0 }), "remove existing cell");
    expect(!map.remove({ 0, 0 }), "remove twice fails");
    expect(!map.contains({ 0, 0 }) && map.size() == 18, "removed cell is gone");
    expect(map.revision() != rev, "revision bumps on mutation");
    for (const Cell& c : map.cells()) {
        expect(map.find(c.coord) == &c, "index stays consistent after remove");
    }

    map.clear();
    expect(map.empty(), "clear empties the map");
}

void test_find_borders_once() {
    const TerrainModel m = defaultModel();
    HexMap map(5, 5, HexLayout{});
    for (const HexCoord& h : hexRange({ 0, 0 }, 2)) {
        map.setCell(makeCell(m, h.q, h.r, "lowlands", "moderate", "grassland"));
    }

    const auto all = map.findBorders([](const Cell&, const Cell&) { return true; });
    expect(all.size() == 42, "radius-2 map has 42 adjacent pairs");

    std::set<std::pair<uint64_t, uint64_t>> seen;
    for (const auto& p : all) {
        const uint64_t ka = hexKey(p.first->coord);
        const uint64_t kb = hexKey(p.second->coord);
        expect(ka < kb, "border pair is canonically ordered");
        expect(hexDistance(p.first->coord, p.second->coord) == 1, "border pair is adjacent");
        expect(seen.insert({ ka, kb }).second, "border pair reported once");
    }

    // Water/land borders on a generated map against a brute-force count.
    GenerationOptions opt;
    opt.seed = 7;
    const HexMap gen = generated(m, 30, 20, opt);
    auto differs = [](const Cell& a, const Cell& b) { return a.terrain.water != b.terrain.water; };
    const auto coast = gen.findBorders(differs);

    size_t brute = 0;
    for (const Cell& c : gen.cells()) {
        for (const Cell* n : gen.neighbors(c.coord)) {
            if (differs(c, *n)) ++brute;
        }
    }
    expect(coast.size() * 2 == brute, "each water/land pair reported exactly once");
}

void test_config_validation_errors() {
    {
        TerrainModel m;
        std::string errors;
        expect(m.load(defaultTerrainConfig(), &errors), "defaults load");
        expect(errors.empty(), "defaults produce no errors");
        expect(m.valueCount(LayerKind::Height) == 5, "five height values");
        expect(m.valueCount(LayerKind::Climate) == 3, "three climate values");
        expect(m.valueCount(LayerKind::Vegetation) == 6, "six vegetation values");
        expect(m.fallback(LayerKind::Vegetation) == idx(m, LayerKind::Vegetation, "none"), "vegetation fallback");
    }

    auto failsWith = [](TerrainConfig cfg, const std::string& needle, const std::string& what) {
        TerrainModel m;
        std::string errors;
        const bool ok = m.load(cfg, &errors);
        expect(!ok, what + " should fail to load");
        expect(!m.loaded(), what + " leaves the model unloaded");
        expect(contains(errors, needle), what + " error mentions '" + needle + "': " + errors);
    };

    {
        TerrainConfig cfg = defaultTerrainConfig();
        cfg.layers.erase(cfg.layers.begin() + 1);
        failsWith(cfg, "Missing required layer: climate", "missing layer");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        cfg.findLayer("climate")->values.clear();
        failsWith(cfg, "has no values", "empty layer");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        cfg.findLayer("height")->fallback = "lava";
        failsWith(cfg, "fallback 'lava'", "unknown fallback");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        LayerDef* veg = cfg.findLayer("vegetation");
        veg->values.push_back(veg->values[1]);
        failsWith(cfg, "Duplicate value id vegetation.grassland", "duplicate id");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        cfg.findLayer("climate")->findValue("hot")->weight = -1.0;
        failsWith(cfg, "Invalid weight for climate.hot", "negative weight");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        cfg.findLayer("climate")->findValue("cold")->weight = std::nan("");
        failsWith(cfg, "Invalid weight for climate.cold", "NaN weight");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        ConstraintDef c;
        c.clauses.push_back({ "altitude", { "high" } });
        cfg.findLayer("vegetation")->findValue("forest")->constraints.push_back(c);
        failsWith(cfg, "unknown layer 'altitude'", "unknown constraint layer");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        ConstraintDef c;
        c.clauses.push_back({ "height", { "volcano" } });
        cfg.findLayer("vegetation")->findValue("forest")->constraints.push_back(c);
        failsWith(cfg, "unknown value 'height.volcano'", "unknown constraint value");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        ConstraintDef c;
        c.clauses.push_back({ "vegetation", { "none" } });
        cfg.findLayer("vegetation")->findValue("forest")->constraints.push_back(c);
        failsWith(cfg, "references its own layer", "self-referencing constraint");
    }
    {
        TerrainConfig cfg = defaultTerrainConfig();
        cfg.findLayer("vegetation")->findValue("forest")->constraints.push_back(ConstraintDef{});
        failsWith(cfg, "Empty constraint on vegetation.forest", "empty constraint");
    }
    {
        // Vegetation already depends on height; this closes the loop.
        TerrainConfig cfg = defaultTerrainConfig();
        ConstraintDef c;
        c.clauses.push_back({ "vegetation", { "none", "forest" } });
        cfg.findLayer("height")->findValue("hills")->constraints.push_back(c);
        failsWith(cfg, "dependency cycle", "layer cycle");
    }
}

void test_generation_order_follows_dependencies() {
    const TerrainModel def = defaultModel();
    const auto& order = def.generationOrder();
    expect(order[0] == LayerKind::Height && order[1] == LayerKind::Climate && order[2] == LayerKind::Vegetation,
           "default generation order");

    TerrainConfig cfg = defaultTerrainConfig();
    ConstraintDef c;
    c.clauses.push_back({ "climate", { "moderate", "cold" } });
    cfg.findLayer("height")->findValue("hills")->constraints.push_back(c);

    TerrainModel m;
    std::string errors;
    expect(m.load(cfg, &errors), "height-on-climate config loads: " + errors);
    const auto& o = m.generationOrder();
    expect(o[0] == LayerKind::Climate && o[1] == LayerKind::Height && o[2] == LayerKind::Vegetation,
           "climate is generated before a height layer that depends on it");

    GenerationOptions opt;
    opt.mode = GenerationMode::Random;
    opt.seed = 99;
    const HexMap map = generated(m, 20, 20, opt);
    const ValueIndex hills = idx(m, LayerKind::Height, "hills");
    const ValueIndex hot = idx(m, LayerKind::Climate, "hot");
    for (const Cell& cell : map.cells()) {
        expect(!(cell.layers.get(LayerKind::Height) == hills && cell.layers.get(LayerKind::Climate) == hot),
               "no hot hills once hills require a cooler climate");
    }
}

void test_constraint_semantics() {
    const TerrainModel m = defaultModel();
    const ValueIndex none = idx(m, LayerKind::Vegetation, "none");
    const ValueIndex grass = idx(m, LayerKind::Vegetation, "grassland");
    const ValueIndex forest = idx(m, LayerKind::Vegetation, "forest");
    const ValueIndex desert = idx(m, LayerKind::Vegetation, "desert");
    const ValueIndex tundra = idx(m, LayerKind::Vegetation, "tundra");
    const ValueIndex swamp = idx(m, LayerKind::Vegetation, "swamp");

    LayerValues hotMountains;
    hotMountains.set(LayerKind::Height, idx(m, LayerKind::Height, "mountains"));
    hotMountains.set(LayerKind::Climate, idx(m, LayerKind::Climate, "hot"));
    const auto cands = m.validValuesFor(LayerKind::Vegetation, hotMountains);
    expect(cands.size() == 1 && cands[0] == none, "hot mountains only allow barren ground");

    LayerValues hotHills;
    hotHills.set(LayerKind::Height, idx(m, LayerKind::Height, "hills"));
    hotHills.set(LayerKind::Climate, idx(m, LayerKind::Climate, "hot"));
    const std::vector<ValueIndex> expectedHotHills = { none, grass, desert };
    expect(m.validValuesFor(LayerKind::Vegetation, hotHills) == expectedHotHills,
           "hot hills: forest excluded by the two-clause exclude, grassland allowed");

    LayerValues moderateLow;
    moderateLow.set(LayerKind::Height, idx(m, LayerKind::Height, "lowlands"));
    moderateLow.set(LayerKind::Climate, idx(m, LayerKind::Climate, "moderate"));
    expect(m.isValueValid(LayerKind::Vegetation, forest, moderateLow), "forest on moderate lowlands");
    expect(m.isValueValid(LayerKind::Vegetation, swamp, moderateLow), "swamp on moderate lowlands");
    expect(!m.isValueValid(LayerKind::Vegetation, desert, moderateLow), "desert needs a hot climate");
    expect(!m.isValueValid(LayerKind::Vegetation, tundra, moderateLow), "tundra needs a cold climate");

    // A clause on a layer without a value cannot veto.
    LayerValues partial;
    partial.set(LayerKind::Height, idx(m, LayerKind::Height, "mountains"));
    expect(m.isValueValid(LayerKind::Vegetation, grass, partial), "exclude with an unassigned clause passes");
    expect(m.isValueValid(LayerKind::Vegetation, tundra, partial), "require on an unassigned layer passes");
    expect(!m.isValueValid(LayerKind::Vegetation, desert, partial), "assigned clause still rejects");

    expect(!m.isValueValid(LayerKind::Vegetation, NO_VALUE, moderateLow), "NO_VALUE is never valid");
    expect(!m.isValueValid(LayerKind::Vegetation, static_cast<ValueIndex>(40), moderateLow), "out of range index");
}

void test_weighted_random_value() {
    const TerrainModel m = defaultModel();
    RNG rng(2024u);

    expect(m.weightedRandomValue(LayerKind::Climate, {}, rng) == m.fallback(LayerKind::Climate),
           "empty candidate list yields the fallback");

    const std::vector<ValueIndex> all = { 0, 1, 2 };
    int counts[3] = { 0, 0, 0 };
    const int draws = 20000;
    for (int i = 0; i < draws; ++i) {
        const ValueIndex v = m.weightedRandomValue(LayerKind::Climate, all, rng);
        expect(v <= 2, "weighted pick stays in the candidate list");
        if (v <= 2) ++counts[v];
    }
    const double moderateShare = static_cast<double>(counts[1]) / draws;
    expect(moderateShare > 0.45 && moderateShare < 0.55, "moderate (weight 50 of 100) drawn about half the time");

    TerrainConfig cfg = defaultTerrainConfig();
    for (ValueDef& v : cfg.findLayer("climate")->values) v.weight = 0.0;
    TerrainModel zero;
    expect(zero.load(cfg), "zero weights are allowed");
    const std::vector<ValueIndex> pair = { 2, 1 };
    expect(zero.weightedRandomValue(LayerKind::Climate, pair, rng) == 2, "zero total weight picks the first candidate");
}

void test_composite_resolution() {
    const TerrainModel m = defaultModel();

    const CompositeTerrain grass = m.resolveComposite(valuesOf(m, "lowlands", "moderate", "grassland"));
    expect(grass.id == "lowlands_moderate_grassland", "land composite id");
    expect(grass.name == "Grassland", "untinted lowland name");
    expect(grass.color == rgb(0x7ec850), "untinted lowland keeps the vegetation color");
    expect(grass.walkable && grass.buildable && !grass.water, "grassland flags");
    expect(near(grass.movementCost, 1.0f), "grassland movement");

    const CompositeTerrain desert = m.resolveComposite(valuesOf(m, "hills", "hot", "desert"));
    expect(desert.id == "hills_hot_desert", "hot desert hills id");
    expect(desert.name == "Hot Desert (Hills)", "display name: " + desert.name);
    expect(desert.description == "Rolling hills, hot climate zone, arid desert", "description: " + desert.description);
    expect(desert.color.r == 255 && desert.color.g == 231 && desert.color.b == 172,
           "tint blended 80/20 then lightened by elevation");
    expect(near(desert.movementCost, 2.0f), "movement = vegetation cost + half the elevation");
    expect(desert.buildable, "desert hills are buildable");

    const CompositeTerrain tundra = m.resolveComposite(valuesOf(m, "mountains", "cold", "tundra"));
    expect(tundra.name == "Cold Tundra (Mountains)", "cold tundra name");
    expect(!tundra.buildable, "mountains are never buildable");
    expect(near(tundra.movementCost, 2.8f), "tundra mountain movement");

    const CompositeTerrain deep = m.resolveComposite(valuesOf(m, "deep_water", "hot", "forest"));
    expect(deep.id == "deep_water" && deep.water, "water composite ignores climate and vegetation");
    expect(!deep.walkable && std::isinf(deep.movementCost), "deep water is impassable");
    expect(deep.color == rgb(0x4a90e2), "deep water color");

    const CompositeTerrain shallow = m.resolveComposite(valuesOf(m, "shallow_water", "cold", "none"));
    expect(shallow.walkable && near(shallow.movementCost, 3.0f) && !shallow.buildable, "shallow water wading");

    const LayerValues v = valuesOf(m, "hills", "cold", "forest");
    expect(m.resolveComposite(v) == m.resolveComposite(v), "composite is a pure function of the layer values");

    expect(m.resolveComposite(LayerValues{}) == TerrainModel::defaultComposite(), "unresolvable tuple gives default");
    expect(TerrainModel::defaultComposite().color == rgb(0xcccccc), "default composite color");
}

void test_terrain_ini_overrides() {
    const std::string text =
        "# user overrides\n"
        "value.vegetation.forest.weight = 5\n"
        "value.vegetation.oasis.name = Oasis\n"
        "value.vegetation.oasis.color = 3cb371\n"
        "value.vegetation.oasis.moisture = 0.95\n"
        "value.vegetation.oasis.require = height:lowlands, climate:hot\n"
        "value.vegetation.swamp.require = none\n"
        "value.height.hills.elevation = abc\n"
        "value.climate.cold.tint = none\n"
        "layer.vegetation.fallback = grassland\n"
        "sprite.forest = art/forest.bmp\n"
        "texture.hills = art/hills.bmp\n"
        "border.image = art/sand.bmp\n"
        "border.thickness = 0.4\n"
        "bogus.key = 1\n"
        "not a key value line\n";

    TerrainConfig cfg = defaultTerrainConfig();
    std::string warnings;
    applyTerrainConfigText(text, cfg, &warnings);

    expect(contains(warnings, "Unknown key: bogus.key"), "unknown key warned");
    expect(contains(warnings, "Invalid elevation value: abc"), "bad number warned");
    expect(contains(warnings, "Line 16: Expected key=value"), "malformed line warned with its line number");

    const LayerDef* veg = cfg.findLayer("vegetation");
    expect(veg && veg->values.size() == 7, "new vegetation value appended");
    expect(veg && veg->fallback == "grassland", "fallback overridden");
    expect(veg && veg->findValue("forest")->weight == 5.0, "weight overridden");
    expect(veg && veg->findValue("swamp")->constraints.empty(), "require = none clears the built-in constraints");
    expect(cfg.findLayer("height")->findValue("hills")->elevation == 1, "invalid value leaves the default");
    expect(!cfg.findLayer("climate")->findValue("cold")->tint, "tint = none removes the tint");
    expect(cfg.sprites.count("forest") == 1 && cfg.textures.count("hills") == 1, "art tables filled");
    expect(near(cfg.borderThickness, 0.4f), "border thickness");

    const auto paths = cfg.imagePaths();
    const std::vector<std::string> expectedPaths = { "art/forest.bmp", "art/hills.bmp", "art/sand.bmp" };
    expect(paths == expectedPaths, "image paths: sprites, textures, then border art");

    TerrainModel m;
    std::string errors;
    expect(m.load(cfg, &errors), "overridden config loads: " + errors);

    const ValueIndex oasis = idx(m, LayerKind::Vegetation, "oasis");
    expect(oasis == 6, "oasis appended at the end");
    expect(m.isValueValid(LayerKind::Vegetation, oasis, valuesOf(m, "lowlands", "hot", "none")), "oasis on hot lowlands");
    expect(!m.isValueValid(LayerKind::Vegetation, oasis, valuesOf(m, "lowlands", "cold", "none")), "no cold oasis");
    expect(m.isValueValid(LayerKind::Vegetation, idx(m, LayerKind::Vegetation, "swamp"),
                          valuesOf(m, "mountains", "hot", "none")),
           "unconstrained swamp is valid anywhere");

    std::vector<ConstraintClause> clauses;
    expect(parseConstraintClauses("height:lowlands|hills, climate:hot", clauses), "constraint syntax parses");
    expect(clauses.size() == 2 && clauses[0].ids.size() == 2 && clauses[1].layer == "climate", "clauses split");
    expect(!parseConstraintClauses("height", clauses), "missing colon rejected");
    expect(!parseConstraintClauses("height:lowlands|", clauses), "empty id rejected");

    Color c;
    expect(parseColor("0x4a90e2", c) && c == rgb(0x4a90e2), "0x color");
    expect(parseColor("74, 144, 226", c) && c == rgb(0x4a90e2), "r,g,b color");
    expect(parseColor("4a90e2", c) && c == rgb(0x4a90e2), "bare hex color");
    expect(!parseColor("zz0000", c), "bad color rejected");
    expect(colorToHex(rgb(0x4a90e2)) == "4a90e2", "colorToHex");
}

void test_generation_random_mode() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    opt.seed = 42;
    opt.mode = GenerationMode::Random;

    GenerationStats stats;
    const HexMap map = generated(m, 10, 10, opt, &stats);
    expect(map.size() == 100, "10x10 grid has 100 cells");
    expect(stats.cells == 100, "stats cell count");
    expect(stats.fallbacks == 0, "barren ground is always valid, so random mode never falls back");

    for (const Cell& c : map.cells()) {
        expect(c.layers.complete(), "every layer assigned");
        for (LayerKind k : { LayerKind::Height, LayerKind::Climate, LayerKind::Vegetation }) {
            expect(m.isValueValid(k, c.layers.get(k), c.layers), "every value satisfies its constraints");
        }
        expect(c.terrain == m.resolveComposite(c.layers), "cached composite matches the layers");

        const OffsetCoord o = axialToOffset(c.coord, HexOrientation::Pointy);
        expect(o.col >= 0 && o.col < 10 && o.row >= 0 && o.row < 10, "cell inside the offset rectangle");
    }
}

void test_generation_noise_mode() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    opt.seed = 1234;
    opt.mode = GenerationMode::Noise;

    GenerationStats stats;
    const HexMap map = generated(m, 50, 40, opt, &stats);
    expect(map.size() == 2000, "50x40 grid has 2000 cells");

    for (int row = 0; row < 40; ++row) {
        for (int col = 0; col < 50; ++col) {
            expect(map.contains(offsetToAxial({ col, row }, HexOrientation::Pointy)), "full offset coverage");
        }
    }

    int fallbackCells = 0;
    size_t water = 0;
    for (const Cell& c : map.cells()) {
        expect(c.layers.complete(), "noise cell fully assigned");
        const ValueIndex veg = c.layers.get(LayerKind::Vegetation);
        if (!m.isValueValid(LayerKind::Vegetation, veg, c.layers)) {
            expect(veg == m.fallback(LayerKind::Vegetation), "invalid vegetation only via the fallback");
            ++fallbackCells;
        }
        if (c.terrain.water) ++water;
    }
    expect(fallbackCells <= stats.fallbacks, "fallback assignments are counted");
    expect(water > 0 && water < map.size(), "noise map has both water and land");

    const ValueIndex mountains = idx(m, LayerKind::Height, "mountains");
    const ValueIndex hot = idx(m, LayerKind::Climate, "hot");
    for (const Cell& c : map.cells()) {
        if (c.layers.get(LayerKind::Height) == mountains && c.layers.get(LayerKind::Climate) == hot) {
            expect(c.layers.get(LayerKind::Vegetation) == idx(m, LayerKind::Vegetation, "none"), "hot mountains barren");
        }
    }

    GenerationOptions flat = opt;
    flat.orientation = HexOrientation::Flat;
    flat.island = true;
    const HexMap flatMap = generated(m, 20, 15, flat);
    expect(flatMap.size() == 300 && flatMap.layout().orientation == HexOrientation::Flat, "flat island grid");
    for (int row = 0; row < 15; ++row) {
        for (int col = 0; col < 20; ++col) {
            expect(flatMap.contains(offsetToAxial({ col, row }, HexOrientation::Flat)), "flat offset coverage");
        }
    }

    // The island falloff zeroes the height noise on the outer ring, which the
    // first tier maps to deep water.
    for (int col = 0; col < 20; ++col) {
        const Cell* c = flatMap.find(offsetToAxial({ col, 0 }, HexOrientation::Flat));
        expect(c && c->layers.get(LayerKind::Height) == idx(m, LayerKind::Height, "deep_water"), "island border is deep water");
    }
}

void test_generation_determinism() {
    const TerrainModel m = defaultModel();

    for (GenerationMode mode : { GenerationMode::Random, GenerationMode::Noise }) {
        GenerationOptions opt;
        opt.seed = 31337;
        opt.mode = mode;

        const HexMap a = generated(m, 40, 30, opt);
        const HexMap b = generated(m, 40, 30, opt);
        expect(a.size() == b.size(), "same seed, same size");

        bool same = true;
        for (const Cell& c : a.cells()) {
            const Cell* o = b.find(c.coord);
            if (!o || o->layers != c.layers || !(o->terrain == c.terrain)) same = false;
        }
        expect(same, std::string("same seed reproduces the map in ") + generationModeName(mode) + " mode");

        opt.seed = 31338;
        const HexMap d = generated(m, 40, 30, opt);
        size_t diff = 0;
        for (const Cell& c : a.cells()) {
            const Cell* o = d.find(c.coord);
            if (o && o->layers != c.layers) ++diff;
        }
        expect(diff > 0, std::string("different seed changes the map in ") + generationModeName(mode) + " mode");
    }
}

void test_generation_errors_keep_output() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    HexMap map = generated(m, 5, 5, opt);
    const uint64_t rev = map.revision();

    std::string errors;
    expect(!generateMap(map, m, 0, 5, 30.0f, opt, nullptr, &errors), "zero width rejected");
    expect(!generateMap(map, m, 5, 5, 0.0f, opt, nullptr, &errors), "zero cell size rejected");

    GenerationOptions badTier = opt;
    badTier.heightTiers[1].id = "lava";
    errors.clear();
    expect(!generateMap(map, m, 5, 5, 30.0f, badTier, nullptr, &errors), "unknown tier id rejected");
    expect(contains(errors, "unknown height value 'lava'"), "tier error names the id: " + errors);

    GenerationOptions unordered = opt;
    unordered.climateTiers[1].max = 0.1;
    errors.clear();
    expect(!generateMap(map, m, 5, 5, 30.0f, unordered, nullptr, &errors), "unordered tiers rejected");

    TerrainModel unloaded;
    expect(!generateMap(map, unloaded, 5, 5, 30.0f, opt, nullptr, &errors), "unloaded model rejected");

    expect(map.size() == 25 && map.revision() == rev, "failed generation leaves the previous map untouched");
}

void test_generation_helpers() {
    const TerrainModel m = defaultModel();
    const GenerationOptions opt;

    expect(pickTier(opt.heightTiers, 0.1) == 0, "low noise is deep water");
    expect(pickTier(opt.heightTiers, 0.30) == 1, "tier max is exclusive");
    expect(pickTier(opt.heightTiers, 0.99) == 4, "high noise is mountains");
    expect(pickTier(opt.heightTiers, 1.0) == 4, "last tier takes the top of the range");

    expect(near(static_cast<float>(latitudeWarmth(5, 11)), 1.0f), "middle row is warmest");
    expect(near(static_cast<float>(latitudeWarmth(0, 11)), 0.0f), "first row is coldest");
    expect(near(static_cast<float>(latitudeWarmth(10, 11)), 0.0f), "last row is coldest");

    expect(near(static_cast<float>(islandFalloff(0, 5, 11, 11)), 0.0f), "island falloff zero on the border");
    expect(near(static_cast<float>(islandFalloff(5, 5, 11, 11)), 1.0f), "island falloff one at the center");

    const ValueIndex none = idx(m, LayerKind::Vegetation, "none");
    const ValueIndex grass = idx(m, LayerKind::Vegetation, "grassland");
    const ValueIndex forest = idx(m, LayerKind::Vegetation, "forest");
    const std::vector<ValueIndex> cands = { none, grass, forest };
    expect(nearestMoistureValue(m, LayerKind::Vegetation, cands, 0.5) == grass, "moisture 0.5 prefers grassland");
    expect(nearestMoistureValue(m, LayerKind::Vegetation, cands, 0.9) == forest, "wet prefers forest");
    expect(nearestMoistureValue(m, LayerKind::Vegetation, cands, 0.0) == none, "dry prefers barren");
    expect(nearestMoistureValue(m, LayerKind::Vegetation, {}, 0.5) == NO_VALUE, "no candidates");

    TerrainConfig cfg = defaultTerrainConfig();
    cfg.findLayer("vegetation")->findValue("forest")->moisture = 0.45f;
    TerrainModel tie;
    expect(tie.load(cfg), "tie config loads");
    const std::vector<ValueIndex> forestFirst = { forest, grass };
    const std::vector<ValueIndex> grassFirst = { grass, forest };
    expect(nearestMoistureValue(tie, LayerKind::Vegetation, forestFirst, 0.45) == forest, "tie goes to the first candidate");
    expect(nearestMoistureValue(tie, LayerKind::Vegetation, grassFirst, 0.45) == grass, "tie order is stable");
}

void test_simplex_noise() {
    const SimplexNoise a(5u);
    const SimplexNoise b(5u);
    const SimplexNoise c(6u);

    bool differs = false;
    for (int y = 0; y < 20; ++y) {
        for (int x = 0; x < 20; ++x) {
            const double px = x * 0.37;
            const double py = y * 0.53;
            expect(a.sample(px, py) == b.sample(px, py), "same seed, same noise");
            if (a.sample(px, py) != c.sample(px, py)) differs = true;

            const double n = a.sampleNormalized(px, py);
            expect(n >= 0.0 && n <= 1.0, "normalized sample in [0,1]");
            const double o = a.octaveSampleNormalized(px, py, 4, 0.5, 0.08);
            expect(o >= 0.0 && o <= 1.0, "octave sample in [0,1]");
            const double raw = a.sample(px, py);
            expect(raw >= -1.01 && raw <= 1.01, "raw sample roughly in [-1,1]");
        }
    }
    expect(differs, "different seeds give different fields");
}

void test_set_layer_value_is_local() {
    World world;
    std::string errors;
    expect(world.init(defaultTerrainConfig(), &errors), "world init: " + errors);

    GenerationOptions opt;
    opt.seed = 11;
    expect(world.generate(12, 10, 30.0f, opt, &errors), "world generate: " + errors);

    const HexMap& map = world.map();
    const Cell* target = nullptr;
    for (const Cell& c : map.cells()) {
        if (!c.terrain.water) {
            target = &c;
            break;
        }
    }
    expect(target != nullptr, "generated map has a land cell");
    if (!target) return;

    const HexCoord coord = target->coord;
    const ValueIndex oldVeg = target->layers.get(LayerKind::Vegetation);
    const ValueIndex newVeg = static_cast<ValueIndex>((oldVeg + 1) % world.model().valueCount(LayerKind::Vegetation));

    std::vector<std::pair<HexCoord, CompositeTerrain>> before;
    for (const Cell& c : map.cells()) before.emplace_back(c.coord, c.terrain);
    const uint64_t rev = map.revision();

    expect(world.setLayerValue(coord, LayerKind::Vegetation, newVeg), "setLayerValue on an existing cell");
    expect(map.revision() != rev, "terraforming bumps the revision");

    int changed = 0;
    for (const auto& entry : before) {
        const Cell* c = map.find(entry.first);
        expect(c != nullptr, "cell survives terraforming");
        if (!c) continue;
        if (!(c->terrain == entry.second)) {
            ++changed;
            expect(c->coord == coord, "only the edited cell changes");
        }
    }
    expect(changed == 1, "exactly one composite re-derived");

    const Cell* edited = map.find(coord);
    expect(edited && edited->layers.get(LayerKind::Vegetation) == newVeg, "new value stored");
    expect(edited && edited->terrain == world.model().resolveComposite(edited->layers), "composite re-derived");

    expect(!world.setLayerValue({ 500, 500 }, LayerKind::Vegetation, newVeg), "absent cell rejected");
    expect(!world.setLayerValue(coord, LayerKind::Vegetation, static_cast<ValueIndex>(60)), "unknown value rejected");
}

void test_map_text_roundtrip() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    opt.seed = 77;
    opt.orientation = HexOrientation::Flat;
    const HexMap map = generated(m, 12, 9, opt);

    const std::string text = mapRecordsToText(serializeMap(map, m));
    expect(text.rfind("# hexworld map v1\nsize 12 9 flat 30\n", 0) == 0, "map text header");

    MapRecords rec;
    std::string errors;
    expect(mapRecordsFromText(text, rec, &errors), "map text parses: " + errors);

    HexMap back;
    expect(deserializeMap(rec, m, back, &errors), "records deserialize: " + errors);
    expect(back.size() == map.size(), "cell count preserved");
    expect(back.width() == 12 && back.height() == 9, "dimensions preserved");
    expect(back.layout().orientation == HexOrientation::Flat && near(back.layout().size, 30.0f), "layout preserved");
    for (const Cell& c : map.cells()) {
        const Cell* o = back.find(c.coord);
        expect(o && o->layers == c.layers && o->terrain == c.terrain, "cell preserved");
    }

    // Fractional cell sizes survive the text form bit for bit.
    MapRecords fine = serializeMap(map, m);
    fine.layout.size = 100.0f / 3.0f;
    MapRecords fineBack;
    expect(mapRecordsFromText(mapRecordsToText(fine), fineBack, &errors), "fractional size parses: " + errors);
    expect(fineBack.layout.size == fine.layout.size, "fractional cell size preserved exactly");

    // Errors
    MapRecords bad;
    expect(!mapRecordsFromText("size 1 1 pointy 30\n0 0 lowlands moderate none\n", bad, &errors), "missing header");
    expect(!mapRecordsFromText("# hexworld map v1\nsize 1 1 hex 30\n", bad, &errors), "unknown orientation");
    expect(!mapRecordsFromText("# hexworld map v1\nsize 1 1 pointy 30\n0 0 lowlands\n", bad, &errors), "short line");

    HexMap untouched = map;
    MapRecords unknownId;
    expect(mapRecordsFromText("# hexworld map v1\nsize 2 1 pointy 30\n0 0 lowlands moderate none\n1 0 lava hot none\n",
                              unknownId, &errors),
           "syntactically valid text parses");
    errors.clear();
    expect(!deserializeMap(unknownId, m, untouched, &errors), "unknown id rejected");
    expect(contains(errors, "Unknown layer value in cell 1,0"), "unknown id error names the cell");
    expect(untouched.size() == map.size(), "failed load leaves the map untouched");

    MapRecords dup;
    expect(mapRecordsFromText("# hexworld map v1\nsize 2 1 pointy 30\n0 0 lowlands moderate none\n0 0 hills cold none\n",
                              dup, &errors),
           "duplicate text parses");
    expect(!deserializeMap(dup, m, untouched, &errors), "duplicate coordinates rejected");

    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "hexworld_test_map.txt";
    expect(writeMapText(path.string(), map, m), "writeMapText");
    HexMap fromFile;
    expect(readMapText(path.string(), m, fromFile, &errors), "readMapText: " + errors);
    expect(fromFile.size() == map.size(), "file round trip size");

    World world;
    expect(world.init(defaultTerrainConfig()), "world init for load");
    expect(world.loadMap(path.string(), &errors), "World::loadMap");
    expect(world.map().size() == map.size(), "World::loadMap size");

    std::error_code ec;
    fs::remove(path, ec);
    expect(!readMapText(path.string(), m, fromFile, &errors), "missing file rejected");
}

void test_shared_edge_symmetry() {
    for (HexOrientation o : { HexOrientation::Pointy, HexOrientation::Flat }) {
        HexLayout layout;
        layout.orientation = o;
        layout.size = 30.0f;
        const float eps = sharedEdgeEpsilon(layout);

        const HexCoord c{ 3, -2 };
        for (const HexCoord& n : hexNeighbors(c)) {
            const auto ab = sharedEdge(layout, c, n, eps);
            const auto ba = sharedEdge(layout, n, c, eps);
            expect(ab.has_value() && ba.has_value(), "neighbors share an edge");
            if (!ab || !ba) continue;

            const bool sameOrder = distance(ab->a, ba->a) < eps && distance(ab->b, ba->b) < eps;
            const bool swapped = distance(ab->a, ba->b) < eps && distance(ab->b, ba->a) < eps;
            expect(sameOrder || swapped, "shared edge has the same endpoints from both sides");
            expect(near(distance(ab->a, ab->b), 30.0f, 0.05f), "shared edge length equals the cell size");
        }

        expect(!sharedEdge(layout, c, { c.q + 2, c.r }, eps).has_value(), "cells two apart share nothing");
        expect(!sharedEdge(layout, c, { c.q + 1, c.r + 1 }, eps).has_value(), "distant diagonal cells share nothing");
    }
}

void test_coast_single_pair() {
    const TerrainModel m = defaultModel();
    HexMap map(2, 1, HexLayout{});
    map.setCell(makeCell(m, 0, 0, "deep_water", "moderate", "none"));
    map.setCell(makeCell(m, 1, 0, "lowlands", "moderate", "grassland"));

    const Cell* water = map.find({ 0, 0 });
    const Cell* land = map.find({ 1, 0 });
    const std::vector<const Cell*> both = { water, land };

    const auto edges = collectCoastEdges(map, both, false);
    expect(edges.size() == 1, "one water/land pair gives exactly one coast edge");
    if (edges.size() == 1) {
        const CoastEdge& e = edges[0];
        expect(e.land == HexCoord{ 1, 0 } && e.water == HexCoord{ 0, 0 } && !e.mapEdge, "edge sides");

        const Vec2f lc = hexToPixel(map.layout(), e.land);
        const Vec2f wc = hexToPixel(map.layout(), e.water);
        for (const Vec2f& p : { e.edge.a, e.edge.b }) {
            expect(near(distance(p, lc), 30.0f, 0.05f) && near(distance(p, wc), 30.0f, 0.05f),
                   "edge endpoints are corners of both hexes");
        }
        const Vec2f mid = (e.edge.a + e.edge.b) * 0.5f;
        expect(dot(e.landward, lc - mid) > 0.0f, "landward points at the land cell");
        expect(near(length(e.landward), 1.0f), "landward is a unit vector");
    }

    expect(collectCoastEdges(map, { land }, false).size() == 1, "edge found from the land side alone");
    expect(collectCoastEdges(map, { water }, false).size() == 1, "edge found from the water side alone");

    const auto withBorder = collectCoastEdges(map, both, true);
    size_t mapEdges = 0;
    for (const CoastEdge& e : withBorder) {
        if (e.mapEdge) ++mapEdges;
    }
    expect(withBorder.size() == 6 && mapEdges == 5, "land cell gets a virtual edge toward each missing neighbor");
}

void test_coast_edge_tiling() {
    CoastEdge e;
    e.edge = { { 0.0f, 0.0f }, { 30.0f, 0.0f } };
    e.landward = { 0.0f, 1.0f };

    const EdgeTiling t = tileEdge(e, 8.4f, 64, 32);
    expect(t.count == 2, "30 units over a 16.8 natural width rounds to two tiles");
    expect(near(t.tileW, 15.0f) && near(t.tileH, 7.5f), "tiles scaled uniformly to cover the edge");
    expect(near(t.tileW * static_cast<float>(t.count), 30.0f), "tiles cover the edge exactly");
    expect(t.centers.size() == 2 && near(t.centers[0].x, 7.5f) && near(t.centers[1].x, 22.5f), "tile centers");
    expect(near(t.angleDeg, 0.0f), "edge angle");
    expect(t.flipV, "land below the edge flips the art");

    CoastEdge up = e;
    up.landward = { 0.0f, -1.0f };
    expect(!tileEdge(up, 8.4f, 64, 32).flipV, "land above the edge keeps the art upright");

    expect(tileEdge(e, 8.4f, 0, 32).count == 0, "zero-width image draws nothing");
    expect(tileEdge(e, 30.0f, 64, 16).count == 1, "a short edge still gets one tile");

    CoastEdge diag;
    diag.edge = { { 0.0f, 0.0f }, { 0.0f, 10.0f } };
    diag.landward = { 1.0f, 0.0f };
    expect(near(tileEdge(diag, 2.0f, 4, 4).angleDeg, 90.0f), "vertical edge angle");
    expect(!borderFlipNeeded(diag.edge, diag.landward), "land to the right of a downward edge");
    expect(borderFlipNeeded(diag.edge, { -1.0f, 0.0f }), "land to the left of a downward edge");
}

void test_corner_joins() {
    expect(near(maxPairwiseAngleDeg({ { 1.0f, 0.0f }, { 0.0f, 1.0f }, { -1.0f, 0.0f } }), 180.0f, 0.05f),
           "max pairwise angle");

    auto edge = [](Vec2f a, Vec2f b) {
        CoastEdge e;
        e.edge = { a, b };
        e.landward = { 0.0f, -1.0f };
        return e;
    };

    const std::vector<CoastEdge> narrow = {
        edge({ 0.0f, 0.0f }, { 10.0f, 0.0f }),
        edge({ 0.0f, 0.0f }, { 5.0f, 8.660254f }),
    };
    const auto nj = findCornerJoins(narrow, { 2.0f, 4.0f }, 0.5f);
    expect(nj.size() == 1, "two edges meet at one vertex");
    if (nj.size() == 1) {
        expect(nj[0].kind == CornerKind::Narrow, "60 degree join is narrow");
        expect(nj[0].edgeCount == 2, "join edge count");
        expect(near(nj[0].size, 3.0f), "join size averages the tile heights");
        expect(near(nj[0].pos.x, 0.0f) && near(nj[0].pos.y, 0.0f), "join position");
        expect(near(nj[0].maxAngleDeg, 60.0f, 0.05f), "join angle");
    }

    const std::vector<CoastEdge> wide = {
        edge({ 0.0f, 0.0f }, { 10.0f, 0.0f }),
        edge({ -5.0f, 8.660254f }, { 0.0f, 0.0f }),
    };
    const auto wj = findCornerJoins(wide, { 2.0f, 2.0f }, 0.5f);
    expect(wj.size() == 1 && wj[0].kind == CornerKind::Wide, "120 degree join is wide");

    // Endpoints within the merge distance are one vertex.
    const std::vector<CoastEdge> jitter = {
        edge({ 0.0f, 0.0f }, { 10.0f, 0.0f }),
        edge({ 0.2f, -0.1f }, { 5.0f, 8.660254f }),
    };
    expect(findCornerJoins(jitter, { 1.0f, 1.0f }, 0.5f).size() == 1, "nearby endpoints merge");

    // Same across the origin, where vertex buckets have negative indices.
    const std::vector<CoastEdge> acrossOrigin = {
        edge({ -0.1f, -0.1f }, { -10.0f, -0.1f }),
        edge({ 0.1f, 0.1f }, { -5.0f, 8.660254f }),
        edge({ -40.0f, 25.0f }, { -50.0f, 25.0f }),
        edge({ -40.0f, -25.0f }, { -30.0f, -25.0f }),
    };
    const auto oj = findCornerJoins(acrossOrigin, { 1.0f, 1.0f, 1.0f, 1.0f }, 0.5f);
    expect(oj.size() == 1, "endpoints straddling zero merge, distant negative ones do not");
    if (oj.size() == 1) expect(near(oj[0].pos.x, 0.0f, 0.2f) && near(oj[0].pos.y, 0.0f, 0.2f), "merged join sits at the origin");

    // An island hex: six coast edges, six wide joins around it.
    const TerrainModel m = defaultModel();
    HexMap map(3, 3, HexLayout{});
    for (const HexCoord& h : hexRange({ 0, 0 }, 1)) {
        const bool center = (h == HexCoord{ 0, 0 });
        map.setCell(makeCell(m, h.q, h.r, center ? "lowlands" : "deep_water", "moderate", center ? "grassland" : "none"));
    }
    const auto all = map.filter([](const Cell&) { return true; });
    const auto edges = collectCoastEdges(map, all, false);
    expect(edges.size() == 6, "island hex has six coast edges");

    const std::vector<float> heights(edges.size(), 8.0f);
    const auto joins = findCornerJoins(edges, heights, sharedEdgeEpsilon(map.layout()) * 2.0f);
    expect(joins.size() == 6, "island hex has six corner joins");
    for (const CornerJoin& j : joins) {
        expect(j.kind == CornerKind::Wide && j.edgeCount == 2, "hex corners are wide");
        expect(near(j.maxAngleDeg, 120.0f, 0.1f), "hex corner angle");
        expect(near(j.size, 8.0f), "hex corner size");
    }
}

void test_cull_reduces_work() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    opt.seed = 3;
    const HexMap map = generated(m, 100, 80, opt);
    expect(map.size() == 8000, "100x80 map");

    Camera cam;
    cam.setViewportSize(1280, 800);
    ViewBounds ext{};
    {
        bool first = true;
        for (const Cell& c : map.cells()) {
            const Vec2f p = hexToPixel(map.layout(), c.coord);
            if (first) {
                ext = { p.x, p.y, p.x, p.y };
                first = false;
            }
            ext.left = std::min(ext.left, p.x);
            ext.top = std::min(ext.top, p.y);
            ext.right = std::max(ext.right, p.x);
            ext.bottom = std::max(ext.bottom, p.y);
        }
    }
    cam.centerOn({ (ext.left + ext.right) * 0.5f, (ext.top + ext.bottom) * 0.5f });

    ViewportCuller culler;
    const auto& visible = culler.visibleCells(map, cam);
    expect(!visible.empty(), "centered camera sees cells");
    expect(visible.size() * 10 <= map.size(), "visible set is at most a tenth of the map at zoom 1");
}

void test_cull_no_false_negatives() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    opt.seed = 5;
    const HexMap map = generated(m, 60, 50, opt);
    const HexLayout& layout = map.layout();
    const Vec2f he = hexHalfExtents(layout);

    Camera cam;
    cam.setViewportSize(900, 600);
    cam.centerOn(hexToPixel(layout, offsetToAxial({ 30, 25 }, HexOrientation::Pointy)));

    ViewportCuller culler;
    const float pans[][2] = { { 7.0f, 3.0f }, { -13.0f, 11.0f }, { 29.0f, -2.0f }, { -4.0f, -31.0f }, { 0.5f, 0.5f } };
    const float zooms[] = { 1.0f, 1.7f, 0.6f };

    int checked = 0;
    for (float z : zooms) {
        cam.setZoom(z);
        for (const auto& p : pans) {
            for (int step = 0; step < 40; ++step) {
                cam.pan(p[0], p[1]);

                const auto& visible = culler.visibleCells(map, cam);
                std::unordered_set<uint64_t> keys;
                for (const Cell* c : visible) keys.insert(hexKey(c->coord));

                // Any cell whose bounding box overlaps the viewport must be in the set.
                const ViewBounds vb = cam.viewBounds();
                const float tol = 0.01f;
                for (const Cell& c : map.cells()) {
                    const Vec2f ctr = hexToPixel(layout, c.coord);
                    const bool overlaps = ctr.x + he.x > vb.left + tol && ctr.x - he.x < vb.right - tol &&
                                          ctr.y + he.y > vb.top + tol && ctr.y - he.y < vb.bottom - tol;
                    if (overlaps && keys.count(hexKey(c.coord)) == 0) {
                        expect(false, "visible cell missing from the cached set");
                    }
                }
                ++checked;
            }
        }
    }
    expect(checked == 600, "every camera step checked");
    expect(culler.recomputeCount() < checked, "cache reused between small moves");

    // A pan just under the threshold combined with a zoom step just under the
    // epsilon keeps the cache valid, and the reused set must still cover the view.
    RNG rng(2024u);
    for (HexOrientation orient : { HexOrientation::Pointy, HexOrientation::Flat }) {
        GenerationOptions wide;
        wide.seed = 9;
        wide.orientation = orient;
        const HexMap big = generated(m, 120, 80, wide);
        const HexLayout& bl = big.layout();
        const Vec2f bhe = hexHalfExtents(bl);

        Camera c2;
        c2.setViewportSize(1280, 800);
        ViewportCuller drift;
        int missing = 0;
        int reused = 0;
        for (int i = 0; i < 300; ++i) {
            c2.setZoom(0.3f + static_cast<float>(rng.next01()) * 2.7f);
            const int col = rng.range(0, 119);
            const int row = rng.range(0, 79);
            c2.centerOn(hexToPixel(bl, offsetToAxial({ col, row }, orient)));
            drift.invalidate();
            drift.visibleCells(big, c2);

            const float threshold = bl.size * c2.zoom * 0.999f;
            c2.pan(rng.range(0, 1) ? threshold : -threshold, rng.range(0, 1) ? threshold : -threshold);
            c2.zoom += rng.range(0, 1) ? 0.99e-4f : -0.99e-4f;
            if (drift.stateFor(big, c2) != ViewportCuller::State::Valid) continue;
            ++reused;

            const auto& cached = drift.visibleCells(big, c2);
            std::unordered_set<uint64_t> keys;
            for (const Cell* c : cached) keys.insert(hexKey(c->coord));

            const ViewBounds vb = c2.viewBounds();
            for (const Cell& c : big.cells()) {
                const Vec2f ctr = hexToPixel(bl, c.coord);
                const bool overlaps = ctr.x + bhe.x > vb.left && ctr.x - bhe.x < vb.right &&
                                      ctr.y + bhe.y > vb.top && ctr.y - bhe.y < vb.bottom;
                if (overlaps && keys.count(hexKey(c.coord)) == 0) ++missing;
            }
        }
        expect(reused > 250, "near-threshold moves keep the cache valid");
        expect(missing == 0, "pan plus sub-epsilon zoom drift misses " + std::to_string(missing) + " cells");
    }
}

void test_cull_state_machine() {
    const TerrainModel m = defaultModel();
    GenerationOptions opt;
    HexMap map = generated(m, 30, 30, opt);

    Camera cam;
    cam.setViewportSize(640, 480);

    ViewportCuller culler;
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "empty cache is stale");
    culler.visibleCells(map, cam);
    expect(culler.recomputeCount() == 1, "first query computes");
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Valid, "fresh cache is valid");

    cam.pan(10.0f, 0.0f);
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Valid, "sub-cell pan keeps the cache");
    culler.visibleCells(map, cam);
    expect(culler.recomputeCount() == 1, "no recompute for a sub-cell pan");

    cam.pan(25.0f, 0.0f);
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "accumulated pan past one cell is stale");
    culler.visibleCells(map, cam);
    expect(culler.recomputeCount() == 2, "recompute after a long pan");

    cam.setZoom(1.5f);
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "zoom change is stale");
    culler.visibleCells(map, cam);

    cam.pan(40.0f, 0.0f);
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Valid, "threshold scales with zoom");
    cam.pan(10.0f, 0.0f);
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "beyond cell size times zoom");
    culler.visibleCells(map, cam);

    cam.setViewportSize(800, 480);
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "viewport resize is stale");
    culler.visibleCells(map, cam);

    map.setCell(makeCell(m, 500, 500, "lowlands", "moderate", "none"));
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "map edit is stale");
    culler.visibleCells(map, cam);

    const HexMap other = generated(m, 30, 30, opt);
    expect(culler.stateFor(other, cam) == ViewportCuller::State::Stale, "a different map is stale");

    culler.invalidate();
    expect(culler.stateFor(map, cam) == ViewportCuller::State::Stale, "invalidate forces a recompute");

    const CullKey k = makeCullKey(map, cam);
    expect(!cullKeyStale(k, k), "identical keys are not stale");
    CullKey tiny = k;
    tiny.zoom += 5e-5f;
    expect(!cullKeyStale(k, tiny), "zoom jitter below epsilon is ignored");
}

void test_camera_transforms() {
    Camera cam;
    cam.setViewportSize(800, 600);
    cam.x = 13.0f;
    cam.y = -7.0f;

    const Vec2f p = cam.screenToWorld(123.0f, 456.0f);
    const Vec2f s = cam.worldToScreen(p.x, p.y);
    expect(near(s.x, 123.0f) && near(s.y, 456.0f), "screen/world round trip");

    const Vec2f before = cam.screenToWorld(200.0f, 150.0f);
    cam.zoomBy(1.5f, 200.0f, 150.0f);
    const Vec2f after = cam.screenToWorld(200.0f, 150.0f);
    expect(near(cam.zoom, 1.5f), "zoomBy multiplies");
    expect(near(before.x, after.x) && near(before.y, after.y), "zoomBy keeps the cursor point fixed");

    cam.setZoom(10.0f);
    expect(near(cam.zoom, 3.0f), "zoom clamped to max");
    cam.setZoom(0.01f);
    expect(near(cam.zoom, 0.3f), "zoom clamped to min");

    cam.reset();
    expect(cam.x == 0.0f && cam.y == 0.0f && near(cam.zoom, 1.0f), "reset");
    const Vec2f origin = cam.worldToScreen(0.0f, 0.0f);
    expect(near(origin.x, 400.0f) && near(origin.y, 300.0f), "world origin at the viewport center");

    cam.setZoom(2.0f);
    cam.centerOn({ 100.0f, 50.0f });
    const Vec2f c = cam.worldToScreen(100.0f, 50.0f);
    expect(near(c.x, 400.0f) && near(c.y, 300.0f), "centerOn");
    expect(near(cam.center().x, 100.0f) && near(cam.center().y, 50.0f), "center");

    const ViewBounds vb = cam.viewBounds();
    expect(near(vb.right - vb.left, 400.0f) && near(vb.bottom - vb.top, 300.0f), "view bounds scale with zoom");
    expect(cam.isVisible({ 100.0f, 50.0f }), "center visible");
    expect(!cam.isVisible({ 1000.0f, 50.0f }), "far point not visible");
    expect(cam.isVisible({ vb.right + 5.0f, 50.0f }, 10.0f), "margin extends visibility");
}

void test_lod_gates() {
    const LodThresholds t;

    const LodGates far = lodGatesFor(0.3f, t);
    expect(!far.hexPolygons && !far.textures && !far.borders && !far.grid, "far zoom: squares only");

    const LodGates low = lodGatesFor(0.4f, t);
    expect(low.hexPolygons && !low.textures && !low.borders && !low.grid, "hexes without detail");

    const LodGates mid = lodGatesFor(0.6f, t);
    expect(mid.hexPolygons && mid.textures && mid.borders && !mid.grid, "detail without grid");

    const LodGates edge = lodGatesFor(0.7f, t);
    expect(edge.grid, "threshold is inclusive");

    const LodGates close = lodGatesFor(2.0f, t);
    expect(close.hexPolygons && close.textures && close.borders && close.grid, "close zoom: everything");
}

void test_debug_views() {
    const TerrainModel m = defaultModel();
    const Cell water = makeCell(m, 0, 0, "deep_water", "hot", "none");
    const Cell land = makeCell(m, 1, 0, "hills", "cold", "tundra");

    expect(debugColor(DebugView::None, m, land) == land.terrain.color, "normal view uses the composite color");
    expect(debugColor(DebugView::Landmass, m, water) == rgb(0x3498db), "landmass water");
    expect(debugColor(DebugView::Landmass, m, land) == rgb(0xd4c4a0), "landmass land");
    expect(debugColor(DebugView::Height, m, water) == rgb(0x1a5490), "height table");
    expect(debugColor(DebugView::Climate, m, land) == rgb(0x3498db), "climate table");
    expect(debugColor(DebugView::Vegetation, m, land) == rgb(0xb8d4e0), "vegetation table");

    Cell unknown;
    expect(debugColor(DebugView::Height, m, unknown) == rgb(0x888888), "unknown ids are grey");

    DebugView v = DebugView::None;
    for (int i = 0; i < DEBUG_VIEW_COUNT; ++i) v = nextDebugView(v);
    expect(v == DebugView::None, "debug views cycle");
    expect(std::string(debugViewName(DebugView::Climate)) == "climate", "debug view names");
}

void test_art_lookup_order() {
    const TerrainModel m = defaultModel();
    const LayerValues v = valuesOf(m, "lowlands", "hot", "desert");

    const std::vector<std::string> expected = {
        "desert+hot+lowlands", "desert+lowlands", "desert+hot", "desert", "lowlands", "hot",
    };
    expect(artCandidateKeys(m, v) == expected, "art keys from most to least specific");

    const std::unordered_map<std::string, std::string> table = {
        { "hot", "hot.bmp" },
        { "desert", "desert.bmp" },
        { "forest", "forest.bmp" },
        { "desert+lowlands", "" },
    };
    const std::vector<std::string> paths = resolveArtPaths(table, expected);
    const std::vector<std::string> expectedPaths = { "desert.bmp", "hot.bmp" };
    expect(paths == expectedPaths, "resolved paths keep priority and skip misses");
}

void test_asset_registry() {
    int loads = 0;
    int releases = 0;

    {
        AssetRegistry reg(
            [&](const std::string& path) -> std::optional<LoadedImage> {
                ++loads;
                if (path.rfind("ok", 0) == 0) return LoadedImage{ nullptr, 16, 8 };
                if (path == "empty.bmp") return LoadedImage{ nullptr, 0, 0 };
                return std::nullopt;
            },
            [&](const LoadedImage&) { ++releases; });

        reg.request("ok1.bmp");
        reg.request("ok1.bmp");
        reg.request("missing.bmp");
        reg.request("");
        reg.requestAll({ "empty.bmp", "ok2.bmp", "missing.bmp" });
        expect(reg.pendingCount() == 4, "requests are deduplicated");
        expect(reg.status("ok1.bmp") == AssetRegistry::Status::Pending, "queued path is pending");
        expect(reg.status("other.bmp") == AssetRegistry::Status::Unknown, "unrequested path is unknown");

        expect(reg.pump(1) == 1, "pump honours the per-frame limit");
        expect(reg.pendingCount() == 3 && loads == 1, "one load per pump(1)");
        expect(reg.status("ok1.bmp") == AssetRegistry::Status::Ready, "first image ready");

        expect(reg.pump(0) == 3, "pump(0) drains the queue");
        expect(reg.pendingCount() == 0 && loads == 4 && reg.loadAttempts() == 4, "each path loaded once");

        expect(reg.status("missing.bmp") == AssetRegistry::Status::Unavailable, "failed load is unavailable");
        expect(reg.status("empty.bmp") == AssetRegistry::Status::Unavailable, "zero-sized image is unavailable");
        expect(releases == 1, "zero-sized image released");
        expect(reg.get("missing.bmp") == nullptr, "unavailable image has no data");

        const LoadedImage* img = reg.get("ok2.bmp");
        expect(img && img->w == 16 && img->h == 8, "ready image data");

        reg.request("missing.bmp");
        expect(reg.pendingCount() == 0 && reg.pump(0) == 0, "unavailable paths are not retried");

        const std::vector<std::string> paths = { "missing.bmp", "nope.bmp", "ok2.bmp", "ok1.bmp" };
        expect(firstReadyImage(reg, paths) == reg.get("ok2.bmp"), "first ready image wins");
        expect(firstReadyImage(reg, { "missing.bmp" }) == nullptr, "no ready image");

        reg.clear();
        expect(releases == 3, "clear releases every ready image");
        expect(reg.status("ok1.bmp") == AssetRegistry::Status::Unknown, "clear forgets paths");

        reg.request("ok3.bmp");
        reg.pump(0);
    }
    expect(releases == 4, "destructor releases remaining images");
}

void test_settings_parsing() {
    Settings s;
    std::string warnings;
    applySettingsText(
        "window_width = 1024\n"
        "map_width = 50\n"
        "map_height = 5000\n"
        "orientation = flat\n"
        "generator = random\n"
        "island = yes\n"
        "show_grid = off\n"
        "lod_grid_zoom = 0.9\n"
        "seed = 0x10\n"
        "terrain_config = my_terrain.ini  # comment\n"
        "cell_size = big\n"
        "foo = 1\n",
        s, &warnings);

    expect(s.windowWidth == 1024, "window_width");
    expect(s.mapWidth == 50, "map_width");
    expect(s.mapHeight == 1000, "map_height clamped");
    expect(s.orientation == HexOrientation::Flat, "orientation");
    expect(s.generator == GenerationMode::Random, "generator");
    expect(s.island, "island");
    expect(!s.showGrid, "show_grid");
    expect(near(s.lodGridZoom, 0.9f), "lod_grid_zoom");
    expect(s.seed == 16u, "hex seed");
    expect(s.terrainConfig == "my_terrain.ini", "terrain_config with trailing comment");
    expect(s.cellSize == 30, "invalid cell_size keeps the default");
    expect(contains(warnings, "Unknown key: foo"), "unknown settings key warned");
    expect(contains(warnings, "Invalid value for cell_size: big"), "bad settings value warned");

    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "hexworld_test_settings.ini";
    expect(writeDefaultSettings(path.string()), "writeDefaultSettings");

    std::string fileWarnings;
    const Settings d = loadSettings(path.string(), &fileWarnings);
    expect(fileWarnings.empty(), "default settings file has no warnings: " + fileWarnings);
    expect(d.mapWidth == 100 && d.mapHeight == 80 && d.cellSize == 30 && d.showGrid, "default settings values");

    expect(updateIniKey(path.string(), "show_grid", "false"), "updateIniKey");
    expect(updateIniKey(path.string(), "island", "true"), "updateIniKey existing key");
    expect(updateIniKey(path.string(), "asset_dir", "art"), "updateIniKey string");
    const Settings u = loadSettings(path.string());
    expect(!u.showGrid && u.island && u.assetDir == "art", "updated keys read back");

    std::error_code ec;
    fs::remove(path, ec);

    const Settings missing = loadSettings(path.string());
    expect(missing.windowWidth == 1280, "missing file gives defaults");
}

void test_ini_helpers() {
    bool b = false;
    expect(parseBool("On", b) && b, "parseBool on");
    expect(parseBool("no", b) && !b, "parseBool no");
    expect(!parseBool("maybe", b), "parseBool rejects junk");

    int i = 0;
    expect(parseInt(" -12 ", i) && i == -12, "parseInt");
    expect(!parseInt("12abc", i), "parseInt rejects trailing junk");

    unsigned int u = 0;
    expect(parseUint32("4294967295", u) && u == 4294967295u, "parseUint32 max");
    expect(!parseUint32("-1", u), "parseUint32 rejects negatives");
    expect(!parseUint32("4294967296", u), "parseUint32 rejects overflow");

    std::string key;
    std::string value;
    expect(splitIniLine("Map_Width = 12", key, value) && key == "map_width" && value == "12", "splitIniLine");
    expect(trim(stripIniComment("a = b ; note")) == "a = b", "stripIniComment");

    const auto toks = splitDot("value.height.hills.name");
    expect(toks.size() == 4 && toks[2] == "hills", "splitDot");
}

void test_procedural_overlays() {
    const SpritePixels hills = generateHillOverlay(64);
    const SpritePixels mountains = generateMountainOverlay(64);

    expect(hills.w == 64 && hills.h == 64 && hills.px.size() == 64u * 64u, "hill overlay size");
    expect(mountains.w == 64 && mountains.h == 64, "mountain overlay size");

    const float hc = spriteCoverage(hills);
    const float mc = spriteCoverage(mountains);
    expect(hc > 0.0f && hc < 0.5f, "hill overlay is a light decoration");
    expect(mc > 0.0f && mc < 0.5f, "mountain overlay is a light decoration");
    expect(hills.at(0, 0).a == 0, "hill overlay corner is transparent");

    expect(generateHillOverlay(4).w == 16, "overlay size clamped");
}

void test_world_queries() {
    World world;
    std::string errors;
    expect(world.init(defaultTerrainConfig(), &errors), "world init");

    GenerationOptions opt;
    opt.seed = 21;
    expect(world.generate(10, 8, 30.0f, opt, &errors), "world generate");
    expect(world.lastStats().cells == 80, "world stats");
    expect(world.lastOptions().seed == 21u, "world remembers its options");

    const Cell& some = world.map().cells()[17];
    const Vec2f p = hexToPixel(world.map().layout(), some.coord);
    const Cell* hit = world.cellAt(p.x + 3.0f, p.y - 2.0f);
    expect(hit && hit->coord == some.coord, "cellAt finds the cell under a point");
    expect(world.cellAt(-5000.0f, -5000.0f) == nullptr, "cellAt off the map");

    const ViewBounds ext = world.extent();
    const Vec2f c = world.center();
    expect(ext.left < ext.right && ext.top < ext.bottom, "extent");
    expect(c.x > ext.left && c.x < ext.right && c.y > ext.top && c.y < ext.bottom, "center inside the extent");

    const size_t before = world.map().size();
    expect(!world.generate(-1, 8, 30.0f, opt, &errors), "invalid generate fails");
    expect(world.map().size() == before, "failed generate keeps the old map");

    TerrainConfig broken = defaultTerrainConfig();
    broken.findLayer("height")->fallback = "nowhere";
    World bad;
    expect(!bad.init(broken, &errors), "world init rejects a broken config");
    expect(!bad.generate(5, 5, 30.0f, opt, &errors), "nothing generates without a valid model");
}

} // namespace

int main() {
    std::cout << "Running HexWorld tests...\n";

    test_rng_reproducible();
    test_hex_math();
    test_hex_map_queries();
    test_find_borders_once();

    test_config_validation_errors();
    test_generation_order_follows_dependencies();
    test_constraint_semantics();
    test_weighted_random_value();
    test_composite_resolution();
    test_terrain_ini_overrides();

    test_generation_random_mode();
    test_generation_noise_mode();
    test_generation_determinism();
    test_generation_errors_keep_output();
    test_generation_helpers();
    test_simplex_noise();
    test_set_layer_value_is_local();
    test_map_text_roundtrip();

    test_shared_edge_symmetry();
    test_coast_single_pair();
    test_coast_edge_tiling();
    test_corner_joins();

    test_cull_reduces_work();
    test_cull_no_false_negatives();
    test_cull_state_machine();
    test_camera_transforms();
    test_lod_gates();
    test_debug_views();
    test_art_lookup_order();
    test_asset_registry();

    test_settings_parsing();
    test_ini_helpers();
    test_procedural_overlays();
    test_world_queries();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
