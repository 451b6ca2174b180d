#include "camera.hpp"
#include "coast_stitch.hpp"
#include "terrain_config.hpp"
#include "version.hpp"
#include "viewport_cull.hpp"
#include "world.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Generates a map without opening a window and prints statistics.\n\n"
        << "Options:\n"
        << "  --seed <n>              Generation seed. Default: 42.\n"
        << "  --width <n>             Map width in cells. Default: 100.\n"
        << "  --height <n>            Map height in cells. Default: 80.\n"
        << "  --cell-size <n>         Cell size in world units. Default: 30.\n"
        << "  --random                Weighted random generator (default: noise).\n"
        << "  --island                Push the map border toward water.\n"
        << "  --flat                  Flat-topped hexes.\n"
        << "  --no-map-edges          Do not count the map border as coastline.\n"
        << "  --view <w>x<h>          Viewport for the visible-cell count. Default: 1280x800.\n"
        << "  --terrain <path>        Optional terrain override INI to load.\n"
        << "  --load <path>           Read a map dump instead of generating.\n"
        << "  --dump <path>           Write the map as text.\n"
        << "  --json-report <path>    Write the statistics as JSON.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static bool parseViewSize(const std::string& s, uint32_t& w, uint32_t& h) {
    const size_t x = s.find('x');
    if (x == std::string::npos) return false;
    return parseU32(s.substr(0, x), w) && parseU32(s.substr(x + 1), h) && w > 0 && h > 0;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

struct MapReport {
    size_t cells = 0;
    int fallbacks = 0;
    size_t coastEdges = 0;
    size_t mapEdgeCoastEdges = 0;
    size_t visibleCells = 0;
    // Per layer: cell count per value index.
    std::vector<std::vector<size_t>> histograms;
};

static MapReport buildReport(const World& world, bool mapEdges, int viewW, int viewH) {
    const HexMap& map = world.map();
    const TerrainModel& model = world.model();

    MapReport r;
    r.cells = map.size();
    r.fallbacks = world.lastStats().fallbacks;

    r.histograms.resize(LAYER_KIND_COUNT);
    for (size_t k = 0; k < static_cast<size_t>(LAYER_KIND_COUNT); ++k) {
        r.histograms[k].assign(static_cast<size_t>(model.valueCount(static_cast<LayerKind>(k))), 0);
    }
    for (const Cell& c : map.cells()) {
        for (size_t k = 0; k < static_cast<size_t>(LAYER_KIND_COUNT); ++k) {
            const ValueIndex v = c.layers.v[k];
            if (v < r.histograms[k].size()) ++r.histograms[k][v];
        }
    }

    const std::vector<const Cell*> all = map.filter([](const Cell&) { return true; });
    const std::vector<CoastEdge> edges = collectCoastEdges(map, all, mapEdges);
    r.coastEdges = edges.size();
    for (const CoastEdge& e : edges) {
        if (e.mapEdge) ++r.mapEdgeCoastEdges;
    }

    Camera cam;
    cam.setViewportSize(viewW, viewH);
    cam.centerOn(world.center());
    ViewportCuller culler;
    r.visibleCells = culler.visibleCells(map, cam).size();
    return r;
}

static void printReport(const World& world, const MapReport& r) {
    const TerrainModel& model = world.model();

    std::cout << "Cells: " << r.cells << "\n";
    for (size_t k = 0; k < static_cast<size_t>(LAYER_KIND_COUNT); ++k) {
        const LayerKind layer = static_cast<LayerKind>(k);
        std::cout << layerName(layer) << ":\n";
        for (size_t i = 0; i < r.histograms[k].size(); ++i) {
            const double pct = r.cells ? (100.0 * static_cast<double>(r.histograms[k][i]) / static_cast<double>(r.cells)) : 0.0;
            std::cout << "  " << model.idOf(layer, static_cast<ValueIndex>(i)) << " " << r.histograms[k][i] << " ("
                      << static_cast<int>(pct + 0.5) << "%)\n";
        }
    }
    std::cout << "Fallback assignments: " << r.fallbacks << "\n";
    std::cout << "Coastline edges: " << r.coastEdges << " (" << r.mapEdgeCoastEdges << " on the map border)\n";
    std::cout << "Visible cells (centered view): " << r.visibleCells << "\n";
}

static bool writeJsonReport(const std::string& path, const World& world, const MapReport& r, std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open json report: " + path;
        return false;
    }

    const TerrainModel& model = world.model();
    const GenerationOptions& opt = world.lastOptions();

    f << "{\n";
    f << "  \"version\": \"" << jsonEscape(HEXWORLD_VERSION) << "\",\n";
    f << "  \"seed\": " << opt.seed << ",\n";
    f << "  \"mode\": \"" << generationModeName(opt.mode) << "\",\n";
    f << "  \"island\": " << (opt.island ? "true" : "false") << ",\n";
    f << "  \"width\": " << world.map().width() << ",\n";
    f << "  \"height\": " << world.map().height() << ",\n";
    f << "  \"cells\": " << r.cells << ",\n";
    f << "  \"fallbacks\": " << r.fallbacks << ",\n";
    f << "  \"coastEdges\": " << r.coastEdges << ",\n";
    f << "  \"mapEdgeCoastEdges\": " << r.mapEdgeCoastEdges << ",\n";
    f << "  \"visibleCells\": " << r.visibleCells << ",\n";
    f << "  \"layers\": {\n";
    for (size_t k = 0; k < static_cast<size_t>(LAYER_KIND_COUNT); ++k) {
        const LayerKind layer = static_cast<LayerKind>(k);
        f << "    \"" << layerName(layer) << "\": {";
        for (size_t i = 0; i < r.histograms[k].size(); ++i) {
            if (i) f << ", ";
            f << "\"" << jsonEscape(model.idOf(layer, static_cast<ValueIndex>(i))) << "\": " << r.histograms[k][i];
        }
        f << "}" << (k + 1 < static_cast<size_t>(LAYER_KIND_COUNT) ? "," : "") << "\n";
    }
    f << "  }\n";
    f << "}\n";

    if (!f.good()) {
        if (err) *err = "Failed to write json report: " + path;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    uint32_t seed = 42;
    uint32_t width = 100;
    uint32_t height = 80;
    uint32_t cellSize = 30;
    uint32_t viewW = 1280;
    uint32_t viewH = 800;
    bool randomMode = false;
    bool island = false;
    bool flat = false;
    bool mapEdges = true;
    std::string terrainPath;
    std::string loadPath;
    std::string dumpPath;
    std::string jsonReport;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (a == "--version" || a == "-v") {
            std::cout << HEXWORLD_APPNAME << " " << HEXWORLD_VERSION << "\n";
            return 0;
        }

        if (a == "--seed" || a == "--width" || a == "--height" || a == "--cell-size") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a value\n";
                return 2;
            }
            uint32_t n = 0;
            if (!parseU32(v, n) || (a != "--seed" && n == 0)) {
                std::cerr << "Invalid " << a << ": " << v << "\n";
                return 2;
            }
            if (a == "--seed") seed = n;
            else if (a == "--width") width = n;
            else if (a == "--height") height = n;
            else cellSize = n;
        } else if (a == "--view") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseViewSize(v, viewW, viewH)) {
                std::cerr << "--view requires <w>x<h>\n";
                return 2;
            }
        } else if (a == "--random") {
            randomMode = true;
        } else if (a == "--island") {
            island = true;
        } else if (a == "--flat") {
            flat = true;
        } else if (a == "--no-map-edges") {
            mapEdges = false;
        } else if (a == "--terrain" || a == "--load" || a == "--dump" || a == "--json-report") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a path\n";
                return 2;
            }
            if (a == "--terrain") terrainPath = v;
            else if (a == "--load") loadPath = v;
            else if (a == "--dump") dumpPath = v;
            else jsonReport = v;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    TerrainConfig cfg = defaultTerrainConfig();
    if (!terrainPath.empty()) {
        std::string warns;
        if (!loadTerrainConfigIni(terrainPath, cfg, &warns)) {
            std::cerr << "Failed to load terrain overrides: " << terrainPath << "\n";
            return 1;
        }
        if (!warns.empty()) std::cerr << "[config] " << terrainPath << ":\n" << warns;
    }

    World world;
    std::string errors;
    if (!world.init(cfg, &errors)) {
        std::cerr << "[config] invalid terrain configuration:\n" << errors;
        return 1;
    }

    if (!loadPath.empty()) {
        if (!world.loadMap(loadPath, &errors)) {
            std::cerr << "Failed to load map: " << loadPath << "\n" << errors;
            return 1;
        }
        std::cout << "Loaded " << loadPath << "\n";
    } else {
        GenerationOptions opt;
        opt.seed = seed;
        opt.mode = randomMode ? GenerationMode::Random : GenerationMode::Noise;
        opt.island = island;
        opt.orientation = flat ? HexOrientation::Flat : HexOrientation::Pointy;
        if (!world.generate(static_cast<int>(width), static_cast<int>(height), static_cast<float>(cellSize), opt,
                            &errors)) {
            std::cerr << "[mapgen] generation failed:\n" << errors;
            return 1;
        }
    }

    const MapReport report = buildReport(world, mapEdges, static_cast<int>(viewW), static_cast<int>(viewH));
    printReport(world, report);

    int rc = 0;
    if (!dumpPath.empty()) {
        if (world.saveMap(dumpPath)) {
            std::cout << "Map written: " << dumpPath << "\n";
        } else {
            std::cerr << "Failed to write map: " << dumpPath << "\n";
            rc = 1;
        }
    }

    if (!jsonReport.empty()) {
        std::string jerr;
        if (!writeJsonReport(jsonReport, world, report, &jerr)) {
            std::cerr << jerr << "\n";
            rc = 1;
        }
    }

    return rc;
}
