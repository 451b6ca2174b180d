#include "map_io.hpp"

#include "ini_utils.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace {

const char* kHeader = "# hexworld map v1";

void addError(std::string* out, const std::string& msg) {
    if (out) *out += msg + "\n";
}

} // namespace

MapRecords serializeMap(const HexMap& map, const TerrainModel& model) {
    MapRecords rec;
    rec.width = map.width();
    rec.height = map.height();
    rec.layout = map.layout();
    rec.cells.reserve(map.size());

    for (const Cell& c : map.cells()) {
        CellRecord r;
        r.q = c.coord.q;
        r.r = c.coord.r;
        for (int i = 0; i < LAYER_KIND_COUNT; ++i) {
            const LayerKind k = static_cast<LayerKind>(i);
            r.ids[static_cast<size_t>(i)] = model.idOf(k, c.layers.get(k));
        }
        rec.cells.push_back(std::move(r));
    }
    return rec;
}

bool deserializeMap(const MapRecords& records, const TerrainModel& model, HexMap& out, std::string* outErrors) {
    if (!model.loaded()) {
        addError(outErrors, "Terrain model is not loaded");
        return false;
    }

    HexMap map(records.width, records.height, records.layout);
    bool ok = true;

    for (const CellRecord& r : records.cells) {
        Cell c;
        c.coord = HexCoord{ r.q, r.r };
        if (map.contains(c.coord)) {
            addError(outErrors, "Duplicate cell " + std::to_string(r.q) + "," + std::to_string(r.r));
            ok = false;
            continue;
        }
        if (!model.valuesFromIds(r.ids[0], r.ids[1], r.ids[2], c.layers)) {
            addError(outErrors, "Unknown layer value in cell " + std::to_string(r.q) + "," + std::to_string(r.r));
            ok = false;
            continue;
        }
        c.terrain = model.resolveComposite(c.layers);
        map.setCell(c);
    }

    if (!ok) return false;
    out = std::move(map);
    return true;
}

std::string mapRecordsToText(const MapRecords& records) {
    std::ostringstream oss;
    oss << kHeader << "\n";
    oss << "size " << records.width << " " << records.height << " "
        << (records.layout.orientation == HexOrientation::Flat ? "flat" : "pointy") << " "
        << std::setprecision(std::numeric_limits<float>::max_digits10) << records.layout.size << "\n";
    for (const CellRecord& r : records.cells) {
        oss << r.q << " " << r.r << " " << r.ids[0] << " " << r.ids[1] << " " << r.ids[2] << "\n";
    }
    return oss.str();
}

bool mapRecordsFromText(const std::string& text, MapRecords& out, std::string* outErrors) {
    std::istringstream iss(text);
    std::string line;

    MapRecords rec;
    bool sawHeader = false;
    bool sawSize = false;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);
        line = trim(line);
        if (line.empty()) continue;

        if (line[0] == '#') {
            if (trim(line) == kHeader) sawHeader = true;
            continue;
        }
        if (!sawHeader) {
            addError(outErrors, "Missing map header (expected '" + std::string(kHeader) + "')");
            return false;
        }

        std::istringstream ls(line);
        if (line.compare(0, 5, "size ") == 0) {
            std::string tag;
            std::string orient;
            float size = 0.0f;
            if (!(ls >> tag >> rec.width >> rec.height >> orient >> size) || size <= 0.0f) {
                addError(outErrors, "Line " + std::to_string(lineNo) + ": bad size line");
                return false;
            }
            orient = toLower(orient);
            if (orient == "pointy") rec.layout.orientation = HexOrientation::Pointy;
            else if (orient == "flat") rec.layout.orientation = HexOrientation::Flat;
            else {
                addError(outErrors, "Line " + std::to_string(lineNo) + ": unknown orientation " + orient);
                return false;
            }
            rec.layout.size = size;
            sawSize = true;
            continue;
        }

        CellRecord r;
        std::string extra;
        if (!(ls >> r.q >> r.r >> r.ids[0] >> r.ids[1] >> r.ids[2]) || (ls >> extra)) {
            addError(outErrors, "Line " + std::to_string(lineNo) + ": expected <q> <r> <height> <climate> <vegetation>");
            return false;
        }
        rec.cells.push_back(std::move(r));
    }

    if (!sawHeader || !sawSize) {
        addError(outErrors, "Map text is missing its header or size line");
        return false;
    }

    out = std::move(rec);
    return true;
}

bool writeMapText(const std::string& path, const HexMap& map, const TerrainModel& model) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << mapRecordsToText(serializeMap(map, model));
    return static_cast<bool>(f);
}

bool readMapText(const std::string& path, const TerrainModel& model, HexMap& out, std::string* outErrors) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        addError(outErrors, "Could not open map file: " + path);
        return false;
    }
    std::ostringstream oss;
    oss << f.rdbuf();

    MapRecords rec;
    if (!mapRecordsFromText(oss.str(), rec, outErrors)) return false;
    return deserializeMap(rec, model, out, outErrors);
}
