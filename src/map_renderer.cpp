#include "map_renderer.hpp"

#include "version.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

constexpr float kPi = 3.14159265358979323846f;

const Color kBackground{ 0x1e, 0x1e, 0x1e, 255 };
const Color kGridColor{ 0x33, 0x33, 0x33, 255 };
const Color kSandColor{ 0xda, 0xa5, 0x20, 255 };
const Color kHighlight{ 255, 255, 255, 76 };
const Color kWhite{ 255, 255, 255, 255 };

constexpr float kSandWidth = 6.0f;
constexpr int kLoadsPerFrame = 4;
constexpr int kOverlayPx = 64;

SDL_Vertex vertex(const Vec2f& p, Color c, float u = 0.0f, float v = 0.0f) {
    SDL_Vertex out;
    out.position.x = p.x;
    out.position.y = p.y;
    out.color.r = c.r;
    out.color.g = c.g;
    out.color.b = c.b;
    out.color.a = c.a;
    out.tex_coord.x = u;
    out.tex_coord.y = v;
    return out;
}

uint32_t packValues(const LayerValues& v) {
    return static_cast<uint32_t>(v.v[0]) | (static_cast<uint32_t>(v.v[1]) << 8) | (static_cast<uint32_t>(v.v[2]) << 16);
}

} // namespace

MapRenderer::MapRenderer(int windowW, int windowH, bool vsync)
    : winW(windowW), winH(windowH), vsyncEnabled(vsync) {}

MapRenderer::~MapRenderer() {
    shutdown();
}

bool MapRenderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1"); // linear; art is scaled with the zoom

    const std::string title = std::string(HEXWORLD_APPNAME) + " v" + HEXWORLD_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    pixfmt = SDL_AllocFormat(SDL_PIXELFORMAT_RGBA32);
    if (!pixfmt) {
        std::cerr << "SDL_AllocFormat failed\n";
        shutdown();
        return false;
    }

    hillOverlayTex = textureFromSprite(generateHillOverlay(kOverlayPx));
    mountainOverlayTex = textureFromSprite(generateMountainOverlay(kOverlayPx));
    if (!hillOverlayTex || !mountainOverlayTex) {
        std::cerr << "[render] procedural overlays unavailable: " << SDL_GetError() << "\n";
    }

    assets = std::make_unique<AssetRegistry>(
        [this](const std::string& path) { return loadImage(path); },
        [](const LoadedImage& img) {
            if (img.texture) SDL_DestroyTexture(img.texture);
        });

    initialized = true;
    return true;
}

void MapRenderer::shutdown() {
    // Registry textures belong to the renderer; release them first.
    assets.reset();
    artCache.clear();
    culler.invalidate();

    if (hillOverlayTex) { SDL_DestroyTexture(hillOverlayTex); hillOverlayTex = nullptr; }
    if (mountainOverlayTex) { SDL_DestroyTexture(mountainOverlayTex); mountainOverlayTex = nullptr; }

    if (pixfmt) { SDL_FreeFormat(pixfmt); pixfmt = nullptr; }
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }

    initialized = false;
}

void MapRenderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP);
}

void MapRenderer::setTitle(const std::string& title) {
    if (window) SDL_SetWindowTitle(window, title.c_str());
}

void MapRenderer::outputSize(int& w, int& h) const {
    w = winW;
    h = winH;
    if (renderer) SDL_GetRendererOutputSize(renderer, &w, &h);
}

SDL_Texture* MapRenderer::textureFromSprite(const SpritePixels& s) {
    if (!renderer || !pixfmt) return nullptr;

    SDL_Texture* tex = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STATIC, s.w, s.h);
    if (!tex) return nullptr;

    SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);

    std::vector<uint32_t> mapped;
    mapped.resize(static_cast<size_t>(s.w * s.h));

    for (int i = 0; i < s.w * s.h; ++i) {
        const Color& c = s.px[static_cast<size_t>(i)];
        mapped[static_cast<size_t>(i)] = SDL_MapRGBA(pixfmt, c.r, c.g, c.b, c.a);
    }

    SDL_UpdateTexture(tex, nullptr, mapped.data(), s.w * static_cast<int>(sizeof(uint32_t)));
    return tex;
}

std::optional<LoadedImage> MapRenderer::loadImage(const std::string& path) {
    if (!renderer) return std::nullopt;

    namespace fs = std::filesystem;
    fs::path full(path);
    if (full.is_relative() && !assetDir.empty()) full = fs::path(assetDir) / full;

    SDL_Surface* surf = SDL_LoadBMP(full.string().c_str());
    if (!surf) return std::nullopt;

    LoadedImage img;
    img.w = surf->w;
    img.h = surf->h;
    img.texture = SDL_CreateTextureFromSurface(renderer, surf);
    SDL_FreeSurface(surf);
    if (!img.texture) return std::nullopt;

    SDL_SetTextureBlendMode(img.texture, SDL_BLENDMODE_BLEND);
    return img;
}

void MapRenderer::loadArt(const TerrainConfig& cfg, const std::string& dir) {
    assetDir = dir;
    spriteTable = cfg.sprites;
    textureTable = cfg.textures;
    borderImage = cfg.borderImage;
    cornerNarrowImage = cfg.cornerNarrowImage;
    cornerWideImage = cfg.cornerWideImage;
    borderThickness = cfg.borderThickness;
    artCache.clear();

    if (!assets) return;
    assets->clear();

    const std::vector<std::string> paths = cfg.imagePaths();
    assets->requestAll(paths);
    if (!paths.empty()) std::cout << "[assets] queued " << paths.size() << " images\n";
}

const MapRenderer::ArtPaths& MapRenderer::artFor(const TerrainModel& model, const LayerValues& values) {
    const uint32_t key = packValues(values);
    auto it = artCache.find(key);
    if (it != artCache.end()) return it->second;

    const std::vector<std::string> keys = artCandidateKeys(model, values);
    ArtPaths paths;
    paths.sprite = resolveArtPaths(spriteTable, keys);
    paths.texture = resolveArtPaths(textureTable, keys);
    return artCache.emplace(key, std::move(paths)).first->second;
}

const std::vector<const Cell*>& MapRenderer::visibleCells(const HexMap& map, const Camera& cam) {
    return culler.visibleCells(map, cam);
}

void MapRenderer::renderFrame(const World& world, const Camera& cam, const RenderOptions& opt) {
    if (!renderer) return;

    if (assets) assets->pump(kLoadsPerFrame);

    SDL_SetRenderDrawColor(renderer, kBackground.r, kBackground.g, kBackground.b, 255);
    SDL_RenderClear(renderer);

    const HexMap& map = world.map();
    const std::vector<const Cell*>& cells = visibleCells(map, cam);

    stats = FrameStats{};
    stats.totalCells = map.size();
    stats.visibleCells = cells.size();
    stats.cullRecomputes = culler.recomputeCount();

    if (opt.debugView != DebugView::None) {
        drawDebug(world, cam, cells, opt.debugView);
    } else {
        const LodGates gates = lodGatesFor(cam.zoom, opt.lod);
        drawFills(world, cam, cells, gates.hexPolygons, gates.textures);
        if (gates.borders) drawCoast(world, cam, cells, opt.coastMapEdges);
        if (opt.showGrid && gates.grid) drawGrid(map, cam, cells);
        if (opt.hover) drawHighlight(map, cam, *opt.hover);
    }

    SDL_RenderPresent(renderer);
}

void MapRenderer::pushHex(const HexLayout& layout, const Camera& cam, const HexCoord& h, Color c) {
    const Vec2f center = hexToPixel(layout, h);
    const auto corners = hexCorners(layout, center);

    const int base = static_cast<int>(verts.size());
    verts.push_back(vertex(cam.worldToScreen(center.x, center.y), c));
    for (const Vec2f& p : corners) verts.push_back(vertex(cam.worldToScreen(p.x, p.y), c));
    for (int i = 0; i < 6; ++i) {
        indices.push_back(base);
        indices.push_back(base + 1 + i);
        indices.push_back(base + 1 + (i + 1) % 6);
    }
}

void MapRenderer::pushSquare(const HexLayout& layout, const Camera& cam, const HexCoord& h, Color c) {
    const Vec2f center = hexToPixel(layout, h);
    const Vec2f sc = cam.worldToScreen(center.x, center.y);
    const Vec2f he = hexHalfExtents(layout);
    const float half = std::max(he.x, he.y) * cam.zoom;

    const int base = static_cast<int>(verts.size());
    verts.push_back(vertex({ sc.x - half, sc.y - half }, c));
    verts.push_back(vertex({ sc.x + half, sc.y - half }, c));
    verts.push_back(vertex({ sc.x + half, sc.y + half }, c));
    verts.push_back(vertex({ sc.x - half, sc.y + half }, c));
    const int quad[6] = { 0, 1, 2, 0, 2, 3 };
    for (int q : quad) indices.push_back(base + q);
}

void MapRenderer::pushThickLine(const Vec2f& a, const Vec2f& b, float width, Color c) {
    const Vec2f dir = normalized(b - a);
    const Vec2f n = Vec2f{ -dir.y, dir.x } * (width * 0.5f);

    const int base = static_cast<int>(verts.size());
    verts.push_back(vertex(a + n, c));
    verts.push_back(vertex(b + n, c));
    verts.push_back(vertex(b - n, c));
    verts.push_back(vertex(a - n, c));
    const int quad[6] = { 0, 1, 2, 0, 2, 3 };
    for (int q : quad) indices.push_back(base + q);
}

void MapRenderer::pushDisc(const Vec2f& center, float radius, Color c) {
    constexpr int SEGMENTS = 10;
    const int base = static_cast<int>(verts.size());
    verts.push_back(vertex(center, c));
    for (int i = 0; i < SEGMENTS; ++i) {
        const float a = 2.0f * kPi * static_cast<float>(i) / static_cast<float>(SEGMENTS);
        verts.push_back(vertex({ center.x + std::cos(a) * radius, center.y + std::sin(a) * radius }, c));
    }
    for (int i = 0; i < SEGMENTS; ++i) {
        indices.push_back(base);
        indices.push_back(base + 1 + i);
        indices.push_back(base + 1 + (i + 1) % SEGMENTS);
    }
}

void MapRenderer::flushGeometry(SDL_Texture* tex) {
    if (!verts.empty() && !indices.empty()) {
        if (SDL_RenderGeometry(renderer, tex, verts.data(), static_cast<int>(verts.size()), indices.data(),
                               static_cast<int>(indices.size())) != 0) {
            std::cerr << "[render] SDL_RenderGeometry failed: " << SDL_GetError() << "\n";
        }
    }
    verts.clear();
    indices.clear();
}

void MapRenderer::drawTexturedHex(const HexLayout& layout, const Camera& cam, const HexCoord& h, SDL_Texture* tex) {
    if (!tex) return;

    const Vec2f center = hexToPixel(layout, h);
    const auto corners = hexCorners(layout, center);
    const Vec2f he = hexHalfExtents(layout);
    const float left = center.x - he.x;
    const float top = center.y - he.y;

    // UVs map the hex's bounding box onto the whole image.
    auto uv = [&](const Vec2f& p, float& u, float& v) {
        u = (p.x - left) / (2.0f * he.x);
        v = (p.y - top) / (2.0f * he.y);
    };

    float u = 0.0f, v = 0.0f;
    uv(center, u, v);
    verts.push_back(vertex(cam.worldToScreen(center.x, center.y), kWhite, u, v));
    for (const Vec2f& p : corners) {
        uv(p, u, v);
        verts.push_back(vertex(cam.worldToScreen(p.x, p.y), kWhite, u, v));
    }
    for (int i = 0; i < 6; ++i) {
        indices.push_back(0);
        indices.push_back(1 + i);
        indices.push_back(1 + (i + 1) % 6);
    }
    flushGeometry(tex);
}

void MapRenderer::drawDebug(const World& world, const Camera& cam, const std::vector<const Cell*>& cells,
                            DebugView view) {
    const HexLayout& layout = world.map().layout();
    for (const Cell* c : cells) pushHex(layout, cam, c->coord, debugColor(view, world.model(), *c));
    flushGeometry();
}

void MapRenderer::drawFills(const World& world, const Camera& cam, const std::vector<const Cell*>& cells, bool hexes,
                            bool textures) {
    const HexLayout& layout = world.map().layout();
    const TerrainModel& model = world.model();

    if (!hexes) {
        for (const Cell* c : cells) pushSquare(layout, cam, c->coord, c->terrain.color);
        flushGeometry();
        return;
    }

    // Pass 1: sprite where one is loaded, composite color otherwise. Hexes don't
    // overlap, so the batched solid fills can be flushed after the sprites.
    for (const Cell* c : cells) {
        const ArtPaths& art = artFor(model, c->layers);
        const LoadedImage* sprite = assets ? firstReadyImage(*assets, art.sprite) : nullptr;
        if (sprite) continue;
        pushHex(layout, cam, c->coord, c->terrain.color);
    }
    flushGeometry();

    for (const Cell* c : cells) {
        const ArtPaths& art = artFor(model, c->layers);
        const LoadedImage* sprite = assets ? firstReadyImage(*assets, art.sprite) : nullptr;
        if (sprite) drawTexturedHex(layout, cam, c->coord, sprite->texture);
    }

    if (!textures) return;

    // Pass 2: decoration overlay, never on top of a sprite.
    for (const Cell* c : cells) {
        const ArtPaths& art = artFor(model, c->layers);
        if (assets && firstReadyImage(*assets, art.sprite)) continue;

        if (const LoadedImage* tex = assets ? firstReadyImage(*assets, art.texture) : nullptr) {
            drawTexturedHex(layout, cam, c->coord, tex->texture);
            continue;
        }

        const ValueDef* height = model.value(LayerKind::Height, c->layers.get(LayerKind::Height));
        if (!height || c->terrain.water) continue;
        if (height->overlay == OverlayStyle::Hills) drawTexturedHex(layout, cam, c->coord, hillOverlayTex);
        else if (height->overlay == OverlayStyle::Mountains) drawTexturedHex(layout, cam, c->coord, mountainOverlayTex);
    }
}

void MapRenderer::drawCoast(const World& world, const Camera& cam, const std::vector<const Cell*>& cells,
                            bool mapEdges) {
    const HexMap& map = world.map();
    const HexLayout& layout = map.layout();

    const std::vector<CoastEdge> edges = collectCoastEdges(map, cells, mapEdges);
    stats.coastEdges = edges.size();
    if (edges.empty()) return;

    const LoadedImage* border = (assets && !borderImage.empty()) ? assets->get(borderImage) : nullptr;

    if (!border) {
        // Fallback: uniform rounded sand stroke.
        const float width = kSandWidth * cam.zoom;
        for (const CoastEdge& e : edges) {
            const Vec2f a = cam.worldToScreen(e.edge.a.x, e.edge.a.y);
            const Vec2f b = cam.worldToScreen(e.edge.b.x, e.edge.b.y);
            pushThickLine(a, b, width, kSandColor);
            pushDisc(a, width * 0.5f, kSandColor);
            pushDisc(b, width * 0.5f, kSandColor);
        }
        flushGeometry();
        return;
    }

    const float thickness = layout.size * borderThickness;
    std::vector<float> tileHeights;
    tileHeights.reserve(edges.size());

    for (const CoastEdge& e : edges) {
        const EdgeTiling t = tileEdge(e, thickness, border->w, border->h);
        tileHeights.push_back(t.tileH);

        const float w = t.tileW * cam.zoom;
        const float h = t.tileH * cam.zoom;
        const SDL_RendererFlip flip = t.flipV ? SDL_FLIP_VERTICAL : SDL_FLIP_NONE;
        for (const Vec2f& c : t.centers) {
            const Vec2f sc = cam.worldToScreen(c.x, c.y);
            const SDL_FRect dst{ sc.x - w * 0.5f, sc.y - h * 0.5f, w, h };
            SDL_RenderCopyExF(renderer, border->texture, nullptr, &dst, t.angleDeg, nullptr, flip);
        }
    }

    const LoadedImage* narrow = cornerNarrowImage.empty() ? nullptr : assets->get(cornerNarrowImage);
    const LoadedImage* wide = cornerWideImage.empty() ? nullptr : assets->get(cornerWideImage);
    if (!narrow && !wide) return;

    const std::vector<CornerJoin> joins = findCornerJoins(edges, tileHeights, sharedEdgeEpsilon(layout) * 2.0f);
    stats.cornerJoins = joins.size();

    for (const CornerJoin& j : joins) {
        const LoadedImage* img = (j.kind == CornerKind::Narrow) ? narrow : wide;
        if (!img) continue;
        const float s = j.size * cam.zoom;
        const Vec2f sc = cam.worldToScreen(j.pos.x, j.pos.y);
        const SDL_FRect dst{ sc.x - s * 0.5f, sc.y - s * 0.5f, s, s };
        SDL_RenderCopyExF(renderer, img->texture, nullptr, &dst, j.rotationDeg, nullptr, SDL_FLIP_NONE);
    }
}

void MapRenderer::drawGrid(const HexMap& map, const Camera& cam, const std::vector<const Cell*>& cells) {
    SDL_SetRenderDrawColor(renderer, kGridColor.r, kGridColor.g, kGridColor.b, kGridColor.a);
    const HexLayout& layout = map.layout();

    SDL_FPoint pts[7];
    for (const Cell* c : cells) {
        const auto corners = hexCorners(layout, hexToPixel(layout, c->coord));
        for (int i = 0; i < 6; ++i) {
            const Vec2f p = cam.worldToScreen(corners[static_cast<size_t>(i)].x, corners[static_cast<size_t>(i)].y);
            pts[i] = SDL_FPoint{ p.x, p.y };
        }
        pts[6] = pts[0];
        SDL_RenderDrawLinesF(renderer, pts, 7);
    }
}

void MapRenderer::drawHighlight(const HexMap& map, const Camera& cam, const HexCoord& h) {
    if (!map.contains(h)) return;
    pushHex(map.layout(), cam, h, kHighlight);
    flushGeometry();
}

std::string MapRenderer::saveScreenshotBMP(const std::string& directory, const std::string& prefix) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!directory.empty()) {
        fs::create_directories(fs::path(directory), ec);
    }

    // Timestamp for filename.
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    tm = *std::localtime(&t);
#endif

    std::ostringstream name;
    name << prefix << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".bmp";

    fs::path outPath = directory.empty() ? fs::path(name.str()) : fs::path(directory) / name.str();

    // Read back the current backbuffer.
    int w = 0, h = 0;
    if (SDL_GetRendererOutputSize(renderer, &w, &h) != 0) {
        w = winW;
        h = winH;
    }

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) return {};

    if (SDL_RenderReadPixels(renderer, nullptr, surface->format->format, surface->pixels, surface->pitch) != 0) {
        SDL_FreeSurface(surface);
        return {};
    }

    if (SDL_SaveBMP(surface, outPath.string().c_str()) != 0) {
        SDL_FreeSurface(surface);
        return {};
    }

    SDL_FreeSurface(surface);
    return outPath.string();
}
