#pragma once

#include "sdl.hpp"

#include "asset_registry.hpp"
#include "camera.hpp"
#include "coast_stitch.hpp"
#include "render_modes.hpp"
#include "terrain_sprites.hpp"
#include "viewport_cull.hpp"
#include "world.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct FrameStats {
    size_t totalCells = 0;
    size_t visibleCells = 0;
    size_t coastEdges = 0;
    size_t cornerJoins = 0;
    int cullRecomputes = 0;
};

class MapRenderer {
public:
    MapRenderer(int windowW, int windowH, bool vsync);
    ~MapRenderer();

    bool init();
    void shutdown();

    // Forgets previously requested art and queues every image `cfg` names.
    // Relative paths are resolved against assetDir.
    void loadArt(const TerrainConfig& cfg, const std::string& assetDir);

    // Draws one frame of `world` as seen through `cam` and presents it.
    void renderFrame(const World& world, const Camera& cam, const RenderOptions& opt);

    // The cached visible set (recomputed only when the culler goes stale).
    const std::vector<const Cell*>& visibleCells(const HexMap& map, const Camera& cam);

    // Window controls
    void toggleFullscreen();
    void setTitle(const std::string& title);
    void outputSize(int& w, int& h) const;

    // Screenshot helper: saves a BMP of the current frame.
    // Returns the full path written, or an empty string on failure.
    std::string saveScreenshotBMP(const std::string& directory, const std::string& prefix = "hexworld_shot") const;

    const FrameStats& lastFrameStats() const { return stats; }

private:
    struct ArtPaths {
        std::vector<std::string> sprite;
        std::vector<std::string> texture;
    };

    SDL_Texture* textureFromSprite(const SpritePixels& s);
    std::optional<LoadedImage> loadImage(const std::string& path);
    const ArtPaths& artFor(const TerrainModel& model, const LayerValues& values);

    void drawDebug(const World& world, const Camera& cam, const std::vector<const Cell*>& cells, DebugView view);
    void drawFills(const World& world, const Camera& cam, const std::vector<const Cell*>& cells, bool hexes,
                   bool textures);
    void drawCoast(const World& world, const Camera& cam, const std::vector<const Cell*>& cells, bool mapEdges);
    void drawGrid(const HexMap& map, const Camera& cam, const std::vector<const Cell*>& cells);
    void drawHighlight(const HexMap& map, const Camera& cam, const HexCoord& h);

    // Batched solid geometry (one SDL_RenderGeometry call per flush).
    void pushHex(const HexLayout& layout, const Camera& cam, const HexCoord& h, Color c);
    void pushSquare(const HexLayout& layout, const Camera& cam, const HexCoord& h, Color c);
    void pushThickLine(const Vec2f& a, const Vec2f& b, float width, Color c);
    void pushDisc(const Vec2f& center, float radius, Color c);
    void flushGeometry(SDL_Texture* tex = nullptr);
    void drawTexturedHex(const HexLayout& layout, const Camera& cam, const HexCoord& h, SDL_Texture* tex);

    int winW = 0;
    int winH = 0;
    bool vsyncEnabled = false;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_PixelFormat* pixfmt = nullptr;

    // Procedural decoration used when no texture image is configured.
    SDL_Texture* hillOverlayTex = nullptr;
    SDL_Texture* mountainOverlayTex = nullptr;

    std::unique_ptr<AssetRegistry> assets;
    std::string assetDir;
    std::string borderImage;
    std::string cornerNarrowImage;
    std::string cornerWideImage;
    float borderThickness = 0.28f;

    std::unordered_map<std::string, std::string> spriteTable;
    std::unordered_map<std::string, std::string> textureTable;
    // Art candidate paths per packed LayerValues tuple.
    std::unordered_map<uint32_t, ArtPaths> artCache;

    ViewportCuller culler;

    std::vector<SDL_Vertex> verts;
    std::vector<int> indices;

    FrameStats stats;
};
