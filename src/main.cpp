#include "sdl.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include "ini_utils.hpp"
#include "map_renderer.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "terrain_config.hpp"
#include "version.hpp"
#include "world.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            unsigned int v = 0;
            if (!parseUint32(argv[i + 1], v)) return std::nullopt;
            return static_cast<uint32_t>(v);
        }
    }
    return std::nullopt;
}

static std::optional<int> parseIntArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            int v = 0;
            if (!parseInt(argv[i + 1], v)) return std::nullopt;
            return v;
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << HEXWORLD_APPNAME << " " << HEXWORLD_VERSION << "\n"
        << "Usage: " << (exe ? exe : "hexworld") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Generate with a specific seed\n"
        << "  --width <n>          Map width in cells\n"
        << "  --height <n>         Map height in cells\n"
        << "  --random             Weighted random generator\n"
        << "  --noise              Noise field generator (default)\n"
        << "  --island             Push the map border toward water\n"
        << "  --flat               Flat-topped hexes\n"
        << "  --config <path>      Settings file (default: hexworld.ini next to the executable)\n"
        << "  --terrain <path>     Terrain override file\n"
        << "\n"
        << "Controls:\n"
        << "  drag / wheel         Pan / zoom\n"
        << "  G                    Toggle grid\n"
        << "  D                    Cycle debug views\n"
        << "  R                    Regenerate with a new seed\n"
        << "  M                    Toggle random/noise generator\n"
        << "  I                    Toggle island mode\n"
        << "  Home                 Reset camera\n"
        << "  F11 / F12            Fullscreen / screenshot\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static GenerationOptions optionsFromSettings(const Settings& s) {
    GenerationOptions opt;
    opt.seed = s.seed;
    opt.mode = s.generator;
    opt.orientation = s.orientation;
    opt.island = s.island;
    return opt;
}

static std::string describeCell(const World& world, const Cell& c) {
    std::ostringstream ss;
    ss << c.terrain.name << " [" << c.coord.q << "," << c.coord.r << "]";
    if (!c.terrain.water) ss << " move " << c.terrain.movementCost;
    if (c.terrain.buildable) ss << " buildable";
    ss << " (" << world.model().idOf(LayerKind::Height, c.layers.get(LayerKind::Height)) << "/"
       << world.model().idOf(LayerKind::Climate, c.layers.get(LayerKind::Climate)) << "/"
       << world.model().idOf(LayerKind::Vegetation, c.layers.get(LayerKind::Vegetation)) << ")";
    return ss.str();
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "hexworld");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << HEXWORLD_APPNAME << " " << HEXWORLD_VERSION << "\n";
        return 0;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Settings live next to the executable unless --config says otherwise.
    std::filesystem::path baseDir;
    if (char* p = SDL_GetBasePath()) {
        baseDir = std::filesystem::path(p);
        SDL_free(p);
    } else {
        baseDir = std::filesystem::current_path();
    }

    const std::optional<std::string> configArg = parseStringArg(argc, argv, "--config");
    const std::filesystem::path settingsPathFs =
        (configArg && !configArg->empty()) ? std::filesystem::path(*configArg) : baseDir / "hexworld.ini";
    const std::string settingsPath = settingsPathFs.string();
    const std::string screenshotDir = (baseDir / "screenshots").string();

    if (!std::filesystem::exists(settingsPathFs)) {
        if (writeDefaultSettings(settingsPath)) {
            std::cout << "[config] wrote default settings to " << settingsPath << "\n";
        }
    }

    std::string settingsWarnings;
    Settings settings = loadSettings(settingsPath, &settingsWarnings);
    if (!settingsWarnings.empty()) {
        std::cerr << "[config] " << settingsPath << ":\n" << settingsWarnings;
    }

    // Command line beats the settings file.
    if (const auto seed = parseSeedArg(argc, argv)) settings.seed = *seed;
    if (const auto w = parseIntArg(argc, argv, "--width")) settings.mapWidth = *w;
    if (const auto h = parseIntArg(argc, argv, "--height")) settings.mapHeight = *h;
    if (hasFlag(argc, argv, "--random")) settings.generator = GenerationMode::Random;
    if (hasFlag(argc, argv, "--noise")) settings.generator = GenerationMode::Noise;
    if (hasFlag(argc, argv, "--island")) settings.island = true;
    if (hasFlag(argc, argv, "--flat")) settings.orientation = HexOrientation::Flat;
    if (const auto t = parseStringArg(argc, argv, "--terrain")) settings.terrainConfig = *t;

    if (settings.seed == 0) settings.seed = static_cast<uint32_t>(SDL_GetTicks()) | 1u;

    // Terrain tables: built-in defaults plus the optional override file.
    TerrainConfig terrainCfg = defaultTerrainConfig();
    if (!settings.terrainConfig.empty()) {
        std::string warnings;
        if (!loadTerrainConfigIni(settings.terrainConfig, terrainCfg, &warnings)) {
            std::cerr << "[config] could not read terrain file " << settings.terrainConfig << "\n";
            SDL_Quit();
            return 1;
        }
        if (!warnings.empty()) std::cerr << "[config] " << settings.terrainConfig << ":\n" << warnings;
    }

    World world;
    {
        std::string errors;
        if (!world.init(terrainCfg, &errors)) {
            std::cerr << "[config] invalid terrain configuration:\n" << errors;
            SDL_Quit();
            return 1;
        }
    }

    GenerationOptions genOptions = optionsFromSettings(settings);
    {
        std::string errors;
        if (!world.generate(settings.mapWidth, settings.mapHeight, static_cast<float>(settings.cellSize), genOptions,
                            &errors)) {
            std::cerr << "[mapgen] generation failed:\n" << errors;
            SDL_Quit();
            return 1;
        }
    }

    MapRenderer renderer(settings.windowWidth, settings.windowHeight, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }
    renderer.loadArt(terrainCfg, settings.assetDir);

    if (settings.startFullscreen) {
        renderer.toggleFullscreen();
    }

    Camera cam;
    cam.minZoom = settings.minZoom;
    cam.maxZoom = settings.maxZoom;
    {
        int w = 0, h = 0;
        renderer.outputSize(w, h);
        cam.setViewportSize(w, h);
    }
    cam.centerOn(world.center());

    RenderOptions renderOpt;
    renderOpt.showGrid = settings.showGrid;
    renderOpt.coastMapEdges = settings.coastMapEdges;
    renderOpt.lod.squareZoom = settings.lodSquareZoom;
    renderOpt.lod.detailZoom = settings.lodDetailZoom;
    renderOpt.lod.gridZoom = settings.lodGridZoom;

    auto regenerate = [&]() {
        std::string errors;
        if (!world.generate(settings.mapWidth, settings.mapHeight, static_cast<float>(settings.cellSize), genOptions,
                            &errors)) {
            std::cerr << "[mapgen] generation failed:\n" << errors;
        }
        renderOpt.hover.reset();
    };

    const bool vsyncEnabled = settings.vsync;

    bool running = true;
    bool dragging = false;
    bool wantScreenshot = false;
    std::string lastTitle;

    while (running) {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_WINDOWEVENT:
                    if (ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                        int w = 0, h = 0;
                        renderer.outputSize(w, h);
                        cam.setViewportSize(w, h);
                    }
                    break;

                case SDL_MOUSEBUTTONDOWN:
                    if (ev.button.button == SDL_BUTTON_LEFT) dragging = true;
                    break;

                case SDL_MOUSEBUTTONUP:
                    if (ev.button.button == SDL_BUTTON_LEFT) dragging = false;
                    break;

                case SDL_MOUSEMOTION: {
                    if (dragging) cam.pan(static_cast<float>(ev.motion.xrel), static_cast<float>(ev.motion.yrel));
                    const Vec2f wp = cam.screenToWorld(static_cast<float>(ev.motion.x), static_cast<float>(ev.motion.y));
                    if (const Cell* c = world.cellAt(wp.x, wp.y)) renderOpt.hover = c->coord;
                    else renderOpt.hover.reset();
                    break;
                }

                case SDL_MOUSEWHEEL: {
                    if (ev.wheel.y == 0) break;
                    int mx = 0, my = 0;
                    SDL_GetMouseState(&mx, &my);
                    const float factor = (ev.wheel.y > 0) ? 1.1f : (1.0f / 1.1f);
                    cam.zoomBy(factor, static_cast<float>(mx), static_cast<float>(my));
                    break;
                }

                case SDL_KEYDOWN:
                    if (ev.key.repeat != 0) break;
                    switch (ev.key.keysym.sym) {
                        case SDLK_ESCAPE:
                            running = false;
                            break;
                        case SDLK_g:
                            renderOpt.showGrid = !renderOpt.showGrid;
                            settings.showGrid = renderOpt.showGrid;
                            if (!updateIniKey(settingsPath, "show_grid", renderOpt.showGrid ? "true" : "false")) {
                                std::cerr << "[config] failed to save show_grid\n";
                            }
                            break;
                        case SDLK_d:
                            renderOpt.debugView = nextDebugView(renderOpt.debugView);
                            std::cout << "[render] debug view: " << debugViewName(renderOpt.debugView) << "\n";
                            break;
                        case SDLK_r:
                            genOptions.seed = hashCombine(genOptions.seed, static_cast<uint32_t>(SDL_GetTicks()));
                            regenerate();
                            break;
                        case SDLK_m:
                            genOptions.mode = (genOptions.mode == GenerationMode::Noise) ? GenerationMode::Random
                                                                                         : GenerationMode::Noise;
                            regenerate();
                            break;
                        case SDLK_i:
                            genOptions.island = !genOptions.island;
                            regenerate();
                            break;
                        case SDLK_HOME:
                            cam.reset();
                            cam.centerOn(world.center());
                            break;
                        case SDLK_F11:
                            renderer.toggleFullscreen();
                            break;
                        case SDLK_F12:
                            wantScreenshot = true;
                            break;
                        default:
                            break;
                    }
                    break;

                default:
                    break;
            }
        }

        if (!running) break;

        renderer.renderFrame(world, cam, renderOpt);

        if (wantScreenshot) {
            const std::string outPath = renderer.saveScreenshotBMP(screenshotDir);
            if (!outPath.empty()) {
                std::cout << "[render] screenshot saved: " << outPath << "\n";
            } else {
                std::cerr << "[render] screenshot failed: " << SDL_GetError() << "\n";
            }
            wantScreenshot = false;
        }

        std::ostringstream title;
        title << HEXWORLD_APPNAME << " - seed " << genOptions.seed << " (" << generationModeName(genOptions.mode)
              << (genOptions.island ? ", island" : "") << ")";
        if (renderOpt.debugView != DebugView::None) title << " [" << debugViewName(renderOpt.debugView) << "]";
        if (renderOpt.hover) {
            if (const Cell* c = world.map().find(*renderOpt.hover)) title << " - " << describeCell(world, *c);
        }
        if (title.str() != lastTitle) {
            lastTitle = title.str();
            renderer.setTitle(lastTitle);
        }

        // Without vsync, yield a little to keep CPU usage sane.
        if (!vsyncEnabled) SDL_Delay(1);
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
