#include "sdl.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "content.hpp"
#include "game.hpp"
#include "keybinds.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "text_utils.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            uint32_t seed = 0;
            if (!parseSeed(argv[i + 1], seed)) {
                std::cerr << "Invalid seed (expected 0.." << UINT32_MAX << "): " << argv[i + 1] << "\n";
                return std::nullopt;
            }
            return seed;
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
        << TOMBCRAWL_APPNAME << " " << TOMBCRAWL_VERSION << "\n"
        << "Usage: " << (exe ? exe : "tombcrawl") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Start a new run with a specific seed\n"
        << "  --load               Load the save file on start (alias: --continue)\n"
        << "  --data-dir <path>    Override the save/config directory\n"
        << "  --content <file>     Load tuning overrides from an INI file\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

// Relative paths in settings are resolved against the data directory.
static std::filesystem::path resolveDataPath(const std::filesystem::path& baseDir, const std::string& p) {
    std::filesystem::path fp(p);
    if (fp.is_absolute()) return fp;
    return baseDir / fp;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "tombcrawl");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << TOMBCRAWL_APPNAME << " " << TOMBCRAWL_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Settings and saves live in a per-user writable directory unless overridden.
    const std::optional<std::string> dataDirArg = parseStringArg(argc, argv, "--data-dir");
    const bool resetSettings = hasFlag(argc, argv, "--reset-settings");

    std::filesystem::path baseDir;
    if (dataDirArg && !dataDirArg->empty()) {
        baseDir = std::filesystem::path(*dataDirArg);
    } else if (char* p = SDL_GetPrefPath("tombcrawl", TOMBCRAWL_APPNAME)) {
        baseDir = std::filesystem::path(p);
        SDL_free(p);
    } else {
        baseDir = std::filesystem::current_path();
    }

    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) std::cerr << "Could not create data directory " << baseDir.string() << ": " << ec.message() << "\n";
    }

    const std::filesystem::path settingsPathFs = baseDir / "tombcrawl_settings.ini";
    const std::string settingsPath = settingsPathFs.string();

    if (resetSettings || !std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Could not write default settings to " << settingsPath << "\n";
        }
    }

    std::string settingsWarnings;
    Settings settings = loadSettings(settingsPath, &settingsWarnings);
    if (!settingsWarnings.empty()) {
        std::cerr << "Settings warnings (" << settingsPath << "):\n" << settingsWarnings;
    }

    KeyBinds keyBinds = KeyBinds::defaults();
    keyBinds.loadOverridesFromIni(settingsPath);

    // Tuning: built-in tables, then the optional content file.
    ContentTables content;
    DungeonGenConfig gen;

    std::string contentFile = settings.contentFile;
    if (auto arg = parseStringArg(argc, argv, "--content")) contentFile = *arg;
    if (!contentFile.empty()) {
        const std::string contentPath = resolveDataPath(baseDir, contentFile).string();
        std::string contentWarnings;
        if (!loadContentIni(contentPath, content, gen, &contentWarnings)) {
            std::cerr << "Could not read content file " << contentPath << "; using built-in tables.\n";
        } else {
            std::cout << "Loaded content overrides from " << contentPath << "\n";
        }
        if (!contentWarnings.empty()) {
            std::cerr << "Content warnings (" << contentPath << "):\n" << contentWarnings;
        }
    }
    if (settings.fovRadius > 0) content.fovRadius = settings.fovRadius;

    const std::string savePath = resolveDataPath(baseDir, settings.saveFile).string();

    Game game;
    game.setContent(content, gen);

    const bool wantLoad = hasFlag(argc, argv, "--load") || hasFlag(argc, argv, "--continue");
    bool loaded = false;
    if (wantLoad) {
        loaded = game.loadFromFile(savePath);
        if (!loaded) std::cerr << "Could not load " << savePath << "; starting a new run.\n";
    }

    if (!loaded) {
        const std::optional<uint32_t> seedArg = parseSeedArg(argc, argv);
        const uint32_t seed = seedArg ? *seedArg : static_cast<uint32_t>(SDL_GetTicks()) ^ 0x9E3779B9u;
        if (!game.newGame(seed)) {
            std::cerr << "Dungeon generation failed (seed " << seed << "). Check the map and room settings.\n";
            SDL_Quit();
            return 1;
        }
        std::cout << "New run, seed " << seed << "\n";
    }

    const int tileSize = settings.tileSize;
    const int hudHeight = settings.hudHeight;
    const int winW = game.dungeon().width * tileSize;
    const int winH = game.dungeon().height * tileSize + hudHeight;

    Renderer renderer(winW, winH, tileSize, hudHeight, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }

    if (settings.startFullscreen) {
        renderer.toggleFullscreen();
    }

    int mouseTileX = -1;
    int mouseTileY = -1;

    bool running = true;
    while (running) {
        const uint32_t frameStart = SDL_GetTicks();

        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_KEYDOWN: {
                    const SDL_Keycode key = ev.key.keysym.sym;
                    const Uint16 mods = ev.key.keysym.mod;

                    if (keyBinds.mapKey(key, mods) == KeyAction::ToggleFullscreen) {
                        renderer.toggleFullscreen();
                        settings.startFullscreen = !settings.startFullscreen;
                        if (!updateIniKey(settingsPath, "start_fullscreen", settings.startFullscreen ? "true" : "false")) {
                            std::cerr << "Could not update " << settingsPath << "\n";
                        }
                        break;
                    }

                    // Escape with nothing open leaves the game.
                    const bool idle = game.state() == EngineState::AwaitingInput || game.isGameOver();
                    if (idle && !game.characterSheetOpen() && keyBinds.mapKey(key, mods) == KeyAction::Cancel) {
                        running = false;
                        break;
                    }

                    const Intent in = keyBinds.intentFor(game, key, mods);
                    if (in.kind != IntentKind::None) game.handleIntent(in);
                    break;
                }

                case SDL_MOUSEMOTION: {
                    int tx = -1;
                    int ty = -1;
                    if (!renderer.windowToMapTile(game, ev.motion.x, ev.motion.y, tx, ty)) {
                        mouseTileX = -1;
                        mouseTileY = -1;
                        break;
                    }
                    mouseTileX = tx;
                    mouseTileY = ty;
                    if (game.state() == EngineState::Targeting) {
                        game.handleIntent(Intent::targetTile(tx, ty));
                    }
                    break;
                }

                case SDL_MOUSEBUTTONDOWN: {
                    if (game.state() != EngineState::Targeting) break;

                    if (ev.button.button == SDL_BUTTON_RIGHT) {
                        game.handleIntent(Intent::of(IntentKind::Cancel));
                        break;
                    }
                    if (ev.button.button != SDL_BUTTON_LEFT) break;

                    int tx = -1;
                    int ty = -1;
                    if (!renderer.windowToMapTile(game, ev.button.x, ev.button.y, tx, ty)) break;
                    game.handleIntent(Intent::targetTile(tx, ty));
                    game.handleIntent(Intent::of(IntentKind::Confirm));
                    break;
                }

                default:
                    break;
            }
        }

        renderer.render(game, settings.playerName, mouseTileX, mouseTileY);

        // If vsync is enabled, SDL_RenderPresent will throttle naturally.
        if (!settings.vsync) {
            const uint32_t targetFrameMs = 16;
            const uint32_t frameTime = SDL_GetTicks() - frameStart;
            if (frameTime < targetFrameMs) {
                SDL_Delay(targetFrameMs - frameTime);
            } else {
                SDL_Delay(1);
            }
        }
    }

    // A finished run is not worth resuming.
    if (!game.isGameOver()) {
        if (game.saveToFile(savePath)) {
            std::cout << "Saved to " << savePath << "\n";
        } else {
            std::cerr << "Failed to save to " << savePath << "\n";
        }
    } else {
        std::error_code ec;
        std::filesystem::remove(savePath, ec);
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
