#pragma once
#include "sdl.hpp"

#include "game.hpp"

#include <string>

class Renderer {
public:
    Renderer(int windowW, int windowH, int tileSize, int hudHeight, bool vsync);
    ~Renderer();

    bool init();
    void shutdown();

    // `mouseTileX/Y` is the map tile under the mouse (or -1) for the name tooltip.
    void render(const Game& game, const std::string& playerName, int mouseTileX, int mouseTileY);

    // Window controls
    void toggleFullscreen();

    // Input helpers
    // Converts a window pixel coordinate to a map tile coordinate.
    // Returns false if the coordinate is outside the map region.
    bool windowToMapTile(const Game& game, int winX, int winY, int& tileX, int& tileY) const;

private:
    int winW = 0;
    int winH = 0;
    int tile = 16;
    int hudH = 140;
    bool vsyncEnabled = false;

    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    void fillRect(const SDL_Rect& r, Color c);
    void drawPanel(const SDL_Rect& rect);

    void drawMap(const Game& game);
    void drawEntities(const Game& game);
    void drawHud(const Game& game, const std::string& playerName, int mouseTileX, int mouseTileY);
    void drawMenuOverlay(const Menu& menu);
    void drawCharacterOverlay(const Game& game);
    void drawTargetingOverlay(const Game& game);
    void drawGameOverOverlay();
};
