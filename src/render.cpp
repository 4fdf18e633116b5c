#include "render.hpp"
#include "ui_font.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>

namespace {

constexpr Color Black{0, 0, 0, 255};
constexpr Color HudText{220, 220, 220, 255};
constexpr Color Muted{160, 160, 170, 255};

bool entityShown(const Game& game, const Entity& e) {
    if (game.fov().isVisible(e.pos.x, e.pos.y)) return true;
    const Dungeon& d = game.dungeon();
    return e.alwaysVisible && d.inBounds(e.pos.x, e.pos.y) && d.at(e.pos.x, e.pos.y).explored;
}

} // namespace

Renderer::Renderer(int windowW, int windowH, int tileSize, int hudHeight, bool vsync)
    : winW(windowW), winH(windowH), tile(tileSize), hudH(hudHeight), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(TOMBCRAWL_APPNAME) + " v" + TOMBCRAWL_VERSION;
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

    // Keep a fixed "virtual" resolution and let SDL scale the final output.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    SDL_RenderSetIntegerScale(renderer, SDL_TRUE);

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    const Uint32 flags = SDL_GetWindowFlags(window);
    const bool isFs = (flags & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
    SDL_SetWindowFullscreen(window, isFs ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP);
}

bool Renderer::windowToMapTile(const Game& game, int winX, int winY, int& tileX, int& tileY) const {
    if (!renderer) return false;

    float lx = 0.0f, ly = 0.0f;
    SDL_RenderWindowToLogical(renderer, winX, winY, &lx, &ly);

    const int x = static_cast<int>(lx);
    const int y = static_cast<int>(ly);
    if (x < 0 || y < 0) return false;

    tileX = x / tile;
    tileY = y / tile;
    return game.dungeon().inBounds(tileX, tileY);
}

void Renderer::fillRect(const SDL_Rect& r, Color c) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_RenderFillRect(renderer, &r);
}

void Renderer::drawPanel(const SDL_Rect& rect) {
    fillRect(rect, Color{10, 10, 16, 225});
    SDL_SetRenderDrawColor(renderer, 120, 110, 80, 255);
    SDL_RenderDrawRect(renderer, &rect);
}

void Renderer::render(const Game& game, const std::string& playerName, int mouseTileX, int mouseTileY) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, Black.r, Black.g, Black.b, 255);
    SDL_RenderClear(renderer);

    drawMap(game);
    drawEntities(game);
    drawHud(game, playerName, mouseTileX, mouseTileY);

    if (game.state() == EngineState::Targeting) drawTargetingOverlay(game);
    if (game.state() == EngineState::InventoryMenu || game.state() == EngineState::LevelUp) {
        drawMenuOverlay(game.currentMenu());
    }
    if (game.characterSheetOpen()) drawCharacterOverlay(game);
    if (game.isGameOver()) drawGameOverOverlay();

    SDL_RenderPresent(renderer);
}

void Renderer::drawMap(const Game& game) {
    const Dungeon& d = game.dungeon();
    const VisibilityQuery& fov = game.fov();

    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            const Tile& t = d.at(x, y);
            const bool visible = fov.isVisible(x, y);
            if (!visible && !t.explored) continue;

            const bool wall = t.blockSight;
            Color c;
            if (visible) c = wall ? colors::LightWall : colors::LightGround;
            else c = wall ? colors::DarkWall : colors::DarkGround;

            fillRect(SDL_Rect{x * tile, y * tile, tile, tile}, c);
        }
    }
}

void Renderer::drawEntities(const Game& game) {
    const EntityStore& store = game.entities();
    const int scale = std::max(1, tile / 8);
    const int glyphW = 5 * scale;
    const int glyphH = 7 * scale;

    auto drawOne = [&](const Entity& e) {
        if (!entityShown(game, e)) return;
        const int px = e.pos.x * tile + (tile - glyphW) / 2;
        const int py = e.pos.y * tile + (tile - glyphH) / 2;
        drawText5x7(renderer, px, py, scale, e.color, std::string(1, e.glyph));
    };

    // Non-blocking things (items, corpses, stairs) underneath whatever stands on them.
    for (size_t i = 1; i < store.size(); ++i) {
        if (!store[i].blocks) drawOne(store[i]);
    }
    for (size_t i = 1; i < store.size(); ++i) {
        if (store[i].blocks) drawOne(store[i]);
    }
    drawOne(store.player());
}

void Renderer::drawHud(const Game& game, const std::string& playerName, int mouseTileX, int mouseTileY) {
    const int mapH = game.dungeon().height * tile;
    const int top = std::min(mapH, winH - hudH);
    fillRect(SDL_Rect{0, top, winW, winH - top}, Color{12, 12, 18, 255});

    const int scale = 2;
    const int lineH = 8 * scale + 2;
    const int barW = 20 * 6 * scale;

    // HP bar
    const Entity& p = game.player();
    const int hp = p.fighter ? std::max(0, p.fighter->hp) : 0;
    const int maxHp = std::max(1, game.playerMaxHp());
    const SDL_Rect bar{8, top + 8, barW, lineH};
    fillRect(bar, colors::DarkRed);
    fillRect(SDL_Rect{bar.x, bar.y, barW * std::min(hp, maxHp) / maxHp, lineH}, colors::Red);
    drawText5x7(renderer, bar.x + 4, bar.y + 1, scale, colors::White,
                "HP: " + std::to_string(hp) + "/" + std::to_string(maxHp));

    int y = bar.y + lineH + 6;
    drawText5x7(renderer, 8, y, scale, HudText, playerName);
    y += lineH;
    drawText5x7(renderer, 8, y, scale, HudText, "Dungeon level: " + std::to_string(game.depth()));
    y += lineH;
    const int xp = p.fighter ? p.fighter->xp : 0;
    drawText5x7(renderer, 8, y, scale, HudText,
                "Level " + std::to_string(p.level) + "  XP " + std::to_string(xp) + "/" + std::to_string(game.xpToNextLevel()));

    // Names under the mouse
    if (game.dungeon().inBounds(mouseTileX, mouseTileY) && game.fov().isVisible(mouseTileX, mouseTileY)) {
        std::string names;
        for (const Entity& e : game.entities()) {
            if (e.pos.x != mouseTileX || e.pos.y != mouseTileY) continue;
            if (!names.empty()) names += ", ";
            names += e.name;
        }
        if (!names.empty()) drawText5x7(renderer, 8, top + hudH - lineH - 4, scale, Muted, names);
    }

    // Newest messages at the bottom of the log panel.
    const int logX = barW + 24;
    const int logW = winW - logX - 8;
    const int maxLines = std::max(1, (hudH - 12) / lineH);
    const auto& msgs = game.log().messages();

    const int charsPerLine = std::max(1, logW / charAdvance5x7(scale));

    int lines = 0;
    int cy = top + hudH - 6;
    for (auto it = msgs.rbegin(); it != msgs.rend() && lines < maxLines; ++it) {
        const std::vector<std::string> wrapped = wrapText5x7(it->text, charsPerLine);
        const int needed = std::max(1, static_cast<int>(wrapped.size()));
        if (lines + needed > maxLines) break;
        cy -= needed * lineHeight5x7(scale);
        for (size_t i = 0; i < wrapped.size(); ++i) {
            drawText5x7(renderer, logX, cy + static_cast<int>(i) * lineHeight5x7(scale), scale, it->color, wrapped[i]);
        }
        lines += needed;
    }
}

void Renderer::drawMenuOverlay(const Menu& menu) {
    const int scale = 2;
    const int lineH = 8 * scale + 2;

    int width = textWidth5x7(menu.header, scale);
    for (size_t i = 0; i < menu.options.size(); ++i) {
        width = std::max(width, textWidth5x7("(a) " + menu.options[i], scale));
    }
    width = std::min(width + 24, winW - 16);
    const int height = static_cast<int>(menu.options.size() + 2) * lineH + 16;

    const SDL_Rect panel{(winW - width) / 2, std::max(8, (winH - hudH - height) / 2), width, height};
    drawPanel(panel);

    int y = panel.y + 8;
    drawText5x7(renderer, panel.x + 12, y, scale, colors::Yellow, menu.header);
    y += lineH * 2;
    for (size_t i = 0; i < menu.options.size(); ++i) {
        const char letter = static_cast<char>('a' + static_cast<int>(i));
        drawText5x7(renderer, panel.x + 12, y, scale, colors::White, std::string("(") + letter + ") " + menu.options[i]);
        y += lineH;
    }
}

void Renderer::drawCharacterOverlay(const Game& game) {
    const std::vector<std::string> lines = game.characterSheet();
    const int scale = 2;
    const int lineH = 8 * scale + 2;

    int width = 0;
    for (const auto& l : lines) width = std::max(width, textWidth5x7(l, scale));
    width += 24;
    const int height = static_cast<int>(lines.size()) * lineH + 16;

    const SDL_Rect panel{(winW - width) / 2, std::max(8, (winH - hudH - height) / 2), width, height};
    drawPanel(panel);

    int y = panel.y + 8;
    for (const auto& l : lines) {
        drawText5x7(renderer, panel.x + 12, y, scale, colors::White, l);
        y += lineH;
    }
}

void Renderer::drawTargetingOverlay(const Game& game) {
    const Vec2i c = game.targetCursor();
    const bool ok = game.fov().isVisible(c.x, c.y);
    const Color col = ok ? colors::Yellow : colors::Red;

    // Blast radius preview
    const int r = game.content().spells.fireballRadius;
    for (int y = c.y - r; y <= c.y + r; ++y) {
        for (int x = c.x - r; x <= c.x + r; ++x) {
            if (!game.dungeon().inBounds(x, y)) continue;
            if (distance(c, Vec2i{x, y}) > static_cast<float>(r)) continue;
            fillRect(SDL_Rect{x * tile, y * tile, tile, tile}, Color{255, 127, 0, 50});
        }
    }

    const SDL_Rect cur{c.x * tile, c.y * tile, tile, tile};
    SDL_SetRenderDrawColor(renderer, col.r, col.g, col.b, 255);
    SDL_RenderDrawRect(renderer, &cur);
}

void Renderer::drawGameOverOverlay() {
    const int scale = 4;
    const std::string text = "YOU DIED";
    const int w = textWidth5x7(text, scale);
    const int x = (winW - w) / 2;
    const int y = (winH - hudH) / 2 - 14;
    fillRect(SDL_Rect{x - 12, y - 12, w + 24, 7 * scale + 24}, Color{0, 0, 0, 200});
    drawText5x7(renderer, x, y, scale, colors::Red, text);
}
