#pragma once
#include "common.hpp"
#include "entity.hpp"
#include "rng.hpp"
#include <cstdint>
#include <vector>

struct ContentTables;

// New tiles start as solid wall; the generator carves floor out of them.
struct Tile {
    bool blocked = true;
    bool blockSight = true;
    // Set once the tile has been inside the player's field of view. Never reverts.
    bool explored = false;
};

// Axis-aligned rectangle. The walls are on the edges; the interior
// (x1, x2) x (y1, y2) is what gets carved.
struct Room {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    static Room fromSize(int x, int y, int w, int h) { return Room{x, y, x + w, y + h}; }

    Vec2i center() const { return Vec2i{(x1 + x2) / 2, (y1 + y2) / 2}; }

    // Inclusive bounds: rooms that share a wall line count as overlapping.
    bool intersects(const Room& o) const {
        return x1 <= o.x2 && x2 >= o.x1 && y1 <= o.y2 && y2 >= o.y1;
    }

    bool containsStrictly(Vec2i p) const {
        return p.x > x1 && p.x < x2 && p.y > y1 && p.y < y2;
    }
};

class Dungeon {
public:
    int width = 0;
    int height = 0;
    std::vector<Tile> tiles;

    Dungeon() = default;
    Dungeon(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    Tile& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    const Tile& at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    // Out-of-bounds counts as wall.
    bool isWall(int x, int y) const;
    bool isOpaque(int x, int y) const;

    void carveRoom(const Room& room);
    void carveHTunnel(int x1, int x2, int y);
    void carveVTunnel(int y1, int y2, int x);
};

struct DungeonGenConfig {
    int width = 80;
    int height = 43;
    int roomMinSize = 6;
    int roomMaxSize = 10;
    int maxRooms = 30;
};

// Output of one generation pass. `rooms` is only kept so callers (and tests)
// can inspect the layout; the game discards it once the level is installed.
struct GeneratedLevel {
    Dungeon dungeon;
    std::vector<Room> rooms;
    // Monsters and items in spawn order, followed by the stairs (if any room was accepted).
    std::vector<Entity> spawned;
    Vec2i playerStart{-1, -1};
    Vec2i stairs{-1, -1};

    // False when no room could be placed. There is no player start or stairs then.
    bool ok() const { return !rooms.empty(); }
};

GeneratedLevel generateDungeon(const DungeonGenConfig& cfg, const ContentTables& content, int depth, RNG& rng);
