#include "dungeon.hpp"

#include "content.hpp"

#include <algorithm>

Dungeon::Dungeon(int w, int h) : width(w), height(h), tiles(static_cast<size_t>(std::max(0, w * h))) {}

bool Dungeon::isWall(int x, int y) const {
    if (!inBounds(x, y)) return true;
    return at(x, y).blocked;
}

bool Dungeon::isOpaque(int x, int y) const {
    if (!inBounds(x, y)) return true;
    return at(x, y).blockSight;
}

namespace {

void carveFloor(Dungeon& d, int x, int y) {
    if (!d.inBounds(x, y)) return;
    Tile& t = d.at(x, y);
    t.blocked = false;
    t.blockSight = false;
}

} // namespace

void Dungeon::carveRoom(const Room& room) {
    for (int y = room.y1 + 1; y < room.y2; ++y) {
        for (int x = room.x1 + 1; x < room.x2; ++x) {
            carveFloor(*this, x, y);
        }
    }
}

void Dungeon::carveHTunnel(int x1, int x2, int y) {
    for (int x = std::min(x1, x2); x <= std::max(x1, x2); ++x) {
        carveFloor(*this, x, y);
    }
}

void Dungeon::carveVTunnel(int y1, int y2, int x) {
    for (int y = std::min(y1, y2); y <= std::max(y1, y2); ++y) {
        carveFloor(*this, x, y);
    }
}

GeneratedLevel generateDungeon(const DungeonGenConfig& cfg, const ContentTables& content, int depth, RNG& rng) {
    GeneratedLevel out;
    out.dungeon = Dungeon(cfg.width, cfg.height);

    // A room needs at least one interior tile for its center to sit inside it.
    const int minSize = std::max(2, std::min(cfg.roomMinSize, cfg.roomMaxSize));
    const int maxSize = std::max(minSize, std::max(cfg.roomMinSize, cfg.roomMaxSize));

    for (int attempt = 0; attempt < cfg.maxRooms; ++attempt) {
        const int w = rng.range(minSize, maxSize);
        const int h = rng.range(minSize, maxSize);

        // Keep the whole rectangle (walls included) inside the map.
        const int maxX = cfg.width - w - 1;
        const int maxY = cfg.height - h - 1;
        if (maxX < 0 || maxY < 0) continue;

        const Room room = Room::fromSize(rng.range(0, maxX), rng.range(0, maxY), w, h);

        const bool overlaps = std::any_of(out.rooms.begin(), out.rooms.end(),
            [&](const Room& other) { return room.intersects(other); });
        if (overlaps) continue;

        out.dungeon.carveRoom(room);

        const Vec2i c = room.center();
        if (out.rooms.empty()) {
            // The player is placed here after generation; keep the tile free.
            out.playerStart = c;
        } else {
            const Vec2i prev = out.rooms.back().center();
            if (rng.coin()) {
                out.dungeon.carveHTunnel(prev.x, c.x, prev.y);
                out.dungeon.carveVTunnel(prev.y, c.y, c.x);
            } else {
                out.dungeon.carveVTunnel(prev.y, c.y, prev.x);
                out.dungeon.carveHTunnel(prev.x, c.x, c.y);
            }
        }

        populateRoom(room, out.dungeon, out.spawned, depth, content, rng, out.playerStart);

        out.rooms.push_back(room);
    }

    if (out.rooms.empty()) return out;

    out.stairs = out.rooms.back().center();
    out.spawned.push_back(makeStairs(out.stairs.x, out.stairs.y));
    return out;
}
