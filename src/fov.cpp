#include "fov.hpp"

#include <algorithm>
#include <functional>

void ShadowcastFov::reset(const Dungeon& dung) {
    width = dung.width;
    height = dung.height;
    opaque.assign(static_cast<size_t>(std::max(0, width * height)), 0);
    visible.assign(opaque.size(), 0);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            opaque[idx(x, y)] = dung.at(x, y).blockSight ? 1 : 0;
        }
    }
}

bool ShadowcastFov::isVisible(int x, int y) const {
    if (!inBounds(x, y)) return false;
    return visible[idx(x, y)] != 0;
}

void ShadowcastFov::recompute(int px, int py, int radius, bool lightWalls) {
    std::fill(visible.begin(), visible.end(), 0);
    if (!inBounds(px, py)) return;

    auto markVis = [&](int x, int y) {
        if (!inBounds(x, y)) return;
        if (!lightWalls && isOpaqueTile(x, y)) return;
        visible[idx(x, y)] = 1;
    };

    // Always see your own tile
    visible[idx(px, py)] = 1;

    const int r2 = radius * radius;

    std::function<void(int, float, float, int, int, int, int)> castLight;
    castLight = [&](int row, float start, float end, int xx, int xy, int yx, int yy) {
        if (start < end) return;
        float newStart = start;
        for (int dist = row; dist <= radius; ++dist) {
            bool blocked = false;

            for (int dx = -dist, dy = -dist; dx <= 0; ++dx) {
                const float lSlope = (dx - 0.5f) / (dy + 0.5f);
                const float rSlope = (dx + 0.5f) / (dy - 0.5f);
                if (start < rSlope) continue;
                if (end > lSlope) break;

                const int ax = px + dx * xx + dy * xy;
                const int ay = py + dx * yx + dy * yy;

                if (!inBounds(ax, ay)) continue;
                const int d2 = (ax - px) * (ax - px) + (ay - py) * (ay - py);
                if (d2 <= r2) {
                    markVis(ax, ay);
                }

                if (blocked) {
                    if (isOpaqueTile(ax, ay)) {
                        newStart = rSlope;
                        continue;
                    }
                    blocked = false;
                    start = newStart;
                } else if (isOpaqueTile(ax, ay) && dist < radius) {
                    blocked = true;
                    castLight(dist + 1, start, lSlope, xx, xy, yx, yy);
                    newStart = rSlope;
                }
            }

            if (blocked) break;
        }
    };

    // Octant transforms
    castLight(1, 1.0f, 0.0f, 1, 0, 0, 1);
    castLight(1, 1.0f, 0.0f, 0, 1, 1, 0);
    castLight(1, 1.0f, 0.0f, 0, -1, 1, 0);
    castLight(1, 1.0f, 0.0f, -1, 0, 0, 1);
    castLight(1, 1.0f, 0.0f, -1, 0, 0, -1);
    castLight(1, 1.0f, 0.0f, 0, -1, -1, 0);
    castLight(1, 1.0f, 0.0f, 0, 1, -1, 0);
    castLight(1, 1.0f, 0.0f, 1, 0, 0, -1);
}
