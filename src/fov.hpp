#pragma once
#include "dungeon.hpp"

#include <cstdint>
#include <vector>

// Line-of-sight service queried by the simulation. The core never computes
// visibility itself; it only asks "is (x,y) visible from the tracked origin".
class VisibilityQuery {
public:
    virtual ~VisibilityQuery() = default;

    // Rebuild the transparency map after a level is generated or loaded.
    virtual void reset(const Dungeon& dung) = 0;

    virtual void recompute(int originX, int originY, int radius, bool lightWalls) = 0;

    virtual bool isVisible(int x, int y) const = 0;
};

// Recursive shadowcasting over 8 octants.
// Reference: RogueBasin "Recursive Shadowcasting".
class ShadowcastFov final : public VisibilityQuery {
public:
    void reset(const Dungeon& dung) override;
    void recompute(int originX, int originY, int radius, bool lightWalls) override;
    bool isVisible(int x, int y) const override;

private:
    int width = 0;
    int height = 0;
    std::vector<uint8_t> opaque;
    std::vector<uint8_t> visible;

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }
    size_t idx(int x, int y) const { return static_cast<size_t>(y * width + x); }
    bool isOpaqueTile(int x, int y) const { return !inBounds(x, y) || opaque[idx(x, y)] != 0; }
};
