#pragma once
#include <cmath>
#include <cstdint>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(Vec2i a, Vec2i b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2i a, Vec2i b) { return !(a == b); }

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline bool operator==(Color a, Color b) { return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a; }

// Palette shared by the simulation (message colors, entity glyph colors) and the renderer.
namespace colors {
constexpr Color White{255, 255, 255, 255};
constexpr Color Red{255, 0, 0, 255};
constexpr Color DarkRed{128, 0, 0, 255};
constexpr Color Orange{255, 127, 0, 255};
constexpr Color DarkerOrange{127, 63, 0, 255};
constexpr Color Yellow{255, 255, 0, 255};
constexpr Color LightYellow{255, 255, 115, 255};
constexpr Color Green{0, 255, 0, 255};
constexpr Color LightGreen{115, 255, 115, 255};
constexpr Color DesaturatedGreen{63, 127, 63, 255};
constexpr Color DarkerGreen{0, 127, 0, 255};
constexpr Color LightCyan{115, 255, 255, 255};
constexpr Color LightBlue{115, 185, 255, 255};
constexpr Color Sky{0, 191, 255, 255};
constexpr Color Violet{127, 0, 255, 255};
constexpr Color LightViolet{185, 115, 255, 255};

// Map colors (lit = currently visible, dark = explored but out of sight).
constexpr Color DarkWall{0, 0, 100, 255};
constexpr Color LightWall{130, 110, 50, 255};
constexpr Color DarkGround{50, 50, 150, 255};
constexpr Color LightGround{200, 180, 50, 255};
} // namespace colors

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline float distance(Vec2i a, Vec2i b) {
    const int dx = b.x - a.x;
    const int dy = b.y - a.y;
    return std::sqrt(static_cast<float>(dx * dx + dy * dy));
}

// Programmer errors (bad indices, oversized menus) are not recoverable.
// Prints the reason to stderr and aborts the process.
[[noreturn]] void contractViolation(const char* what);
