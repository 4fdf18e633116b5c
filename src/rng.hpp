#pragma once
#include <cstdint>

// xorshift32. Same seed, same run on every platform; not for anything secret.
// Game owns the single instance the simulation draws from, and its state is
// part of the save file.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // Inclusive on both ends. An empty or inverted range yields `lo`.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        const uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    bool coin() { return (nextU32() & 1u) != 0u; }
};
