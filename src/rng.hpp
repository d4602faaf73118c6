#pragma once
#include <cstdint>
#include <limits>

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// One generator is owned by whoever drives a play session and is passed by
// reference to everything that rolls dice or resolves a percentage check.
// Tests construct their own with a fixed seed.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    float next01() {
        // [0,1)
        return (nextU32() / (static_cast<float>(std::numeric_limits<uint32_t>::max()) + 1.0f));
    }

    bool chance(float p) {
        return next01() < p;
    }
};

// Percentile roll used by every to-hit, evasion and resistance check.
inline int d100(RNG& rng) {
    return rng.range(1, 100);
}
