/**
 * Balatro Joker Engine - Seeded RNG
 *
 * Every random joker roll goes through one of these so that a run replays
 * identically from its seed. The engine derives a fresh stream per hand.
 */

#pragma once

#include <cstdint>
#include <random>

namespace balatro {

class ScopedRng {
public:
    explicit ScopedRng(uint64_t seed = 0) : seed_(seed) {
        rng_.seed(static_cast<std::mt19937::result_type>(seed ^ (seed >> 32)));
    }

    /**
     * Uniform integer in [lo, hi].
     */
    int range(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

    /**
     * "numerator in denominator" roll. The probability scale from Oops! All 6s
     * multiplies the numerator.
     */
    bool chance(int numerator, int denominator) {
        if (denominator <= 0) return false;
        int scaled = numerator * probability_scale_;
        if (scaled >= denominator) return true;
        return range(1, denominator) <= scaled;
    }

    void set_probability_scale(int scale) { probability_scale_ = scale < 1 ? 1 : scale; }
    int probability_scale() const { return probability_scale_; }
    uint64_t seed() const { return seed_; }

    /**
     * Mix a run seed with a per-event counter (splitmix64 finalizer).
     */
    static uint64_t derive(uint64_t seed, uint64_t stream) {
        uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (stream + 1);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

private:
    uint64_t seed_;
    int probability_scale_ = 1;
    std::mt19937 rng_;
};

} // namespace balatro
