/**
 * Balatro Joker Engine - Saturating Arithmetic
 *
 * Integer combination never wraps: every helper clamps at the type limits.
 * Float helpers reject NaN and infinities so callers can flag them.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

namespace balatro {
namespace math {

inline int64_t saturating_add(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return std::numeric_limits<int64_t>::max();
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return std::numeric_limits<int64_t>::min();
    }
    return a + b;
}

inline int32_t saturating_add(int32_t a, int32_t b) {
    int64_t sum = static_cast<int64_t>(a) + static_cast<int64_t>(b);
    if (sum > std::numeric_limits<int32_t>::max()) return std::numeric_limits<int32_t>::max();
    if (sum < std::numeric_limits<int32_t>::min()) return std::numeric_limits<int32_t>::min();
    return static_cast<int32_t>(sum);
}

inline uint32_t saturating_add(uint32_t a, uint32_t b) {
    if (a > std::numeric_limits<uint32_t>::max() - b) {
        return std::numeric_limits<uint32_t>::max();
    }
    return a + b;
}

inline int64_t saturating_mul(int64_t a, int64_t b) {
    if (a == 0 || b == 0) return 0;
    bool negative = (a < 0) != (b < 0);
    if (a == std::numeric_limits<int64_t>::min() || b == std::numeric_limits<int64_t>::min()) {
        return negative ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
    }
    int64_t abs_a = a < 0 ? -a : a;
    int64_t abs_b = b < 0 ? -b : b;
    if (abs_a > std::numeric_limits<int64_t>::max() / abs_b) {
        return negative ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
    }
    return a * b;
}

inline bool is_finite(double v) {
    return std::isfinite(v);
}

inline double clamp(double v, double lo, double hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

/**
 * Convert a double to int64, clamping at the limits. NaN becomes 0.
 */
inline int64_t saturating_cast(double v) {
    if (std::isnan(v)) return 0;
    // 2^63 is exactly representable; anything at or above it saturates
    if (v >= 9223372036854775808.0) return std::numeric_limits<int64_t>::max();
    if (v <= -9223372036854775808.0) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(v);
}

} // namespace math
} // namespace balatro
