/**
 * Balatro Joker Engine - Effect Value Type
 *
 * An Effect is what a joker hook hands back: chips and mult to add, a mult
 * multiplier, money, retriggers, and requests the game engine carries out
 * after scoring (destroy, transform, create). The default Effect is the
 * identity.
 *
 * Accumulation rules (EffectAccumulator):
 * - chips, money and all integer modifiers add with saturation
 * - additive mult sums, then clamps to [-max_mult, max_mult]
 * - the multiplier multiplies, then clamps to [0, max_mult]
 * - a non-finite float keeps the value from before that step and is flagged
 * - flags OR together, request lists concatenate, the last message wins
 */

#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace balatro {

constexpr double DEFAULT_MAX_MULT = 1000000.0;
constexpr uint32_t MAX_RETRIGGERS_PER_EFFECT = 10;

// ============================================================================
// DEFERRED REQUESTS
// ============================================================================

enum class TransformKind : uint8_t {
    SET_ENHANCEMENT,
    CLEAR_ENHANCEMENT,
    ADD_PERMANENT_CHIPS,
    DESTROY,
    COPY
};

struct CardTransform {
    uint32_t card_id = 0;
    TransformKind kind = TransformKind::SET_ENHANCEMENT;
    Enhancement enhancement = Enhancement::NONE;
    int amount = 0;
};

struct CreationRequest {
    CreationKind kind = CreationKind::TAROT;
    uint16_t count = 1;
};

// ============================================================================
// EFFECT
// ============================================================================

struct Effect {
    int64_t chips = 0;
    double mult = 0.0;
    double mult_multiplier = 1.0;
    int64_t money = 0;
    int32_t interest_bonus = 0;
    uint32_t retrigger = 0;

    bool destroy_self = false;
    bool disable_boss_blind = false;
    std::vector<InstanceId> destroy_others;  // Slots of sibling jokers to remove

    std::vector<CardTransform> transform_cards;
    int32_t hand_size_mod = 0;
    int32_t discard_mod = 0;
    int32_t hands_mod = 0;
    int32_t sell_value_delta = 0;         // Applied to the joker that produced it
    int32_t global_sell_value_delta = 0;  // Applied to every joker
    std::vector<CreationRequest> creations;

    std::string message;

    // Convenience constructors
    static Effect add_chips(int64_t amount);
    static Effect add_mult(double amount);
    static Effect times_mult(double factor);
    static Effect earn(int64_t amount);
    static Effect retrigger_times(uint32_t count);
    static Effect create(CreationKind kind, uint16_t count = 1);

    Effect& with_message(std::string text) {
        message = std::move(text);
        return *this;
    }

    bool is_identity() const;
};

/**
 * Field-wise combination without bounds. Used for per-hook results before
 * they reach the accumulator.
 */
Effect combine(const Effect& a, const Effect& b);

/**
 * Reject effects that are malformed regardless of context. Returns the
 * problem description, or nullopt when the effect is acceptable.
 */
std::optional<std::string> validate_effect(const Effect& effect,
                                           uint32_t max_retriggers = MAX_RETRIGGERS_PER_EFFECT);

// ============================================================================
// ACCUMULATOR
// ============================================================================

class EffectAccumulator {
public:
    explicit EffectAccumulator(double max_mult = DEFAULT_MAX_MULT);

    /**
     * Fold one effect into the running total with clamping.
     *
     * @return false if any field was rejected (non-finite or negative multiplier)
     */
    bool accumulate(const Effect& effect);

    const Effect& total() const { return total_; }
    double max_mult() const { return max_mult_; }
    const std::string& last_violation() const { return last_violation_; }
    void reset();

private:
    Effect total_;
    double max_mult_;
    std::string last_violation_;
};

// ============================================================================
// APPLICATION
// ============================================================================

/**
 * Result of applying an aggregate effect to the base score and the wallet.
 */
struct ScoreApplication {
    int64_t chips = 0;
    double mult = 0.0;
    int64_t score = 0;
    int64_t wallet = 0;
};

/**
 * Final application, in this order:
 *   mult  = min(max_mult, clamp(base_mult + effect.mult, 0, max_mult) * multiplier)
 *   chips = base_chips + effect.chips (saturating, floor 0)
 *   score = chips * mult (saturating)
 *   wallet = max(0, wallet + effect.money)
 */
ScoreApplication apply_effect(const Effect& effect, int64_t base_chips, double base_mult,
                              int64_t wallet, double max_mult = DEFAULT_MAX_MULT);

} // namespace balatro
