/**
 * Balatro Joker Engine - Effect Implementation
 */

#include "effect.hpp"
#include "math_safe.hpp"

namespace balatro {

// ============================================================================
// EFFECT
// ============================================================================

Effect Effect::add_chips(int64_t amount) {
    Effect e;
    e.chips = amount;
    return e;
}

Effect Effect::add_mult(double amount) {
    Effect e;
    e.mult = amount;
    return e;
}

Effect Effect::times_mult(double factor) {
    Effect e;
    e.mult_multiplier = factor;
    return e;
}

Effect Effect::earn(int64_t amount) {
    Effect e;
    e.money = amount;
    return e;
}

Effect Effect::retrigger_times(uint32_t count) {
    Effect e;
    e.retrigger = count;
    return e;
}

Effect Effect::create(CreationKind kind, uint16_t count) {
    Effect e;
    e.creations.push_back({kind, count});
    return e;
}

bool Effect::is_identity() const {
    return chips == 0 && mult == 0.0 && mult_multiplier == 1.0 && money == 0 &&
           interest_bonus == 0 && retrigger == 0 && !destroy_self && !disable_boss_blind &&
           destroy_others.empty() && transform_cards.empty() && hand_size_mod == 0 &&
           discard_mod == 0 && hands_mod == 0 && sell_value_delta == 0 &&
           global_sell_value_delta == 0 && creations.empty();
}

namespace {

// Everything except the float fields, which callers handle with their own bounds
void combine_discrete(Effect& into, const Effect& from) {
    into.chips = math::saturating_add(into.chips, from.chips);
    into.money = math::saturating_add(into.money, from.money);
    into.interest_bonus = math::saturating_add(into.interest_bonus, from.interest_bonus);
    into.retrigger = math::saturating_add(into.retrigger, from.retrigger);
    into.destroy_self = into.destroy_self || from.destroy_self;
    into.disable_boss_blind = into.disable_boss_blind || from.disable_boss_blind;
    into.destroy_others.insert(into.destroy_others.end(),
                               from.destroy_others.begin(), from.destroy_others.end());
    into.transform_cards.insert(into.transform_cards.end(),
                                from.transform_cards.begin(), from.transform_cards.end());
    into.hand_size_mod = math::saturating_add(into.hand_size_mod, from.hand_size_mod);
    into.discard_mod = math::saturating_add(into.discard_mod, from.discard_mod);
    into.hands_mod = math::saturating_add(into.hands_mod, from.hands_mod);
    into.sell_value_delta = math::saturating_add(into.sell_value_delta, from.sell_value_delta);
    into.global_sell_value_delta =
        math::saturating_add(into.global_sell_value_delta, from.global_sell_value_delta);
    into.creations.insert(into.creations.end(), from.creations.begin(), from.creations.end());
    if (!from.message.empty()) {
        into.message = from.message;
    }
}

} // anonymous namespace

Effect combine(const Effect& a, const Effect& b) {
    Effect out = a;
    combine_discrete(out, b);
    out.mult = a.mult + b.mult;
    out.mult_multiplier = a.mult_multiplier * b.mult_multiplier;
    return out;
}

std::optional<std::string> validate_effect(const Effect& effect, uint32_t max_retriggers) {
    if (!math::is_finite(effect.mult)) {
        return std::string("non-finite mult");
    }
    if (!math::is_finite(effect.mult_multiplier)) {
        return std::string("non-finite mult multiplier");
    }
    if (effect.mult_multiplier < 0.0) {
        return std::string("negative mult multiplier");
    }
    if (effect.retrigger > max_retriggers) {
        return "retrigger count " + std::to_string(effect.retrigger) + " exceeds " +
               std::to_string(max_retriggers);
    }
    return std::nullopt;
}

// ============================================================================
// ACCUMULATOR
// ============================================================================

EffectAccumulator::EffectAccumulator(double max_mult) : max_mult_(max_mult) {}

bool EffectAccumulator::accumulate(const Effect& effect) {
    bool ok = true;
    combine_discrete(total_, effect);

    double mult = total_.mult + effect.mult;
    if (!math::is_finite(effect.mult) || !math::is_finite(mult)) {
        last_violation_ = "non-finite mult rejected";
        ok = false;
    } else {
        total_.mult = math::clamp(mult, -max_mult_, max_mult_);
    }

    double multiplier = total_.mult_multiplier * effect.mult_multiplier;
    if (!math::is_finite(effect.mult_multiplier) || !math::is_finite(multiplier)) {
        last_violation_ = "non-finite mult multiplier rejected";
        ok = false;
    } else if (effect.mult_multiplier < 0.0) {
        last_violation_ = "negative mult multiplier rejected";
        ok = false;
    } else {
        total_.mult_multiplier = math::clamp(multiplier, 0.0, max_mult_);
    }

    return ok;
}

void EffectAccumulator::reset() {
    total_ = Effect{};
    last_violation_.clear();
}

// ============================================================================
// APPLICATION
// ============================================================================

ScoreApplication apply_effect(const Effect& effect, int64_t base_chips, double base_mult,
                              int64_t wallet, double max_mult) {
    ScoreApplication out;

    out.chips = math::saturating_add(base_chips, effect.chips);
    if (out.chips < 0) out.chips = 0;

    double additive = base_mult + effect.mult;
    if (!math::is_finite(additive)) additive = base_mult;
    additive = math::clamp(additive, 0.0, max_mult);

    double multiplier = math::is_finite(effect.mult_multiplier) ? effect.mult_multiplier : 1.0;
    double mult = additive * math::clamp(multiplier, 0.0, max_mult);
    out.mult = math::clamp(mult, 0.0, max_mult);

    out.score = math::saturating_cast(static_cast<double>(out.chips) * out.mult);

    out.wallet = math::saturating_add(wallet, effect.money);
    if (out.wallet < 0) out.wallet = 0;

    return out;
}

} // namespace balatro
