/**
 * Balatro Joker Engine - Scaling Joker Framework Implementation
 */

#include "scaling_joker.hpp"
#include "math_safe.hpp"

namespace balatro {

namespace {

constexpr const char* VALUE_FIELD = "value";

} // anonymous namespace

ScalingJoker::ScalingJoker(std::shared_ptr<const ScalingJokerDef> def)
    : MetaJoker(def->meta), def_(std::move(def)) {}

std::unique_ptr<Joker> ScalingJoker::clone() const {
    return std::make_unique<ScalingJoker>(def_);
}

double ScalingJoker::value(const GameContext& ctx) const {
    return ctx.state_store().get_number(ctx.current_key(), VALUE_FIELD, def_->base_value);
}

double ScalingJoker::apply_rule(GameContext& ctx, const ScalingRule& rule, double value,
                                double times) const {
    if (rule.hand_condition && !rule.hand_condition(ctx)) {
        return value;
    }
    if (rule.op == ScalingOp::RESET) {
        return def_->base_value;
    }
    double next = value + rule.amount * times;
    if (!math::is_finite(next)) {
        return value;
    }
    return math::clamp(next, def_->min_value, def_->max_value);
}

Effect ScalingJoker::store_value(GameContext& ctx, double value) {
    ctx.instance_state()[VALUE_FIELD] = value;
    Effect effect;
    if (def_->destroy_at_min && value <= def_->min_value) {
        effect.destroy_self = true;
        effect.message = std::string(meta_.name) + " is used up";
    }
    return effect;
}

Effect ScalingJoker::scoring_effect(double value) const {
    switch (def_->target) {
        case ScalingTarget::CHIPS:
            return value > 0.0 ? Effect::add_chips(math::saturating_cast(value)) : Effect{};
        case ScalingTarget::MULT:
            return value != 0.0 ? Effect::add_mult(value) : Effect{};
        case ScalingTarget::X_MULT:
            return value != 1.0 ? Effect::times_mult(value) : Effect{};
    }
    return {};
}

Effect ScalingJoker::on_hand_played(GameContext& ctx) {
    double v = value(ctx);
    double start = v;

    for (const auto& rule : def_->rules) {
        if (rule.trigger == ScalingTrigger::HAND_PLAYED) {
            v = apply_rule(ctx, rule, v, 1.0);
        } else if (rule.trigger == ScalingTrigger::CARD_SCORED) {
            int matches = 0;
            for (const auto& card : ctx.scoring_cards()) {
                if (!rule.card_condition || rule.card_condition(ctx, card)) ++matches;
            }
            if (matches > 0) v = apply_rule(ctx, rule, v, matches);
        }
    }

    Effect effect;
    if (v != start) {
        effect = store_value(ctx, v);
    }
    if (!effect.destroy_self) {
        effect = combine(effect, scoring_effect(v));
    }
    return effect;
}

Effect ScalingJoker::run_trigger(GameContext& ctx, ScalingTrigger trigger) {
    double v = value(ctx);
    double start = v;
    for (const auto& rule : def_->rules) {
        if (rule.trigger == trigger) {
            v = apply_rule(ctx, rule, v, 1.0);
        }
    }
    return v != start ? store_value(ctx, v) : Effect{};
}

void ScalingJoker::on_acquired(GameContext& ctx) {
    nlohmann::json& entry = ctx.instance_state();
    if (!entry.contains(VALUE_FIELD)) {
        entry[VALUE_FIELD] = def_->base_value;
    }
}

void ScalingJoker::on_destroyed(GameContext& ctx) {
    ctx.state_store().erase(ctx.current_key());
}

Effect ScalingJoker::on_round_start(GameContext& ctx) {
    return run_trigger(ctx, ScalingTrigger::ROUND_START);
}

Effect ScalingJoker::on_round_end(GameContext& ctx) {
    return run_trigger(ctx, ScalingTrigger::ROUND_END);
}

Effect ScalingJoker::on_discard(GameContext& ctx, const std::vector<Card>& discarded) {
    double v = value(ctx);
    double start = v;
    for (const auto& rule : def_->rules) {
        if (rule.trigger == ScalingTrigger::DISCARD) {
            v = apply_rule(ctx, rule, v, 1.0);
        } else if (rule.trigger == ScalingTrigger::CARD_DISCARDED) {
            int matches = 0;
            for (const auto& card : discarded) {
                if (!rule.card_condition || rule.card_condition(ctx, card)) ++matches;
            }
            if (matches > 0) v = apply_rule(ctx, rule, v, matches);
        }
    }
    return v != start ? store_value(ctx, v) : Effect{};
}

Effect ScalingJoker::on_game_event(GameContext& ctx, const GameEvent& event) {
    double v = value(ctx);
    double start = v;
    for (const auto& rule : def_->rules) {
        if (rule.trigger == ScalingTrigger::GAME_EVENT && rule.event == event.type) {
            v = apply_rule(ctx, rule, v, event.count);
        }
    }
    return v != start ? store_value(ctx, v) : Effect{};
}

} // namespace balatro
