/**
 * Balatro Joker Engine - Scaling Joker Framework
 *
 * Jokers with one number that grows or decays over the run (Green Joker,
 * Runner, Hologram, Popcorn, ...). The number lives in the JokerStateStore
 * under the joker's (id, slot) key, so it persists with the run rather than
 * with the instance.
 *
 * Hand-level and card-level growth is applied before the joker scores, so
 * the hand that grows Runner already benefits from it.
 */

#pragma once

#include "joker.hpp"
#include "static_joker.hpp"

#include <limits>
#include <vector>

namespace balatro {

enum class ScalingTrigger : uint8_t {
    HAND_PLAYED,     // Once per hand (optional hand predicate)
    CARD_SCORED,     // Once per matching scoring card
    DISCARD,         // Once per discard action
    CARD_DISCARDED,  // Once per matching discarded card
    ROUND_START,
    ROUND_END,
    GAME_EVENT       // Scaled by the event count
};

enum class ScalingOp : uint8_t {
    ADD,
    RESET
};

enum class ScalingTarget : uint8_t {
    CHIPS,
    MULT,
    X_MULT
};

struct ScalingRule {
    ScalingTrigger trigger = ScalingTrigger::HAND_PLAYED;
    ScalingOp op = ScalingOp::ADD;
    double amount = 0.0;
    HandPredicate hand_condition = nullptr;
    CardPredicate card_condition = nullptr;
    GameEventType event = GameEventType::PACK_OPENED;
};

struct ScalingJokerDef {
    JokerMeta meta;
    ScalingTarget target = ScalingTarget::MULT;
    double base_value = 0.0;
    std::vector<ScalingRule> rules;
    double min_value = std::numeric_limits<double>::lowest();
    double max_value = std::numeric_limits<double>::max();
    bool destroy_at_min = false;  // Self-destructs once the value reaches min_value
};

class ScalingJoker : public MetaJoker, public JokerGameplay, public JokerLifecycle {
public:
    explicit ScalingJoker(std::shared_ptr<const ScalingJokerDef> def);

    JokerGameplay* gameplay() override { return this; }
    JokerLifecycle* lifecycle() override { return this; }
    std::unique_ptr<Joker> clone() const override;

    Effect on_hand_played(GameContext& ctx) override;
    Effect on_card_scored(GameContext&, const Card&) override { return {}; }

    void on_acquired(GameContext& ctx) override;
    void on_destroyed(GameContext& ctx) override;
    Effect on_round_start(GameContext& ctx) override;
    Effect on_round_end(GameContext& ctx) override;
    Effect on_discard(GameContext& ctx, const std::vector<Card>& discarded) override;
    Effect on_game_event(GameContext& ctx, const GameEvent& event) override;

    /** Current value from the store (base value when nothing is stored). */
    double value(const GameContext& ctx) const;

    const ScalingJokerDef& definition() const { return *def_; }

private:
    double apply_rule(GameContext& ctx, const ScalingRule& rule, double value, double times) const;
    Effect run_trigger(GameContext& ctx, ScalingTrigger trigger);
    Effect store_value(GameContext& ctx, double value);
    Effect scoring_effect(double value) const;

    std::shared_ptr<const ScalingJokerDef> def_;
};

} // namespace balatro
