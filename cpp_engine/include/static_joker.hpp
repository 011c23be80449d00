/**
 * Balatro Joker Engine - Static Joker Framework
 *
 * Stateless jokers described by data: metadata, a trigger (hand-level or
 * per scoring card), optional predicates and either a fixed Effect or a
 * formula over the context.
 *
 * Example usage:
 *   auto def = StaticJokerBuilder(JokerId::JOKER)
 *       .name("Joker")
 *       .description("+4 Mult")
 *       .rarity(Rarity::COMMON)
 *       .cost(2)
 *       .effect(Effect::add_mult(4))
 *       .build();
 */

#pragma once

#include "joker.hpp"

namespace balatro {

using HandPredicate = bool (*)(const GameContext& ctx);
using CardPredicate = bool (*)(const GameContext& ctx, const Card& card);
using EffectFormula = Effect (*)(GameContext& ctx, const Card* card);

struct StaticJokerDef {
    JokerMeta meta;
    bool per_card = false;
    HandPredicate hand_condition = nullptr;
    CardPredicate card_condition = nullptr;
    Effect effect;
    EffectFormula formula = nullptr;  // Overrides effect when set
    RuleModifiers modifiers;
    bool has_modifiers = false;
};

class StaticJoker : public MetaJoker, public JokerGameplay, public JokerModifiers {
public:
    explicit StaticJoker(StaticJokerDef def);

    JokerGameplay* gameplay() override { return this; }
    const JokerModifiers* modifiers() const override {
        return def_.has_modifiers ? this : nullptr;
    }
    bool copyable() const override { return true; }
    std::unique_ptr<Joker> clone() const override;

    Effect on_hand_played(GameContext& ctx) override;
    Effect on_card_scored(GameContext& ctx, const Card& card) override;
    RuleModifiers rule_modifiers() const override { return def_.modifiers; }

    const StaticJokerDef& definition() const { return def_; }

private:
    Effect produce(GameContext& ctx, const Card* card) const;

    StaticJokerDef def_;
};

/**
 * Fluent builder for StaticJokerDef.
 */
class StaticJokerBuilder {
public:
    explicit StaticJokerBuilder(JokerId id) { def_.meta.id = id; }

    StaticJokerBuilder& name(const char* n) { def_.meta.name = n; return *this; }
    StaticJokerBuilder& description(const char* d) { def_.meta.description = d; return *this; }
    StaticJokerBuilder& rarity(Rarity r) { def_.meta.rarity = r; return *this; }
    StaticJokerBuilder& cost(int c) { def_.meta.cost = c; return *this; }

    /** Trigger once per hand, optionally only when the predicate holds. */
    StaticJokerBuilder& on_hand(HandPredicate when = nullptr) {
        def_.per_card = false;
        def_.hand_condition = when;
        return *this;
    }

    /** Trigger per scoring card, optionally only for matching cards. */
    StaticJokerBuilder& on_card(CardPredicate when = nullptr) {
        def_.per_card = true;
        def_.card_condition = when;
        return *this;
    }

    StaticJokerBuilder& also_when(HandPredicate when) { def_.hand_condition = when; return *this; }
    StaticJokerBuilder& effect(Effect e) { def_.effect = std::move(e); return *this; }
    StaticJokerBuilder& formula(EffectFormula f) { def_.formula = f; return *this; }
    StaticJokerBuilder& modifiers(const RuleModifiers& m) {
        def_.modifiers = m;
        def_.has_modifiers = true;
        return *this;
    }

    StaticJokerDef build() const { return def_; }

private:
    StaticJokerDef def_;
};

} // namespace balatro
