/**
 * Balatro Joker Engine - Conditional Joker Framework
 *
 * Jokers built from (Condition, Effect) rules. A Condition is a small value
 * tree: primitives over the hand, the run and the scored card, combined with
 * AND / OR / NOT.
 *
 * Example usage:
 *   // +8 Mult if the played hand contains a Pair
 *   ConditionalJokerBuilder(meta)
 *       .when_hand(Condition::hand_contains(HandType::PAIR), Effect::add_mult(8))
 *       .build();
 *
 *   // Flush played while holding at least $10
 *   Condition::all_of({Condition::hand_type_is(HandType::FLUSH),
 *                      Condition::money_at_least(10)});
 */

#pragma once

#include "joker.hpp"

#include <vector>

namespace balatro {

class Condition {
public:
    enum class Kind : uint8_t {
        ALWAYS,
        NEVER,
        // Hand
        HAND_TYPE_IS,
        HAND_CONTAINS,
        CARD_COUNT_AT_MOST,
        CARD_COUNT_EXACTLY,
        // Run
        MONEY_AT_LEAST,
        MONEY_AT_MOST,
        ANTE_AT_LEAST,
        ROUND_AT_LEAST,
        DISCARDS_REMAINING_AT_MOST,
        HANDS_REMAINING_AT_MOST,
        JOKER_COUNT_AT_LEAST,
        DECK_SIZE_AT_LEAST,
        // Scored card
        CARD_SUIT_IS,
        CARD_RANK_IS,
        CARD_IS_FACE,
        CARD_IS_EVEN,
        CARD_IS_ODD,
        CARD_HAS_ENHANCEMENT,
        CARD_IS_FIRST_SCORED,
        // Randomness
        CHANCE,
        // Combinators
        AND,
        OR,
        NOT
    };

    Condition() = default;

    static Condition always() { return Condition(Kind::ALWAYS); }
    static Condition never() { return Condition(Kind::NEVER); }
    static Condition hand_type_is(HandType t) { return Condition(Kind::HAND_TYPE_IS, hand_index(t)); }
    static Condition hand_contains(HandType t) { return Condition(Kind::HAND_CONTAINS, hand_index(t)); }
    static Condition card_count_at_most(int n) { return Condition(Kind::CARD_COUNT_AT_MOST, n); }
    static Condition card_count_exactly(int n) { return Condition(Kind::CARD_COUNT_EXACTLY, n); }
    static Condition money_at_least(int n) { return Condition(Kind::MONEY_AT_LEAST, n); }
    static Condition money_at_most(int n) { return Condition(Kind::MONEY_AT_MOST, n); }
    static Condition ante_at_least(int n) { return Condition(Kind::ANTE_AT_LEAST, n); }
    static Condition round_at_least(int n) { return Condition(Kind::ROUND_AT_LEAST, n); }
    static Condition discards_remaining_at_most(int n) {
        return Condition(Kind::DISCARDS_REMAINING_AT_MOST, n);
    }
    static Condition hands_remaining_at_most(int n) {
        return Condition(Kind::HANDS_REMAINING_AT_MOST, n);
    }
    static Condition joker_count_at_least(int n) { return Condition(Kind::JOKER_COUNT_AT_LEAST, n); }
    static Condition deck_size_at_least(int n) { return Condition(Kind::DECK_SIZE_AT_LEAST, n); }
    static Condition card_suit_is(Suit s) { return Condition(Kind::CARD_SUIT_IS, static_cast<int>(s)); }
    static Condition card_rank_is(Rank r) { return Condition(Kind::CARD_RANK_IS, rank_value(r)); }
    static Condition card_is_face() { return Condition(Kind::CARD_IS_FACE); }
    static Condition card_is_even() { return Condition(Kind::CARD_IS_EVEN); }
    static Condition card_is_odd() { return Condition(Kind::CARD_IS_ODD); }
    static Condition card_has_enhancement(Enhancement e) {
        return Condition(Kind::CARD_HAS_ENHANCEMENT, static_cast<int>(e));
    }
    static Condition card_is_first_scored() { return Condition(Kind::CARD_IS_FIRST_SCORED); }
    static Condition chance(int numerator, int denominator) {
        Condition c(Kind::CHANCE, numerator);
        c.second_ = denominator;
        return c;
    }

    static Condition all_of(std::vector<Condition> children);
    static Condition any_of(std::vector<Condition> children);
    static Condition negate(Condition child);

    /**
     * Evaluate against the context. Card primitives are false when no card
     * is given. CHANCE consumes a roll from the context RNG.
     */
    bool evaluate(GameContext& ctx, const Card* card) const;

    /** True if any primitive in the tree looks at the scored card. */
    bool uses_card() const;

    /** True if the tree contains a CHANCE roll. */
    bool is_random() const;

    /** Structural hash, stable for equal trees. */
    uint64_t structure_hash() const;

    Kind kind() const { return kind_; }
    const std::vector<Condition>& children() const { return children_; }

private:
    explicit Condition(Kind kind, int value = 0) : kind_(kind), value_(value) {}

    Kind kind_ = Kind::ALWAYS;
    int value_ = 0;
    int second_ = 0;
    std::vector<Condition> children_;
};

struct ConditionalRule {
    Condition condition;
    Effect effect;
    bool per_card = false;
};

class ConditionalJoker : public MetaJoker, public JokerGameplay {
public:
    ConditionalJoker(const JokerMeta& meta, std::vector<ConditionalRule> rules);

    JokerGameplay* gameplay() override { return this; }
    bool copyable() const override { return true; }
    std::unique_ptr<Joker> clone() const override;

    /** Every matching hand-level rule contributes, in rule order. */
    Effect on_hand_played(GameContext& ctx) override;

    /** Every matching per-card rule contributes, in rule order. */
    Effect on_card_scored(GameContext& ctx, const Card& card) override;

    const std::vector<ConditionalRule>& rules() const { return rules_; }

private:
    std::vector<ConditionalRule> rules_;
};

class ConditionalJokerBuilder {
public:
    explicit ConditionalJokerBuilder(const JokerMeta& meta) : meta_(meta) {}

    ConditionalJokerBuilder& when_hand(Condition condition, Effect effect) {
        rules_.push_back({std::move(condition), std::move(effect), false});
        return *this;
    }

    ConditionalJokerBuilder& when_card(Condition condition, Effect effect) {
        rules_.push_back({std::move(condition), std::move(effect), true});
        return *this;
    }

    std::unique_ptr<ConditionalJoker> build() const {
        return std::make_unique<ConditionalJoker>(meta_, rules_);
    }

    const JokerMeta& meta() const { return meta_; }
    const std::vector<ConditionalRule>& rules() const { return rules_; }

private:
    JokerMeta meta_;
    std::vector<ConditionalRule> rules_;
};

} // namespace balatro
