/**
 * Balatro Joker Engine - Conditional Joker Framework Implementation
 */

#include "conditional_joker.hpp"

namespace balatro {

// ============================================================================
// CONDITION
// ============================================================================

Condition Condition::all_of(std::vector<Condition> children) {
    Condition c(Kind::AND);
    c.children_ = std::move(children);
    return c;
}

Condition Condition::any_of(std::vector<Condition> children) {
    Condition c(Kind::OR);
    c.children_ = std::move(children);
    return c;
}

Condition Condition::negate(Condition child) {
    Condition c(Kind::NOT);
    c.children_.push_back(std::move(child));
    return c;
}

bool Condition::evaluate(GameContext& ctx, const Card* card) const {
    switch (kind_) {
        case Kind::ALWAYS:
            return true;
        case Kind::NEVER:
            return false;

        case Kind::HAND_TYPE_IS:
            return hand_index(ctx.hand_type()) == static_cast<size_t>(value_) &&
                   !ctx.played_cards().empty();
        case Kind::HAND_CONTAINS:
            return ctx.hand_contains(static_cast<HandType>(value_));
        case Kind::CARD_COUNT_AT_MOST:
            return static_cast<int>(ctx.played_cards().size()) <= value_;
        case Kind::CARD_COUNT_EXACTLY:
            return static_cast<int>(ctx.played_cards().size()) == value_;

        case Kind::MONEY_AT_LEAST:
            return ctx.money() >= value_;
        case Kind::MONEY_AT_MOST:
            return ctx.money() <= value_;
        case Kind::ANTE_AT_LEAST:
            return ctx.ante() >= value_;
        case Kind::ROUND_AT_LEAST:
            return ctx.round() >= value_;
        case Kind::DISCARDS_REMAINING_AT_MOST:
            return ctx.discards_remaining() <= value_;
        case Kind::HANDS_REMAINING_AT_MOST:
            return ctx.hands_remaining() <= value_;
        case Kind::JOKER_COUNT_AT_LEAST:
            return static_cast<int>(ctx.roster().size()) >= value_;
        case Kind::DECK_SIZE_AT_LEAST:
            return ctx.deck().full_deck_size >= value_;

        case Kind::CARD_SUIT_IS:
            return card && ctx.is_suit(*card, static_cast<Suit>(value_));
        case Kind::CARD_RANK_IS:
            return card && !card->is_stone() && rank_value(card->rank) == value_;
        case Kind::CARD_IS_FACE:
            return card && ctx.is_face(*card);
        case Kind::CARD_IS_EVEN:
            return card && card->is_even();
        case Kind::CARD_IS_ODD:
            return card && card->is_odd();
        case Kind::CARD_HAS_ENHANCEMENT:
            return card && card->enhancement == static_cast<Enhancement>(value_);
        case Kind::CARD_IS_FIRST_SCORED:
            return card && ctx.scoring_index() == 0;

        case Kind::CHANCE:
            return ctx.rng().chance(value_, second_);

        case Kind::AND:
            for (const auto& child : children_) {
                if (!child.evaluate(ctx, card)) return false;
            }
            return true;
        case Kind::OR:
            for (const auto& child : children_) {
                if (child.evaluate(ctx, card)) return true;
            }
            return false;
        case Kind::NOT:
            return children_.empty() || !children_[0].evaluate(ctx, card);
    }
    return false;
}

bool Condition::uses_card() const {
    switch (kind_) {
        case Kind::CARD_SUIT_IS:
        case Kind::CARD_RANK_IS:
        case Kind::CARD_IS_FACE:
        case Kind::CARD_IS_EVEN:
        case Kind::CARD_IS_ODD:
        case Kind::CARD_HAS_ENHANCEMENT:
        case Kind::CARD_IS_FIRST_SCORED:
            return true;
        default:
            break;
    }
    for (const auto& child : children_) {
        if (child.uses_card()) return true;
    }
    return false;
}

bool Condition::is_random() const {
    if (kind_ == Kind::CHANCE) return true;
    for (const auto& child : children_) {
        if (child.is_random()) return true;
    }
    return false;
}

uint64_t Condition::structure_hash() const {
    uint64_t h = 1469598103934665603ULL;
    auto mix = [&h](uint64_t v) {
        h ^= v;
        h *= 1099511628211ULL;
    };
    mix(static_cast<uint64_t>(kind_));
    mix(static_cast<uint64_t>(static_cast<uint32_t>(value_)));
    mix(static_cast<uint64_t>(static_cast<uint32_t>(second_)));
    for (const auto& child : children_) {
        mix(child.structure_hash());
    }
    return h;
}

// ============================================================================
// CONDITIONAL JOKER
// ============================================================================

ConditionalJoker::ConditionalJoker(const JokerMeta& meta, std::vector<ConditionalRule> rules)
    : MetaJoker(meta), rules_(std::move(rules)) {}

std::unique_ptr<Joker> ConditionalJoker::clone() const {
    return std::make_unique<ConditionalJoker>(meta_, rules_);
}

Effect ConditionalJoker::on_hand_played(GameContext& ctx) {
    Effect total;
    for (const auto& rule : rules_) {
        if (rule.per_card) continue;
        if (rule.condition.evaluate(ctx, nullptr)) {
            total = combine(total, rule.effect);
        }
    }
    return total;
}

Effect ConditionalJoker::on_card_scored(GameContext& ctx, const Card& card) {
    Effect total;
    for (const auto& rule : rules_) {
        if (!rule.per_card) continue;
        if (rule.condition.evaluate(ctx, &card)) {
            total = combine(total, rule.effect);
        }
    }
    return total;
}

} // namespace balatro
