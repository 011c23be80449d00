/**
 * Balatro Joker Engine - Static Joker Framework Implementation
 */

#include "static_joker.hpp"

namespace balatro {

StaticJoker::StaticJoker(StaticJokerDef def) : MetaJoker(def.meta), def_(std::move(def)) {}

std::unique_ptr<Joker> StaticJoker::clone() const {
    return std::make_unique<StaticJoker>(def_);
}

Effect StaticJoker::produce(GameContext& ctx, const Card* card) const {
    if (def_.formula) {
        return def_.formula(ctx, card);
    }
    return def_.effect;
}

Effect StaticJoker::on_hand_played(GameContext& ctx) {
    if (def_.per_card) {
        return {};
    }
    if (def_.hand_condition && !def_.hand_condition(ctx)) {
        return {};
    }
    return produce(ctx, nullptr);
}

Effect StaticJoker::on_card_scored(GameContext& ctx, const Card& card) {
    if (!def_.per_card) {
        return {};
    }
    if (def_.hand_condition && !def_.hand_condition(ctx)) {
        return {};
    }
    if (def_.card_condition && !def_.card_condition(ctx, card)) {
        return {};
    }
    return produce(ctx, &card);
}

} // namespace balatro
