/**
 * Balatro Joker Engine - Legacy Joker Bridge Implementation
 */

#include "legacy_joker.hpp"

namespace balatro {

LegacyJokerAdapter::LegacyJokerAdapter(std::unique_ptr<LegacyJoker> legacy)
    : legacy_(std::move(legacy)) {}

std::unique_ptr<Joker> LegacyJokerAdapter::clone() const {
    return std::make_unique<LegacyJokerAdapter>(legacy_->clone());
}

Effect LegacyJokerAdapter::forward(LegacyEvent event, GameContext& ctx, const Card* card,
                                   const std::vector<Card>* cards,
                                   const GameEvent* game_event) {
    LegacyCall call;
    call.event = event;
    call.card = card;
    call.cards = cards;
    call.game_event = game_event;
    return legacy_->evaluate(call, ctx);
}

void LegacyJokerAdapter::on_acquired(GameContext& ctx) {
    forward(LegacyEvent::ACQUIRED, ctx);
}

Effect LegacyJokerAdapter::on_sold(GameContext& ctx) {
    return forward(LegacyEvent::SOLD, ctx);
}

void LegacyJokerAdapter::on_destroyed(GameContext& ctx) {
    forward(LegacyEvent::DESTROYED, ctx);
}

Effect LegacyJokerAdapter::on_round_start(GameContext& ctx) {
    return forward(LegacyEvent::BLIND_START, ctx);
}

Effect LegacyJokerAdapter::on_round_end(GameContext& ctx) {
    return forward(LegacyEvent::ROUND_END, ctx);
}

void LegacyJokerAdapter::on_roster_changed(GameContext& ctx) {
    forward(LegacyEvent::ROSTER_CHANGED, ctx);
}

Effect LegacyJokerAdapter::on_discard(GameContext& ctx, const std::vector<Card>& discarded) {
    return forward(LegacyEvent::DISCARD, ctx, nullptr, &discarded);
}

Effect LegacyJokerAdapter::on_game_event(GameContext& ctx, const GameEvent& event) {
    return forward(LegacyEvent::GAME_EVENT, ctx, nullptr, nullptr, &event);
}

Effect LegacyJokerAdapter::on_hand_played(GameContext& ctx) {
    return forward(LegacyEvent::HAND_PLAYED, ctx, nullptr, &ctx.played_cards());
}

Effect LegacyJokerAdapter::on_card_scored(GameContext& ctx, const Card& card) {
    return forward(LegacyEvent::CARD_SCORED, ctx, &card);
}

StateResult LegacyJokerAdapter::deserialize_state(const nlohmann::json& state) {
    std::string error;
    if (!legacy_->load_state(state, error)) {
        return StateResult::fail(error.empty() ? "legacy state rejected" : error);
    }
    return StateResult::ok();
}

std::unique_ptr<Joker> bridge_legacy(std::unique_ptr<LegacyJoker> legacy) {
    return std::make_unique<LegacyJokerAdapter>(std::move(legacy));
}

} // namespace balatro
