/**
 * Retrigger Jokers
 *
 * Jokers that make scoring cards score again. The pipeline caps each
 * request and the total per hand.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

bool final_hand(const GameContext& ctx) {
    return ctx.is_final_hand();
}

bool low_rank(const GameContext&, const Card& card) {
    return !card.is_stone() && card.rank >= Rank::TWO && card.rank <= Rank::FIVE;
}

bool face_card(const GameContext& ctx, const Card& card) {
    return ctx.is_face(card);
}

bool first_scored(const GameContext& ctx, const Card&) {
    return ctx.scoring_index() == 0;
}

/**
 * Seltzer: retrigger every card for the next 10 hands, then dissolve.
 */
Effect seltzer_hand(GameContext&, InternalJokerState& state, const Card*) {
    int64_t left = state.counter("hands_left");
    state.set_flag("active", left > 0);
    if (left <= 0) {
        return {};
    }
    Effect effect;
    if (state.increment("hands_left", -1) == 0) {
        effect.destroy_self = true;
        effect.message = "Drank!";
    }
    return effect;
}

Effect seltzer_card(GameContext&, InternalJokerState& state, const Card*) {
    return state.flag("active") ? Effect::retrigger_times(1) : Effect{};
}

} // anonymous namespace

void register_retrigger_jokers(JokerRegistry& registry) {
    add_static(registry, StaticJokerBuilder(JokerId::DUSK)
        .name("Dusk").description("Retrigger all played cards in final hand of round")
        .rarity(Rarity::UNCOMMON).cost(5)
        .on_card()
        .also_when(final_hand)
        .effect(Effect::retrigger_times(1))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::HACK)
        .name("Hack").description("Retrigger each played 2, 3, 4, or 5")
        .rarity(Rarity::UNCOMMON).cost(6)
        .on_card(low_rank)
        .effect(Effect::retrigger_times(1))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SOCK_AND_BUSKIN)
        .name("Sock and Buskin").description("Retrigger all played face cards")
        .rarity(Rarity::UNCOMMON).cost(6)
        .on_card(face_card)
        .effect(Effect::retrigger_times(1))
        .build(), reach_ante(3));

    add_static(registry, StaticJokerBuilder(JokerId::HANGING_CHAD)
        .name("Hanging Chad").description("Retrigger first played card used in scoring 2 additional times")
        .rarity(Rarity::COMMON).cost(4)
        .on_card(first_scored)
        .effect(Effect::retrigger_times(2))
        .build());

    InternalJokerState seltzer_state;
    seltzer_state.set_counter("hands_left", 10);
    seltzer_state.version = 0;
    add_advanced(registry, AdvancedJokerBuilder({JokerId::SELTZER, "Seltzer",
            "Retrigger all cards played for the next 10 hands", Rarity::UNCOMMON, 6})
        .on_hand(seltzer_hand)
        .on_card(seltzer_card)
        .initial_state(seltzer_state)
        .build());
}

} // namespace jokers
} // namespace balatro
