/**
 * Economy Jokers
 *
 * Jokers that pay money or change sell values. Most pay out at the end of
 * the round; the rest pay per scoring or held card.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

// ============================================================================
// ROUND-END PAYOUTS
// ============================================================================

Effect golden_round_end(GameContext&, InternalJokerState&) {
    return Effect::earn(4);
}

Effect cloud_nine_round_end(GameContext& ctx, InternalJokerState&) {
    int nines = ctx.deck().nines;
    return nines > 0 ? Effect::earn(nines) : Effect{};
}

Effect satellite_round_end(GameContext& ctx, InternalJokerState&) {
    int planets = ctx.run().unique_planets_used;
    return planets > 0 ? Effect::earn(planets) : Effect{};
}

/**
 * Delayed Gratification: $2 per remaining discard if none were used.
 */
Effect delayed_round_end(GameContext& ctx, InternalJokerState&) {
    if (ctx.history().discards_this_round() > 0 || ctx.discards_remaining() <= 0) {
        return {};
    }
    return Effect::earn(2 * ctx.discards_remaining());
}

Effect rocket_round_end(GameContext&, InternalJokerState& state) {
    return Effect::earn(state.data_int("payout", 1));
}

Effect rocket_event(GameContext&, InternalJokerState& state, const GameEvent& event) {
    if (event.type == GameEventType::BOSS_DEFEATED) {
        state.set_data("payout", state.data_int("payout", 1) + 2);
    }
    return {};
}

Effect egg_round_end(GameContext&, InternalJokerState&) {
    Effect effect;
    effect.sell_value_delta = 3;
    return effect;
}

Effect gift_card_round_end(GameContext&, InternalJokerState&) {
    Effect effect;
    effect.global_sell_value_delta = 1;
    return effect;
}

Effect to_the_moon_round_end(GameContext&, InternalJokerState&) {
    Effect effect;
    effect.interest_bonus = 1;
    return effect;
}

// ============================================================================
// DISCARD PAYOUTS
// ============================================================================

Effect faceless_discard(GameContext& ctx, InternalJokerState&, const std::vector<Card>& discarded) {
    int faces = 0;
    for (const auto& card : discarded) {
        if (ctx.is_face(card)) ++faces;
    }
    return faces >= 3 ? Effect::earn(5) : Effect{};
}

/**
 * Trading Card: a first discard of exactly one card destroys it for $3.
 */
Effect trading_card_discard(GameContext& ctx, InternalJokerState&,
                            const std::vector<Card>& discarded) {
    if (ctx.history().discards_this_round() > 0 || discarded.size() != 1) {
        return {};
    }
    Effect effect = Effect::earn(3);
    effect.transform_cards.push_back({discarded.front().id, TransformKind::DESTROY,
                                      Enhancement::NONE, 0});
    return effect;
}

Effect mail_in_rebate_discard(GameContext&, InternalJokerState& state,
                              const std::vector<Card>& discarded) {
    int rank = state.data_int("rank", rank_value(Rank::ACE));
    int matches = 0;
    for (const auto& card : discarded) {
        if (!card.is_stone() && rank_value(card.rank) == rank) ++matches;
    }
    return matches > 0 ? Effect::earn(5 * matches) : Effect{};
}

Effect mail_in_rebate_round_end(GameContext& ctx, InternalJokerState& state) {
    if (!state.flag("fixed")) {
        state.set_data("rank", ctx.rng().range(rank_value(Rank::TWO), rank_value(Rank::ACE)));
    }
    return {};
}

// ============================================================================
// HAND PAYOUTS
// ============================================================================

Effect to_do_hand(GameContext& ctx, InternalJokerState& state, const Card*) {
    int target = state.data_int("hand", static_cast<int>(HandType::PAIR));
    return static_cast<int>(ctx.hand_type()) == target ? Effect::earn(4) : Effect{};
}

/**
 * To Do List: pick another poker hand among the base nine at round end.
 */
Effect to_do_round_end(GameContext& ctx, InternalJokerState& state) {
    if (state.flag("fixed")) {
        return {};
    }
    int current = state.data_int("hand", static_cast<int>(HandType::PAIR));
    int next = ctx.rng().range(0, static_cast<int>(HandType::STRAIGHT_FLUSH) - 1);
    if (next >= current) ++next;
    state.set_data("hand", next);
    return {};
}

bool boss_ability_triggered(const GameContext& ctx) {
    return ctx.run().blind == BlindKind::BOSS && ctx.run().boss_ability_triggered;
}

bool is_diamond(const GameContext& ctx, const Card& card) {
    return ctx.is_suit(card, Suit::DIAMONDS);
}

bool is_gold(const GameContext&, const Card& card) {
    return card.enhancement == Enhancement::GOLD;
}

/**
 * Reserved Parking: each face card held in hand has a 1 in 2 chance to
 * give $1.
 */
Effect reserved_parking_formula(GameContext& ctx, const Card*) {
    int64_t earned = 0;
    for (const auto& card : ctx.held_cards()) {
        if (card.debuffed || !ctx.is_face(card)) continue;
        for (int i = 0; i < held_activations(ctx); ++i) {
            if (ctx.rng().chance(1, 2)) ++earned;
        }
    }
    return earned > 0 ? Effect::earn(earned) : Effect{};
}

InternalJokerState with_data(const char* key, int value) {
    InternalJokerState state;
    state.set_data(key, value);
    state.version = 0;
    return state;
}

} // anonymous namespace

// ============================================================================
// REGISTRATION
// ============================================================================

void register_economy_jokers(JokerRegistry& registry) {
    add_advanced(registry, AdvancedJokerBuilder({JokerId::GOLDEN_JOKER, "Golden Joker",
            "Earn $4 at end of round", Rarity::COMMON, 6})
        .on_round_end(golden_round_end)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::CLOUD_NINE, "Cloud 9",
            "Earn $1 for each 9 in your full deck at end of round", Rarity::UNCOMMON, 7})
        .on_round_end(cloud_nine_round_end)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::SATELLITE, "Satellite",
            "Earn $1 at end of round per unique Planet card used this run", Rarity::UNCOMMON, 6})
        .on_round_end(satellite_round_end)
        .build(), reach_ante(4));

    add_advanced(registry, AdvancedJokerBuilder({JokerId::DELAYED_GRATIFICATION,
            "Delayed Gratification",
            "Earn $2 per discard if no discards are used by end of the round",
            Rarity::COMMON, 4})
        .on_round_end(delayed_round_end)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::ROCKET, "Rocket",
            "Earn $1 at end of round. Payout increases by $2 when Boss Blind is defeated",
            Rarity::UNCOMMON, 6})
        .on_round_end(rocket_round_end)
        .on_event(rocket_event)
        .initial_state(with_data("payout", 1))
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::EGG, "Egg",
            "Gains $3 of sell value at end of round", Rarity::COMMON, 4})
        .on_round_end(egg_round_end)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::GIFT_CARD, "Gift Card",
            "Add $1 of sell value to every Joker at end of round", Rarity::UNCOMMON, 6})
        .on_round_end(gift_card_round_end)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::TO_THE_MOON, "To the Moon",
            "Earn an extra $1 of interest for every $5 you have at end of round",
            Rarity::UNCOMMON, 5})
        .on_round_end(to_the_moon_round_end)
        .build(), reach_ante(5));

    add_advanced(registry, AdvancedJokerBuilder({JokerId::FACELESS_JOKER, "Faceless Joker",
            "Earn $5 if 3 or more face cards are discarded at the same time",
            Rarity::COMMON, 4})
        .on_discard(faceless_discard)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::TRADING_CARD, "Trading Card",
            "If first discard of round has only 1 card, destroy it and earn $3",
            Rarity::UNCOMMON, 6})
        .on_discard(trading_card_discard)
        .build());

    add_parameterized(registry, AdvancedJokerBuilder({JokerId::MAIL_IN_REBATE, "Mail-In Rebate",
            "Earn $5 for each discarded card of the chosen rank, rank changes every round",
            Rarity::COMMON, 4})
        .on_discard(mail_in_rebate_discard)
        .on_round_end(mail_in_rebate_round_end)
        .initial_state(with_data("rank", rank_value(Rank::ACE)))
        .build(), read_rank_argument);

    add_parameterized(registry, AdvancedJokerBuilder({JokerId::TO_DO_LIST, "To Do List",
            "Earn $4 if poker hand is the chosen hand, poker hand changes at end of round",
            Rarity::COMMON, 4})
        .on_hand(to_do_hand)
        .on_round_end(to_do_round_end)
        .initial_state(with_data("hand", static_cast<int>(HandType::PAIR)))
        .build(), read_hand_argument);

    add_static(registry, StaticJokerBuilder(JokerId::MATADOR)
        .name("Matador").description("Earn $8 if played hand triggers the Boss Blind ability")
        .rarity(Rarity::UNCOMMON).cost(7)
        .on_hand(boss_ability_triggered)
        .effect(Effect::earn(8))
        .build(), reach_ante(5));

    add_static(registry, StaticJokerBuilder(JokerId::RESERVED_PARKING)
        .name("Reserved Parking")
        .description("Each face card held in hand has a 1 in 2 chance to give $1")
        .rarity(Rarity::COMMON).cost(6)
        .formula(reserved_parking_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::ROUGH_GEM)
        .name("Rough Gem").description("Played cards with Diamond suit earn $1 when scored")
        .rarity(Rarity::UNCOMMON).cost(7)
        .on_card(is_diamond)
        .effect(Effect::earn(1))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::GOLDEN_TICKET)
        .name("Golden Ticket").description("Played Gold cards earn $4 when scored")
        .rarity(Rarity::COMMON).cost(5)
        .on_card(is_gold)
        .effect(Effect::earn(4))
        .build());
}

} // namespace jokers
} // namespace balatro
