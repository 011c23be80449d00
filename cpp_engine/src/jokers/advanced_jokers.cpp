/**
 * Advanced Jokers
 *
 * Jokers that keep their own counters or read the round history: Loyalty
 * Card, Card Sharp, Obelisk, Vampire, the round-start creators and the
 * jokers whose target suit or rank changes every round.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

Suit suit_of(const InternalJokerState& state) {
    return static_cast<Suit>(state.data_int("suit", static_cast<int>(Suit::SPADES)));
}

/**
 * Pick a different suit at the end of the round unless the suit was fixed
 * at construction.
 */
Effect reroll_suit(GameContext& ctx, InternalJokerState& state) {
    if (state.flag("fixed")) {
        return {};
    }
    int current = static_cast<int>(suit_of(state));
    int next = ctx.rng().range(0, 2);
    if (next >= current) ++next;
    state.set_data("suit", next);
    return {};
}

double x_mult_of(const InternalJokerState& state) {
    return state.data_number("x_mult", 1.0);
}

Effect x_mult_effect(const InternalJokerState& state) {
    double x = x_mult_of(state);
    return x > 1.0 ? Effect::times_mult(x) : Effect{};
}

/**
 * Room left in the joker slots for created jokers.
 */
int free_joker_slots(const GameContext& ctx) {
    int room = ctx.run().joker_slots - static_cast<int>(ctx.roster().size());
    return room > 0 ? room : 0;
}

// ============================================================================
// HAND AND CARD PROCESSORS
// ============================================================================

/**
 * Loyalty Card: X4 Mult every 6 hands played.
 */
Effect loyalty_hand(GameContext&, InternalJokerState& state, const Card*) {
    int64_t played = state.increment("hands_played");
    return played % 6 == 0 ? Effect::times_mult(4).with_message("Loyalty!") : Effect{};
}

/**
 * Obelisk: grows while the most played hand is avoided, resets when it is
 * played.
 */
Effect obelisk_hand(GameContext& ctx, InternalJokerState& state, const Card*) {
    static const AdvancedCondition most_played = AdvancedCondition::hand_is_most_played();
    if (most_played.evaluate(ctx, state, nullptr)) {
        state.set_data("x_mult", 1.0);
        return {};
    }
    state.set_data("x_mult", x_mult_of(state) + 0.2);
    return x_mult_effect(state);
}

/**
 * Vampire: X0.1 per scoring enhanced card, which loses its enhancement.
 */
Effect vampire_hand(GameContext& ctx, InternalJokerState& state, const Card*) {
    Effect effect;
    int drained = 0;
    for (const auto& card : ctx.scoring_cards()) {
        if (card.enhancement == Enhancement::NONE || card.debuffed) continue;
        ++drained;
        effect.transform_cards.push_back({card.id, TransformKind::CLEAR_ENHANCEMENT,
                                          Enhancement::NONE, 0});
    }
    if (drained > 0) {
        state.set_data("x_mult", x_mult_of(state) + 0.1 * drained);
    }
    return combine(effect, x_mult_effect(state));
}

Effect dna_hand(GameContext& ctx, InternalJokerState&, const Card*) {
    Effect effect;
    effect.transform_cards.push_back({ctx.played_cards().front().id, TransformKind::COPY,
                                      Enhancement::NONE, 0});
    effect.message = "Copied!";
    return effect;
}

Effect sixth_sense_hand(GameContext& ctx, InternalJokerState&, const Card*) {
    const Card& card = ctx.played_cards().front();
    if (card.is_stone() || card.rank != Rank::SIX) {
        return {};
    }
    Effect effect = Effect::create(CreationKind::SPECTRAL);
    effect.transform_cards.push_back({card.id, TransformKind::DESTROY, Enhancement::NONE, 0});
    return effect;
}

Effect card_sharp_hand(GameContext&, InternalJokerState&, const Card*) {
    return Effect::times_mult(3);
}

Effect ancient_card(GameContext& ctx, InternalJokerState& state, const Card* card) {
    return ctx.is_suit(*card, suit_of(state)) ? Effect::times_mult(1.5) : Effect{};
}

Effect idol_card(GameContext& ctx, InternalJokerState& state, const Card* card) {
    if (card->is_stone() || rank_value(card->rank) != state.data_int("rank", 14)) {
        return {};
    }
    return ctx.is_suit(*card, suit_of(state)) ? Effect::times_mult(2) : Effect{};
}

Effect counter_mult_hand(GameContext&, InternalJokerState& state, const Card*) {
    int64_t mult = state.counter("mult");
    return mult > 0 ? Effect::add_mult(static_cast<double>(mult)) : Effect{};
}

Effect counter_chips_hand(GameContext&, InternalJokerState& state, const Card*) {
    int64_t chips = state.counter("chips");
    return chips > 0 ? Effect::add_chips(chips) : Effect{};
}

Effect x_mult_hand(GameContext&, InternalJokerState& state, const Card*) {
    return x_mult_effect(state);
}

// ============================================================================
// LIFECYCLE HOOKS
// ============================================================================

/**
 * Ceremonial Dagger: destroy the joker to the right and add double its
 * sell value to this joker's Mult.
 */
Effect dagger_round_start(GameContext& ctx, InternalJokerState& state) {
    size_t right = ctx.position() + 1;
    if (right >= ctx.roster().size()) {
        return {};
    }
    const RosterEntry& target = ctx.roster()[right];
    state.increment("mult", 2 * target.sell_value);

    Effect effect;
    effect.destroy_others.push_back(target.slot);
    return effect;
}

/**
 * Madness: on Small and Big Blinds gain X0.5 Mult and destroy a random
 * other joker.
 */
Effect madness_round_start(GameContext& ctx, InternalJokerState& state) {
    if (ctx.run().blind == BlindKind::BOSS) {
        return {};
    }
    state.set_data("x_mult", x_mult_of(state) + 0.5);

    std::vector<InstanceId> others;
    for (size_t i = 0; i < ctx.roster().size(); ++i) {
        if (i != ctx.position()) others.push_back(ctx.roster()[i].slot);
    }
    Effect effect;
    if (!others.empty()) {
        int pick = ctx.rng().range(0, static_cast<int>(others.size()) - 1);
        effect.destroy_others.push_back(others[pick]);
    }
    return effect;
}

Effect burglar_round_start(GameContext& ctx, InternalJokerState&) {
    Effect effect;
    effect.hands_mod = 3;
    effect.discard_mod = -ctx.discards_remaining();
    return effect;
}

Effect riff_raff_round_start(GameContext& ctx, InternalJokerState&) {
    int room = free_joker_slots(ctx);
    if (room == 0) {
        return {};
    }
    return Effect::create(CreationKind::JOKER, static_cast<uint16_t>(room < 2 ? room : 2));
}

Effect idol_round_end(GameContext& ctx, InternalJokerState& state) {
    if (state.flag("fixed")) {
        return {};
    }
    state.set_data("rank", ctx.rng().range(2, 14));
    state.set_data("suit", ctx.rng().range(0, 3));
    return {};
}

Effect castle_discard(GameContext& ctx, InternalJokerState& state,
                      const std::vector<Card>& discarded) {
    int matches = 0;
    for (const auto& card : discarded) {
        if (ctx.is_suit(card, suit_of(state))) ++matches;
    }
    if (matches > 0) {
        state.increment("chips", 3 * matches);
    }
    return {};
}

Effect yorick_discard(GameContext&, InternalJokerState& state,
                      const std::vector<Card>& discarded) {
    int64_t total = state.increment("discarded", static_cast<int64_t>(discarded.size()));
    state.set_data("x_mult", 1.0 + static_cast<double>(total / 23));
    return {};
}

Effect burnt_discard(GameContext& ctx, InternalJokerState&, const std::vector<Card>&) {
    if (ctx.history().discards_this_round() > 0) {
        return {};
    }
    return Effect::create(CreationKind::HAND_LEVEL_UP);
}

Effect invisible_sold(GameContext& ctx, InternalJokerState& state) {
    if (state.counter("rounds") < 2 || ctx.roster().size() < 2) {
        return {};
    }
    return Effect::create(CreationKind::JOKER).with_message("Duplicated!");
}

Effect luchador_sold(GameContext& ctx, InternalJokerState&) {
    if (ctx.run().blind != BlindKind::BOSS) {
        return {};
    }
    Effect effect;
    effect.disable_boss_blind = true;
    return effect;
}

Effect hallucination_event(GameContext& ctx, InternalJokerState&, const GameEvent& event) {
    if (event.type != GameEventType::PACK_OPENED || !ctx.rng().chance(1, 2)) {
        return {};
    }
    return Effect::create(CreationKind::TAROT);
}

Effect perkeo_event(GameContext&, InternalJokerState&, const GameEvent& event) {
    if (event.type != GameEventType::SHOP_EXITED) {
        return {};
    }
    return Effect::create(CreationKind::CONSUMABLE_COPY);
}

InternalJokerState initial_data(const char* key, nlohmann::json value) {
    InternalJokerState state;
    state.set_data(key, std::move(value));
    state.version = 0;
    return state;
}

} // anonymous namespace

// ============================================================================
// REGISTRATION
// ============================================================================

void register_advanced_jokers(JokerRegistry& registry) {
    add_advanced(registry, AdvancedJokerBuilder({JokerId::CEREMONIAL_DAGGER, "Ceremonial Dagger",
            "When Blind is selected, destroy Joker to the right and permanently add double its sell value to this Mult",
            Rarity::UNCOMMON, 6})
        .on_round_start(dagger_round_start)
        .on_hand(counter_mult_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::LOYALTY_CARD, "Loyalty Card",
            "X4 Mult every 6 hands played", Rarity::UNCOMMON, 5})
        .on_hand(loyalty_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::DNA, "DNA",
            "If first hand of round has only 1 card, add a permanent copy to deck",
            Rarity::RARE, 8})
        .when(AdvancedCondition::all_of({AdvancedCondition::first_hand_of_round(),
                                         Condition::card_count_exactly(1)}))
        .on_hand(dna_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::SIXTH_SENSE, "Sixth Sense",
            "If first hand of round is a single 6, destroy it and create a Spectral card",
            Rarity::UNCOMMON, 6})
        .when(AdvancedCondition::all_of({AdvancedCondition::first_hand_of_round(),
                                         Condition::card_count_exactly(1)}))
        .on_hand(sixth_sense_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::CARD_SHARP, "Card Sharp",
            "X3 Mult if played poker hand has already been played this round",
            Rarity::UNCOMMON, 6})
        .when(AdvancedCondition::hand_already_played_this_round())
        .on_hand(card_sharp_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::MADNESS, "Madness",
            "When Small or Big Blind is selected, gain X0.5 Mult and destroy a random Joker",
            Rarity::UNCOMMON, 7})
        .on_round_start(madness_round_start)
        .on_hand(x_mult_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::VAMPIRE, "Vampire",
            "This Joker gains X0.1 Mult per scoring Enhanced card played, removes card Enhancement",
            Rarity::UNCOMMON, 7})
        .on_hand(vampire_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::OBELISK, "Obelisk",
            "This Joker gains X0.2 Mult per consecutive hand played without playing your most played poker hand",
            Rarity::RARE, 8})
        .on_hand(obelisk_hand)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::YORICK, "Yorick",
            "This Joker gains X1 Mult every 23 cards discarded", Rarity::LEGENDARY, 20})
        .on_discard(yorick_discard)
        .on_hand(x_mult_hand)
        .build(), soul());

    add_parameterized(registry, AdvancedJokerBuilder({JokerId::ANCIENT_JOKER, "Ancient Joker",
            "Each played card with the chosen suit gives X1.5 Mult when scored, suit changes at end of round",
            Rarity::RARE, 8})
        .on_card(ancient_card)
        .on_round_end(reroll_suit)
        .initial_state(initial_data("suit", static_cast<int>(Suit::HEARTS)))
        .build(), read_suit_argument);

    add_parameterized(registry, AdvancedJokerBuilder({JokerId::CASTLE, "Castle",
            "This Joker gains +3 Chips per discarded card of the chosen suit, suit changes every round",
            Rarity::UNCOMMON, 6})
        .on_discard(castle_discard)
        .on_hand(counter_chips_hand)
        .on_round_end(reroll_suit)
        .initial_state(initial_data("suit", static_cast<int>(Suit::SPADES)))
        .build(), read_suit_argument);

    InternalJokerState idol_state = initial_data("rank", rank_value(Rank::ACE));
    idol_state.data["suit"] = static_cast<int>(Suit::SPADES);
    add_parameterized(registry, AdvancedJokerBuilder({JokerId::THE_IDOL, "The Idol",
            "Each played card of the chosen rank and suit gives X2 Mult when scored, card changes every round",
            Rarity::UNCOMMON, 6})
        .on_card(idol_card)
        .on_round_end(idol_round_end)
        .initial_state(idol_state)
        .build(), read_card_argument);

    add_advanced(registry, AdvancedJokerBuilder({JokerId::MARBLE_JOKER, "Marble Joker",
            "Adds one Stone card to the deck when Blind is selected", Rarity::UNCOMMON, 6})
        .on_round_start([](GameContext&, InternalJokerState&) {
            return Effect::create(CreationKind::STONE_CARD);
        })
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::RIFF_RAFF, "Riff-Raff",
            "When Blind is selected, create 2 Common Jokers", Rarity::COMMON, 6})
        .on_round_start(riff_raff_round_start)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::CERTIFICATE, "Certificate",
            "When round begins, add a random playing card with a random seal to your hand",
            Rarity::UNCOMMON, 6})
        .on_round_start([](GameContext&, InternalJokerState&) {
            return Effect::create(CreationKind::PLAYING_CARD);
        })
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::CARTOMANCER, "Cartomancer",
            "Create a Tarot card when Blind is selected", Rarity::UNCOMMON, 6})
        .on_round_start([](GameContext&, InternalJokerState&) {
            return Effect::create(CreationKind::TAROT);
        })
        .build(), reach_ante(5));

    add_advanced(registry, AdvancedJokerBuilder({JokerId::BURGLAR, "Burglar",
            "When Blind is selected, gain +3 Hands and lose all discards", Rarity::UNCOMMON, 6})
        .on_round_start(burglar_round_start)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::HALLUCINATION, "Hallucination",
            "1 in 2 chance to create a Tarot card when any Booster Pack is opened",
            Rarity::COMMON, 4})
        .on_event(hallucination_event)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::BURNT_JOKER, "Burnt Joker",
            "Upgrade the level of the first discarded poker hand each round", Rarity::RARE, 8})
        .on_discard(burnt_discard)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::INVISIBLE_JOKER, "Invisible Joker",
            "After 2 rounds, sell this card to Duplicate a random Joker", Rarity::RARE, 8})
        .on_round_end([](GameContext&, InternalJokerState& state) {
            state.increment("rounds");
            return Effect{};
        })
        .on_sold(invisible_sold)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::DIET_COLA, "Diet Cola",
            "Sell this card to create a free Double Tag", Rarity::UNCOMMON, 6})
        .on_sold([](GameContext&, InternalJokerState&) {
            return Effect::create(CreationKind::DOUBLE_TAG);
        })
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::LUCHADOR, "Luchador",
            "Sell this card to disable the current Boss Blind", Rarity::UNCOMMON, 5})
        .on_sold(luchador_sold)
        .build());

    add_advanced(registry, AdvancedJokerBuilder({JokerId::PERKEO, "Perkeo",
            "Creates a Negative copy of 1 random consumable card in your possession at the end of the shop",
            Rarity::LEGENDARY, 20})
        .on_event(perkeo_event)
        .build(), soul());
}

} // namespace jokers
} // namespace balatro
