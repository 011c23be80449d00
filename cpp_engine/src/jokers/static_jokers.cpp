/**
 * Static Jokers
 *
 * Stateless jokers whose effect is a fixed bonus or a formula over the
 * context: flat mult, per-suit and per-rank card bonuses, deck and money
 * formulas, held-in-hand abilities.
 */

#include "jokers/joker_catalog.hpp"

#include <algorithm>
#include <cmath>

namespace balatro {
namespace jokers {

namespace {

// ============================================================================
// FORMULAS
// ============================================================================

/**
 * Joker Stencil: X1 Mult for each empty joker slot. Stencil counts itself
 * as empty.
 */
Effect stencil_formula(GameContext& ctx, const Card*) {
    int stencils = 0;
    for (const auto& entry : ctx.roster()) {
        if (entry.id == JokerId::JOKER_STENCIL) ++stencils;
    }
    int empty = ctx.run().joker_slots - static_cast<int>(ctx.roster().size()) + stencils;
    if (empty <= 1) {
        return {};
    }
    return Effect::times_mult(static_cast<double>(empty));
}

Effect banner_formula(GameContext& ctx, const Card*) {
    return Effect::add_chips(30 * std::max(0, ctx.discards_remaining()));
}

Effect misprint_formula(GameContext& ctx, const Card*) {
    return Effect::add_mult(ctx.rng().range(0, 23));
}

/**
 * Raised Fist: double the rank of the lowest ranked card held in hand.
 */
Effect raised_fist_formula(GameContext& ctx, const Card*) {
    const Card* lowest = nullptr;
    for (const auto& card : ctx.held_cards()) {
        if (card.is_stone() || card.debuffed) continue;
        if (!lowest || card.rank < lowest->rank) lowest = &card;
    }
    if (!lowest) {
        return {};
    }
    return Effect::add_mult(2.0 * nominal_value(*lowest) * held_activations(ctx));
}

Effect steel_formula(GameContext& ctx, const Card*) {
    int steel = ctx.deck().steel_cards;
    return steel > 0 ? Effect::times_mult(1.0 + 0.2 * steel) : Effect{};
}

Effect abstract_formula(GameContext& ctx, const Card*) {
    return Effect::add_mult(3.0 * ctx.roster().size());
}

Effect supernova_formula(GameContext& ctx, const Card*) {
    return Effect::add_mult(ctx.plays_of(ctx.hand_type()));
}

Effect blue_formula(GameContext& ctx, const Card*) {
    return Effect::add_chips(2 * std::max(0, ctx.deck().cards_remaining));
}

Effect hiker_formula(GameContext&, const Card* card) {
    Effect effect;
    effect.transform_cards.push_back({card->id, TransformKind::ADD_PERMANENT_CHIPS,
                                      Enhancement::NONE, 5});
    return effect;
}

Effect baron_formula(GameContext& ctx, const Card*) {
    int kings = count_held(ctx, Rank::KING) * held_activations(ctx);
    return kings > 0 ? Effect::times_mult(std::pow(1.5, kings)) : Effect{};
}

Effect midas_formula(GameContext&, const Card* card) {
    Effect effect;
    effect.transform_cards.push_back({card->id, TransformKind::SET_ENHANCEMENT,
                                      Enhancement::GOLD, 0});
    return effect;
}

Effect erosion_formula(GameContext& ctx, const Card*) {
    int missing = ctx.deck().starting_deck_size - ctx.deck().full_deck_size;
    return missing > 0 ? Effect::add_mult(4.0 * missing) : Effect{};
}

Effect stone_formula(GameContext& ctx, const Card*) {
    return Effect::add_chips(25 * std::max(0, ctx.deck().stone_cards));
}

Effect baseball_formula(GameContext& ctx, const Card*) {
    int uncommon = 0;
    for (const auto& entry : ctx.roster()) {
        if (entry.rarity == Rarity::UNCOMMON) ++uncommon;
    }
    return uncommon > 0 ? Effect::times_mult(std::pow(1.5, uncommon)) : Effect{};
}

Effect bull_formula(GameContext& ctx, const Card*) {
    return Effect::add_chips(2 * std::max<int64_t>(0, ctx.run().money));
}

/**
 * Swashbuckler: sell value of every other joker added to Mult.
 */
Effect swashbuckler_formula(GameContext& ctx, const Card*) {
    int total = 0;
    for (size_t i = 0; i < ctx.roster().size(); ++i) {
        if (i != ctx.position()) total += ctx.roster()[i].sell_value;
    }
    return Effect::add_mult(total);
}

Effect shoot_the_moon_formula(GameContext& ctx, const Card*) {
    int queens = count_held(ctx, Rank::QUEEN) * held_activations(ctx);
    return Effect::add_mult(13.0 * queens);
}

Effect bootstraps_formula(GameContext& ctx, const Card*) {
    return Effect::add_mult(2.0 * (std::max<int64_t>(0, ctx.run().money) / 5));
}

// ============================================================================
// PREDICATES
// ============================================================================

bool is_fibonacci(const GameContext&, const Card& card) {
    if (card.is_stone()) return false;
    switch (card.rank) {
        case Rank::ACE:
        case Rank::TWO:
        case Rank::THREE:
        case Rank::FIVE:
        case Rank::EIGHT:
            return true;
        default:
            return false;
    }
}

bool blackboard_holds(const GameContext& ctx) {
    for (const auto& card : ctx.held_cards()) {
        if (!ctx.is_suit(card, Suit::SPADES) && !ctx.is_suit(card, Suit::CLUBS)) return false;
    }
    return true;
}

bool superposition_holds(const GameContext& ctx) {
    if (!ctx.hand_contains(HandType::STRAIGHT)) return false;
    for (const auto& card : ctx.played_cards()) {
        if (!card.is_stone() && card.rank == Rank::ACE) return true;
    }
    return false;
}

/** Photograph: only the first face card among the scoring cards. */
bool first_scoring_face(const GameContext& ctx, const Card& card) {
    if (!ctx.is_face(card)) return false;
    const auto& scoring = ctx.scoring_cards();
    for (size_t i = 0; i < scoring.size(); ++i) {
        if (ctx.is_face(scoring[i])) return i == ctx.scoring_index();
    }
    return false;
}

bool is_ten_or_four(const GameContext&, const Card& card) {
    return !card.is_stone() && (card.rank == Rank::TEN || card.rank == Rank::FOUR);
}

bool is_king_or_queen(const GameContext&, const Card& card) {
    return !card.is_stone() && (card.rank == Rank::KING || card.rank == Rank::QUEEN);
}

/**
 * Flower Pot: a scoring Diamond, Club, Heart and Spade. Wild cards fill
 * whichever suit is still missing.
 */
bool flower_pot_holds(const GameContext& ctx) {
    bool seen[4] = {false, false, false, false};
    int wilds = 0;
    for (const auto& card : ctx.scoring_cards()) {
        if (card.is_stone()) continue;
        if (card.is_wild()) {
            ++wilds;
            continue;
        }
        for (int s = 0; s < 4; ++s) {
            if (ctx.is_suit(card, static_cast<Suit>(s))) seen[s] = true;
        }
    }
    int missing = 0;
    for (bool s : seen) {
        if (!s) ++missing;
    }
    return missing <= wilds;
}

/**
 * Seeing Double: a scoring Club plus a scoring card of any other suit.
 */
bool seeing_double_holds(const GameContext& ctx) {
    int clubs = 0;
    int others = 0;
    int wilds = 0;
    for (const auto& card : ctx.scoring_cards()) {
        if (card.is_stone()) continue;
        if (card.is_wild()) {
            ++wilds;
        } else if (ctx.is_suit(card, Suit::CLUBS)) {
            ++clubs;
        } else {
            ++others;
        }
    }
    if (clubs > 0) return others > 0 || wilds > 0;
    if (others > 0) return wilds > 0;
    return wilds >= 2;
}

bool drivers_license_holds(const GameContext& ctx) {
    return ctx.deck().enhanced_cards >= 16;
}

} // anonymous namespace

// ============================================================================
// REGISTRATION
// ============================================================================

void register_static_jokers(JokerRegistry& registry) {
    add_static(registry, StaticJokerBuilder(JokerId::JOKER)
        .name("Joker").description("+4 Mult").rarity(Rarity::COMMON).cost(2)
        .effect(Effect::add_mult(4))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::JOKER_STENCIL)
        .name("Joker Stencil")
        .description("X1 Mult for each empty Joker slot")
        .rarity(Rarity::UNCOMMON).cost(8)
        .formula(stencil_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::BANNER)
        .name("Banner").description("+30 Chips for each remaining discard")
        .rarity(Rarity::COMMON).cost(5)
        .formula(banner_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::MISPRINT)
        .name("Misprint").description("+0-23 Mult")
        .rarity(Rarity::COMMON).cost(4)
        .formula(misprint_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::RAISED_FIST)
        .name("Raised Fist")
        .description("Adds double the rank of lowest ranked card held in hand to Mult")
        .rarity(Rarity::COMMON).cost(5)
        .formula(raised_fist_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::FIBONACCI)
        .name("Fibonacci")
        .description("Each played Ace, 2, 3, 5, or 8 gives +8 Mult when scored")
        .rarity(Rarity::UNCOMMON).cost(8)
        .on_card(is_fibonacci)
        .effect(Effect::add_mult(8))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::STEEL_JOKER)
        .name("Steel Joker")
        .description("Gives X0.2 Mult for each Steel Card in your full deck")
        .rarity(Rarity::UNCOMMON).cost(7)
        .formula(steel_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SCARY_FACE)
        .name("Scary Face").description("Played face cards give +30 Chips when scored")
        .rarity(Rarity::COMMON).cost(4)
        .on_card([](const GameContext& ctx, const Card& card) { return ctx.is_face(card); })
        .effect(Effect::add_chips(30))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::ABSTRACT_JOKER)
        .name("Abstract Joker").description("+3 Mult for each Joker card")
        .rarity(Rarity::COMMON).cost(4)
        .formula(abstract_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::EVEN_STEVEN)
        .name("Even Steven")
        .description("Played cards with even rank give +4 Mult when scored")
        .rarity(Rarity::COMMON).cost(4)
        .on_card([](const GameContext&, const Card& card) { return card.is_even(); })
        .effect(Effect::add_mult(4))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::ODD_TODD)
        .name("Odd Todd")
        .description("Played cards with odd rank give +31 Chips when scored")
        .rarity(Rarity::COMMON).cost(4)
        .on_card([](const GameContext&, const Card& card) { return card.is_odd(); })
        .effect(Effect::add_chips(31))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SUPERNOVA)
        .name("Supernova")
        .description("Adds the number of times poker hand has been played this run to Mult")
        .rarity(Rarity::COMMON).cost(5)
        .formula(supernova_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::BLACKBOARD)
        .name("Blackboard")
        .description("X3 Mult if all cards held in hand are Spades or Clubs")
        .rarity(Rarity::UNCOMMON).cost(6)
        .on_hand(blackboard_holds)
        .effect(Effect::times_mult(3))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::BLUE_JOKER)
        .name("Blue Joker").description("+2 Chips for each remaining card in deck")
        .rarity(Rarity::COMMON).cost(5)
        .formula(blue_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::HIKER)
        .name("Hiker")
        .description("Every played card permanently gains +5 Chips when scored")
        .rarity(Rarity::UNCOMMON).cost(5)
        .on_card()
        .formula(hiker_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SUPERPOSITION)
        .name("Superposition")
        .description("Create a Tarot card if poker hand contains an Ace and a Straight")
        .rarity(Rarity::COMMON).cost(4)
        .on_hand(superposition_holds)
        .effect(Effect::create(CreationKind::TAROT))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::BARON)
        .name("Baron").description("Each King held in hand gives X1.5 Mult")
        .rarity(Rarity::RARE).cost(8)
        .formula(baron_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::MIDAS_MASK)
        .name("Midas Mask").description("All played face cards become Gold cards when scored")
        .rarity(Rarity::UNCOMMON).cost(7)
        .on_card([](const GameContext& ctx, const Card& card) { return ctx.is_face(card); })
        .formula(midas_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::PHOTOGRAPH)
        .name("Photograph").description("First played face card gives X2 Mult when scored")
        .rarity(Rarity::COMMON).cost(5)
        .on_card(first_scoring_face)
        .effect(Effect::times_mult(2))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::EROSION)
        .name("Erosion")
        .description("+4 Mult for each card below the deck's starting size")
        .rarity(Rarity::UNCOMMON).cost(6)
        .formula(erosion_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::STONE_JOKER)
        .name("Stone Joker").description("Gives +25 Chips for each Stone Card in your full deck")
        .rarity(Rarity::UNCOMMON).cost(6)
        .formula(stone_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::BASEBALL_CARD)
        .name("Baseball Card").description("Uncommon Jokers each give X1.5 Mult")
        .rarity(Rarity::RARE).cost(8)
        .formula(baseball_formula)
        .build(), reach_ante(4));

    add_static(registry, StaticJokerBuilder(JokerId::BULL)
        .name("Bull").description("+2 Chips for each $1 you have")
        .rarity(Rarity::UNCOMMON).cost(6)
        .formula(bull_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::WALKIE_TALKIE)
        .name("Walkie Talkie")
        .description("Each played 10 or 4 gives +10 Chips and +4 Mult when scored")
        .rarity(Rarity::COMMON).cost(4)
        .on_card(is_ten_or_four)
        .effect(combine(Effect::add_chips(10), Effect::add_mult(4)))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SMILEY_FACE)
        .name("Smiley Face").description("Played face cards give +5 Mult when scored")
        .rarity(Rarity::COMMON).cost(4)
        .on_card([](const GameContext& ctx, const Card& card) { return ctx.is_face(card); })
        .effect(Effect::add_mult(5))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SWASHBUCKLER)
        .name("Swashbuckler")
        .description("Adds the sell value of all other owned Jokers to Mult")
        .rarity(Rarity::COMMON).cost(4)
        .formula(swashbuckler_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::ARROWHEAD)
        .name("Arrowhead").description("Played cards with Spade suit give +50 Chips when scored")
        .rarity(Rarity::UNCOMMON).cost(7)
        .on_card([](const GameContext& ctx, const Card& card) {
            return ctx.is_suit(card, Suit::SPADES);
        })
        .effect(Effect::add_chips(50))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::ONYX_AGATE)
        .name("Onyx Agate").description("Played cards with Club suit give +7 Mult when scored")
        .rarity(Rarity::UNCOMMON).cost(7)
        .on_card([](const GameContext& ctx, const Card& card) {
            return ctx.is_suit(card, Suit::CLUBS);
        })
        .effect(Effect::add_mult(7))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::FLOWER_POT)
        .name("Flower Pot")
        .description("X3 Mult if poker hand contains a Diamond, Club, Heart, and Spade card")
        .rarity(Rarity::UNCOMMON).cost(6)
        .on_hand(flower_pot_holds)
        .effect(Effect::times_mult(3))
        .build(), reach_ante(8));

    add_static(registry, StaticJokerBuilder(JokerId::SEEING_DOUBLE)
        .name("Seeing Double")
        .description("X2 Mult if played hand has a scoring Club and a scoring card of any other suit")
        .rarity(Rarity::UNCOMMON).cost(6)
        .on_hand(seeing_double_holds)
        .effect(Effect::times_mult(2))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::STUNTMAN)
        .name("Stuntman").description("+250 Chips, -2 hand size")
        .rarity(Rarity::RARE).cost(7)
        .effect(Effect::add_chips(250))
        .modifiers([] {
            RuleModifiers m;
            m.hand_size = -2;
            return m;
        }())
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::SHOOT_THE_MOON)
        .name("Shoot the Moon").description("Each Queen held in hand gives +13 Mult")
        .rarity(Rarity::COMMON).cost(5)
        .formula(shoot_the_moon_formula)
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::DRIVERS_LICENSE)
        .name("Driver's License")
        .description("X3 Mult if you have at least 16 Enhanced cards in your full deck")
        .rarity(Rarity::RARE).cost(7)
        .on_hand(drivers_license_holds)
        .effect(Effect::times_mult(3))
        .build());

    add_static(registry, StaticJokerBuilder(JokerId::BOOTSTRAPS)
        .name("Bootstraps").description("+2 Mult for every $5 you have")
        .rarity(Rarity::UNCOMMON).cost(7)
        .formula(bootstraps_formula)
        .build(), win_runs(2));

    add_static(registry, StaticJokerBuilder(JokerId::TRIBOULET)
        .name("Triboulet").description("Played Kings and Queens each give X2 Mult when scored")
        .rarity(Rarity::LEGENDARY).cost(20)
        .on_card(is_king_or_queen)
        .effect(Effect::times_mult(2))
        .build(), soul());
}

} // namespace jokers
} // namespace balatro
