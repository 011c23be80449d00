/**
 * Conditional Jokers
 *
 * Jokers described entirely by (Condition, Effect) rules: the hand-type
 * family (Jolly, Sly, The Duo, ...), card filters with chance rolls and run
 * thresholds.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

/**
 * Register a joker that pays out when the played hand contains a type.
 */
void add_hand_type_joker(JokerRegistry& registry, JokerId id, const char* name,
                         const char* description, Rarity rarity, int cost, HandType type,
                         Effect effect, const UnlockCondition& unlock = {}) {
    add_conditional(registry,
                    ConditionalJokerBuilder(JokerMeta{id, name, description, rarity, cost})
                        .when_hand(Condition::hand_contains(type), std::move(effect)),
                    unlock);
}

} // anonymous namespace

void register_conditional_jokers(JokerRegistry& registry) {
    // Mult family
    add_hand_type_joker(registry, JokerId::JOLLY_JOKER, "Jolly Joker",
                        "+8 Mult if played hand contains a Pair", Rarity::COMMON, 3,
                        HandType::PAIR, Effect::add_mult(8));
    add_hand_type_joker(registry, JokerId::ZANY_JOKER, "Zany Joker",
                        "+12 Mult if played hand contains a Three of a Kind", Rarity::COMMON, 4,
                        HandType::THREE_OF_A_KIND, Effect::add_mult(12));
    add_hand_type_joker(registry, JokerId::MAD_JOKER, "Mad Joker",
                        "+10 Mult if played hand contains a Two Pair", Rarity::COMMON, 4,
                        HandType::TWO_PAIR, Effect::add_mult(10));
    add_hand_type_joker(registry, JokerId::CRAZY_JOKER, "Crazy Joker",
                        "+12 Mult if played hand contains a Straight", Rarity::COMMON, 4,
                        HandType::STRAIGHT, Effect::add_mult(12));
    add_hand_type_joker(registry, JokerId::DROLL_JOKER, "Droll Joker",
                        "+10 Mult if played hand contains a Flush", Rarity::COMMON, 4,
                        HandType::FLUSH, Effect::add_mult(10));

    // Chips family
    add_hand_type_joker(registry, JokerId::SLY_JOKER, "Sly Joker",
                        "+50 Chips if played hand contains a Pair", Rarity::COMMON, 3,
                        HandType::PAIR, Effect::add_chips(50));
    add_hand_type_joker(registry, JokerId::WILY_JOKER, "Wily Joker",
                        "+100 Chips if played hand contains a Three of a Kind", Rarity::COMMON, 4,
                        HandType::THREE_OF_A_KIND, Effect::add_chips(100));
    add_hand_type_joker(registry, JokerId::CLEVER_JOKER, "Clever Joker",
                        "+80 Chips if played hand contains a Two Pair", Rarity::COMMON, 4,
                        HandType::TWO_PAIR, Effect::add_chips(80));
    add_hand_type_joker(registry, JokerId::DEVIOUS_JOKER, "Devious Joker",
                        "+100 Chips if played hand contains a Straight", Rarity::COMMON, 4,
                        HandType::STRAIGHT, Effect::add_chips(100));
    add_hand_type_joker(registry, JokerId::CRAFTY_JOKER, "Crafty Joker",
                        "+80 Chips if played hand contains a Flush", Rarity::COMMON, 4,
                        HandType::FLUSH, Effect::add_chips(80));

    // X Mult family
    add_hand_type_joker(registry, JokerId::THE_DUO, "The Duo",
                        "X2 Mult if played hand contains a Pair", Rarity::RARE, 8,
                        HandType::PAIR, Effect::times_mult(2), play_hand(HandType::PAIR, 1));
    add_hand_type_joker(registry, JokerId::THE_TRIO, "The Trio",
                        "X3 Mult if played hand contains a Three of a Kind", Rarity::RARE, 8,
                        HandType::THREE_OF_A_KIND, Effect::times_mult(3),
                        play_hand(HandType::THREE_OF_A_KIND, 1));
    add_hand_type_joker(registry, JokerId::THE_FAMILY, "The Family",
                        "X4 Mult if played hand contains a Four of a Kind", Rarity::RARE, 8,
                        HandType::FOUR_OF_A_KIND, Effect::times_mult(4),
                        play_hand(HandType::FOUR_OF_A_KIND, 1));
    add_hand_type_joker(registry, JokerId::THE_ORDER, "The Order",
                        "X3 Mult if played hand contains a Straight", Rarity::RARE, 8,
                        HandType::STRAIGHT, Effect::times_mult(3), play_hand(HandType::STRAIGHT, 1));
    add_hand_type_joker(registry, JokerId::THE_TRIBE, "The Tribe",
                        "X2 Mult if played hand contains a Flush", Rarity::RARE, 8,
                        HandType::FLUSH, Effect::times_mult(2), play_hand(HandType::FLUSH, 1));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::HALF_JOKER, "Half Joker",
                                 "+20 Mult if played hand contains 3 or fewer cards",
                                 Rarity::COMMON, 5})
            .when_hand(Condition::card_count_at_most(3), Effect::add_mult(20)));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::MYSTIC_SUMMIT, "Mystic Summit",
                                 "+15 Mult when 0 discards remaining", Rarity::COMMON, 5})
            .when_hand(Condition::discards_remaining_at_most(0), Effect::add_mult(15)));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::EIGHT_BALL, "8 Ball",
                                 "1 in 4 chance for each played 8 to create a Tarot card when scored",
                                 Rarity::COMMON, 5})
            .when_card(Condition::all_of({Condition::card_rank_is(Rank::EIGHT),
                                          Condition::chance(1, 4)}),
                       Effect::create(CreationKind::TAROT)));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::SCHOLAR, "Scholar",
                                 "Played Aces give +20 Chips and +4 Mult when scored",
                                 Rarity::COMMON, 4})
            .when_card(Condition::card_rank_is(Rank::ACE),
                       combine(Effect::add_chips(20), Effect::add_mult(4))));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::BUSINESS_CARD, "Business Card",
                                 "Played face cards have a 1 in 2 chance to give $2 when scored",
                                 Rarity::COMMON, 4})
            .when_card(Condition::all_of({Condition::card_is_face(), Condition::chance(1, 2)}),
                       Effect::earn(2)));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::SPACE_JOKER, "Space Joker",
                                 "1 in 4 chance to upgrade level of played poker hand",
                                 Rarity::UNCOMMON, 5})
            .when_hand(Condition::chance(1, 4), Effect::create(CreationKind::HAND_LEVEL_UP)));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::SEANCE, "Seance",
                                 "If poker hand is a Straight Flush, create a random Spectral card",
                                 Rarity::UNCOMMON, 6})
            .when_hand(Condition::hand_type_is(HandType::STRAIGHT_FLUSH),
                       Effect::create(CreationKind::SPECTRAL)),
        play_hand(HandType::STRAIGHT_FLUSH, 1));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::VAGABOND, "Vagabond",
                                 "Create a Tarot card if hand is played with $4 or less",
                                 Rarity::RARE, 8})
            .when_hand(Condition::money_at_most(4), Effect::create(CreationKind::TAROT)),
        reach_ante(3));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::ACROBAT, "Acrobat", "X3 Mult on final hand of round",
                                 Rarity::UNCOMMON, 6})
            .when_hand(Condition::hands_remaining_at_most(0), Effect::times_mult(3)));

    add_conditional(registry,
        ConditionalJokerBuilder({JokerId::BLOODSTONE, "Bloodstone",
                                 "1 in 2 chance for played cards with Heart suit to give X1.5 Mult when scored",
                                 Rarity::UNCOMMON, 7})
            .when_card(Condition::all_of({Condition::card_suit_is(Suit::HEARTS),
                                          Condition::chance(1, 2)}),
                       Effect::times_mult(1.5)));
}

} // namespace jokers
} // namespace balatro
