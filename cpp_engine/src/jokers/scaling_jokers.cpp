/**
 * Scaling Jokers
 *
 * Jokers with one value that grows or decays over the run. The value lives
 * in the run's JokerStateStore, so it is saved with the roster.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

// ============================================================================
// RULE BUILDERS
// ============================================================================

ScalingRule grow(ScalingTrigger trigger, double amount, HandPredicate when = nullptr,
                 CardPredicate card = nullptr) {
    ScalingRule rule;
    rule.trigger = trigger;
    rule.amount = amount;
    rule.hand_condition = when;
    rule.card_condition = card;
    return rule;
}

ScalingRule grow_on(GameEventType event, double amount) {
    ScalingRule rule;
    rule.trigger = ScalingTrigger::GAME_EVENT;
    rule.event = event;
    rule.amount = amount;
    return rule;
}

ScalingRule reset_on(ScalingTrigger trigger, HandPredicate when = nullptr) {
    ScalingRule rule;
    rule.trigger = trigger;
    rule.op = ScalingOp::RESET;
    rule.hand_condition = when;
    return rule;
}

ScalingRule reset_on(GameEventType event) {
    ScalingRule rule = reset_on(ScalingTrigger::GAME_EVENT);
    rule.event = event;
    return rule;
}

ScalingJokerDef scaling(const JokerMeta& meta, ScalingTarget target, double base_value,
                        std::vector<ScalingRule> rules) {
    ScalingJokerDef def;
    def.meta = meta;
    def.target = target;
    def.base_value = base_value;
    def.rules = std::move(rules);
    return def;
}

// ============================================================================
// PREDICATES
// ============================================================================

bool no_scoring_face(const GameContext& ctx) {
    return !scoring_has_face(ctx);
}

bool contains_two_pair(const GameContext& ctx) {
    return ctx.hand_contains(HandType::TWO_PAIR);
}

bool contains_straight(const GameContext& ctx) {
    return ctx.hand_contains(HandType::STRAIGHT);
}

bool exactly_four_cards(const GameContext& ctx) {
    return ctx.played_cards().size() == 4;
}

bool is_two(const GameContext&, const Card& card) {
    return !card.is_stone() && card.rank == Rank::TWO;
}

bool is_jack(const GameContext&, const Card& card) {
    return !card.is_stone() && card.rank == Rank::JACK;
}

bool lucky_hit(const GameContext&, const Card& card) {
    return card.enhancement == Enhancement::LUCKY && card.lucky_triggered;
}

} // anonymous namespace

// ============================================================================
// REGISTRATION
// ============================================================================

void register_scaling_jokers(JokerRegistry& registry) {
    ScalingJokerDef green = scaling(
        {JokerId::GREEN_JOKER, "Green Joker", "+1 Mult per hand played, -1 Mult per discard",
         Rarity::COMMON, 4},
        ScalingTarget::MULT, 0.0,
        {grow(ScalingTrigger::HAND_PLAYED, 1.0), grow(ScalingTrigger::DISCARD, -1.0)});
    green.min_value = 0.0;
    add_scaling(registry, green);

    // Reset first so a hand with a face card scores nothing
    add_scaling(registry, scaling(
        {JokerId::RIDE_THE_BUS, "Ride the Bus",
         "This Joker gains +1 Mult per consecutive hand played without a scoring face card",
         Rarity::COMMON, 6},
        ScalingTarget::MULT, 0.0,
        {reset_on(ScalingTrigger::HAND_PLAYED, scoring_has_face),
         grow(ScalingTrigger::HAND_PLAYED, 1.0, no_scoring_face)}));

    add_scaling(registry, scaling(
        {JokerId::SPARE_TROUSERS, "Spare Trousers",
         "This Joker gains +2 Mult if played hand contains a Two Pair", Rarity::UNCOMMON, 6},
        ScalingTarget::MULT, 0.0,
        {grow(ScalingTrigger::HAND_PLAYED, 2.0, contains_two_pair)}));

    add_scaling(registry, scaling(
        {JokerId::RUNNER, "Runner",
         "Gains +15 Chips if played hand contains a Straight", Rarity::COMMON, 5},
        ScalingTarget::CHIPS, 0.0,
        {grow(ScalingTrigger::HAND_PLAYED, 15.0, contains_straight)}));

    add_scaling(registry, scaling(
        {JokerId::SQUARE_JOKER, "Square Joker",
         "This Joker gains +4 Chips if played hand has exactly 4 cards", Rarity::COMMON, 4},
        ScalingTarget::CHIPS, 0.0,
        {grow(ScalingTrigger::HAND_PLAYED, 4.0, exactly_four_cards)}));

    add_scaling(registry, scaling(
        {JokerId::WEE_JOKER, "Wee Joker",
         "This Joker gains +8 Chips when each played 2 is scored", Rarity::RARE, 8},
        ScalingTarget::CHIPS, 0.0,
        {grow(ScalingTrigger::CARD_SCORED, 8.0, nullptr, is_two)}),
        play_hand(HandType::HIGH_CARD, 20));

    add_scaling(registry, scaling(
        {JokerId::LUCKY_CAT, "Lucky Cat",
         "This Joker gains X0.25 Mult every time a Lucky card successfully triggers",
         Rarity::UNCOMMON, 6},
        ScalingTarget::X_MULT, 1.0,
        {grow(ScalingTrigger::CARD_SCORED, 0.25, nullptr, lucky_hit)}));

    add_scaling(registry, scaling(
        {JokerId::HOLOGRAM, "Hologram",
         "This Joker gains X0.25 Mult every time a playing card is added to your deck",
         Rarity::UNCOMMON, 7},
        ScalingTarget::X_MULT, 1.0,
        {grow_on(GameEventType::CARD_ADDED_TO_DECK, 0.25)}));

    add_scaling(registry, scaling(
        {JokerId::CONSTELLATION, "Constellation",
         "This Joker gains X0.1 Mult every time a Planet card is used", Rarity::UNCOMMON, 6},
        ScalingTarget::X_MULT, 1.0,
        {grow_on(GameEventType::PLANET_USED, 0.1)}));

    add_scaling(registry, scaling(
        {JokerId::GLASS_JOKER, "Glass Joker",
         "This Joker gains X0.75 Mult for every Glass Card that is destroyed",
         Rarity::UNCOMMON, 6},
        ScalingTarget::X_MULT, 1.0,
        {grow_on(GameEventType::GLASS_SHATTERED, 0.75)}));

    add_scaling(registry, scaling(
        {JokerId::CAMPFIRE, "Campfire",
         "This Joker gains X0.25 Mult for each card sold, resets when Boss Blind is defeated",
         Rarity::RARE, 9},
        ScalingTarget::X_MULT, 1.0,
        {grow_on(GameEventType::CARD_SOLD, 0.25), reset_on(GameEventType::BOSS_DEFEATED)}));

    add_scaling(registry, scaling(
        {JokerId::THROWBACK, "Throwback",
         "X0.25 Mult for each Blind skipped this run", Rarity::UNCOMMON, 6},
        ScalingTarget::X_MULT, 1.0,
        {grow_on(GameEventType::BLIND_SKIPPED, 0.25)}));

    add_scaling(registry, scaling(
        {JokerId::RED_CARD, "Red Card",
         "This Joker gains +3 Mult when any Booster Pack is skipped", Rarity::COMMON, 5},
        ScalingTarget::MULT, 0.0,
        {grow_on(GameEventType::PACK_SKIPPED, 3.0)}));

    add_scaling(registry, scaling(
        {JokerId::FLASH_CARD, "Flash Card",
         "This Joker gains +2 Mult per reroll in the shop", Rarity::UNCOMMON, 5},
        ScalingTarget::MULT, 0.0,
        {grow_on(GameEventType::SHOP_REROLLED, 2.0)}));

    add_scaling(registry, scaling(
        {JokerId::FORTUNE_TELLER, "Fortune Teller",
         "+1 Mult per Tarot card used this run", Rarity::COMMON, 6},
        ScalingTarget::MULT, 0.0,
        {grow_on(GameEventType::TAROT_USED, 1.0)}));

    add_scaling(registry, scaling(
        {JokerId::HIT_THE_ROAD, "Hit the Road",
         "This Joker gains X0.5 Mult for every Jack discarded this round", Rarity::RARE, 8},
        ScalingTarget::X_MULT, 1.0,
        {grow(ScalingTrigger::CARD_DISCARDED, 0.5, nullptr, is_jack),
         reset_on(ScalingTrigger::ROUND_END)}));

    add_scaling(registry, scaling(
        {JokerId::CANIO, "Canio",
         "This Joker gains X1 Mult when a face card is destroyed", Rarity::LEGENDARY, 20},
        ScalingTarget::X_MULT, 1.0,
        {grow_on(GameEventType::FACE_CARD_DESTROYED, 1.0)}),
        soul());

    ScalingJokerDef ramen = scaling(
        {JokerId::RAMEN, "Ramen", "X2 Mult, loses X0.01 Mult per card discarded",
         Rarity::UNCOMMON, 6},
        ScalingTarget::X_MULT, 2.0,
        {grow(ScalingTrigger::CARD_DISCARDED, -0.01)});
    ramen.min_value = 1.0;
    ramen.destroy_at_min = true;
    add_scaling(registry, ramen);
}

} // namespace jokers
} // namespace balatro
