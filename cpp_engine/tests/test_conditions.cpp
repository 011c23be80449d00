/**
 * Tests for the conditional and advanced frameworks
 */

#include <sstream>
#include "advanced_joker.hpp"
#include "conditional_joker.hpp"

using namespace balatro;
using namespace balatro::testing;

// ============================================================================
// CONDITION TESTS
// ============================================================================

TEST(Condition, HandPrimitives) {
    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    TEST_ASSERT_TRUE(Condition::hand_type_is(HandType::PAIR).evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(Condition::hand_contains(HandType::HIGH_CARD).evaluate(ctx, nullptr));
    TEST_ASSERT_FALSE(Condition::hand_contains(HandType::FLUSH).evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(Condition::card_count_at_most(3).evaluate(ctx, nullptr));
    TEST_ASSERT_FALSE(Condition::card_count_exactly(3).evaluate(ctx, nullptr));
}

TEST(Condition, HandTypeIsFalseForEmptyHand) {
    ContextFixture f;
    GameContext& ctx = f.context();
    TEST_ASSERT_FALSE(Condition::hand_type_is(HandType::HIGH_CARD).evaluate(ctx, nullptr));
}

TEST(Condition, RunPrimitives) {
    ContextFixture f;
    f.run.money = 12;
    f.run.ante = 3;
    f.run.discards_remaining = 0;
    GameContext& ctx = f.context();

    TEST_ASSERT_TRUE(Condition::money_at_least(10).evaluate(ctx, nullptr));
    TEST_ASSERT_FALSE(Condition::money_at_most(4).evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(Condition::ante_at_least(3).evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(Condition::discards_remaining_at_most(0).evaluate(ctx, nullptr));
}

TEST(Condition, CardPrimitivesNeedACard) {
    ContextFixture f;
    GameContext& ctx = f.context();
    Card ace = card(Rank::ACE, Suit::HEARTS);

    TEST_ASSERT_FALSE(Condition::card_suit_is(Suit::HEARTS).evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(Condition::card_suit_is(Suit::HEARTS).evaluate(ctx, &ace));
    TEST_ASSERT_TRUE(Condition::card_rank_is(Rank::ACE).evaluate(ctx, &ace));
    TEST_ASSERT_TRUE(Condition::card_is_odd().evaluate(ctx, &ace));
    TEST_ASSERT_FALSE(Condition::card_is_face().evaluate(ctx, &ace));
}

TEST(Condition, Composition) {
    ContextFixture f;
    f.run.money = 20;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    Condition flush_and_rich = Condition::all_of(
        {Condition::hand_contains(HandType::FLUSH), Condition::money_at_least(10)});
    Condition pair_or_flush = Condition::any_of(
        {Condition::hand_contains(HandType::FLUSH), Condition::hand_contains(HandType::PAIR)});

    TEST_ASSERT_FALSE(flush_and_rich.evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(pair_or_flush.evaluate(ctx, nullptr));
    TEST_ASSERT_TRUE(Condition::negate(flush_and_rich).evaluate(ctx, nullptr));
}

TEST(Condition, RandomnessAndCardUseAreTracked) {
    Condition rolled = Condition::all_of(
        {Condition::card_is_face(), Condition::chance(1, 2)});
    TEST_ASSERT_TRUE(rolled.is_random());
    TEST_ASSERT_TRUE(rolled.uses_card());
    TEST_ASSERT_FALSE(Condition::hand_contains(HandType::PAIR).is_random());
    TEST_ASSERT_EQ(Condition::always().structure_hash(), Condition::always().structure_hash());
}

TEST(Condition, CertainChanceAlwaysHits) {
    ContextFixture f;
    GameContext& ctx = f.context();
    for (int i = 0; i < 20; ++i) {
        TEST_ASSERT_TRUE(Condition::chance(4, 4).evaluate(ctx, nullptr));
    }
}

TEST(ConditionalJoker, RulesApplyInOrder) {
    auto joker = ConditionalJokerBuilder({JokerId::JOLLY_JOKER, "Test", "", Rarity::COMMON, 3})
        .when_hand(Condition::hand_contains(HandType::PAIR), Effect::add_mult(8))
        .when_hand(Condition::hand_contains(HandType::FLUSH), Effect::add_mult(100))
        .when_card(Condition::card_is_face(), Effect::add_chips(30))
        .build();

    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    Effect hand = joker->on_hand_played(ctx);
    TEST_ASSERT_NEAR(8.0, hand.mult, 1e-12);
    Effect per_card = joker->on_card_scored(ctx, ctx.scoring_cards()[0]);
    TEST_ASSERT_EQ(30, per_card.chips);
}

// ============================================================================
// ADVANCED CONDITION TESTS
// ============================================================================

TEST(AdvancedCondition, TemporalPrimitives) {
    ContextFixture f;
    f.history.start_round(1, 1);
    f.play(pair_of_kings());
    InternalJokerState state;

    GameContext& first = f.context();
    TEST_ASSERT_TRUE(AdvancedCondition::first_hand_of_round().evaluate(first, state, nullptr));
    TEST_ASSERT_FALSE(
        AdvancedCondition::hand_already_played_this_round().evaluate(first, state, nullptr));

    f.history.record_hand(HandType::PAIR);
    GameContext& second = f.context();
    TEST_ASSERT_FALSE(AdvancedCondition::first_hand_of_round().evaluate(second, state, nullptr));
    TEST_ASSERT_TRUE(
        AdvancedCondition::hand_already_played_this_round().evaluate(second, state, nullptr));
    TEST_ASSERT_TRUE(AdvancedCondition::recent_hand_types({HandType::PAIR})
                         .evaluate(second, state, nullptr));
}

TEST(AdvancedCondition, RoundStartClearsRoundHistory) {
    ContextFixture f;
    f.history.start_round(1, 1);
    f.history.record_hand(HandType::PAIR);
    f.history.record_discard(3);
    f.history.start_round(2, 1);

    TEST_ASSERT_EQ(0, f.history.hands_played_this_round());
    TEST_ASSERT_EQ(0, f.history.cards_discarded_this_round());
    TEST_ASSERT_EQ(0, f.history.plays_this_round(HandType::PAIR));
}

TEST(AdvancedCondition, StatePrimitives) {
    ContextFixture f;
    GameContext& ctx = f.context();
    InternalJokerState state;
    state.set_counter("hands", 12);
    state.set_flag("armed", true);

    TEST_ASSERT_TRUE(AdvancedCondition::counter_at_least("hands", 10).evaluate(ctx, state, nullptr));
    TEST_ASSERT_TRUE(AdvancedCondition::counter_multiple_of("hands", 6).evaluate(ctx, state, nullptr));
    TEST_ASSERT_FALSE(AdvancedCondition::counter_multiple_of("hands", 5).evaluate(ctx, state, nullptr));
    TEST_ASSERT_TRUE(AdvancedCondition::flag_set("armed").evaluate(ctx, state, nullptr));
    TEST_ASSERT_FALSE(AdvancedCondition::flag_set("missing").evaluate(ctx, state, nullptr));
}

TEST(AdvancedCondition, RosterPrimitives) {
    ContextFixture f;
    f.roster.push_back({1, JokerId::BLUEPRINT, Rarity::RARE, 5, true});
    f.roster.push_back({2, JokerId::JOKER, Rarity::COMMON, 1, true});
    GameContext& ctx = f.context();
    InternalJokerState state;

    TEST_ASSERT_TRUE(AdvancedCondition::has_joker(JokerId::BLUEPRINT).evaluate(ctx, state, nullptr));
    TEST_ASSERT_FALSE(AdvancedCondition::has_joker(JokerId::BRAINSTORM).evaluate(ctx, state, nullptr));
    TEST_ASSERT_TRUE(AdvancedCondition::joker_count_at_least(2).evaluate(ctx, state, nullptr));
}

TEST(AdvancedCondition, ChanceIsNotCacheable) {
    AdvancedCondition lucky = AdvancedCondition::all_of(
        {AdvancedCondition::first_hand_of_round(), Condition::chance(1, 4)});
    TEST_ASSERT_FALSE(lucky.is_cacheable());
    TEST_ASSERT_TRUE(AdvancedCondition::final_hand().is_cacheable());
}

TEST(InternalState, JsonRoundTrip) {
    InternalJokerState state;
    state.set_counter("hands", 4);
    state.set_flag("armed", true);
    state.set_data("suit", 2);

    std::string error;
    auto restored = InternalJokerState::from_json(state.to_json(), error);
    TEST_ASSERT_TRUE(restored.has_value());
    TEST_ASSERT_EQ(4, restored->counter("hands"));
    TEST_ASSERT_TRUE(restored->flag("armed"));
    TEST_ASSERT_EQ(2, restored->data_int("suit", 0));
}

TEST(InternalState, RejectsMalformedJson) {
    std::string error;
    auto restored = InternalJokerState::from_json(nlohmann::json::array(), error);
    TEST_ASSERT_FALSE(restored.has_value());
    TEST_ASSERT_FALSE(error.empty());
}

// ============================================================================
// CONDITION CACHE TESTS
// ============================================================================

namespace {

std::shared_ptr<const AdvancedJokerDef> cached_pair_def() {
    return AdvancedJokerBuilder({JokerId::CARD_SHARP, "Cached", "", Rarity::COMMON, 4})
        .when(Condition::hand_contains(HandType::PAIR))
        .on_hand([](GameContext&, InternalJokerState&, const Card*) {
            return Effect::add_mult(5);
        })
        .build();
}

} // anonymous namespace

TEST(ConditionCache, RepeatedEvaluationHits) {
    AdvancedJoker joker(cached_pair_def());
    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    for (int i = 0; i < 4; ++i) {
        TEST_ASSERT_NEAR(5.0, joker.on_hand_played(ctx).mult, 1e-12);
    }

    TEST_ASSERT_EQ(1u, joker.cache().stats().misses);
    TEST_ASSERT_EQ(3u, joker.cache().stats().hits);
    TEST_ASSERT_NEAR(0.75, joker.cache().stats().hit_rate(), 1e-12);
}

TEST(ConditionCache, RoundBoundaryInvalidates) {
    AdvancedJoker joker(cached_pair_def());
    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    joker.on_hand_played(ctx);
    uint64_t epoch = joker.cache().epoch();
    joker.on_round_start(ctx);
    TEST_ASSERT_EQ(epoch + 1, joker.cache().epoch());

    joker.on_hand_played(ctx);
    TEST_ASSERT_EQ(2u, joker.cache().stats().misses);
    TEST_ASSERT_EQ(0u, joker.cache().stats().hits);
}

TEST(ConditionCache, DisabledCacheNeverStores) {
    AdvancedJoker joker(cached_pair_def());
    EngineConfig config;
    config.cache_enabled = false;
    joker.configure(config);

    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();
    joker.on_hand_played(ctx);
    joker.on_hand_played(ctx);

    TEST_ASSERT_EQ(0u, joker.cache().size());
    TEST_ASSERT_EQ(0u, joker.cache().stats().hits);
}

TEST(ConditionCache, EvictsWhenFull) {
    ConditionCache cache(2);
    cache.store({1, 10, 0}, true);
    cache.store({1, 11, 0}, true);
    cache.store({1, 12, 0}, false);
    TEST_ASSERT_TRUE(cache.size() <= 2);
    TEST_ASSERT_TRUE(cache.stats().evictions > 0);
}

// ============================================================================
// ADVANCED STATE TESTS
// ============================================================================

TEST(AdvancedJoker, FailedLoadLeavesStateUntouched) {
    AdvancedJoker joker(cached_pair_def());
    joker.internal_state().set_counter("hands", 3);
    joker.internal_state().set_flag("armed", true);
    joker.internal_state().set_data("suit", 1);
    std::string before = joker.serialize_state().dump();

    // Counters parse fine; the bad flag arrives after them
    nlohmann::json partial = {{"counters", {{"hands", 9}, {"discards", 4}}},
                              {"flags", {{"armed", "yes"}}}};
    StateResult result = joker.deserialize_state(partial);
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_FALSE(result.error.empty());
    TEST_ASSERT_EQ(before, joker.serialize_state().dump());
    TEST_ASSERT_EQ(3, joker.internal_state().counter("hands"));

    TEST_ASSERT_FALSE(joker.deserialize_state({{"version", -1}}).success);
    TEST_ASSERT_FALSE(joker.deserialize_state({{"data", 5}}).success);
    TEST_ASSERT_EQ(before, joker.serialize_state().dump());
}
