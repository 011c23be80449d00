/**
 * Tests for catalog jokers driven through the engine facade
 */

#include <sstream>
#include "joker_engine.hpp"

using namespace balatro;
using namespace balatro::testing;

namespace {

RunSnapshot default_run() {
    RunSnapshot run;
    run.base_chips = 20;
    run.base_mult = 2.0;
    run.hands_remaining = 3;
    return run;
}

InstanceId acquire(JokerEngine& engine, JokerId id, const ConstructionArgs& args = nullptr) {
    AcquireResult acquired = engine.acquire(id, args);
    if (!acquired.success) {
        throw std::runtime_error("acquire failed: " + acquired.error);
    }
    return acquired.handle;
}

} // anonymous namespace

// ============================================================================
// STATIC AND CONDITIONAL JOKERS
// ============================================================================

TEST(Catalog, JokerAddsFourMult) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::JOKER);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_TRUE(result.success());
    TEST_ASSERT_NEAR(4.0, result.aggregate.mult, 1e-12);
    TEST_ASSERT_EQ(1u, result.triggered.size());
}

TEST(Catalog, JollyJokerNeedsAPair) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::JOLLY_JOKER);

    ProcessResult pair = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_NEAR(8.0, pair.aggregate.mult, 1e-12);

    auto high = cards({{Rank::KING, Suit::SPADES}, {Rank::TWO, Suit::HEARTS}});
    ProcessResult none = engine.process(engine.make_hand(high), default_run());
    TEST_ASSERT_TRUE(none.aggregate.is_identity());
    TEST_ASSERT_TRUE(none.triggered.empty());
}

TEST(Catalog, ScaryFaceScoresEachFaceCard) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::SCARY_FACE);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_EQ(60, result.aggregate.chips);
}

// ============================================================================
// SCALING JOKERS
// ============================================================================

TEST(Catalog, GreenJokerGrowsAndShrinks) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::GREEN_JOKER);
    RunSnapshot run = default_run();

    TEST_ASSERT_NEAR(1.0, engine.process(engine.make_hand(pair_of_kings()), run).aggregate.mult, 1e-12);
    TEST_ASSERT_NEAR(2.0, engine.process(engine.make_hand(pair_of_kings()), run).aggregate.mult, 1e-12);

    engine.notify_discard({card(Rank::TWO, Suit::CLUBS, 20)}, run);
    TEST_ASSERT_NEAR(2.0, engine.process(engine.make_hand(pair_of_kings()), run).aggregate.mult, 1e-12);
}

// ============================================================================
// RETRIGGERS
// ============================================================================

TEST(Catalog, HangingChadRetriggersFirstCard) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::HANGING_CHAD);
    acquire(engine, JokerId::SCARY_FACE);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_EQ(2u, result.metrics.retriggers);
    TEST_ASSERT_EQ(120, result.aggregate.chips);  // First king scores three times
}

TEST(Catalog, SeltzerDissolvesAfterTenHands) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::SELTZER);
    RunSnapshot run = default_run();

    for (int hand = 1; hand <= 10; ++hand) {
        ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), run);
        TEST_ASSERT_EQ(2u, result.metrics.retriggers);
        TEST_ASSERT_EQ(hand == 10 ? 1u : 0u, result.removals.size());
        engine.apply_removals(result, run);
    }
    TEST_ASSERT_TRUE(engine.jokers().empty());
}

// ============================================================================
// COPY JOKERS
// ============================================================================

TEST(Catalog, BlueprintCopiesRightNeighbour) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::BLUEPRINT);
    acquire(engine, JokerId::JOKER);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_TRUE(result.success());
    TEST_ASSERT_NEAR(8.0, result.aggregate.mult, 1e-12);
}

TEST(Catalog, BlueprintSkipsStatefulJokers) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::BLUEPRINT);
    acquire(engine, JokerId::SELTZER);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_EQ(2u, result.metrics.retriggers);
}

TEST(Catalog, MutualCopiesTerminate) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::BLUEPRINT);
    acquire(engine, JokerId::BRAINSTORM);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_TRUE(result.success());
    TEST_ASSERT_TRUE(result.aggregate.is_identity());
}

TEST(Catalog, BrainstormNeverCopiesItself) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::BRAINSTORM);
    acquire(engine, JokerId::JOKER);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_NEAR(4.0, result.aggregate.mult, 1e-12);
}

// ============================================================================
// PARAMETERIZED AND ADVANCED JOKERS
// ============================================================================

TEST(Catalog, AncientJokerUsesChosenSuit) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::ANCIENT_JOKER, {{"suit", "spades"}});

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_NEAR(1.5, result.aggregate.mult_multiplier, 1e-12);  // Only K of spades

    // A fixed suit survives the round end
    engine.end_round(default_run());
    result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_NEAR(1.5, result.aggregate.mult_multiplier, 1e-12);
}

TEST(Catalog, CeremonialDaggerEatsRightNeighbour) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::CEREMONIAL_DAGGER);
    InstanceId joker = acquire(engine, JokerId::JOKER);
    RunSnapshot run = default_run();

    ProcessResult start = engine.start_round(run);
    TEST_ASSERT_EQ(1u, start.removals.size());
    TEST_ASSERT_EQ(joker, start.removals[0].slot);
    TEST_ASSERT_EQ(1u, engine.apply_removals(start, run));
    TEST_ASSERT_EQ(1u, engine.jokers().size());

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), run);
    TEST_ASSERT_NEAR(2.0, result.aggregate.mult, 1e-12);  // Twice the Joker's $1 sell value
}

// ============================================================================
// ECONOMY JOKERS
// ============================================================================

TEST(Catalog, GoldenJokerPaysAtRoundEnd) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::GOLDEN_JOKER);

    ProcessResult result = engine.end_round(default_run());
    TEST_ASSERT_EQ(4, result.aggregate.money);

    ScoreApplication applied = engine.apply_effect(result.aggregate, 0, 0.0, 10);
    TEST_ASSERT_EQ(14, applied.wallet);
}

TEST(Catalog, EggGainsSellValue) {
    JokerEngine engine(test_config());
    InstanceId egg = acquire(engine, JokerId::EGG);
    TEST_ASSERT_EQ(2, engine.jokers().slot_of(egg)->sell_value);

    engine.end_round(default_run());
    engine.end_round(default_run());
    TEST_ASSERT_EQ(8, engine.jokers().slot_of(egg)->sell_value);

    SellResult sold = engine.sell(egg);
    TEST_ASSERT_TRUE(sold.success);
    TEST_ASSERT_EQ(8, sold.sell_value);
}

// ============================================================================
// RULE JOKERS
// ============================================================================

TEST(Catalog, RuleJokersChangeModifiers) {
    JokerEngine engine(test_config());
    InstanceId juggler = acquire(engine, JokerId::JUGGLER);
    acquire(engine, JokerId::FOUR_FINGERS);

    TEST_ASSERT_EQ(1, engine.rule_modifiers().hand_size);
    TEST_ASSERT_TRUE(engine.rule_modifiers().four_fingers);

    auto four_clubs = cards({{Rank::TWO, Suit::CLUBS}, {Rank::SIX, Suit::CLUBS},
                             {Rank::NINE, Suit::CLUBS}, {Rank::KING, Suit::CLUBS}});
    TEST_ASSERT_TRUE(engine.make_hand(four_clubs).evaluation.type == HandType::FLUSH);

    engine.sell(juggler);
    TEST_ASSERT_EQ(0, engine.rule_modifiers().hand_size);
}

// ============================================================================
// LEGACY JOKERS
// ============================================================================

TEST(Catalog, IceCreamMeltsThroughTheBridge) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::ICE_CREAM);
    RunSnapshot run = default_run();

    TEST_ASSERT_EQ(100, engine.process(engine.make_hand(pair_of_kings()), run).aggregate.chips);
    TEST_ASSERT_EQ(95, engine.process(engine.make_hand(pair_of_kings()), run).aggregate.chips);
    TEST_ASSERT_FALSE(engine.jokers().at(0).joker->copyable());
}

TEST(Catalog, SinJokersScoreTheirSuit) {
    JokerEngine engine(test_config());
    acquire(engine, JokerId::LUSTY_JOKER);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), default_run());
    TEST_ASSERT_NEAR(3.0, result.aggregate.mult, 1e-12);  // K of hearts only
    TEST_ASSERT_TRUE(engine.jokers().at(0).joker->copyable());
}
