/**
 * Tests for Effect accumulation and score application
 */

#include <cmath>
#include <limits>
#include <sstream>
#include "effect.hpp"

using namespace balatro;

// ============================================================================
// EFFECT VALUE TESTS
// ============================================================================

TEST(Effect, DefaultIsIdentity) {
    Effect e;
    TEST_ASSERT_TRUE(e.is_identity());
    TEST_ASSERT_EQ(0, e.chips);
    TEST_ASSERT_NEAR(0.0, e.mult, 1e-12);
    TEST_ASSERT_NEAR(1.0, e.mult_multiplier, 1e-12);
    TEST_ASSERT_EQ(0, e.money);
}

TEST(Effect, MessageAloneIsIdentity) {
    Effect e;
    e.message = "Nope!";
    TEST_ASSERT_TRUE(e.is_identity());
}

TEST(Effect, CombineAddsAndMultiplies) {
    Effect a = Effect::add_mult(4);
    a.chips = 10;
    Effect b = Effect::times_mult(1.5);
    b.chips = 5;
    b.destroy_self = true;

    Effect c = combine(a, b);
    TEST_ASSERT_EQ(15, c.chips);
    TEST_ASSERT_NEAR(4.0, c.mult, 1e-12);
    TEST_ASSERT_NEAR(1.5, c.mult_multiplier, 1e-12);
    TEST_ASSERT_TRUE(c.destroy_self);
}

TEST(Effect, CombineConcatenatesRequests) {
    Effect a = Effect::create(CreationKind::TAROT);
    Effect b = Effect::create(CreationKind::PLANET, 2);
    Effect c = combine(a, b);
    TEST_ASSERT_EQ(2u, c.creations.size());
    TEST_ASSERT_TRUE(c.creations[1].kind == CreationKind::PLANET);
    TEST_ASSERT_EQ(2, c.creations[1].count);
}

TEST(Effect, ValidateRejectsNegativeMultiplier) {
    TEST_ASSERT_TRUE(validate_effect(Effect::times_mult(-2.0)).has_value());
    TEST_ASSERT_FALSE(validate_effect(Effect::times_mult(0.0)).has_value());
}

TEST(Effect, ValidateRejectsNonFinite) {
    TEST_ASSERT_TRUE(validate_effect(Effect::add_mult(std::nan(""))).has_value());
    TEST_ASSERT_TRUE(
        validate_effect(Effect::times_mult(std::numeric_limits<double>::infinity())).has_value());
}

TEST(Effect, ValidateCapsRetriggers) {
    TEST_ASSERT_FALSE(validate_effect(Effect::retrigger_times(10)).has_value());
    TEST_ASSERT_TRUE(validate_effect(Effect::retrigger_times(11)).has_value());
}

// ============================================================================
// ACCUMULATOR TESTS
// ============================================================================

TEST(Accumulator, AddsInOrder) {
    EffectAccumulator acc;
    TEST_ASSERT_TRUE(acc.accumulate(Effect::add_mult(4)));
    TEST_ASSERT_TRUE(acc.accumulate(Effect::add_mult(4)));
    TEST_ASSERT_TRUE(acc.accumulate(Effect::times_mult(2)));

    TEST_ASSERT_NEAR(8.0, acc.total().mult, 1e-12);
    TEST_ASSERT_NEAR(2.0, acc.total().mult_multiplier, 1e-12);
}

TEST(Accumulator, ClampsAdditiveMult) {
    EffectAccumulator acc;
    acc.accumulate(Effect::add_mult(2000000));
    TEST_ASSERT_NEAR(1000000.0, acc.total().mult, 1e-9);

    acc.accumulate(Effect::add_mult(-5000000));
    TEST_ASSERT_NEAR(-1000000.0, acc.total().mult, 1e-9);
}

TEST(Accumulator, ClampsMultiplier) {
    EffectAccumulator acc;
    for (int i = 0; i < 10; ++i) {
        acc.accumulate(Effect::times_mult(100));
    }
    TEST_ASSERT_NEAR(1000000.0, acc.total().mult_multiplier, 1e-9);
}

TEST(Accumulator, RejectsNonFiniteAndKeepsPriorValue) {
    EffectAccumulator acc;
    acc.accumulate(Effect::add_mult(3));
    bool ok = acc.accumulate(Effect::add_mult(std::numeric_limits<double>::infinity()));

    TEST_ASSERT_FALSE(ok);
    TEST_ASSERT_NEAR(3.0, acc.total().mult, 1e-12);
    TEST_ASSERT_FALSE(acc.last_violation().empty());
}

TEST(Accumulator, RejectsNegativeMultiplier) {
    EffectAccumulator acc;
    acc.accumulate(Effect::times_mult(2));
    TEST_ASSERT_FALSE(acc.accumulate(Effect::times_mult(-1)));
    TEST_ASSERT_NEAR(2.0, acc.total().mult_multiplier, 1e-12);
}

TEST(Accumulator, ChipsSaturate) {
    EffectAccumulator acc;
    acc.accumulate(Effect::add_chips(std::numeric_limits<int64_t>::max()));
    acc.accumulate(Effect::add_chips(100));
    TEST_ASSERT_EQ(std::numeric_limits<int64_t>::max(), acc.total().chips);
}

TEST(Accumulator, ResetRestoresIdentity) {
    EffectAccumulator acc;
    acc.accumulate(Effect::add_mult(4));
    acc.reset();
    TEST_ASSERT_TRUE(acc.total().is_identity());
}

// ============================================================================
// APPLICATION TESTS
// ============================================================================

TEST(Apply, AdditiveThenMultiplier) {
    Effect e;
    e.mult = 8;
    e.mult_multiplier = 2.0;
    ScoreApplication out = apply_effect(e, 20, 2.0, 0);

    TEST_ASSERT_NEAR(20.0, out.mult, 1e-12);  // (2 + 8) * 2
    TEST_ASSERT_EQ(20, out.chips);
    TEST_ASSERT_EQ(400, out.score);
}

TEST(Apply, MultNeverExceedsCap) {
    Effect e;
    e.mult = 900000;
    e.mult_multiplier = 1000;
    ScoreApplication out = apply_effect(e, 1, 10.0, 0);
    TEST_ASSERT_NEAR(1000000.0, out.mult, 1e-9);
}

TEST(Apply, NegativeAdditiveFloorsAtZero) {
    ScoreApplication out = apply_effect(Effect::add_mult(-50), 10, 4.0, 0);
    TEST_ASSERT_NEAR(0.0, out.mult, 1e-12);
    TEST_ASSERT_EQ(0, out.score);
}

TEST(Apply, WalletNeverNegative) {
    ScoreApplication out = apply_effect(Effect::earn(-30), 0, 0.0, 10);
    TEST_ASSERT_EQ(0, out.wallet);

    out = apply_effect(Effect::earn(5), 0, 0.0, 10);
    TEST_ASSERT_EQ(15, out.wallet);
}

TEST(Apply, ChipsFloorAtZero) {
    ScoreApplication out = apply_effect(Effect::add_chips(-100), 30, 1.0, 0);
    TEST_ASSERT_EQ(0, out.chips);
}

TEST(Apply, ScoreSaturates) {
    Effect e = Effect::add_chips(std::numeric_limits<int64_t>::max() / 2);
    ScoreApplication out = apply_effect(e, 0, 1000000.0, 0);
    TEST_ASSERT_EQ(std::numeric_limits<int64_t>::max(), out.score);
}
