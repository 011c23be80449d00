/**
 * Tests for the two-pass scoring pipeline
 */

#include <sstream>
#include "scoring_pipeline.hpp"

using namespace balatro;
using namespace balatro::testing;

namespace {

/**
 * Requests the same number of retriggers for every scored card.
 */
class RetriggerJoker : public MetaJoker, public JokerGameplay {
public:
    explicit RetriggerJoker(uint32_t count)
        : MetaJoker({JokerId::HACK, "Retrigger", "Retriggers every card", Rarity::COMMON, 4}),
          count_(count) {}

    JokerGameplay* gameplay() override { return this; }
    std::unique_ptr<Joker> clone() const override { return std::make_unique<RetriggerJoker>(count_); }

    Effect on_hand_played(GameContext&) override { return {}; }
    Effect on_card_scored(GameContext&, const Card&) override {
        return Effect::retrigger_times(count_);
    }

private:
    uint32_t count_;
};

/**
 * +1 Chip every time a card scores, so retriggers are countable.
 */
class ChipPerCardJoker : public MetaJoker, public JokerGameplay {
public:
    ChipPerCardJoker()
        : MetaJoker({JokerId::SCARY_FACE, "Counter", "+1 Chip per scored card", Rarity::COMMON, 4}) {}

    JokerGameplay* gameplay() override { return this; }
    std::unique_ptr<Joker> clone() const override { return std::make_unique<ChipPerCardJoker>(); }

    Effect on_hand_played(GameContext&) override { return {}; }
    Effect on_card_scored(GameContext&, const Card&) override { return Effect::add_chips(1); }
};

Effect self_destroying(double mult) {
    Effect effect = Effect::add_mult(mult);
    effect.destroy_self = true;
    return effect;
}

struct PipelineFixture {
    JokerCollection jokers;
    EngineConfig config = test_config();
    ContextFixture f;

    InstanceId add(std::unique_ptr<Joker> joker) { return jokers.add(std::move(joker)); }

    ProcessResult score(std::vector<Card> played) {
        f.roster = jokers.roster();
        f.play(std::move(played));
        GameContext& ctx = f.context();
        ScoringPipeline pipeline(jokers, config);
        return pipeline.score_hand(ctx);
    }
};

} // anonymous namespace

// ============================================================================
// ACCUMULATION TESTS
// ============================================================================

TEST(Pipeline, NoJokersIsIdentity) {
    PipelineFixture p;
    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_TRUE(result.aggregate.is_identity());
    TEST_ASSERT_TRUE(result.success());
    TEST_ASSERT_TRUE(result.removals.empty());
}

TEST(Pipeline, AdditiveThenMultiplicative) {
    PipelineFixture p;
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(4)));
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(4), JokerId::JOLLY_JOKER));
    p.add(std::make_unique<FixedJoker>(Effect::times_mult(2), JokerId::CAVENDISH));

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_NEAR(8.0, result.aggregate.mult, 1e-12);
    TEST_ASSERT_NEAR(2.0, result.aggregate.mult_multiplier, 1e-12);
    TEST_ASSERT_EQ(3u, result.triggered.size());

    ScoreApplication applied = apply_effect(result.aggregate, 20, 2.0, 0);
    TEST_ASSERT_NEAR(20.0, applied.mult, 1e-12);
    TEST_ASSERT_EQ(400, applied.score);
}

TEST(Pipeline, ClampsHugeMult) {
    PipelineFixture p;
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(2000000)));

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_NEAR(1000000.0, result.aggregate.mult, 1e-9);
}

TEST(Pipeline, RejectedFieldIsReported) {
    PipelineFixture p;
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(3)));
    p.add(std::make_unique<FixedJoker>(Effect::times_mult(-2), JokerId::CAVENDISH));

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_NEAR(3.0, result.aggregate.mult, 1e-12);
    TEST_ASSERT_NEAR(1.0, result.aggregate.mult_multiplier, 1e-12);
    TEST_ASSERT_EQ(1u, result.errors.size());
    TEST_ASSERT_TRUE(result.errors[0].kind == ErrorKind::NUMERIC_BOUND);
}

// ============================================================================
// ISOLATION TESTS
// ============================================================================

TEST(Pipeline, ThrowingHookIsIsolated) {
    PipelineFixture p;
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(4)));
    p.add(std::make_unique<ThrowingJoker>());
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(4), JokerId::JOLLY_JOKER));

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_NEAR(8.0, result.aggregate.mult, 1e-12);

    // One hand hook and two card hooks
    TEST_ASSERT_EQ(3u, result.errors.size());
    for (const auto& error : result.errors) {
        TEST_ASSERT_TRUE(error.kind == ErrorKind::HOOK_INVOCATION);
        TEST_ASSERT_TRUE(error.joker_id == JokerId::MISPRINT);
    }
}

TEST(Pipeline, SelfDestroyKeepsSiblings) {
    PipelineFixture p;
    InstanceId doomed = p.add(std::make_unique<FixedJoker>(self_destroying(10)));
    p.add(std::make_unique<FixedJoker>(Effect::add_mult(4), JokerId::JOLLY_JOKER));

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_NEAR(14.0, result.aggregate.mult, 1e-12);
    TEST_ASSERT_EQ(1u, result.removals.size());
    TEST_ASSERT_EQ(doomed, result.removals[0].slot);
    TEST_ASSERT_EQ(2u, p.jokers.size());  // Removal is only a directive
}

// ============================================================================
// RETRIGGER TESTS
// ============================================================================

TEST(Pipeline, RetriggerRerunsCardPass) {
    PipelineFixture p;
    p.add(std::make_unique<RetriggerJoker>(1));
    p.add(std::make_unique<ChipPerCardJoker>());

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_EQ(2u, result.metrics.retriggers);
    TEST_ASSERT_EQ(4, result.aggregate.chips);
}

TEST(Pipeline, RetriggerRequestIsCappedPerEffect) {
    PipelineFixture p;
    p.add(std::make_unique<RetriggerJoker>(50));

    ProcessResult result = p.score(cards({{Rank::ACE, Suit::SPADES}}));
    TEST_ASSERT_EQ(10u, result.metrics.retriggers);
    TEST_ASSERT_FALSE(result.errors.empty());
    TEST_ASSERT_TRUE(result.errors[0].kind == ErrorKind::NUMERIC_BOUND);
}

TEST(Pipeline, RetriggerBudgetPerHand) {
    PipelineFixture p;
    p.config.max_retriggers = 3;
    p.add(std::make_unique<RetriggerJoker>(2));
    p.add(std::make_unique<ChipPerCardJoker>());

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_EQ(3u, result.metrics.retriggers);
    TEST_ASSERT_EQ(5, result.aggregate.chips);  // 2 base passes + 3 retriggers
    TEST_ASSERT_EQ(1u, result.errors.size());
}

// ============================================================================
// COPY TESTS
// ============================================================================

TEST(Pipeline, CopiedEffectDropsDestroyRequest) {
    PipelineFixture p;
    auto registry = get_joker_registry();
    p.add(registry->create(JokerId::BLUEPRINT).joker);
    InstanceId doomed = p.add(std::make_unique<FixedJoker>(self_destroying(5)));

    ProcessResult result = p.score(pair_of_kings());
    TEST_ASSERT_NEAR(10.0, result.aggregate.mult, 1e-12);
    TEST_ASSERT_EQ(1u, result.removals.size());
    TEST_ASSERT_EQ(doomed, result.removals[0].slot);
}

TEST(Pipeline, NotCopyableTargetGivesNothing) {
    PipelineFixture p;
    auto registry = get_joker_registry();
    p.add(registry->create(JokerId::BLUEPRINT).joker);
    p.add(std::make_unique<ThrowingJoker>());

    ProcessResult result = p.score(pair_of_kings());
    // Only the target's own hooks fail; the copy never runs them
    TEST_ASSERT_EQ(3u, result.errors.size());
}

// ============================================================================
// DETERMINISM TESTS
// ============================================================================

TEST(Pipeline, SameSeedSameResult) {
    auto run_once = []() {
        JokerEngine engine(test_config());
        engine.acquire(JokerId::MISPRINT);
        engine.acquire(JokerId::BLOODSTONE);
        RunSnapshot run;
        run.seed = 777;
        std::vector<double> mults;
        for (int i = 0; i < 5; ++i) {
            ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), run);
            mults.push_back(result.aggregate.mult * result.aggregate.mult_multiplier);
        }
        return mults;
    };

    std::vector<double> first = run_once();
    std::vector<double> second = run_once();
    TEST_ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        TEST_ASSERT_NEAR(first[i], second[i], 1e-12);
    }
}
