/**
 * Tests for the legacy joker bridge
 */

#include <sstream>
#include "legacy_joker.hpp"

using namespace balatro;
using namespace balatro::testing;

namespace {

/**
 * Records every event it sees; scores +2 Mult per hand seen so far.
 */
class RecordingLegacy : public LegacyJoker {
public:
    JokerId id() const override { return JokerId::SUPERNOVA; }
    const char* name() const override { return "Recording"; }
    const char* description() const override { return "Remembers events"; }
    Rarity rarity() const override { return Rarity::COMMON; }
    int cost() const override { return 4; }

    Effect evaluate(const LegacyCall& call, GameContext&) override {
        events.push_back(call.event);
        if (call.event == LegacyEvent::HAND_PLAYED) {
            ++hands_;
            return Effect::add_mult(2.0 * hands_);
        }
        if (call.event == LegacyEvent::CARD_SCORED && call.card) {
            return Effect::add_chips(call.card->chip_value());
        }
        if (call.event == LegacyEvent::DISCARD && call.cards) {
            return Effect::earn(static_cast<int64_t>(call.cards->size()));
        }
        return {};
    }

    bool has_state() const override { return stateful_; }
    nlohmann::json save_state() const override { return {{"hands", hands_}}; }
    bool load_state(const nlohmann::json& state, std::string& error) override {
        if (!state.is_object() || !state.contains("hands") || !state["hands"].is_number_integer()) {
            error = "hands missing";
            return false;
        }
        hands_ = state["hands"].get<int>();
        return true;
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<RecordingLegacy>(*this);
    }

    void set_stateful(bool stateful) { stateful_ = stateful; }
    int hands() const { return hands_; }

    std::vector<LegacyEvent> events;

private:
    int hands_ = 0;
    bool stateful_ = true;
};

class PassiveLegacy : public LegacyJoker {
public:
    JokerId id() const override { return JokerId::JUGGLER; }
    const char* name() const override { return "Passive"; }
    const char* description() const override { return "+1 hand size"; }
    Rarity rarity() const override { return Rarity::COMMON; }
    int cost() const override { return 4; }

    Effect evaluate(const LegacyCall&, GameContext&) override { return {}; }

    bool has_passive_modifiers() const override { return true; }
    RuleModifiers passive_modifiers() const override {
        RuleModifiers m;
        m.hand_size = 1;
        return m;
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<PassiveLegacy>();
    }
};

} // anonymous namespace

// ============================================================================
// FORWARDING TESTS
// ============================================================================

TEST(CompatBridge, BridgedOutputMatchesDirectCall) {
    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    RecordingLegacy direct;
    auto bridged = bridge_legacy(std::make_unique<RecordingLegacy>());

    LegacyCall call;
    call.event = LegacyEvent::HAND_PLAYED;
    Effect expected = direct.evaluate(call, ctx);
    Effect actual = bridged->gameplay()->on_hand_played(ctx);
    TEST_ASSERT_NEAR(expected.mult, actual.mult, 1e-12);

    const Card& king = ctx.scoring_cards()[0];
    call.event = LegacyEvent::CARD_SCORED;
    call.card = &king;
    TEST_ASSERT_EQ(direct.evaluate(call, ctx).chips,
                   bridged->gameplay()->on_card_scored(ctx, king).chips);
}

TEST(CompatBridge, IdentityComesFromLegacy) {
    auto bridged = bridge_legacy(std::make_unique<RecordingLegacy>());
    TEST_ASSERT_TRUE(bridged->id() == JokerId::SUPERNOVA);
    TEST_ASSERT_EQ(std::string("Recording"), std::string(bridged->name()));
    TEST_ASSERT_EQ(4, bridged->base_cost());
}

TEST(CompatBridge, LifecycleHooksMapToEvents) {
    auto legacy = std::make_unique<RecordingLegacy>();
    RecordingLegacy* raw = legacy.get();
    auto bridged = bridge_legacy(std::move(legacy));

    ContextFixture f;
    GameContext& ctx = f.context();
    JokerLifecycle* life = bridged->lifecycle();
    TEST_ASSERT_NOT_NULL(life);

    life->on_round_start(ctx);
    life->on_round_end(ctx);
    Effect discard = life->on_discard(ctx, pair_of_kings());
    GameEvent event;
    event.type = GameEventType::BOSS_DEFEATED;
    life->on_game_event(ctx, event);

    TEST_ASSERT_EQ(4u, raw->events.size());
    TEST_ASSERT_TRUE(raw->events[0] == LegacyEvent::BLIND_START);
    TEST_ASSERT_TRUE(raw->events[1] == LegacyEvent::ROUND_END);
    TEST_ASSERT_TRUE(raw->events[2] == LegacyEvent::DISCARD);
    TEST_ASSERT_TRUE(raw->events[3] == LegacyEvent::GAME_EVENT);
    TEST_ASSERT_EQ(2, discard.money);
}

// ============================================================================
// CAPABILITY TESTS
// ============================================================================

TEST(CompatBridge, StatelessLegacyIsCopyable) {
    auto legacy = std::make_unique<RecordingLegacy>();
    legacy->set_stateful(false);
    auto bridged = bridge_legacy(std::move(legacy));

    TEST_ASSERT_NULL(bridged->state());
    TEST_ASSERT_TRUE(bridged->copyable());
    TEST_ASSERT_NULL(bridged->modifiers());
}

TEST(CompatBridge, PassiveModifiersForwarded) {
    auto bridged = bridge_legacy(std::make_unique<PassiveLegacy>());
    const JokerModifiers* mods = bridged->modifiers();
    TEST_ASSERT_NOT_NULL(mods);
    TEST_ASSERT_EQ(1, mods->rule_modifiers().hand_size);
}

// ============================================================================
// STATE TESTS
// ============================================================================

TEST(CompatBridge, StateRoundTrip) {
    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    auto source = bridge_legacy(std::make_unique<RecordingLegacy>());
    source->gameplay()->on_hand_played(ctx);
    source->gameplay()->on_hand_played(ctx);
    nlohmann::json saved = source->state()->serialize_state();

    auto legacy = std::make_unique<RecordingLegacy>();
    RecordingLegacy* raw = legacy.get();
    auto target = bridge_legacy(std::move(legacy));
    TEST_ASSERT_TRUE(target->state()->deserialize_state(saved).success);
    TEST_ASSERT_EQ(2, raw->hands());
}

TEST(CompatBridge, FailedLoadLeavesStateUntouched) {
    ContextFixture f;
    f.play(pair_of_kings());
    GameContext& ctx = f.context();

    auto legacy = std::make_unique<RecordingLegacy>();
    RecordingLegacy* raw = legacy.get();
    auto bridged = bridge_legacy(std::move(legacy));
    bridged->gameplay()->on_hand_played(ctx);

    StateResult result = bridged->state()->deserialize_state({{"hands", "many"}});
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_FALSE(result.error.empty());
    TEST_ASSERT_EQ(1, raw->hands());
}

TEST(CompatBridge, BridgedJokerRunsInEngine) {
    JokerEngine engine(test_config());
    AcquireResult adopted = engine.adopt(bridge_legacy(std::make_unique<RecordingLegacy>()));
    TEST_ASSERT_TRUE(adopted.success);
    engine.acquire(JokerId::JOKER);

    ProcessResult result = engine.process(engine.make_hand(pair_of_kings()), RunSnapshot{});
    TEST_ASSERT_NEAR(6.0, result.aggregate.mult, 1e-12);  // 2 from the bridge, 4 from Joker
    TEST_ASSERT_EQ(20, result.aggregate.chips);           // Two kings through CARD_SCORED
}
