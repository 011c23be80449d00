/**
 * Tests for the engine facade: roster, persistence, configuration, tracing
 */

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include "joker_engine.hpp"

using namespace balatro;
using namespace balatro::testing;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

nlohmann::json save_header(int version) {
    nlohmann::json blob;
    blob["format"] = "joker_state";
    blob["version"] = version;
    blob["jokers"] = nlohmann::json::array();
    return blob;
}

std::vector<JokerId> roster_ids(const JokerEngine& engine) {
    std::vector<JokerId> ids;
    for (const auto& slot : engine.jokers()) {
        ids.push_back(slot.joker->id());
    }
    return ids;
}

} // anonymous namespace

// ============================================================================
// ROSTER TESTS
// ============================================================================

TEST(Engine, AcquireRespectsSlotCapacity) {
    EngineConfig config = test_config();
    config.joker_slots = 2;
    JokerEngine engine(config);

    TEST_ASSERT_TRUE(engine.acquire(JokerId::JOKER).success);
    TEST_ASSERT_TRUE(engine.acquire(JokerId::JOLLY_JOKER).success);

    AcquireResult third = engine.acquire(JokerId::ZANY_JOKER);
    TEST_ASSERT_FALSE(third.success);
    TEST_ASSERT_FALSE(third.error.empty());
    TEST_ASSERT_EQ(2u, engine.jokers().size());
}

TEST(Engine, AcquireWithBadArgumentsChangesNothing) {
    JokerEngine engine(test_config());
    AcquireResult result = engine.acquire(JokerId::ANCIENT_JOKER, {{"suit", "cups"}});
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(engine.jokers().empty());
}

TEST(Engine, HandlesStayFixed) {
    JokerEngine engine(test_config());
    InstanceId first = engine.acquire(JokerId::JOKER).handle;
    InstanceId second = engine.acquire(JokerId::JOKER).handle;
    TEST_ASSERT_NE(first, second);

    TEST_ASSERT_TRUE(engine.sell(first).success);
    InstanceId third = engine.acquire(JokerId::JOKER).handle;
    TEST_ASSERT_NE(first, third);
    TEST_ASSERT_TRUE(engine.jokers().position_of(second) == 0u);
}

TEST(Engine, SellUnknownHandleFails) {
    JokerEngine engine(test_config());
    SellResult sold = engine.sell(42);
    TEST_ASSERT_FALSE(sold.success);
    TEST_ASSERT_FALSE(sold.error.empty());
}

TEST(Engine, SellReturnsSellValueAndHookEffect) {
    JokerEngine engine(test_config());
    InstanceId handle = engine.acquire(JokerId::JOKER).handle;
    SellResult sold = engine.sell(handle);
    TEST_ASSERT_TRUE(sold.success);
    TEST_ASSERT_EQ(1, sold.sell_value);
    TEST_ASSERT_TRUE(engine.jokers().empty());
}

TEST(Engine, ApplyRemovalsSkipsMissingJokers) {
    JokerEngine engine(test_config());
    InstanceId handle = engine.acquire(JokerId::JOKER).handle;

    ProcessResult result;
    result.removals.push_back({handle, JokerId::JOKER, handle, "test"});
    result.removals.push_back({handle, JokerId::JOKER, handle, "test"});
    TEST_ASSERT_EQ(1u, engine.apply_removals(result));
}

// ============================================================================
// HISTORY TESTS
// ============================================================================

TEST(Engine, RecordsHandsAndDiscards) {
    JokerEngine engine(test_config());
    RunSnapshot run;
    engine.start_round(run);
    engine.process(engine.make_hand(pair_of_kings()), run);
    engine.notify_discard(pair_of_kings(), run);

    TEST_ASSERT_EQ(1, engine.history().hands_played_this_round());
    TEST_ASSERT_EQ(2, engine.history().cards_discarded_this_round());
    TEST_ASSERT_EQ(1u, engine.hands_processed());

    run.round = 2;
    engine.start_round(run);
    TEST_ASSERT_EQ(0, engine.history().hands_played_this_round());
}

// ============================================================================
// PERSISTENCE TESTS
// ============================================================================

TEST(Persistence, RoundTripRestoresBehaviour) {
    JokerEngine engine(test_config());
    RunSnapshot run;
    run.seed = 777;
    engine.acquire(JokerId::GREEN_JOKER);
    engine.acquire(JokerId::SELTZER);
    engine.acquire(JokerId::ANCIENT_JOKER, {{"suit", "spades"}});
    engine.acquire(JokerId::MISPRINT);
    engine.process(engine.make_hand(pair_of_kings()), run);
    engine.process(engine.make_hand(pair_of_kings()), run);
    engine.end_round(run);

    nlohmann::json blob = engine.serialize_all();
    TEST_ASSERT_EQ(std::string("joker_state"), blob["format"].get<std::string>());
    TEST_ASSERT_EQ(SAVE_FORMAT_VERSION, blob["version"].get<uint32_t>());
    TEST_ASSERT_EQ(4u, blob["jokers"].size());
    TEST_ASSERT_TRUE(blob["rng_stream"].get<uint64_t>() > 0);

    JokerEngine restored(test_config());
    LoadResult loaded = restored.deserialize_all(blob);
    TEST_ASSERT_TRUE(loaded.success);
    TEST_ASSERT_EQ(4u, loaded.loaded);
    TEST_ASSERT_TRUE(loaded.lost.empty());
    TEST_ASSERT_TRUE(roster_ids(engine) == roster_ids(restored));

    for (size_t i = 0; i < engine.jokers().size(); ++i) {
        TEST_ASSERT_EQ(engine.jokers().at(i).slot, restored.jokers().at(i).slot);
        TEST_ASSERT_EQ(engine.jokers().at(i).sell_value, restored.jokers().at(i).sell_value);
    }

    // Misprint rolls from the per-hand stream, so the reloaded run replays it
    for (int hand = 0; hand < 4; ++hand) {
        ProcessResult original = engine.process(engine.make_hand(pair_of_kings()), run);
        ProcessResult copy = restored.process(restored.make_hand(pair_of_kings()), run);
        TEST_ASSERT_NEAR(original.aggregate.mult, copy.aggregate.mult, 1e-12);
        TEST_ASSERT_NEAR(original.aggregate.mult_multiplier, copy.aggregate.mult_multiplier, 1e-12);
        TEST_ASSERT_EQ(original.metrics.retriggers, copy.metrics.retriggers);
    }
}

TEST(Persistence, OlderBlobStartsRngStreamAtZero) {
    nlohmann::json older = save_header(2);
    older["jokers"].push_back({{"id", "misprint"}, {"slot", 1}});
    nlohmann::json current = save_header(SAVE_FORMAT_VERSION);
    current["rng_stream"] = 0;
    current["jokers"] = older["jokers"];

    JokerEngine from_older(test_config());
    JokerEngine from_current(test_config());
    TEST_ASSERT_TRUE(from_older.deserialize_all(older).success);
    TEST_ASSERT_TRUE(from_current.deserialize_all(current).success);

    RunSnapshot run;
    run.seed = 31;
    for (int hand = 0; hand < 3; ++hand) {
        double a = from_older.process(from_older.make_hand(pair_of_kings()), run).aggregate.mult;
        double b = from_current.process(from_current.make_hand(pair_of_kings()), run).aggregate.mult;
        TEST_ASSERT_NEAR(a, b, 1e-12);
    }
}

TEST(Persistence, MissingRngStreamIsCorrupt) {
    nlohmann::json blob = save_header(3);
    JokerEngine engine(test_config());
    engine.acquire(JokerId::JOKER);

    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_FALSE(loaded.success);
    TEST_ASSERT_TRUE(loaded.errors[0].kind == ErrorKind::CORRUPT_BLOB);
    TEST_ASSERT_EQ(1u, engine.jokers().size());
}

TEST(Persistence, NewerVersionChangesNothing) {
    JokerEngine engine(test_config());
    engine.acquire(JokerId::JOKER);

    nlohmann::json blob = save_header(SAVE_FORMAT_VERSION + 1);
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_FALSE(loaded.success);
    TEST_ASSERT_EQ(1u, loaded.errors.size());
    TEST_ASSERT_TRUE(loaded.errors[0].kind == ErrorKind::UNSUPPORTED_VERSION);
    TEST_ASSERT_EQ(1u, engine.jokers().size());
}

TEST(Persistence, RejectedLoadKeepsScalingValues) {
    JokerEngine engine(test_config());
    RunSnapshot run;
    engine.acquire(JokerId::GREEN_JOKER);
    engine.acquire(JokerId::ANCIENT_JOKER, {{"suit", "hearts"}});
    engine.process(engine.make_hand(pair_of_kings()), run);
    engine.process(engine.make_hand(pair_of_kings()), run);
    std::string before = engine.serialize_all().dump();

    nlohmann::json newer = save_header(SAVE_FORMAT_VERSION + 1);
    newer["jokers"].push_back({{"id", "green_joker"}, {"slot", 1}, {"store", {{"mult", 40}}}});
    TEST_ASSERT_FALSE(engine.deserialize_all(newer).success);

    nlohmann::json no_stream = save_header(SAVE_FORMAT_VERSION);
    no_stream["jokers"] = newer["jokers"];
    TEST_ASSERT_FALSE(engine.deserialize_all(no_stream).success);

    TEST_ASSERT_EQ(before, engine.serialize_all().dump());
}

TEST(Persistence, StructuralProblemsAreCorruptBlob) {
    JokerEngine engine(test_config());
    engine.acquire(JokerId::JOKER);

    LoadResult not_object = engine.deserialize_all(nlohmann::json::array());
    TEST_ASSERT_FALSE(not_object.success);
    TEST_ASSERT_TRUE(not_object.errors[0].kind == ErrorKind::CORRUPT_BLOB);

    nlohmann::json wrong_tag = save_header(2);
    wrong_tag["format"] = "deck_state";
    TEST_ASSERT_FALSE(engine.deserialize_all(wrong_tag).success);

    nlohmann::json no_list = save_header(2);
    no_list.erase("jokers");
    TEST_ASSERT_FALSE(engine.deserialize_all(no_list).success);

    TEST_ASSERT_EQ(1u, engine.jokers().size());
}

TEST(Persistence, BadEntriesAreLostOthersLoad) {
    nlohmann::json blob = save_header(2);
    blob["jokers"].push_back({{"id", "joker"}, {"slot", 1}, {"schema", 1},
                              {"sell_value", 1}, {"state", nullptr}, {"store", nullptr}});
    blob["jokers"].push_back({{"id", "not_a_joker"}, {"slot", 2}, {"schema", 1},
                              {"state", nullptr}});
    blob["jokers"].push_back({{"id", "seltzer"}, {"slot", 3}, {"schema", 1},
                              {"state", {{"counters", "broken"}}}});
    blob["jokers"].push_back({{"id", "egg"}, {"slot", 4}, {"schema", 1}, {"state", nullptr}});
    blob["jokers"].push_back({{"id", "popcorn"}, {"slot", 5}, {"schema", 1},
                              {"state", {{"mult", 12}}}});

    JokerEngine engine(test_config());
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_TRUE(loaded.success);
    TEST_ASSERT_EQ(3u, loaded.loaded);  // joker, egg, popcorn
    TEST_ASSERT_EQ(2u, loaded.lost.size());
    TEST_ASSERT_EQ(std::string("not_a_joker"), loaded.lost[0].key);
    TEST_ASSERT_EQ(std::string("seltzer"), loaded.lost[1].key);
    TEST_ASSERT_TRUE(loaded.errors[1].kind == ErrorKind::STATE_DESERIALIZE);

    nlohmann::json popcorn = engine.jokers().at(2).joker->state()->serialize_state();
    TEST_ASSERT_EQ(12, popcorn["mult"].get<int>());
}

TEST(Persistence, DuplicateSlotIsLost) {
    nlohmann::json blob = save_header(2);
    blob["jokers"].push_back({{"id", "joker"}, {"slot", 4}, {"schema", 1}, {"state", nullptr}});
    blob["jokers"].push_back({{"id", "egg"}, {"slot", 4}, {"schema", 1}, {"state", nullptr}});

    JokerEngine engine(test_config());
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_EQ(1u, loaded.loaded);
    TEST_ASSERT_EQ(1u, loaded.lost.size());
    TEST_ASSERT_TRUE(engine.jokers().at(0).joker->id() == JokerId::JOKER);
}

TEST(Persistence, VersionOneDefaults) {
    nlohmann::json blob = save_header(1);
    blob["jokers"].push_back({{"id", "joker"}, {"schema", 1}, {"state", nullptr}});
    blob["jokers"].push_back({{"id", "egg"}, {"schema", 1}, {"state", nullptr}});

    JokerEngine engine(test_config());
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_TRUE(loaded.success);
    TEST_ASSERT_EQ(1u, loaded.version);
    TEST_ASSERT_EQ(2u, loaded.loaded);

    TEST_ASSERT_EQ(1u, engine.jokers().at(0).slot);
    TEST_ASSERT_EQ(2u, engine.jokers().at(1).slot);
    TEST_ASSERT_EQ(1, engine.jokers().at(0).sell_value);  // Joker costs 2
    TEST_ASSERT_EQ(2, engine.jokers().at(1).sell_value);  // Egg costs 4

    // New jokers get fresh handles above the restored ones
    InstanceId next = engine.acquire(JokerId::JOKER).handle;
    TEST_ASSERT_EQ(3u, next);
}

TEST(Persistence, NewerStateSchemaIsLost) {
    nlohmann::json blob = save_header(2);
    blob["jokers"].push_back({{"id", "seltzer"}, {"slot", 1}, {"schema", 99},
                              {"state", nlohmann::json::object()}});

    JokerEngine engine(test_config());
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_TRUE(loaded.success);
    TEST_ASSERT_EQ(0u, loaded.loaded);
    TEST_ASSERT_TRUE(loaded.errors[0].kind == ErrorKind::UNSUPPORTED_VERSION);
}

TEST(Persistence, OversizedSchemaIsNotTruncated) {
    nlohmann::json blob = save_header(2);
    // 2^32 + 1 would read as schema 1 if narrowed to 32 bits
    blob["jokers"].push_back({{"id", "seltzer"}, {"slot", 1}, {"schema", 4294967297ull},
                              {"state", nullptr}});
    blob["jokers"].push_back({{"id", "joker"}, {"slot", 2}, {"schema", 4294967297ull}});

    JokerEngine engine(test_config());
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_TRUE(loaded.success);
    TEST_ASSERT_EQ(0u, loaded.loaded);
    TEST_ASSERT_EQ(2u, loaded.errors.size());
    for (const auto& error : loaded.errors) {
        TEST_ASSERT_TRUE(error.kind == ErrorKind::UNSUPPORTED_VERSION);
    }
}

TEST(Persistence, SlotAtHandleLimitIsRejected) {
    nlohmann::json blob = save_header(2);
    blob["jokers"].push_back({{"id", "joker"}, {"slot", 1}});
    blob["jokers"].push_back({{"id", "egg"}, {"slot", 4294967295ull}});
    blob["jokers"].push_back({{"id", "mad_joker"}, {"slot", 4294967297ull}});

    JokerEngine engine(test_config());
    LoadResult loaded = engine.deserialize_all(blob);
    TEST_ASSERT_TRUE(loaded.success);
    TEST_ASSERT_EQ(1u, loaded.loaded);
    TEST_ASSERT_EQ(2u, loaded.lost.size());
    for (const auto& error : loaded.errors) {
        TEST_ASSERT_TRUE(error.kind == ErrorKind::CORRUPT_BLOB);
    }

    // New handles stay unique
    InstanceId first = engine.acquire(JokerId::JOKER).handle;
    InstanceId second = engine.acquire(JokerId::MAD_JOKER).handle;
    TEST_ASSERT_EQ(2u, first);
    TEST_ASSERT_EQ(3u, second);
    TEST_ASSERT_TRUE(engine.sell(1).success);
    TEST_ASSERT_NOT_NULL(engine.jokers().find(2));
}

TEST(Collection, RestoreRefusesWrappingAndHeldSlots) {
    JokerCollection jokers;
    auto registry = get_joker_registry();
    TEST_ASSERT_TRUE(jokers.restore(5, registry->create(JokerId::JOKER).joker, 1));
    TEST_ASSERT_FALSE(jokers.restore(5, registry->create(JokerId::EGG).joker, 1));
    TEST_ASSERT_FALSE(jokers.restore(std::numeric_limits<InstanceId>::max(),
                                     registry->create(JokerId::EGG).joker, 1));
    TEST_ASSERT_TRUE(jokers.restore(MAX_RESTORABLE_SLOT, registry->create(JokerId::EGG).joker, 1));
    TEST_ASSERT_EQ(2u, jokers.size());
}

// ============================================================================
// CONFIGURATION TESTS
// ============================================================================

TEST(Config, ApplyOverridesPresentFields) {
    EngineConfig config;
    TEST_ASSERT_TRUE(config.apply({{"max_mult", 500.0}, {"joker_slots", 7}, {"cache_enabled", false}}));
    TEST_ASSERT_NEAR(500.0, config.max_mult, 1e-12);
    TEST_ASSERT_EQ(7, config.joker_slots);
    TEST_ASSERT_FALSE(config.cache_enabled);
    TEST_ASSERT_EQ(100u, config.max_retriggers);
}

TEST(Config, ApplyRejectsBadFields) {
    EngineConfig config;
    TEST_ASSERT_FALSE(config.apply({{"max_mult", -1.0}}));
    TEST_ASSERT_FALSE(config.apply({{"joker_slots", "many"}}));
    TEST_ASSERT_FALSE(config.apply({{"joker_slots", -2}}));
    TEST_ASSERT_FALSE(config.apply({{"max_retriggers", -1}}));
    TEST_ASSERT_FALSE(config.apply({{"max_retriggers_per_effect", -1}}));
    TEST_ASSERT_FALSE(config.apply({{"cache_max_entries", -5}}));
    TEST_ASSERT_EQ(100u, config.max_retriggers);
    TEST_ASSERT_EQ(static_cast<uint32_t>(MAX_RETRIGGERS_PER_EFFECT), config.max_retriggers_per_effect);
}

TEST(Config, FailedApplyChangesNothing) {
    EngineConfig config;
    EngineConfig before = config;

    // Valid fields come before the bad one
    TEST_ASSERT_FALSE(config.apply({{"max_mult", 250.0},
                                    {"max_retriggers", 7},
                                    {"trace_dir", "elsewhere"},
                                    {"joker_slots", -1}}));
    TEST_ASSERT_EQ(before.to_json().dump(), config.to_json().dump());
}

TEST(Config, LoadFromFile) {
    std::string path = temp_path("joker_engine_config_test.json");
    {
        std::ofstream out(path);
        out << R"({"max_retriggers": 12, "seed": 99, "trace_enabled": false})";
    }

    EngineConfig config;
    TEST_ASSERT_TRUE(config.load_from_json(path));
    TEST_ASSERT_EQ(12u, config.max_retriggers);
    TEST_ASSERT_EQ(99u, config.seed);
    std::filesystem::remove(path);

    TEST_ASSERT_FALSE(config.load_from_json(temp_path("joker_engine_missing.json")));
}

TEST(Config, LoadRejectsMalformedFile) {
    std::string path = temp_path("joker_engine_bad_config.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EngineConfig config;
    TEST_ASSERT_FALSE(config.load_from_json(path));
    std::filesystem::remove(path);
}

TEST(Config, MaxMultBoundsApplication) {
    EngineConfig config = test_config();
    config.max_mult = 100.0;
    JokerEngine engine(config);

    Effect effect = Effect::add_mult(500);
    ScoreApplication applied = engine.apply_effect(effect, 10, 1.0, 0);
    TEST_ASSERT_NEAR(100.0, applied.mult, 1e-12);
    TEST_ASSERT_EQ(1000, applied.score);
}

// ============================================================================
// TRACE TESTS
// ============================================================================

TEST(Trace, WritesScoringLog) {
    EngineConfig config = test_config();
    config.trace_enabled = true;
    config.trace_dir = temp_path("joker_engine_traces");

    std::string log_path;
    {
        JokerEngine engine(config);
        TEST_ASSERT_NOT_NULL(engine.trace());
        engine.acquire(JokerId::JOKER);
        engine.process(engine.make_hand(pair_of_kings()), RunSnapshot{});
        log_path = engine.trace()->get_log_path();
    }

    std::ifstream in(log_path);
    TEST_ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    TEST_ASSERT_TRUE(contents.str().find("SCORE TRACE") != std::string::npos);
    TEST_ASSERT_TRUE(contents.str().find("Joker") != std::string::npos);

    in.close();
    std::filesystem::remove_all(config.trace_dir);
}

TEST(Trace, DisabledByDefault) {
    JokerEngine engine(test_config());
    TEST_ASSERT_NULL(engine.trace());
}
