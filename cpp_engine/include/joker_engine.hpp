/**
 * Balatro Joker Engine - Engine Facade
 *
 * This is the interface the game engine talks to. It owns the jokers of one
 * run, their state store and the history temporal conditions read, and it
 * turns played hands and run notifications into aggregate Effects.
 *
 * The facade never applies removal directives by itself: callers decide
 * when to apply_removals(), typically right after scoring.
 */

#pragma once

#include "engine_config.hpp"
#include "game_context.hpp"
#include "joker_collection.hpp"
#include "joker_registry.hpp"
#include "joker_state_store.hpp"
#include "score_trace_logger.hpp"
#include "scoring_pipeline.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace balatro {

/**
 * Version of the joker state blob written by serialize_all().
 *   1 - entries carry id, schema and state only
 *   2 - adds slot, sell_value and the state store entry
 *   3 - adds rng_stream so a reloaded run rolls the same random effects
 */
constexpr uint32_t SAVE_FORMAT_VERSION = 3;

struct AcquireResult {
    bool success = false;
    InstanceId handle = 0;
    std::string error;
};

struct SellResult {
    bool success = false;
    int sell_value = 0;
    Effect effect;  // What the joker's on_sold hook asked for
    std::vector<JokerError> errors;
    std::string error;
};

/**
 * A saved joker that could not be restored.
 */
struct LostJoker {
    std::string key;
    InstanceId slot = 0;
    std::string reason;
};

struct LoadResult {
    bool success = false;  // False only for structural failures; nothing changed then
    uint32_t version = 0;
    size_t loaded = 0;
    std::vector<JokerError> errors;
    std::vector<LostJoker> lost;
};

class JokerEngine {
public:
    explicit JokerEngine(EngineConfig config = {},
                         std::shared_ptr<const JokerRegistry> registry = nullptr);
    ~JokerEngine();

    JokerEngine(const JokerEngine&) = delete;
    JokerEngine& operator=(const JokerEngine&) = delete;

    // ========================================================================
    // SCORING
    // ========================================================================

    /**
     * Classify a hand under the current rule modifiers.
     */
    HandView make_hand(std::vector<Card> played, std::vector<Card> held = {}) const;

    /**
     * Score one played hand against every active joker.
     */
    ProcessResult process(const HandView& hand, const RunSnapshot& run);

    /**
     * Apply an aggregate effect to base chips/mult and the wallet using the
     * configured mult bound.
     */
    ScoreApplication apply_effect(const Effect& effect, int64_t base_chips, double base_mult,
                                  int64_t wallet) const;

    // ========================================================================
    // ROSTER
    // ========================================================================

    AcquireResult acquire(JokerId id, const ConstructionArgs& args = nullptr,
                          const RunSnapshot& run = {});

    /**
     * Add an already constructed joker (bridged legacy jokers, tests).
     */
    AcquireResult adopt(std::unique_ptr<Joker> joker, const RunSnapshot& run = {});

    SellResult sell(InstanceId handle, const RunSnapshot& run = {});
    bool destroy(InstanceId handle, const RunSnapshot& run = {});

    /**
     * Carry out removal directives from a result. Returns how many jokers
     * were removed; directives for jokers already gone are skipped.
     */
    size_t apply_removals(const ProcessResult& result, const RunSnapshot& run = {});

    // ========================================================================
    // NOTIFICATIONS
    // ========================================================================

    ProcessResult start_round(const RunSnapshot& run);
    ProcessResult end_round(const RunSnapshot& run);
    ProcessResult notify_discard(const std::vector<Card>& discarded, const RunSnapshot& run);
    ProcessResult notify_event(const GameEvent& event, const RunSnapshot& run);

    /**
     * Combined passive modifiers of every joker, recomputed whenever the
     * roster or joker state changes.
     */
    const RuleModifiers& rule_modifiers() const { return modifiers_; }

    // ========================================================================
    // PERSISTENCE
    // ========================================================================

    nlohmann::json serialize_all() const;

    /**
     * Replace the roster with a saved one. Structural problems (not an
     * object, wrong format, newer version) change nothing. Individual bad
     * entries are skipped and reported; the rest load.
     */
    LoadResult deserialize_all(const nlohmann::json& blob);

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    const JokerCollection& jokers() const { return jokers_; }
    const JokerStateStore& state_store() const { return store_; }
    const GameHistory& history() const { return history_; }
    const EngineConfig& config() const { return config_; }
    const JokerRegistry& registry() const { return *registry_; }
    uint64_t hands_processed() const { return hands_processed_; }
    const ScoreTraceLogger* trace() const { return trace_.get(); }

private:
    ProcessResult run_notification(LifecycleHook hook, const RunSnapshot& run,
                                   const std::vector<Card>* cards = nullptr,
                                   const GameEvent* event = nullptr,
                                   std::optional<size_t> only_position = std::nullopt);
    void apply_bookkeeping(const ProcessResult& result);
    void roster_changed(const RunSnapshot& run);
    void refresh_modifiers();
    ScopedRng make_rng(const RunSnapshot& run);

    EngineConfig config_;
    std::shared_ptr<const JokerRegistry> registry_;
    JokerCollection jokers_;
    JokerStateStore store_;
    GameHistory history_;
    RuleModifiers modifiers_;
    std::unique_ptr<ScoreTraceLogger> trace_;
    HandView empty_hand_;
    uint64_t hands_processed_ = 0;
    uint64_t rng_stream_ = 0;
};

} // namespace balatro
