/**
 * Balatro Joker Engine - Advanced Joker Framework
 *
 * For jokers whose trigger depends on history or on their own counters:
 * "every 6 hands", "hand type already played this round", "Jacks discarded
 * this round". Pieces:
 *
 *   InternalJokerState - counters, flags and free-form json owned by the instance
 *   AdvancedCondition  - condition tree with temporal and state primitives
 *   ConditionCache     - memoizes deterministic condition results per instance
 *   AdvancedJoker      - wires a condition to processor callbacks
 *
 * Cache entries are keyed by (instance slot, context fingerprint, epoch).
 * The epoch is bumped at round boundaries and whenever the internal state
 * changes, which invalidates every older entry without touching it.
 */

#pragma once

#include "conditional_joker.hpp"
#include "joker.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace balatro {

// ============================================================================
// INTERNAL STATE
// ============================================================================

struct InternalJokerState {
    std::map<std::string, int64_t> counters;
    std::map<std::string, bool> flags;
    nlohmann::json data = nlohmann::json::object();
    uint64_t version = 0;  // Bumped by every mutation

    int64_t counter(const std::string& key) const;
    void set_counter(const std::string& key, int64_t value);
    int64_t increment(const std::string& key, int64_t delta = 1);

    bool flag(const std::string& key) const;
    void set_flag(const std::string& key, bool value);

    void set_data(const std::string& key, nlohmann::json value);
    int data_int(const std::string& key, int fallback) const;
    double data_number(const std::string& key, double fallback) const;

    nlohmann::json to_json() const;

    /**
     * Parse a serialized state. Returns nullopt and fills error when the
     * json is malformed.
     */
    static std::optional<InternalJokerState> from_json(const nlohmann::json& j, std::string& error);
};

// ============================================================================
// CONDITION CACHE
// ============================================================================

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;

    double hit_rate() const {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

struct ConditionCacheKey {
    InstanceId instance = 0;
    uint64_t fingerprint = 0;
    uint64_t epoch = 0;

    bool operator==(const ConditionCacheKey& other) const {
        return instance == other.instance && fingerprint == other.fingerprint &&
               epoch == other.epoch;
    }
};

struct ConditionCacheKeyHash {
    size_t operator()(const ConditionCacheKey& key) const {
        uint64_t h = key.fingerprint ^ (key.epoch * 0x9E3779B97F4A7C15ULL);
        h ^= static_cast<uint64_t>(key.instance) << 17;
        return static_cast<size_t>(h);
    }
};

class ConditionCache {
public:
    explicit ConditionCache(size_t max_entries = 1024) : max_entries_(max_entries) {}

    std::optional<bool> lookup(const ConditionCacheKey& key);
    void store(const ConditionCacheKey& key, bool value);

    void bump_epoch() { ++epoch_; }
    uint64_t epoch() const { return epoch_; }

    void clear();
    size_t size() const { return entries_.size(); }
    const CacheStats& stats() const { return stats_; }
    void reset_stats() { stats_ = CacheStats{}; }

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }
    void set_max_entries(size_t max_entries) { max_entries_ = max_entries; }

private:
    std::unordered_map<ConditionCacheKey, bool, ConditionCacheKeyHash> entries_;
    CacheStats stats_;
    uint64_t epoch_ = 0;
    size_t max_entries_;
    bool enabled_ = true;
};

// ============================================================================
// ADVANCED CONDITION
// ============================================================================

class AdvancedCondition {
public:
    enum class Kind : uint8_t {
        BASIC,                               // Wraps a Condition
        HANDS_PLAYED_THIS_ROUND_AT_LEAST,
        CARDS_DISCARDED_THIS_ROUND_AT_LEAST,
        RECENT_HAND_TYPES,                   // Most recent hands match a sequence
        HAND_ALREADY_PLAYED_THIS_ROUND,
        HAND_IS_MOST_PLAYED,
        FIRST_HAND_OF_ROUND,
        FIRST_DISCARD_OF_ROUND,
        FINAL_HAND,
        COUNTER_AT_LEAST,
        COUNTER_MULTIPLE_OF,
        FLAG_SET,
        HAS_JOKER,
        JOKER_COUNT_AT_LEAST,
        ROUND_AT_LEAST,
        ANTE_AT_LEAST,
        AND,
        OR,
        NOT
    };

    AdvancedCondition() : AdvancedCondition(Condition::always()) {}
    AdvancedCondition(Condition basic);  // Implicit: basic conditions lift

    static AdvancedCondition hands_played_this_round_at_least(int n);
    static AdvancedCondition cards_discarded_this_round_at_least(int n);
    static AdvancedCondition recent_hand_types(std::vector<HandType> sequence);
    static AdvancedCondition hand_already_played_this_round();
    static AdvancedCondition hand_is_most_played();
    static AdvancedCondition first_hand_of_round();
    static AdvancedCondition first_discard_of_round();
    static AdvancedCondition final_hand();
    static AdvancedCondition counter_at_least(std::string key, int64_t n);
    static AdvancedCondition counter_multiple_of(std::string key, int64_t n);
    static AdvancedCondition flag_set(std::string key);
    static AdvancedCondition has_joker(JokerId id);
    static AdvancedCondition joker_count_at_least(int n);
    static AdvancedCondition round_at_least(int n);
    static AdvancedCondition ante_at_least(int n);
    static AdvancedCondition all_of(std::vector<AdvancedCondition> children);
    static AdvancedCondition any_of(std::vector<AdvancedCondition> children);
    static AdvancedCondition negate(AdvancedCondition child);

    bool evaluate(GameContext& ctx, const InternalJokerState& state, const Card* card) const;

    /** Deterministic trees can be cached; anything with a CHANCE roll cannot. */
    bool is_cacheable() const;
    bool uses_card() const;
    uint64_t structure_hash() const;

    Kind kind() const { return kind_; }

private:
    explicit AdvancedCondition(Kind kind) : kind_(kind) {}

    Kind kind_ = Kind::BASIC;
    int64_t value_ = 0;
    std::string key_;
    std::vector<HandType> sequence_;
    Condition basic_;
    std::vector<AdvancedCondition> children_;
};

// ============================================================================
// ADVANCED JOKER
// ============================================================================

using AdvancedProcessor = std::function<Effect(GameContext&, InternalJokerState&, const Card*)>;
using AdvancedHook = std::function<Effect(GameContext&, InternalJokerState&)>;
using AdvancedDiscardHook =
    std::function<Effect(GameContext&, InternalJokerState&, const std::vector<Card>&)>;
using AdvancedEventHook =
    std::function<Effect(GameContext&, InternalJokerState&, const GameEvent&)>;
using AdvancedModifiers = std::function<RuleModifiers(const InternalJokerState&)>;

struct AdvancedJokerDef {
    JokerMeta meta;
    AdvancedCondition condition;
    AdvancedProcessor on_hand;
    AdvancedProcessor on_card;
    AdvancedHook on_acquired;
    AdvancedHook on_round_start;
    AdvancedHook on_round_end;
    AdvancedHook on_sold;
    AdvancedDiscardHook on_discard;
    AdvancedEventHook on_event;
    AdvancedModifiers modifiers;
    InternalJokerState initial_state;
};

class AdvancedJoker : public MetaJoker,
                      public JokerGameplay,
                      public JokerLifecycle,
                      public JokerModifiers,
                      public JokerState {
public:
    explicit AdvancedJoker(std::shared_ptr<const AdvancedJokerDef> def);

    JokerGameplay* gameplay() override;
    JokerLifecycle* lifecycle() override { return this; }
    const JokerModifiers* modifiers() const override;
    JokerState* state() override { return this; }
    const JokerState* state() const override { return this; }
    void configure(const EngineConfig& config) override;
    std::unique_ptr<Joker> clone() const override;

    // Gameplay
    Effect on_hand_played(GameContext& ctx) override;
    Effect on_card_scored(GameContext& ctx, const Card& card) override;

    // Lifecycle
    void on_acquired(GameContext& ctx) override;
    Effect on_sold(GameContext& ctx) override;
    Effect on_round_start(GameContext& ctx) override;
    Effect on_round_end(GameContext& ctx) override;
    Effect on_discard(GameContext& ctx, const std::vector<Card>& discarded) override;
    Effect on_game_event(GameContext& ctx, const GameEvent& event) override;

    // Modifiers
    RuleModifiers rule_modifiers() const override;

    // State
    nlohmann::json serialize_state() const override;
    StateResult deserialize_state(const nlohmann::json& state) override;

    const InternalJokerState& internal_state() const { return state_; }
    InternalJokerState& internal_state() { return state_; }
    const ConditionCache& cache() const { return cache_; }

private:
    bool should_process(GameContext& ctx, const Card* card);
    uint64_t fingerprint(const GameContext& ctx, const Card* card) const;
    Effect run_hook(const AdvancedHook& hook, GameContext& ctx);
    void note_state_change(uint64_t version_before);

    std::shared_ptr<const AdvancedJokerDef> def_;
    InternalJokerState state_;
    ConditionCache cache_;
};

/**
 * Fluent builder for AdvancedJokerDef.
 */
class AdvancedJokerBuilder {
public:
    explicit AdvancedJokerBuilder(const JokerMeta& meta) { def_.meta = meta; }

    AdvancedJokerBuilder& when(AdvancedCondition c) { def_.condition = std::move(c); return *this; }
    AdvancedJokerBuilder& on_hand(AdvancedProcessor p) { def_.on_hand = std::move(p); return *this; }
    AdvancedJokerBuilder& on_card(AdvancedProcessor p) { def_.on_card = std::move(p); return *this; }
    AdvancedJokerBuilder& on_acquired(AdvancedHook h) { def_.on_acquired = std::move(h); return *this; }
    AdvancedJokerBuilder& on_round_start(AdvancedHook h) { def_.on_round_start = std::move(h); return *this; }
    AdvancedJokerBuilder& on_round_end(AdvancedHook h) { def_.on_round_end = std::move(h); return *this; }
    AdvancedJokerBuilder& on_sold(AdvancedHook h) { def_.on_sold = std::move(h); return *this; }
    AdvancedJokerBuilder& on_discard(AdvancedDiscardHook h) { def_.on_discard = std::move(h); return *this; }
    AdvancedJokerBuilder& on_event(AdvancedEventHook h) { def_.on_event = std::move(h); return *this; }
    AdvancedJokerBuilder& modifiers(AdvancedModifiers m) { def_.modifiers = std::move(m); return *this; }
    AdvancedJokerBuilder& initial_state(InternalJokerState s) {
        def_.initial_state = std::move(s);
        return *this;
    }

    std::shared_ptr<const AdvancedJokerDef> build() const {
        return std::make_shared<const AdvancedJokerDef>(def_);
    }

private:
    AdvancedJokerDef def_;
};

} // namespace balatro
