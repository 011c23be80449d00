/**
 * Balatro Joker Engine - Advanced Joker Framework Implementation
 */

#include "advanced_joker.hpp"
#include "engine_config.hpp"

#include <algorithm>

namespace balatro {

namespace {

constexpr uint64_t FNV_OFFSET = 1469598103934665603ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

void mix(uint64_t& h, uint64_t v) {
    h ^= v;
    h *= FNV_PRIME;
}

} // anonymous namespace

// ============================================================================
// INTERNAL STATE
// ============================================================================

int64_t InternalJokerState::counter(const std::string& key) const {
    auto it = counters.find(key);
    return it == counters.end() ? 0 : it->second;
}

void InternalJokerState::set_counter(const std::string& key, int64_t value) {
    counters[key] = value;
    ++version;
}

int64_t InternalJokerState::increment(const std::string& key, int64_t delta) {
    int64_t& value = counters[key];
    value += delta;
    ++version;
    return value;
}

bool InternalJokerState::flag(const std::string& key) const {
    auto it = flags.find(key);
    return it != flags.end() && it->second;
}

void InternalJokerState::set_flag(const std::string& key, bool value) {
    flags[key] = value;
    ++version;
}

void InternalJokerState::set_data(const std::string& key, nlohmann::json value) {
    data[key] = std::move(value);
    ++version;
}

int InternalJokerState::data_int(const std::string& key, int fallback) const {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int>();
}

double InternalJokerState::data_number(const std::string& key, double fallback) const {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

nlohmann::json InternalJokerState::to_json() const {
    nlohmann::json out;
    out["counters"] = counters;
    out["flags"] = flags;
    out["data"] = data;
    out["version"] = version;
    return out;
}

std::optional<InternalJokerState> InternalJokerState::from_json(const nlohmann::json& j,
                                                                std::string& error) {
    if (!j.is_object()) {
        error = "state must be an object";
        return std::nullopt;
    }

    InternalJokerState staged;
    if (j.contains("counters")) {
        const auto& counters = j["counters"];
        if (!counters.is_object()) {
            error = "counters must be an object";
            return std::nullopt;
        }
        for (auto it = counters.begin(); it != counters.end(); ++it) {
            if (!it.value().is_number_integer()) {
                error = "counter '" + it.key() + "' is not an integer";
                return std::nullopt;
            }
            staged.counters[it.key()] = it.value().get<int64_t>();
        }
    }
    if (j.contains("flags")) {
        const auto& flags = j["flags"];
        if (!flags.is_object()) {
            error = "flags must be an object";
            return std::nullopt;
        }
        for (auto it = flags.begin(); it != flags.end(); ++it) {
            if (!it.value().is_boolean()) {
                error = "flag '" + it.key() + "' is not a boolean";
                return std::nullopt;
            }
            staged.flags[it.key()] = it.value().get<bool>();
        }
    }
    if (j.contains("data")) {
        if (!j["data"].is_object()) {
            error = "data must be an object";
            return std::nullopt;
        }
        staged.data = j["data"];
    }
    if (j.contains("version")) {
        const auto& version = j["version"];
        bool non_negative = version.is_number_unsigned() ||
                            (version.is_number_integer() && version.get<int64_t>() >= 0);
        if (!non_negative) {
            error = "version must be a non-negative integer";
            return std::nullopt;
        }
        staged.version = j["version"].get<uint64_t>();
    }
    return staged;
}

// ============================================================================
// CONDITION CACHE
// ============================================================================

std::optional<bool> ConditionCache::lookup(const ConditionCacheKey& key) {
    if (!enabled_) {
        return std::nullopt;
    }
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    ++stats_.hits;
    return it->second;
}

void ConditionCache::store(const ConditionCacheKey& key, bool value) {
    if (!enabled_ || max_entries_ == 0) {
        return;
    }
    if (entries_.size() >= max_entries_) {
        // Stale epochs make up most of a full table; start over
        stats_.evictions += entries_.size();
        entries_.clear();
    }
    entries_[key] = value;
}

void ConditionCache::clear() {
    entries_.clear();
    ++epoch_;
}

// ============================================================================
// ADVANCED CONDITION
// ============================================================================

AdvancedCondition::AdvancedCondition(Condition basic) : kind_(Kind::BASIC), basic_(std::move(basic)) {}

AdvancedCondition AdvancedCondition::hands_played_this_round_at_least(int n) {
    AdvancedCondition c(Kind::HANDS_PLAYED_THIS_ROUND_AT_LEAST);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::cards_discarded_this_round_at_least(int n) {
    AdvancedCondition c(Kind::CARDS_DISCARDED_THIS_ROUND_AT_LEAST);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::recent_hand_types(std::vector<HandType> sequence) {
    AdvancedCondition c(Kind::RECENT_HAND_TYPES);
    c.sequence_ = std::move(sequence);
    return c;
}

AdvancedCondition AdvancedCondition::hand_already_played_this_round() {
    return AdvancedCondition(Kind::HAND_ALREADY_PLAYED_THIS_ROUND);
}

AdvancedCondition AdvancedCondition::hand_is_most_played() {
    return AdvancedCondition(Kind::HAND_IS_MOST_PLAYED);
}

AdvancedCondition AdvancedCondition::first_hand_of_round() {
    return AdvancedCondition(Kind::FIRST_HAND_OF_ROUND);
}

AdvancedCondition AdvancedCondition::first_discard_of_round() {
    return AdvancedCondition(Kind::FIRST_DISCARD_OF_ROUND);
}

AdvancedCondition AdvancedCondition::final_hand() {
    return AdvancedCondition(Kind::FINAL_HAND);
}

AdvancedCondition AdvancedCondition::counter_at_least(std::string key, int64_t n) {
    AdvancedCondition c(Kind::COUNTER_AT_LEAST);
    c.key_ = std::move(key);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::counter_multiple_of(std::string key, int64_t n) {
    AdvancedCondition c(Kind::COUNTER_MULTIPLE_OF);
    c.key_ = std::move(key);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::flag_set(std::string key) {
    AdvancedCondition c(Kind::FLAG_SET);
    c.key_ = std::move(key);
    return c;
}

AdvancedCondition AdvancedCondition::has_joker(JokerId id) {
    AdvancedCondition c(Kind::HAS_JOKER);
    c.value_ = static_cast<int64_t>(id);
    return c;
}

AdvancedCondition AdvancedCondition::joker_count_at_least(int n) {
    AdvancedCondition c(Kind::JOKER_COUNT_AT_LEAST);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::round_at_least(int n) {
    AdvancedCondition c(Kind::ROUND_AT_LEAST);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::ante_at_least(int n) {
    AdvancedCondition c(Kind::ANTE_AT_LEAST);
    c.value_ = n;
    return c;
}

AdvancedCondition AdvancedCondition::all_of(std::vector<AdvancedCondition> children) {
    AdvancedCondition c(Kind::AND);
    c.children_ = std::move(children);
    return c;
}

AdvancedCondition AdvancedCondition::any_of(std::vector<AdvancedCondition> children) {
    AdvancedCondition c(Kind::OR);
    c.children_ = std::move(children);
    return c;
}

AdvancedCondition AdvancedCondition::negate(AdvancedCondition child) {
    AdvancedCondition c(Kind::NOT);
    c.children_.push_back(std::move(child));
    return c;
}

bool AdvancedCondition::evaluate(GameContext& ctx, const InternalJokerState& state,
                                 const Card* card) const {
    const GameHistory& history = ctx.history();

    switch (kind_) {
        case Kind::BASIC:
            return basic_.evaluate(ctx, card);

        case Kind::HANDS_PLAYED_THIS_ROUND_AT_LEAST:
            return history.hands_played_this_round() >= value_;
        case Kind::CARDS_DISCARDED_THIS_ROUND_AT_LEAST:
            return history.cards_discarded_this_round() >= value_;
        case Kind::RECENT_HAND_TYPES: {
            const auto& recent = history.recent_hand_types();
            if (sequence_.size() > recent.size()) return false;
            return std::equal(sequence_.rbegin(), sequence_.rend(), recent.rbegin());
        }
        case Kind::HAND_ALREADY_PLAYED_THIS_ROUND:
            return history.plays_this_round(ctx.hand_type()) > 0;
        case Kind::HAND_IS_MOST_PLAYED: {
            int current = ctx.plays_of(ctx.hand_type());
            for (size_t i = 0; i < HAND_TYPE_COUNT; ++i) {
                if (ctx.run().hand_type_plays[i] > current) return false;
            }
            return true;
        }
        case Kind::FIRST_HAND_OF_ROUND:
            return history.hands_played_this_round() == 0;
        case Kind::FIRST_DISCARD_OF_ROUND:
            return history.discards_this_round() == 0;
        case Kind::FINAL_HAND:
            return ctx.is_final_hand();

        case Kind::COUNTER_AT_LEAST:
            return state.counter(key_) >= value_;
        case Kind::COUNTER_MULTIPLE_OF:
            return value_ > 0 && state.counter(key_) % value_ == 0;
        case Kind::FLAG_SET:
            return state.flag(key_);

        case Kind::HAS_JOKER:
            for (const auto& entry : ctx.roster()) {
                if (static_cast<int64_t>(entry.id) == value_) return true;
            }
            return false;
        case Kind::JOKER_COUNT_AT_LEAST:
            return static_cast<int64_t>(ctx.roster().size()) >= value_;
        case Kind::ROUND_AT_LEAST:
            return ctx.round() >= value_;
        case Kind::ANTE_AT_LEAST:
            return ctx.ante() >= value_;

        case Kind::AND:
            for (const auto& child : children_) {
                if (!child.evaluate(ctx, state, card)) return false;
            }
            return true;
        case Kind::OR:
            for (const auto& child : children_) {
                if (child.evaluate(ctx, state, card)) return true;
            }
            return false;
        case Kind::NOT:
            return children_.empty() || !children_[0].evaluate(ctx, state, card);
    }
    return false;
}

bool AdvancedCondition::is_cacheable() const {
    if (kind_ == Kind::BASIC && basic_.is_random()) return false;
    for (const auto& child : children_) {
        if (!child.is_cacheable()) return false;
    }
    return true;
}

bool AdvancedCondition::uses_card() const {
    if (kind_ == Kind::BASIC) return basic_.uses_card();
    for (const auto& child : children_) {
        if (child.uses_card()) return true;
    }
    return false;
}

uint64_t AdvancedCondition::structure_hash() const {
    uint64_t h = FNV_OFFSET;
    mix(h, static_cast<uint64_t>(kind_));
    mix(h, static_cast<uint64_t>(value_));
    mix(h, std::hash<std::string>{}(key_));
    for (HandType t : sequence_) mix(h, hand_index(t));
    if (kind_ == Kind::BASIC) mix(h, basic_.structure_hash());
    for (const auto& child : children_) mix(h, child.structure_hash());
    return h;
}

// ============================================================================
// ADVANCED JOKER
// ============================================================================

AdvancedJoker::AdvancedJoker(std::shared_ptr<const AdvancedJokerDef> def)
    : MetaJoker(def->meta), def_(std::move(def)), state_(def_->initial_state) {}

JokerGameplay* AdvancedJoker::gameplay() {
    return (def_->on_hand || def_->on_card) ? this : nullptr;
}

const JokerModifiers* AdvancedJoker::modifiers() const {
    return def_->modifiers ? this : nullptr;
}

void AdvancedJoker::configure(const EngineConfig& config) {
    cache_.set_enabled(config.cache_enabled);
    cache_.set_max_entries(config.cache_max_entries);
}

std::unique_ptr<Joker> AdvancedJoker::clone() const {
    auto copy = std::make_unique<AdvancedJoker>(def_);
    copy->state_ = state_;
    copy->cache_.set_enabled(cache_.enabled());
    return copy;
}

uint64_t AdvancedJoker::fingerprint(const GameContext& ctx, const Card* card) const {
    uint64_t h = FNV_OFFSET;
    mix(h, def_->condition.structure_hash());
    mix(h, hand_index(ctx.hand_type()));
    mix(h, ctx.hand().evaluation.contained_mask);
    mix(h, ctx.played_cards().size());
    mix(h, static_cast<uint64_t>(ctx.money()));
    mix(h, static_cast<uint64_t>(ctx.ante()));
    mix(h, static_cast<uint64_t>(ctx.round()));
    mix(h, static_cast<uint64_t>(ctx.hands_remaining()));
    mix(h, static_cast<uint64_t>(ctx.discards_remaining()));
    mix(h, static_cast<uint64_t>(ctx.plays_of(ctx.hand_type())));
    mix(h, ctx.history().fingerprint());
    mix(h, state_.version);
    for (const auto& entry : ctx.roster()) {
        mix(h, static_cast<uint64_t>(entry.id));
    }
    if (card && def_->condition.uses_card()) {
        mix(h, card->id);
        mix(h, static_cast<uint64_t>(card->rank));
        mix(h, static_cast<uint64_t>(card->suit));
        mix(h, static_cast<uint64_t>(card->enhancement));
        mix(h, ctx.scoring_index());
    }
    return h;
}

bool AdvancedJoker::should_process(GameContext& ctx, const Card* card) {
    if (!def_->condition.is_cacheable()) {
        return def_->condition.evaluate(ctx, state_, card);
    }

    ConditionCacheKey key{ctx.current_key().slot, fingerprint(ctx, card), cache_.epoch()};
    if (auto cached = cache_.lookup(key)) {
        return *cached;
    }
    bool result = def_->condition.evaluate(ctx, state_, card);
    cache_.store(key, result);
    return result;
}

void AdvancedJoker::note_state_change(uint64_t version_before) {
    if (state_.version != version_before) {
        cache_.bump_epoch();
    }
}

Effect AdvancedJoker::run_hook(const AdvancedHook& hook, GameContext& ctx) {
    if (!hook) {
        return {};
    }
    uint64_t before = state_.version;
    Effect effect = hook(ctx, state_);
    note_state_change(before);
    return effect;
}

Effect AdvancedJoker::on_hand_played(GameContext& ctx) {
    if (!def_->on_hand || !should_process(ctx, nullptr)) {
        return {};
    }
    uint64_t before = state_.version;
    Effect effect = def_->on_hand(ctx, state_, nullptr);
    note_state_change(before);
    return effect;
}

Effect AdvancedJoker::on_card_scored(GameContext& ctx, const Card& card) {
    if (!def_->on_card || !should_process(ctx, &card)) {
        return {};
    }
    uint64_t before = state_.version;
    Effect effect = def_->on_card(ctx, state_, &card);
    note_state_change(before);
    return effect;
}

void AdvancedJoker::on_acquired(GameContext& ctx) {
    run_hook(def_->on_acquired, ctx);
}

Effect AdvancedJoker::on_sold(GameContext& ctx) {
    return run_hook(def_->on_sold, ctx);
}

Effect AdvancedJoker::on_round_start(GameContext& ctx) {
    cache_.bump_epoch();
    return run_hook(def_->on_round_start, ctx);
}

Effect AdvancedJoker::on_round_end(GameContext& ctx) {
    cache_.bump_epoch();
    return run_hook(def_->on_round_end, ctx);
}

Effect AdvancedJoker::on_discard(GameContext& ctx, const std::vector<Card>& discarded) {
    if (!def_->on_discard) {
        return {};
    }
    uint64_t before = state_.version;
    Effect effect = def_->on_discard(ctx, state_, discarded);
    note_state_change(before);
    return effect;
}

Effect AdvancedJoker::on_game_event(GameContext& ctx, const GameEvent& event) {
    if (!def_->on_event) {
        return {};
    }
    uint64_t before = state_.version;
    Effect effect = def_->on_event(ctx, state_, event);
    note_state_change(before);
    return effect;
}

RuleModifiers AdvancedJoker::rule_modifiers() const {
    return def_->modifiers ? def_->modifiers(state_) : RuleModifiers{};
}

nlohmann::json AdvancedJoker::serialize_state() const {
    return state_.to_json();
}

StateResult AdvancedJoker::deserialize_state(const nlohmann::json& state) {
    std::string error;
    auto staged = InternalJokerState::from_json(state, error);
    if (!staged) {
        return StateResult::fail(error);
    }
    state_ = std::move(*staged);
    cache_.bump_epoch();
    return StateResult::ok();
}

} // namespace balatro
