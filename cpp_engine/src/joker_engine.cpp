/**
 * Balatro Joker Engine - Engine Facade Implementation
 */

#include "joker_engine.hpp"

#include <algorithm>
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace balatro {

namespace {

// Parsed and in-memory json disagree on signedness for small integers
bool is_non_negative(const json& value) {
    if (value.is_number_unsigned()) {
        return true;
    }
    return value.is_number_integer() && value.get<int64_t>() >= 0;
}

} // anonymous namespace

JokerEngine::JokerEngine(EngineConfig config, std::shared_ptr<const JokerRegistry> registry)
    : config_(std::move(config)),
      registry_(registry ? std::move(registry) : get_joker_registry()) {
    if (config_.trace_enabled) {
        trace_ = std::make_unique<ScoreTraceLogger>(config_.trace_dir);
        if (!trace_->is_enabled()) {
            trace_.reset();
        }
    }
}

JokerEngine::~JokerEngine() = default;

ScopedRng JokerEngine::make_rng(const RunSnapshot& run) {
    uint64_t seed = run.seed != 0 ? run.seed : config_.seed;
    ScopedRng rng(ScopedRng::derive(seed, rng_stream_++));
    rng.set_probability_scale(modifiers_.probability_scale);
    return rng;
}

// ============================================================================
// SCORING
// ============================================================================

HandView JokerEngine::make_hand(std::vector<Card> played, std::vector<Card> held) const {
    return HandView::build(std::move(played), std::move(held), modifiers_.hand_rules());
}

ProcessResult JokerEngine::process(const HandView& hand, const RunSnapshot& run) {
    std::vector<RosterEntry> roster = jokers_.roster();
    ScopedRng rng = make_rng(run);
    GameContext ctx(run, hand, store_, history_, rng, modifiers_, roster, config_.max_mult);

    if (trace_) {
        trace_->log_hand(hands_processed_ + 1, run, hand);
    }

    ScoringPipeline pipeline(jokers_, config_, trace_.get());
    ProcessResult result = pipeline.score_hand(ctx);

    if (!hand.played.empty()) {
        history_.record_hand(hand.evaluation.type);
    }
    apply_bookkeeping(result);
    ++hands_processed_;

    if (trace_) {
        trace_->log_aggregate(result.aggregate, result.removals.size(), result.errors.size());
    }
    return result;
}

ScoreApplication JokerEngine::apply_effect(const Effect& effect, int64_t base_chips,
                                           double base_mult, int64_t wallet) const {
    return balatro::apply_effect(effect, base_chips, base_mult, wallet, config_.max_mult);
}

void JokerEngine::apply_bookkeeping(const ProcessResult& result) {
    for (JokerId id : result.triggered) {
        history_.record_trigger(id);
    }
    for (const auto& change : result.sell_value_changes) {
        jokers_.adjust_sell_value(change.slot, change.delta);
    }
    if (result.aggregate.global_sell_value_delta != 0) {
        jokers_.adjust_all_sell_values(result.aggregate.global_sell_value_delta);
    }
}

// ============================================================================
// ROSTER
// ============================================================================

AcquireResult JokerEngine::acquire(JokerId id, const ConstructionArgs& args,
                                   const RunSnapshot& run) {
    CreateResult made = registry_->create(id, args);
    if (!made.success) {
        std::cerr << "[JokerEngine] Cannot create " << to_key(id) << ": " << made.error << std::endl;
        AcquireResult result;
        result.error = made.error;
        return result;
    }
    return adopt(std::move(made.joker), run);
}

AcquireResult JokerEngine::adopt(std::unique_ptr<Joker> joker, const RunSnapshot& run) {
    AcquireResult result;
    if (!joker) {
        result.error = "no joker given";
        return result;
    }

    int capacity = config_.joker_slots + modifiers_.joker_slots;
    if (static_cast<int>(jokers_.size()) >= capacity) {
        result.error = "no free joker slot (" + std::to_string(capacity) + " in use)";
        return result;
    }

    joker->configure(config_);
    InstanceId slot = jokers_.add(std::move(joker));

    auto position = jokers_.position_of(slot);
    ProcessResult acquired = run_notification(LifecycleHook::ACQUIRED, run, nullptr, nullptr, position);
    apply_bookkeeping(acquired);
    roster_changed(run);

    result.success = true;
    result.handle = slot;
    return result;
}

SellResult JokerEngine::sell(InstanceId handle, const RunSnapshot& run) {
    SellResult result;
    auto position = jokers_.position_of(handle);
    if (!position) {
        result.error = "no joker with handle " + std::to_string(handle);
        return result;
    }

    ProcessResult sold = run_notification(LifecycleHook::SOLD, run, nullptr, nullptr, position);
    result.effect = sold.aggregate;
    result.errors = std::move(sold.errors);
    result.sell_value = jokers_.slot_of(handle)->sell_value;

    std::unique_ptr<Joker> removed = jokers_.remove(handle);
    store_.erase(InstanceKey{removed->id(), handle});
    roster_changed(run);

    result.success = true;
    return result;
}

bool JokerEngine::destroy(InstanceId handle, const RunSnapshot& run) {
    auto position = jokers_.position_of(handle);
    if (!position) {
        return false;
    }

    run_notification(LifecycleHook::DESTROYED, run, nullptr, nullptr, position);
    std::unique_ptr<Joker> removed = jokers_.remove(handle);
    store_.erase(InstanceKey{removed->id(), handle});
    roster_changed(run);
    return true;
}

size_t JokerEngine::apply_removals(const ProcessResult& result, const RunSnapshot& run) {
    size_t removed = 0;
    for (const auto& directive : result.removals) {
        if (destroy(directive.slot, run)) {
            ++removed;
        }
    }
    return removed;
}

void JokerEngine::roster_changed(const RunSnapshot& run) {
    run_notification(LifecycleHook::ROSTER_CHANGED, run);
    refresh_modifiers();
}

void JokerEngine::refresh_modifiers() {
    RuleModifiers combined;
    for (const auto& slot : jokers_) {
        if (const JokerModifiers* mods = slot.joker->modifiers()) {
            combined.merge(mods->rule_modifiers());
        }
    }
    modifiers_ = combined;
}

// ============================================================================
// NOTIFICATIONS
// ============================================================================

ProcessResult JokerEngine::run_notification(LifecycleHook hook, const RunSnapshot& run,
                                            const std::vector<Card>* cards,
                                            const GameEvent* event,
                                            std::optional<size_t> only_position) {
    std::vector<RosterEntry> roster = jokers_.roster();
    ScopedRng rng = make_rng(run);
    GameContext ctx(run, empty_hand_, store_, history_, rng, modifiers_, roster, config_.max_mult);

    bool traced = trace_ && hook != LifecycleHook::ROSTER_CHANGED;
    if (traced) {
        trace_->log_notification(to_string(hook), run);
    }

    ScoringPipeline pipeline(jokers_, config_, trace_.get());
    ProcessResult result = pipeline.dispatch(hook, ctx, cards, event, only_position);

    if (traced) {
        trace_->log_aggregate(result.aggregate, result.removals.size(), result.errors.size());
    }
    return result;
}

ProcessResult JokerEngine::start_round(const RunSnapshot& run) {
    history_.start_round(run.round, run.ante);
    ProcessResult result = run_notification(LifecycleHook::ROUND_START, run);
    apply_bookkeeping(result);
    refresh_modifiers();
    return result;
}

ProcessResult JokerEngine::end_round(const RunSnapshot& run) {
    ProcessResult result = run_notification(LifecycleHook::ROUND_END, run);
    apply_bookkeeping(result);
    refresh_modifiers();
    return result;
}

ProcessResult JokerEngine::notify_discard(const std::vector<Card>& discarded,
                                          const RunSnapshot& run) {
    ProcessResult result = run_notification(LifecycleHook::DISCARD, run, &discarded);
    history_.record_discard(discarded.size());
    apply_bookkeeping(result);
    return result;
}

ProcessResult JokerEngine::notify_event(const GameEvent& event, const RunSnapshot& run) {
    ProcessResult result = run_notification(LifecycleHook::GAME_EVENT, run, nullptr, &event);
    apply_bookkeeping(result);
    refresh_modifiers();
    return result;
}

// ============================================================================
// PERSISTENCE
// ============================================================================

json JokerEngine::serialize_all() const {
    json blob;
    blob["format"] = "joker_state";
    blob["version"] = SAVE_FORMAT_VERSION;
    blob["rng_stream"] = rng_stream_;

    json entries = json::array();
    for (const auto& slot : jokers_) {
        const Joker& joker = *slot.joker;
        json entry;
        entry["id"] = to_key(joker.id());
        entry["slot"] = slot.slot;
        entry["sell_value"] = slot.sell_value;

        if (const JokerState* state = joker.state()) {
            entry["schema"] = state->state_schema_version();
            entry["state"] = state->serialize_state();
        } else {
            entry["schema"] = 1u;
            entry["state"] = nullptr;
        }

        const json* stored = store_.find(InstanceKey{joker.id(), slot.slot});
        entry["store"] = stored ? *stored : json(nullptr);
        entries.push_back(std::move(entry));
    }
    blob["jokers"] = std::move(entries);
    return blob;
}

LoadResult JokerEngine::deserialize_all(const json& blob) {
    LoadResult result;

    auto structural = [&result](ErrorKind kind, std::string message) {
        std::cerr << "[JokerEngine] Save rejected: " << message << std::endl;
        JokerError error;
        error.kind = kind;
        error.message = std::move(message);
        result.errors.push_back(std::move(error));
        return result;
    };

    if (!blob.is_object()) {
        return structural(ErrorKind::CORRUPT_BLOB, "save blob is not an object");
    }
    if (blob.value("format", std::string()) != "joker_state") {
        return structural(ErrorKind::CORRUPT_BLOB, "save blob has wrong format tag");
    }
    if (!blob.contains("version") || !blob["version"].is_number_integer()) {
        return structural(ErrorKind::CORRUPT_BLOB, "save blob has no integer version");
    }
    if (blob["version"].is_number_unsigned() &&
        blob["version"].get<uint64_t>() > SAVE_FORMAT_VERSION) {
        return structural(ErrorKind::UNSUPPORTED_VERSION,
                          "save version " + std::to_string(blob["version"].get<uint64_t>()) +
                              " is newer than supported " + std::to_string(SAVE_FORMAT_VERSION));
    }
    int64_t version = blob["version"].get<int64_t>();
    if (version > static_cast<int64_t>(SAVE_FORMAT_VERSION)) {
        return structural(ErrorKind::UNSUPPORTED_VERSION,
                          "save version " + std::to_string(version) + " is newer than supported " +
                              std::to_string(SAVE_FORMAT_VERSION));
    }
    if (version < 1) {
        return structural(ErrorKind::CORRUPT_BLOB, "save version " + std::to_string(version) + " is invalid");
    }
    if (!blob.contains("jokers") || !blob["jokers"].is_array()) {
        return structural(ErrorKind::CORRUPT_BLOB, "save blob has no jokers array");
    }

    uint64_t rng_stream = 0;
    if (version >= 3) {
        if (!blob.contains("rng_stream") || !is_non_negative(blob["rng_stream"])) {
            return structural(ErrorKind::CORRUPT_BLOB, "save blob has no rng stream");
        }
        rng_stream = blob["rng_stream"].get<uint64_t>();
    }

    result.version = static_cast<uint32_t>(version);

    JokerCollection staged;
    JokerStateStore staged_store;
    std::set<InstanceId> used_slots;

    const json& entries = blob["jokers"];
    for (size_t i = 0; i < entries.size(); ++i) {
        const json& entry = entries[i];
        InstanceId fallback_slot = static_cast<InstanceId>(i + 1);

        auto lose = [&](ErrorKind kind, const std::string& key, InstanceId slot,
                        std::optional<JokerId> id, std::string reason) {
            JokerError error;
            error.kind = kind;
            error.joker_id = id;
            error.slot = slot;
            error.message = reason;
            std::cerr << "[JokerEngine] Lost saved joker: " << error.describe() << std::endl;
            result.errors.push_back(std::move(error));
            result.lost.push_back({key, slot, std::move(reason)});
        };

        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            lose(ErrorKind::CORRUPT_BLOB, "", fallback_slot, std::nullopt,
                 "entry " + std::to_string(i) + " is malformed");
            continue;
        }

        std::string key = entry["id"].get<std::string>();
        InstanceId slot = fallback_slot;
        if (version >= 2) {
            if (!entry.contains("slot") || !is_non_negative(entry["slot"])) {
                lose(ErrorKind::CORRUPT_BLOB, key, fallback_slot, std::nullopt, "entry has no slot");
                continue;
            }
            uint64_t saved_slot = entry["slot"].get<uint64_t>();
            if (saved_slot > MAX_RESTORABLE_SLOT) {
                lose(ErrorKind::CORRUPT_BLOB, key, fallback_slot, std::nullopt,
                     "slot " + std::to_string(saved_slot) + " is out of range");
                continue;
            }
            slot = static_cast<InstanceId>(saved_slot);
        }
        if (!used_slots.insert(slot).second) {
            lose(ErrorKind::CORRUPT_BLOB, key, slot, std::nullopt, "duplicate slot");
            continue;
        }

        auto id = joker_id_from_key(key);
        if (!id) {
            lose(ErrorKind::CONSTRUCTION, key, slot, std::nullopt, "unknown joker key '" + key + "'");
            continue;
        }

        CreateResult made = registry_->create(*id);
        if (!made.success) {
            lose(ErrorKind::CONSTRUCTION, key, slot, id, made.error);
            continue;
        }

        uint64_t schema = 1;
        if (entry.contains("schema")) {
            if (!is_non_negative(entry["schema"])) {
                lose(ErrorKind::CORRUPT_BLOB, key, slot, id, "schema is not a non-negative integer");
                continue;
            }
            schema = entry["schema"].get<uint64_t>();
        }

        JokerState* state = made.joker->state();
        uint32_t supported = state ? state->state_schema_version() : 1;
        if (schema > supported) {
            lose(ErrorKind::UNSUPPORTED_VERSION, key, slot, id,
                 "state schema " + std::to_string(schema) + " is newer than supported " +
                     std::to_string(supported));
            continue;
        }
        if (state) {
            if (entry.contains("state") && !entry["state"].is_null()) {
                StateResult restored = state->deserialize_state(entry["state"]);
                if (!restored.success) {
                    lose(ErrorKind::STATE_DESERIALIZE, key, slot, id, restored.error);
                    continue;
                }
            }
        }

        if (entry.contains("store") && !entry["store"].is_null()) {
            if (!staged_store.restore(InstanceKey{*id, slot}, entry["store"])) {
                lose(ErrorKind::STATE_DESERIALIZE, key, slot, id, "store entry is not an object");
                continue;
            }
        }

        int sell_value = std::max(1, made.joker->base_cost() / 2);
        if (entry.contains("sell_value") && entry["sell_value"].is_number_integer()) {
            sell_value = entry["sell_value"].get<int>();
        }

        made.joker->configure(config_);
        if (!staged.restore(slot, std::move(made.joker), sell_value)) {
            lose(ErrorKind::CORRUPT_BLOB, key, slot, id, "slot cannot be restored");
            continue;
        }
        ++result.loaded;
    }

    jokers_ = std::move(staged);
    store_ = std::move(staged_store);
    rng_stream_ = rng_stream;
    refresh_modifiers();

    result.success = true;
    return result;
}

} // namespace balatro
