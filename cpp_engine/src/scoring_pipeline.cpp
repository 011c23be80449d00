/**
 * Balatro Joker Engine - Scoring Pipeline Implementation
 */

#include "scoring_pipeline.hpp"

#include <algorithm>
#include <iostream>

namespace balatro {

const char* to_string(LifecycleHook hook) {
    switch (hook) {
        case LifecycleHook::ACQUIRED: return "ACQUIRED";
        case LifecycleHook::SOLD: return "SOLD";
        case LifecycleHook::DESTROYED: return "DESTROYED";
        case LifecycleHook::ROUND_START: return "ROUND START";
        case LifecycleHook::ROUND_END: return "ROUND END";
        case LifecycleHook::ROSTER_CHANGED: return "ROSTER CHANGED";
        case LifecycleHook::DISCARD: return "DISCARD";
        case LifecycleHook::GAME_EVENT: return "EVENT";
    }
    return "UNKNOWN";
}

ScoringPipeline::ScoringPipeline(JokerCollection& jokers, const EngineConfig& config,
                                 ScoreTraceLogger* trace)
    : jokers_(jokers), config_(config), trace_(trace) {}

// ============================================================================
// BOOKKEEPING
// ============================================================================

void ScoringPipeline::enter(GameContext& ctx, size_t position) {
    const JokerSlot& slot = jokers_.at(position);
    ctx.set_cursor(position, InstanceKey{slot.joker->id(), slot.slot});
}

void ScoringPipeline::report(ProcessResult& result, ErrorKind kind, size_t position,
                             std::string message) {
    JokerError error;
    error.kind = kind;
    if (position < jokers_.size()) {
        error.joker_id = jokers_.at(position).joker->id();
        error.slot = jokers_.at(position).slot;
    }
    error.message = std::move(message);

    std::cerr << "[ScoringPipeline] " << error.describe() << std::endl;
    if (trace_) {
        trace_->log_error(error);
    }
    result.errors.push_back(std::move(error));
    ++result.metrics.errors;
}

void ScoringPipeline::fold(GameContext& ctx, Effect effect, size_t position, const char* pass,
                           const Card* card, ProcessResult& result) {
    const JokerSlot& source = jokers_.at(position);

    if (effect.retrigger > config_.max_retriggers_per_effect) {
        report(result, ErrorKind::NUMERIC_BOUND, position,
               "retrigger request " + std::to_string(effect.retrigger) + " capped at " +
                   std::to_string(config_.max_retriggers_per_effect));
        effect.retrigger = config_.max_retriggers_per_effect;
    }

    if (trace_) {
        trace_->log_contribution(pass, position, source.joker->name(), card, effect);
    }
    if (effect.is_identity()) {
        return;
    }

    if (!ctx.accumulate(effect)) {
        report(result, ErrorKind::NUMERIC_BOUND, position, ctx.last_violation());
    }

    if (std::find(result.triggered.begin(), result.triggered.end(), source.joker->id()) ==
        result.triggered.end()) {
        result.triggered.push_back(source.joker->id());
    }

    auto add_removal = [&](InstanceId slot, const char* reason) {
        for (const auto& existing : result.removals) {
            if (existing.slot == slot) return;
        }
        const Joker* target = jokers_.find(slot);
        if (!target) return;
        result.removals.push_back({slot, target->id(), source.slot, reason});
    };

    if (effect.destroy_self) {
        add_removal(source.slot, "self-destroy");
    }
    for (InstanceId other : effect.destroy_others) {
        add_removal(other, "destroyed by sibling");
    }
    if (effect.sell_value_delta != 0) {
        result.sell_value_changes.push_back({source.slot, effect.sell_value_delta});
    }
}

// ============================================================================
// SCORING PASSES
// ============================================================================

ProcessResult ScoringPipeline::score_hand(GameContext& ctx) {
    ProcessResult result;
    ctx.set_sibling_invoker(this);

    // Pass 1: hand-level hooks
    ctx.set_retrigger(false);
    for (size_t i = 0; i < jokers_.size(); ++i) {
        JokerGameplay* play = jokers_.at(i).joker->gameplay();
        if (!play) continue;

        enter(ctx, i);
        ++result.metrics.jokers_processed;
        ++result.metrics.hooks_invoked;
        try {
            fold(ctx, play->on_hand_played(ctx), i, "HAND", nullptr, result);
        } catch (const std::exception& e) {
            report(result, ErrorKind::HOOK_INVOCATION, i,
                   std::string("on_hand_played threw: ") + e.what());
        }
    }

    // Pass 2: per scoring card, with retriggers
    const auto& scoring = ctx.scoring_cards();
    for (size_t c = 0; c < scoring.size(); ++c) {
        ctx.set_scoring_index(c);
        ctx.set_retrigger(false);
        uint32_t requested = run_card_pass(ctx, scoring[c], false, result);

        uint32_t budget = config_.max_retriggers > result.metrics.retriggers
                              ? config_.max_retriggers - result.metrics.retriggers
                              : 0;
        uint32_t runs = std::min(requested, budget);
        if (runs < requested) {
            report(result, ErrorKind::NUMERIC_BOUND, jokers_.size(),
                   "retrigger budget exhausted; " + std::to_string(requested - runs) +
                       " retrigger(s) dropped");
        }

        ctx.set_retrigger(true);
        for (uint32_t r = 0; r < runs; ++r) {
            run_card_pass(ctx, scoring[c], true, result);
            ++result.metrics.retriggers;
        }
        ctx.set_retrigger(false);
    }

    ctx.set_sibling_invoker(nullptr);
    result.aggregate = ctx.accumulated();
    return result;
}

uint32_t ScoringPipeline::run_card_pass(GameContext& ctx, const Card& card, bool retrigger_run,
                                        ProcessResult& result) {
    uint32_t requested = 0;
    for (size_t i = 0; i < jokers_.size(); ++i) {
        JokerGameplay* play = jokers_.at(i).joker->gameplay();
        if (!play) continue;

        enter(ctx, i);
        ++result.metrics.hooks_invoked;
        try {
            Effect effect = play->on_card_scored(ctx, card);
            if (retrigger_run) {
                effect.retrigger = 0;
            }
            requested += std::min(effect.retrigger, config_.max_retriggers_per_effect);
            fold(ctx, std::move(effect), i, retrigger_run ? "RETRIGGER" : "CARD", &card, result);
        } catch (const std::exception& e) {
            report(result, ErrorKind::HOOK_INVOCATION, i,
                   std::string("on_card_scored threw: ") + e.what());
        }
    }
    return requested;
}

Effect ScoringPipeline::invoke_sibling(GameContext& ctx, size_t position, const Card* card) {
    if (position >= jokers_.size()) {
        return {};
    }
    Joker& target = *jokers_.at(position).joker;
    JokerGameplay* play = target.gameplay();
    if (!play || !target.copyable()) {
        return {};
    }

    enter(ctx, position);
    Effect effect = card ? play->on_card_scored(ctx, *card) : play->on_hand_played(ctx);
    // Copies never carry destroy requests for the target
    effect.destroy_self = false;
    effect.sell_value_delta = 0;
    return effect;
}

// ============================================================================
// LIFECYCLE DISPATCH
// ============================================================================

Effect ScoringPipeline::invoke_lifecycle(LifecycleHook hook, JokerLifecycle& lifecycle,
                                         GameContext& ctx, const std::vector<Card>* cards,
                                         const GameEvent* event) {
    static const std::vector<Card> no_cards;

    switch (hook) {
        case LifecycleHook::ACQUIRED:
            lifecycle.on_acquired(ctx);
            return {};
        case LifecycleHook::SOLD:
            return lifecycle.on_sold(ctx);
        case LifecycleHook::DESTROYED:
            lifecycle.on_destroyed(ctx);
            return {};
        case LifecycleHook::ROUND_START:
            return lifecycle.on_round_start(ctx);
        case LifecycleHook::ROUND_END:
            return lifecycle.on_round_end(ctx);
        case LifecycleHook::ROSTER_CHANGED:
            lifecycle.on_roster_changed(ctx);
            return {};
        case LifecycleHook::DISCARD:
            return lifecycle.on_discard(ctx, cards ? *cards : no_cards);
        case LifecycleHook::GAME_EVENT:
            if (!event) return {};
            return lifecycle.on_game_event(ctx, *event);
    }
    return {};
}

ProcessResult ScoringPipeline::dispatch(LifecycleHook hook, GameContext& ctx,
                                        const std::vector<Card>* cards, const GameEvent* event,
                                        std::optional<size_t> only_position) {
    ProcessResult result;
    ctx.set_retrigger(false);

    size_t first = only_position ? *only_position : 0;
    size_t last = only_position ? std::min(*only_position + 1, jokers_.size()) : jokers_.size();

    for (size_t i = first; i < last; ++i) {
        JokerLifecycle* lifecycle = jokers_.at(i).joker->lifecycle();
        if (!lifecycle) continue;

        enter(ctx, i);
        ++result.metrics.jokers_processed;
        ++result.metrics.hooks_invoked;
        try {
            Effect effect = invoke_lifecycle(hook, *lifecycle, ctx, cards, event);
            fold(ctx, std::move(effect), i, to_string(hook), nullptr, result);
        } catch (const std::exception& e) {
            report(result, ErrorKind::HOOK_INVOCATION, i,
                   std::string(to_string(hook)) + " hook threw: " + e.what());
        }
    }

    result.aggregate = ctx.accumulated();
    return result;
}

} // namespace balatro
