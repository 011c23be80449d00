/**
 * Balatro Joker Engine - Scoring Pipeline
 *
 * Runs the jokers of a collection against a GameContext:
 *
 *   Pass 1  every gameplay joker, in run order, gets on_hand_played
 *   Pass 2  for each scoring card in order, every gameplay joker gets
 *           on_card_scored; the retriggers requested for that card re-run
 *           its pass (bounded by max_retriggers, and requests made during a
 *           re-run are ignored)
 *
 * Each hook's Effect is accumulated with clamping right away. A hook that
 * throws contributes nothing and is reported as a HOOK_INVOCATION error.
 * Destroy requests are only collected; the collection is never modified
 * while a pass is running.
 *
 * Lifecycle notifications (round start/end, discard, events, acquisition,
 * sale) go through dispatch() with the same guarding and accumulation.
 */

#pragma once

#include "engine_config.hpp"
#include "joker_collection.hpp"
#include "joker_errors.hpp"
#include "score_trace_logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace balatro {

struct RemovalDirective {
    InstanceId slot = 0;
    JokerId id = JokerId::JOKER;
    InstanceId requested_by = 0;
    std::string reason;
};

struct SellValueChange {
    InstanceId slot = 0;
    int delta = 0;
};

struct PipelineMetrics {
    size_t hooks_invoked = 0;
    size_t jokers_processed = 0;
    uint32_t retriggers = 0;
    size_t errors = 0;
};

/**
 * Outcome of a scoring pass or a lifecycle dispatch.
 */
struct ProcessResult {
    Effect aggregate;
    std::vector<RemovalDirective> removals;
    std::vector<SellValueChange> sell_value_changes;
    std::vector<JokerId> triggered;  // Jokers that returned a non-identity effect
    std::vector<JokerError> errors;
    PipelineMetrics metrics;

    bool success() const { return errors.empty(); }
};

enum class LifecycleHook : uint8_t {
    ACQUIRED,
    SOLD,
    DESTROYED,
    ROUND_START,
    ROUND_END,
    ROSTER_CHANGED,
    DISCARD,
    GAME_EVENT
};

const char* to_string(LifecycleHook hook);

class ScoringPipeline : public SiblingInvoker {
public:
    ScoringPipeline(JokerCollection& jokers, const EngineConfig& config,
                    ScoreTraceLogger* trace = nullptr);

    /**
     * Run both scoring passes. The context must have been built over this
     * collection's roster.
     */
    ProcessResult score_hand(GameContext& ctx);

    /**
     * Deliver a lifecycle notification to every lifecycle joker, or only to
     * the joker at `only_position`.
     */
    ProcessResult dispatch(LifecycleHook hook, GameContext& ctx,
                           const std::vector<Card>* cards = nullptr,
                           const GameEvent* event = nullptr,
                           std::optional<size_t> only_position = std::nullopt);

    Effect invoke_sibling(GameContext& ctx, size_t position, const Card* card) override;

private:
    uint32_t run_card_pass(GameContext& ctx, const Card& card, bool retrigger_run,
                           ProcessResult& result);
    Effect invoke_lifecycle(LifecycleHook hook, JokerLifecycle& lifecycle, GameContext& ctx,
                            const std::vector<Card>* cards, const GameEvent* event);
    void fold(GameContext& ctx, Effect effect, size_t position, const char* pass,
              const Card* card, ProcessResult& result);
    void report(ProcessResult& result, ErrorKind kind, size_t position, std::string message);
    void enter(GameContext& ctx, size_t position);

    JokerCollection& jokers_;
    const EngineConfig& config_;
    ScoreTraceLogger* trace_;
};

} // namespace balatro
