/**
 * Balatro Joker Engine - Game Context Implementation
 */

#include "game_context.hpp"
#include "math_safe.hpp"

namespace balatro {

// ============================================================================
// HAND VIEW
// ============================================================================

HandView HandView::build(std::vector<Card> played, std::vector<Card> held,
                         const HandRules& rules) {
    HandView view;
    view.played = std::move(played);
    view.held = std::move(held);
    view.evaluation = evaluate_hand(view.played, rules);
    view.scoring.reserve(view.evaluation.scoring_indices.size());
    for (size_t index : view.evaluation.scoring_indices) {
        view.scoring.push_back(view.played[index]);
    }
    return view;
}

// ============================================================================
// GAME HISTORY
// ============================================================================

void GameHistory::start_round(int round, int ante) {
    round_ = round;
    ante_ = ante;
    hands_played_this_round_ = 0;
    cards_discarded_this_round_ = 0;
    discards_this_round_ = 0;
    plays_this_round_.fill(0);
}

void GameHistory::record_hand(HandType type) {
    ++hands_played_this_round_;
    ++plays_this_round_[hand_index(type)];
    recent_hand_types_.push_back(type);
    while (recent_hand_types_.size() > RECENT_LIMIT) {
        recent_hand_types_.pop_front();
    }
}

void GameHistory::record_discard(size_t card_count) {
    ++discards_this_round_;
    cards_discarded_this_round_ += static_cast<int>(card_count);
}

void GameHistory::record_trigger(JokerId id) {
    ++trigger_counts_[id];
}

uint32_t GameHistory::trigger_count(JokerId id) const {
    auto it = trigger_counts_.find(id);
    return it == trigger_counts_.end() ? 0 : it->second;
}

uint64_t GameHistory::fingerprint() const {
    uint64_t h = 1469598103934665603ULL;
    auto mix = [&h](uint64_t v) {
        h ^= v;
        h *= 1099511628211ULL;
    };
    mix(static_cast<uint64_t>(round_));
    mix(static_cast<uint64_t>(ante_));
    mix(static_cast<uint64_t>(hands_played_this_round_));
    mix(static_cast<uint64_t>(cards_discarded_this_round_));
    mix(static_cast<uint64_t>(discards_this_round_));
    for (HandType type : recent_hand_types_) {
        mix(hand_index(type));
    }
    return h;
}

// ============================================================================
// GAME CONTEXT
// ============================================================================

GameContext::GameContext(const RunSnapshot& run, const HandView& hand, JokerStateStore& store,
                         const GameHistory& history, ScopedRng& rng, const RuleModifiers& rules,
                         const std::vector<RosterEntry>& roster, double max_mult)
    : run_(run),
      hand_(hand),
      store_(store),
      history_(history),
      rng_(rng),
      rules_(rules),
      roster_(roster),
      accumulator_(max_mult) {}

int64_t GameContext::chips() const {
    return math::saturating_add(run_.base_chips, accumulator_.total().chips);
}

double GameContext::mult() const {
    const Effect& total = accumulator_.total();
    double additive = math::clamp(run_.base_mult + total.mult, 0.0, accumulator_.max_mult());
    return math::clamp(additive * total.mult_multiplier, 0.0, accumulator_.max_mult());
}

int64_t GameContext::money() const {
    return math::saturating_add(run_.money, accumulator_.total().money);
}

Effect GameContext::copy_joker_effect(size_t position, const Card* card) {
    if (!invoker_ || position >= roster_.size() || position == position_) {
        return {};
    }
    if (copy_depth_ >= roster_.size()) {
        return {};
    }

    // Restores the cursor even if the copied hook throws
    struct CursorGuard {
        GameContext& ctx;
        size_t position;
        InstanceKey key;
        ~CursorGuard() {
            --ctx.copy_depth_;
            ctx.position_ = position;
            ctx.current_ = key;
        }
    };

    ++copy_depth_;
    CursorGuard guard{*this, position_, current_};
    return invoker_->invoke_sibling(*this, position, card);
}

} // namespace balatro
