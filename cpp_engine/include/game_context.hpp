/**
 * Balatro Joker Engine - Game Context
 *
 * The per-invocation view a joker hook sees: scoring accumulators, run
 * progression, the hand, deck composition, the roster, the state store, the
 * game history used by temporal conditions and the seeded RNG.
 *
 * Hooks read the context; only the pipeline writes to it, through
 * accumulate() and the evaluation cursor.
 */

#pragma once

#include "card.hpp"
#include "effect.hpp"
#include "hand_eval.hpp"
#include "joker_id.hpp"
#include "joker_state_store.hpp"
#include "rule_modifiers.hpp"
#include "scoped_rng.hpp"
#include "types.hpp"

#include <deque>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>

namespace balatro {

class GameContext;

// ============================================================================
// RUN SNAPSHOT (input from the game engine)
// ============================================================================

/**
 * Deck composition metadata. Counts cover the full deck, not just the
 * draw pile, unless noted.
 */
struct DeckInfo {
    int full_deck_size = 52;
    int starting_deck_size = 52;
    int cards_remaining = 52;  // Draw pile
    int enhanced_cards = 0;
    int stone_cards = 0;
    int steel_cards = 0;
    int glass_cards = 0;
    int gold_cards = 0;
    int lucky_cards = 0;
    int nines = 4;
};

struct RunSnapshot {
    int64_t base_chips = 0;
    double base_mult = 0.0;
    int64_t money = 0;

    int ante = 1;
    int round = 1;
    Stage stage = Stage::BLIND;
    BlindKind blind = BlindKind::SMALL;
    bool boss_ability_triggered = false;

    int hands_remaining = 3;    // Hands left after the one being scored
    int discards_remaining = 3;
    int joker_slots = 5;

    HandTypeCounts hand_type_plays{};  // Run totals, including the hand being scored

    int tarots_used = 0;
    int planets_used = 0;
    int unique_planets_used = 0;

    DeckInfo deck;
    uint64_t seed = 0;
};

// ============================================================================
// HAND VIEW
// ============================================================================

struct HandView {
    std::vector<Card> played;
    std::vector<Card> held;
    std::vector<Card> discarded_this_round;
    HandEvaluation evaluation;
    std::vector<Card> scoring;  // Copies of played cards at evaluation.scoring_indices

    /**
     * Classify the played cards and pick out the scoring cards.
     */
    static HandView build(std::vector<Card> played, std::vector<Card> held = {},
                          const HandRules& rules = {});
};

// ============================================================================
// GAME HISTORY (temporal conditions)
// ============================================================================

class GameHistory {
public:
    static constexpr size_t RECENT_LIMIT = 16;

    void start_round(int round, int ante);
    void record_hand(HandType type);
    void record_discard(size_t card_count);
    void record_trigger(JokerId id);

    int round() const { return round_; }
    int ante() const { return ante_; }
    int hands_played_this_round() const { return hands_played_this_round_; }
    int cards_discarded_this_round() const { return cards_discarded_this_round_; }
    int discards_this_round() const { return discards_this_round_; }
    int plays_this_round(HandType type) const { return plays_this_round_[hand_index(type)]; }
    const std::deque<HandType>& recent_hand_types() const { return recent_hand_types_; }
    uint32_t trigger_count(JokerId id) const;

    /**
     * Hash of everything a temporal condition can observe.
     */
    uint64_t fingerprint() const;

private:
    int round_ = 1;
    int ante_ = 1;
    int hands_played_this_round_ = 0;
    int cards_discarded_this_round_ = 0;
    int discards_this_round_ = 0;
    HandTypeCounts plays_this_round_{};
    std::deque<HandType> recent_hand_types_;
    std::unordered_map<JokerId, uint32_t> trigger_counts_;
};

// ============================================================================
// ROSTER
// ============================================================================

struct RosterEntry {
    InstanceId slot = 0;
    JokerId id = JokerId::JOKER;
    Rarity rarity = Rarity::COMMON;
    int sell_value = 0;
    bool copyable = false;  // Blueprint/Brainstorm may copy its gameplay hooks
};

/**
 * Implemented by the pipeline so copy jokers can run a sibling's hook.
 */
class SiblingInvoker {
public:
    virtual ~SiblingInvoker() = default;
    virtual Effect invoke_sibling(GameContext& ctx, size_t position, const Card* card) = 0;
};

// ============================================================================
// GAME CONTEXT
// ============================================================================

class GameContext {
public:
    GameContext(const RunSnapshot& run, const HandView& hand, JokerStateStore& store,
                const GameHistory& history, ScopedRng& rng, const RuleModifiers& rules,
                const std::vector<RosterEntry>& roster, double max_mult = DEFAULT_MAX_MULT);

    // Accumulators (base values plus everything accumulated so far)
    int64_t chips() const;
    double mult() const;
    int64_t money() const;
    const Effect& accumulated() const { return accumulator_.total(); }

    /**
     * The only way to change the accumulators. Returns false when a field
     * was rejected by the numeric bounds.
     */
    bool accumulate(const Effect& effect) { return accumulator_.accumulate(effect); }
    const std::string& last_violation() const { return accumulator_.last_violation(); }

    // Run progression
    const RunSnapshot& run() const { return run_; }
    const DeckInfo& deck() const { return run_.deck; }
    int ante() const { return run_.ante; }
    int round() const { return run_.round; }
    Stage stage() const { return run_.stage; }
    int hands_remaining() const { return run_.hands_remaining; }
    int discards_remaining() const { return run_.discards_remaining; }
    bool is_final_hand() const { return run_.hands_remaining == 0; }
    int plays_of(HandType type) const { return run_.hand_type_plays[hand_index(type)]; }

    // Hand
    const HandView& hand() const { return hand_; }
    const std::vector<Card>& played_cards() const { return hand_.played; }
    const std::vector<Card>& scoring_cards() const { return hand_.scoring; }
    const std::vector<Card>& held_cards() const { return hand_.held; }
    HandType hand_type() const { return hand_.evaluation.type; }
    bool hand_contains(HandType type) const { return hand_.evaluation.contains(type); }

    // Rules and helpers that honour them
    const RuleModifiers& rules() const { return rules_; }
    bool is_face(const Card& card) const { return card.is_face(rules_.pareidolia); }
    bool is_suit(const Card& card, Suit suit) const {
        return card.is_suit(suit, rules_.smeared_suits);
    }

    // Roster and evaluation cursor
    const std::vector<RosterEntry>& roster() const { return roster_; }
    size_t position() const { return position_; }
    InstanceKey current_key() const { return current_; }
    bool is_retrigger() const { return retrigger_; }
    size_t scoring_index() const { return scoring_index_; }

    // Shared collaborators
    const GameHistory& history() const { return history_; }
    JokerStateStore& state_store() { return store_; }
    const JokerStateStore& state_store() const { return store_; }
    ScopedRng& rng() { return rng_; }

    /**
     * Store entry of the joker currently being evaluated.
     */
    nlohmann::json& instance_state() { return store_.entry(current_); }

    /**
     * Run the gameplay hook of the joker at a roster position on behalf of
     * the current joker. Returns the identity effect when the target cannot
     * be copied or copies nest deeper than the roster.
     */
    Effect copy_joker_effect(size_t position, const Card* card);

private:
    friend class ScoringPipeline;

    void set_cursor(size_t position, InstanceKey key) {
        position_ = position;
        current_ = key;
    }
    void set_retrigger(bool retrigger) { retrigger_ = retrigger; }
    void set_scoring_index(size_t index) { scoring_index_ = index; }
    void set_sibling_invoker(SiblingInvoker* invoker) { invoker_ = invoker; }

    const RunSnapshot& run_;
    const HandView& hand_;
    JokerStateStore& store_;
    const GameHistory& history_;
    ScopedRng& rng_;
    const RuleModifiers& rules_;
    const std::vector<RosterEntry>& roster_;

    EffectAccumulator accumulator_;
    size_t position_ = 0;
    InstanceKey current_;
    bool retrigger_ = false;
    size_t scoring_index_ = 0;
    size_t copy_depth_ = 0;
    SiblingInvoker* invoker_ = nullptr;
};

} // namespace balatro
