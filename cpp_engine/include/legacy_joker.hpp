/**
 * Balatro Joker Engine - Legacy Joker Interface and Bridge
 *
 * LegacyJoker is the older one-class-does-everything joker model: metadata,
 * a single evaluate() entry point switched on the event, passive queries and
 * optional state. Jokers written against it keep working through
 * LegacyJokerAdapter, which implements the capability interfaces by
 * forwarding each hook to the matching branch of evaluate().
 *
 * The adapter builds its LegacyCall on the stack; forwarding never
 * allocates.
 */

#pragma once

#include "joker.hpp"

#include <memory>
#include <string>
#include <vector>

namespace balatro {

enum class LegacyEvent : uint8_t {
    HAND_PLAYED,
    CARD_SCORED,
    BLIND_START,
    ROUND_END,
    DISCARD,
    ACQUIRED,
    SOLD,
    DESTROYED,
    ROSTER_CHANGED,
    GAME_EVENT
};

/**
 * Everything evaluate() may need besides the context. Pointers are null
 * when the event does not carry them.
 */
struct LegacyCall {
    LegacyEvent event = LegacyEvent::HAND_PLAYED;
    const Card* card = nullptr;
    const std::vector<Card>* cards = nullptr;
    const GameEvent* game_event = nullptr;
};

class LegacyJoker {
public:
    virtual ~LegacyJoker() = default;

    virtual JokerId id() const = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual Rarity rarity() const = 0;
    virtual int cost() const = 0;

    virtual Effect evaluate(const LegacyCall& call, GameContext& ctx) = 0;

    virtual bool has_passive_modifiers() const { return false; }
    virtual RuleModifiers passive_modifiers() const { return {}; }

    virtual bool has_state() const { return false; }
    virtual nlohmann::json save_state() const { return nlohmann::json::object(); }
    /** Must leave the joker untouched and fill error when it returns false. */
    virtual bool load_state(const nlohmann::json&, std::string& /*error*/) { return true; }

    virtual std::unique_ptr<LegacyJoker> clone() const = 0;
};

class LegacyJokerAdapter final : public Joker,
                                 public JokerLifecycle,
                                 public JokerGameplay,
                                 public JokerModifiers,
                                 public JokerState {
public:
    explicit LegacyJokerAdapter(std::unique_ptr<LegacyJoker> legacy);

    // Identity
    JokerId id() const override { return legacy_->id(); }
    const char* name() const override { return legacy_->name(); }
    const char* description() const override { return legacy_->description(); }
    Rarity rarity() const override { return legacy_->rarity(); }
    int base_cost() const override { return legacy_->cost(); }

    // Capability queries
    JokerLifecycle* lifecycle() override { return this; }
    JokerGameplay* gameplay() override { return this; }
    const JokerModifiers* modifiers() const override {
        return legacy_->has_passive_modifiers() ? this : nullptr;
    }
    JokerState* state() override { return legacy_->has_state() ? this : nullptr; }
    const JokerState* state() const override { return legacy_->has_state() ? this : nullptr; }
    bool copyable() const override { return !legacy_->has_state(); }
    std::unique_ptr<Joker> clone() const override;

    // Lifecycle
    void on_acquired(GameContext& ctx) override;
    Effect on_sold(GameContext& ctx) override;
    void on_destroyed(GameContext& ctx) override;
    Effect on_round_start(GameContext& ctx) override;
    Effect on_round_end(GameContext& ctx) override;
    void on_roster_changed(GameContext& ctx) override;
    Effect on_discard(GameContext& ctx, const std::vector<Card>& discarded) override;
    Effect on_game_event(GameContext& ctx, const GameEvent& event) override;

    // Gameplay
    Effect on_hand_played(GameContext& ctx) override;
    Effect on_card_scored(GameContext& ctx, const Card& card) override;

    // Modifiers
    RuleModifiers rule_modifiers() const override { return legacy_->passive_modifiers(); }

    // State
    nlohmann::json serialize_state() const override { return legacy_->save_state(); }
    StateResult deserialize_state(const nlohmann::json& state) override;

    const LegacyJoker& legacy() const { return *legacy_; }

private:
    Effect forward(LegacyEvent event, GameContext& ctx, const Card* card = nullptr,
                   const std::vector<Card>* cards = nullptr,
                   const GameEvent* game_event = nullptr);

    std::unique_ptr<LegacyJoker> legacy_;
};

/**
 * Wrap a legacy joker so it can live in a JokerCollection.
 */
std::unique_ptr<Joker> bridge_legacy(std::unique_ptr<LegacyJoker> legacy);

} // namespace balatro
