/**
 * Balatro Joker Engine - Joker Capability Interfaces
 *
 * A joker is split into five narrow capabilities instead of one wide
 * interface:
 *
 *   Identity  - metadata (always present)
 *   Lifecycle - acquisition, sale, destruction, round and roster notifications
 *   Gameplay  - hand-played and card-scored hooks returning Effects
 *   Modifiers - passive RuleModifiers
 *   State     - json serialization of instance-held data
 *
 * Callers ask a Joker for a capability and get nullptr when it is absent:
 *
 *   if (auto* play = joker.gameplay()) {
 *       Effect e = play->on_hand_played(ctx);
 *   }
 */

#pragma once

#include "effect.hpp"
#include "game_context.hpp"
#include "joker_errors.hpp"
#include "joker_id.hpp"
#include "rule_modifiers.hpp"
#include "types.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

namespace balatro {

struct EngineConfig;

enum class Capability : uint8_t {
    IDENTITY = 1 << 0,
    LIFECYCLE = 1 << 1,
    GAMEPLAY = 1 << 2,
    MODIFIERS = 1 << 3,
    STATE = 1 << 4
};

/**
 * Run event delivered to Lifecycle::on_game_event.
 */
struct GameEvent {
    GameEventType type = GameEventType::PACK_OPENED;
    int count = 1;
};

// ============================================================================
// CAPABILITIES
// ============================================================================

class JokerIdentity {
public:
    virtual ~JokerIdentity() = default;

    virtual JokerId id() const = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual Rarity rarity() const = 0;
    virtual int base_cost() const = 0;
    virtual bool is_unique() const { return false; }
};

/**
 * Notifications. Every hook tolerates being called zero or many times.
 * Round and discard hooks may hand back an Effect (money, destroy requests).
 */
class JokerLifecycle {
public:
    virtual ~JokerLifecycle() = default;

    virtual void on_acquired(GameContext&) {}
    virtual Effect on_sold(GameContext&) { return {}; }
    virtual void on_destroyed(GameContext&) {}
    virtual Effect on_round_start(GameContext&) { return {}; }
    virtual Effect on_round_end(GameContext&) { return {}; }
    virtual void on_roster_changed(GameContext&) {}
    virtual Effect on_discard(GameContext&, const std::vector<Card>& /*discarded*/) { return {}; }
    virtual Effect on_game_event(GameContext&, const GameEvent&) { return {}; }
};

class JokerGameplay {
public:
    virtual ~JokerGameplay() = default;

    virtual Effect on_hand_played(GameContext& ctx) = 0;
    virtual Effect on_card_scored(GameContext& ctx, const Card& card) = 0;
};

class JokerModifiers {
public:
    virtual ~JokerModifiers() = default;

    virtual RuleModifiers rule_modifiers() const = 0;
};

/**
 * Instance-held persistent data. deserialize_state must leave the instance
 * untouched when it fails.
 */
class JokerState {
public:
    virtual ~JokerState() = default;

    virtual nlohmann::json serialize_state() const = 0;
    virtual StateResult deserialize_state(const nlohmann::json& state) = 0;
    virtual uint32_t state_schema_version() const { return 1; }
};

// ============================================================================
// JOKER
// ============================================================================

class Joker : public JokerIdentity {
public:
    virtual JokerLifecycle* lifecycle() { return nullptr; }
    virtual JokerGameplay* gameplay() { return nullptr; }
    virtual const JokerModifiers* modifiers() const { return nullptr; }
    virtual JokerState* state() { return nullptr; }
    virtual const JokerState* state() const { return nullptr; }

    /**
     * Whether Blueprint/Brainstorm may run this joker's gameplay hooks.
     * Jokers that mutate state while scoring must opt out.
     */
    virtual bool copyable() const { return false; }

    /**
     * Engine-wide settings pushed after construction (cache sizing).
     */
    virtual void configure(const EngineConfig&) {}

    virtual std::unique_ptr<Joker> clone() const = 0;

    bool supports(Capability capability) const;
    uint8_t capabilities() const;
};

/**
 * Static metadata shared by the framework and catalog jokers.
 */
struct JokerMeta {
    JokerId id = JokerId::JOKER;
    const char* name = "";
    const char* description = "";
    Rarity rarity = Rarity::COMMON;
    int cost = 0;
};

/**
 * Joker whose Identity comes from a JokerMeta.
 */
class MetaJoker : public Joker {
public:
    explicit MetaJoker(const JokerMeta& meta) : meta_(meta) {}

    JokerId id() const override { return meta_.id; }
    const char* name() const override { return meta_.name; }
    const char* description() const override { return meta_.description; }
    Rarity rarity() const override { return meta_.rarity; }
    int base_cost() const override { return meta_.cost; }

    const JokerMeta& meta() const { return meta_; }

protected:
    JokerMeta meta_;
};

} // namespace balatro
