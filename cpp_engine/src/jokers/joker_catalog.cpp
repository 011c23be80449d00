/**
 * Balatro Joker Engine - Joker Catalog Implementation
 *
 * Central registration point for all joker kinds.
 */

#include "jokers/joker_catalog.hpp"

#include <iostream>
#include <optional>

namespace balatro {
namespace jokers {

// ============================================================================
// REGISTRATION
// ============================================================================

void register_all_jokers(JokerRegistry& registry) {
    if (registry.size() > 0) {
        return;  // Already registered
    }

    register_static_jokers(registry);
    register_conditional_jokers(registry);
    register_scaling_jokers(registry);
    register_advanced_jokers(registry);
    register_economy_jokers(registry);
    register_retrigger_jokers(registry);
    register_rule_jokers(registry);
    register_copy_jokers(registry);
    register_legacy_jokers(registry);

    if (registry.size() != PLAYABLE_JOKER_COUNT) {
        std::cerr << "[JokerRegistry] Catalog registered " << registry.size() << " of "
                  << PLAYABLE_JOKER_COUNT << " jokers" << std::endl;
    }
}

// ============================================================================
// HELPERS
// ============================================================================

UnlockCondition reach_ante(int ante) {
    UnlockCondition unlock;
    unlock.kind = UnlockKind::REACH_ANTE;
    unlock.value = ante;
    return unlock;
}

UnlockCondition play_hand(HandType type, int times) {
    UnlockCondition unlock;
    unlock.kind = UnlockKind::PLAY_HAND_TYPE;
    unlock.value = times;
    unlock.hand_type = type;
    return unlock;
}

UnlockCondition win_runs(int runs) {
    UnlockCondition unlock;
    unlock.kind = UnlockKind::WIN_RUNS;
    unlock.value = runs;
    return unlock;
}

UnlockCondition soul() {
    UnlockCondition unlock;
    unlock.kind = UnlockKind::DISCOVERED_SOUL;
    return unlock;
}

JokerInfo make_info(const JokerMeta& meta, ConstructionStyle style,
                    const UnlockCondition& unlock) {
    JokerInfo info;
    info.id = meta.id;
    info.name = meta.name;
    info.description = meta.description;
    info.rarity = meta.rarity;
    info.cost = meta.cost;
    info.unlock = unlock;
    info.style = style;
    return info;
}

bool add_static(JokerRegistry& registry, const StaticJokerDef& def,
                const UnlockCondition& unlock) {
    return registry.register_joker(
        make_info(def.meta, ConstructionStyle::STATIC, unlock),
        [def](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(std::make_unique<StaticJoker>(def));
        });
}

bool add_conditional(JokerRegistry& registry, const ConditionalJokerBuilder& builder,
                     const UnlockCondition& unlock) {
    return registry.register_joker(
        make_info(builder.meta(), ConstructionStyle::CONDITIONAL, unlock),
        [builder](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(builder.build());
        });
}

bool add_scaling(JokerRegistry& registry, const ScalingJokerDef& def,
                 const UnlockCondition& unlock) {
    auto shared = std::make_shared<const ScalingJokerDef>(def);
    return registry.register_joker(
        make_info(def.meta, ConstructionStyle::SCALING, unlock),
        [shared](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(std::make_unique<ScalingJoker>(shared));
        });
}

bool add_advanced(JokerRegistry& registry, std::shared_ptr<const AdvancedJokerDef> def,
                  const UnlockCondition& unlock) {
    JokerInfo info = make_info(def->meta, ConstructionStyle::ADVANCED, unlock);
    return registry.register_joker(
        std::move(info),
        [def](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(std::make_unique<AdvancedJoker>(def));
        });
}

bool add_parameterized(JokerRegistry& registry, std::shared_ptr<const AdvancedJokerDef> def,
                       ArgumentReader reader, const UnlockCondition& unlock) {
    JokerInfo info = make_info(def->meta, ConstructionStyle::ADVANCED, unlock);
    info.parameterized = true;
    return registry.register_joker(
        std::move(info),
        [def, reader](const ConstructionArgs& a) {
            InternalJokerState state = def->initial_state;
            std::string error;
            if (!reader(a, state, error)) {
                return CreateResult::fail(std::string(def->meta.name) + ": " + error);
            }
            auto joker = std::make_unique<AdvancedJoker>(def);
            joker->internal_state() = std::move(state);
            return CreateResult::ok(std::move(joker));
        });
}

// ============================================================================
// ARGUMENT READERS
// ============================================================================

bool read_suit_argument(const ConstructionArgs& a, InternalJokerState& state,
                        std::string& error) {
    std::optional<Suit> suit;
    if (!args::check_fields(a, {"suit"}, error) || !args::read_suit(a, "suit", suit, error)) {
        return false;
    }
    if (suit) {
        state.set_data("suit", static_cast<int>(*suit));
        state.set_flag("fixed", true);
    }
    return true;
}

bool read_rank_argument(const ConstructionArgs& a, InternalJokerState& state,
                        std::string& error) {
    std::optional<Rank> rank;
    if (!args::check_fields(a, {"rank"}, error) || !args::read_rank(a, "rank", rank, error)) {
        return false;
    }
    if (rank) {
        state.set_data("rank", rank_value(*rank));
        state.set_flag("fixed", true);
    }
    return true;
}

bool read_card_argument(const ConstructionArgs& a, InternalJokerState& state,
                        std::string& error) {
    std::optional<Rank> rank;
    std::optional<Suit> suit;
    if (!args::check_fields(a, {"rank", "suit"}, error) ||
        !args::read_rank(a, "rank", rank, error) || !args::read_suit(a, "suit", suit, error)) {
        return false;
    }
    if (rank.has_value() != suit.has_value()) {
        error = "rank and suit must be given together";
        return false;
    }
    if (rank) {
        state.set_data("rank", rank_value(*rank));
        state.set_data("suit", static_cast<int>(*suit));
        state.set_flag("fixed", true);
    }
    return true;
}

bool read_hand_argument(const ConstructionArgs& a, InternalJokerState& state,
                        std::string& error) {
    std::optional<HandType> hand;
    if (!args::check_fields(a, {"hand"}, error) || !args::read_hand_type(a, "hand", hand, error)) {
        return false;
    }
    if (hand) {
        state.set_data("hand", static_cast<int>(*hand));
        state.set_flag("fixed", true);
    }
    return true;
}

// ============================================================================
// SHARED QUERIES
// ============================================================================

int nominal_value(const Card& card) {
    if (card.rank == Rank::ACE) return 11;
    if (card.rank >= Rank::JACK) return 10;
    return rank_value(card.rank);
}

int held_activations(const GameContext& ctx) {
    return 1 + ctx.rules().retrigger_held;
}

int count_held(const GameContext& ctx, Rank rank) {
    int count = 0;
    for (const auto& card : ctx.held_cards()) {
        if (!card.is_stone() && !card.debuffed && card.rank == rank) ++count;
    }
    return count;
}

bool scoring_has_face(const GameContext& ctx) {
    for (const auto& card : ctx.scoring_cards()) {
        if (ctx.is_face(card)) return true;
    }
    return false;
}

} // namespace jokers
} // namespace balatro
