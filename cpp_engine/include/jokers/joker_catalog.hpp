/**
 * Balatro Joker Engine - Joker Catalog
 *
 * Central registration point for every joker in the collection. Each group
 * file registers the jokers built on one framework; register_all_jokers()
 * calls them all once at startup.
 */

#pragma once

#include "../advanced_joker.hpp"
#include "../conditional_joker.hpp"
#include "../joker_registry.hpp"
#include "../legacy_joker.hpp"
#include "../scaling_joker.hpp"
#include "../static_joker.hpp"

#include <functional>
#include <memory>
#include <string>

namespace balatro {
namespace jokers {

// ============================================================================
// REGISTRATION FUNCTIONS
// ============================================================================

/**
 * Register every joker kind. Calling it on a registry that already has
 * entries does nothing.
 */
void register_all_jokers(JokerRegistry& registry);

// Groups
void register_static_jokers(JokerRegistry& registry);
void register_conditional_jokers(JokerRegistry& registry);
void register_scaling_jokers(JokerRegistry& registry);
void register_advanced_jokers(JokerRegistry& registry);
void register_economy_jokers(JokerRegistry& registry);
void register_retrigger_jokers(JokerRegistry& registry);
void register_rule_jokers(JokerRegistry& registry);
void register_copy_jokers(JokerRegistry& registry);
void register_legacy_jokers(JokerRegistry& registry);

// ============================================================================
// REGISTRATION HELPERS
// ============================================================================

UnlockCondition reach_ante(int ante);
UnlockCondition play_hand(HandType type, int times);
UnlockCondition win_runs(int runs);
UnlockCondition soul();

JokerInfo make_info(const JokerMeta& meta, ConstructionStyle style,
                    const UnlockCondition& unlock = {});

bool add_static(JokerRegistry& registry, const StaticJokerDef& def,
                const UnlockCondition& unlock = {});
bool add_conditional(JokerRegistry& registry, const ConditionalJokerBuilder& builder,
                     const UnlockCondition& unlock = {});
bool add_scaling(JokerRegistry& registry, const ScalingJokerDef& def,
                 const UnlockCondition& unlock = {});
bool add_advanced(JokerRegistry& registry, std::shared_ptr<const AdvancedJokerDef> def,
                  const UnlockCondition& unlock = {});

/**
 * Reads construction arguments into a fresh joker's internal state.
 * Returns false and fills error when the arguments are invalid.
 */
using ArgumentReader =
    std::function<bool(const ConstructionArgs& args, InternalJokerState& state, std::string& error)>;

/**
 * Register an advanced joker that accepts construction arguments.
 */
bool add_parameterized(JokerRegistry& registry, std::shared_ptr<const AdvancedJokerDef> def,
                       ArgumentReader reader, const UnlockCondition& unlock = {});

// Argument readers for the parameterized jokers. A given argument is marked
// "fixed" in the state and is not rerolled at the end of the round.
bool read_suit_argument(const ConstructionArgs& args, InternalJokerState& state,
                        std::string& error);
bool read_rank_argument(const ConstructionArgs& args, InternalJokerState& state,
                        std::string& error);
bool read_card_argument(const ConstructionArgs& args, InternalJokerState& state,
                        std::string& error);
bool read_hand_argument(const ConstructionArgs& args, InternalJokerState& state,
                        std::string& error);

// ============================================================================
// SHARED QUERIES
// ============================================================================

/**
 * Face value used by Raised Fist: pips, 10 for faces, 11 for aces.
 */
int nominal_value(const Card& card);

/**
 * How many times a held-in-hand ability activates (Mime adds one).
 */
int held_activations(const GameContext& ctx);

int count_held(const GameContext& ctx, Rank rank);
bool scoring_has_face(const GameContext& ctx);

} // namespace jokers
} // namespace balatro
