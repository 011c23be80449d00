/**
 * Balatro Joker Engine - Joker Registry
 *
 * Metadata and constructors for every joker kind, queried by the shop
 * (rarity pools, unlock filtering) and by save loading (construction).
 *
 * Architecture:
 * - A JokerRegistry is filled once by register_all_jokers() and then only read
 * - The process-wide registry is published as shared_ptr<const JokerRegistry>;
 *   readers either see no registry yet or the complete table
 * - reset_joker_registry() drops the published table so tests start clean
 *
 * Example usage:
 *   auto registry = get_joker_registry();
 *   for (JokerId id : registry->by_rarity(Rarity::RARE)) { ... }
 *   CreateResult made = registry->create(JokerId::BLUEPRINT);
 */

#pragma once

#include "joker_factory.hpp"
#include "scoped_rng.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace balatro {

// ============================================================================
// JOKER INFO
// ============================================================================

enum class UnlockKind : uint8_t {
    ALWAYS,
    REACH_ANTE,
    PLAY_HAND_TYPE,   // Play a given hand type `value` times
    WIN_RUNS,
    DISCOVERED_SOUL   // Legendary jokers appear only through The Soul
};

struct UnlockCondition {
    UnlockKind kind = UnlockKind::ALWAYS;
    int value = 0;
    HandType hand_type = HandType::HIGH_CARD;
};

enum class ConstructionStyle : uint8_t {
    STATIC,
    CONDITIONAL,
    ADVANCED,
    SCALING,
    CUSTOM,
    LEGACY
};

struct JokerInfo {
    JokerId id = JokerId::JOKER;
    std::string name;
    std::string description;
    Rarity rarity = Rarity::COMMON;
    int cost = 0;
    UnlockCondition unlock;
    ConstructionStyle style = ConstructionStyle::STATIC;
    bool parameterized = false;  // Accepts construction arguments
};

/**
 * Player progress that unlock conditions are checked against.
 */
struct UnlockProgress {
    int highest_ante = 1;
    int runs_won = 0;
    HandTypeCounts hands_played{};
    bool soul_available = false;
};

bool is_unlocked(const UnlockCondition& unlock, const UnlockProgress& progress);

/**
 * Shop rarity weights (percent). Legendary jokers are never sampled.
 */
struct RarityWeights {
    int common = 70;
    int uncommon = 25;
    int rare = 5;
};

// ============================================================================
// JOKER REGISTRY
// ============================================================================

using JokerInfoPredicate = std::function<bool(const JokerInfo&)>;

class JokerRegistry {
public:
    JokerRegistry();

    /**
     * Add a joker kind. Fails (and logs) on reserved or duplicate ids.
     */
    bool register_joker(JokerInfo info, JokerConstructor constructor);

    bool has(JokerId id) const;
    const JokerInfo* get_info(JokerId id) const;
    std::vector<JokerId> by_rarity(Rarity rarity) const;
    std::vector<JokerId> eligible_for(const JokerInfoPredicate& predicate) const;
    std::vector<JokerId> all_ids() const;
    size_t size() const { return factory_.size(); }

    CreateResult create(JokerId id, const ConstructionArgs& args = nullptr) const;
    const JokerFactory& factory() const { return factory_; }

    /**
     * Roll a rarity with the given weights, then pick uniformly among the
     * registered jokers of that rarity passing the filter.
     */
    std::optional<JokerId> sample_by_rarity(ScopedRng& rng,
                                            const JokerInfoPredicate& filter = nullptr,
                                            const RarityWeights& weights = {}) const;

private:
    std::vector<std::optional<JokerInfo>> infos_;  // Indexed by JokerId
    JokerFactory factory_;
};

// ============================================================================
// GLOBAL REGISTRY
// ============================================================================

/**
 * Process-wide registry, built and published on first use. Concurrent first
 * calls build it once; every caller gets the same immutable table.
 */
std::shared_ptr<const JokerRegistry> get_joker_registry();

/**
 * Drop the published registry. The next get_joker_registry() rebuilds it.
 * Instances created from the old table stay valid.
 */
void reset_joker_registry();

} // namespace balatro
