/**
 * Balatro Joker Engine - Joker Registry Implementation
 */

#include "joker_registry.hpp"
#include "jokers/joker_catalog.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace balatro {

bool is_unlocked(const UnlockCondition& unlock, const UnlockProgress& progress) {
    switch (unlock.kind) {
        case UnlockKind::ALWAYS:
            return true;
        case UnlockKind::REACH_ANTE:
            return progress.highest_ante >= unlock.value;
        case UnlockKind::PLAY_HAND_TYPE:
            return progress.hands_played[hand_index(unlock.hand_type)] >= unlock.value;
        case UnlockKind::WIN_RUNS:
            return progress.runs_won >= unlock.value;
        case UnlockKind::DISCOVERED_SOUL:
            return progress.soul_available;
    }
    return false;
}

// ============================================================================
// JOKER REGISTRY
// ============================================================================

JokerRegistry::JokerRegistry() : infos_(JOKER_ID_COUNT) {}

bool JokerRegistry::register_joker(JokerInfo info, JokerConstructor constructor) {
    JokerId id = info.id;
    if (is_reserved(id)) {
        std::cerr << "[JokerRegistry] Refusing reserved id: " << to_key(id) << std::endl;
        return false;
    }
    if (!factory_.add(id, std::move(constructor))) {
        std::cerr << "[JokerRegistry] Duplicate or empty registration: " << to_key(id) << std::endl;
        return false;
    }
    infos_[joker_index(id)] = std::move(info);
    return true;
}

bool JokerRegistry::has(JokerId id) const {
    return factory_.can_create(id);
}

const JokerInfo* JokerRegistry::get_info(JokerId id) const {
    size_t index = joker_index(id);
    if (index >= infos_.size() || !infos_[index]) {
        return nullptr;
    }
    return &*infos_[index];
}

std::vector<JokerId> JokerRegistry::by_rarity(Rarity rarity) const {
    return eligible_for([rarity](const JokerInfo& info) { return info.rarity == rarity; });
}

std::vector<JokerId> JokerRegistry::eligible_for(const JokerInfoPredicate& predicate) const {
    std::vector<JokerId> result;
    for (const auto& info : infos_) {
        if (info && (!predicate || predicate(*info))) {
            result.push_back(info->id);
        }
    }
    return result;
}

std::vector<JokerId> JokerRegistry::all_ids() const {
    return eligible_for(nullptr);
}

CreateResult JokerRegistry::create(JokerId id, const ConstructionArgs& args) const {
    return factory_.create(id, args);
}

std::optional<JokerId> JokerRegistry::sample_by_rarity(ScopedRng& rng,
                                                       const JokerInfoPredicate& filter,
                                                       const RarityWeights& weights) const {
    int total = weights.common + weights.uncommon + weights.rare;
    if (total <= 0) {
        return std::nullopt;
    }

    int roll = rng.range(1, total);
    Rarity rarity = Rarity::RARE;
    if (roll <= weights.common) {
        rarity = Rarity::COMMON;
    } else if (roll <= weights.common + weights.uncommon) {
        rarity = Rarity::UNCOMMON;
    }

    std::vector<JokerId> pool = eligible_for([&](const JokerInfo& info) {
        return info.rarity == rarity && (!filter || filter(info));
    });
    if (pool.empty()) {
        return std::nullopt;
    }
    return pool[static_cast<size_t>(rng.range(0, static_cast<int>(pool.size()) - 1))];
}

// ============================================================================
// GLOBAL REGISTRY
// ============================================================================

namespace {

std::mutex g_registry_mutex;
std::shared_ptr<const JokerRegistry> g_registry;

} // anonymous namespace

std::shared_ptr<const JokerRegistry> get_joker_registry() {
    auto published = std::atomic_load(&g_registry);
    if (published) {
        return published;
    }

    std::lock_guard<std::mutex> lock(g_registry_mutex);
    published = std::atomic_load(&g_registry);
    if (published) {
        return published;  // Another thread finished first
    }

    auto registry = std::make_shared<JokerRegistry>();
    jokers::register_all_jokers(*registry);
    published = registry;
    std::atomic_store(&g_registry, published);
    return published;
}

void reset_joker_registry() {
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    std::atomic_store(&g_registry, std::shared_ptr<const JokerRegistry>());
}

} // namespace balatro
