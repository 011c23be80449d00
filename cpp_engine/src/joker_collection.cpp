/**
 * Balatro Joker Engine - Joker Collection Implementation
 */

#include "joker_collection.hpp"

#include <algorithm>

namespace balatro {

InstanceId JokerCollection::add(std::unique_ptr<Joker> joker) {
    int sell_value = std::max(1, joker->base_cost() / 2);
    InstanceId slot = next_slot_++;
    slots_.push_back({slot, std::move(joker), sell_value});
    return slot;
}

bool JokerCollection::restore(InstanceId slot, std::unique_ptr<Joker> joker, int sell_value) {
    if (slot > MAX_RESTORABLE_SLOT || slot_of(slot) != nullptr) {
        return false;
    }
    slots_.push_back({slot, std::move(joker), sell_value});
    if (slot >= next_slot_) {
        next_slot_ = slot + 1;
    }
    return true;
}

std::unique_ptr<Joker> JokerCollection::remove(InstanceId slot) {
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [slot](const JokerSlot& s) { return s.slot == slot; });
    if (it == slots_.end()) {
        return nullptr;
    }
    std::unique_ptr<Joker> joker = std::move(it->joker);
    slots_.erase(it);
    return joker;
}

Joker* JokerCollection::find(InstanceId slot) {
    for (auto& s : slots_) {
        if (s.slot == slot) return s.joker.get();
    }
    return nullptr;
}

const Joker* JokerCollection::find(InstanceId slot) const {
    for (const auto& s : slots_) {
        if (s.slot == slot) return s.joker.get();
    }
    return nullptr;
}

const JokerSlot* JokerCollection::slot_of(InstanceId slot) const {
    for (const auto& s : slots_) {
        if (s.slot == slot) return &s;
    }
    return nullptr;
}

std::optional<size_t> JokerCollection::position_of(InstanceId slot) const {
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].slot == slot) return i;
    }
    return std::nullopt;
}

void JokerCollection::adjust_sell_value(InstanceId slot, int delta) {
    for (auto& s : slots_) {
        if (s.slot == slot) {
            s.sell_value = std::max(0, s.sell_value + delta);
            return;
        }
    }
}

void JokerCollection::adjust_all_sell_values(int delta) {
    for (auto& s : slots_) {
        s.sell_value = std::max(0, s.sell_value + delta);
    }
}

std::vector<RosterEntry> JokerCollection::roster() const {
    std::vector<RosterEntry> entries;
    entries.reserve(slots_.size());
    for (const auto& s : slots_) {
        RosterEntry entry;
        entry.slot = s.slot;
        entry.id = s.joker->id();
        entry.rarity = s.joker->rarity();
        entry.sell_value = s.sell_value;
        entry.copyable = s.joker->copyable();
        entries.push_back(entry);
    }
    return entries;
}

} // namespace balatro
