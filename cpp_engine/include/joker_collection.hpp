/**
 * Balatro Joker Engine - Joker Collection
 *
 * The active jokers of a run in acquisition order. Native and bridged
 * legacy jokers sit side by side behind the Joker interface. Every joker
 * gets a slot handle that stays fixed while it is owned.
 */

#pragma once

#include "game_context.hpp"
#include "joker.hpp"

#include <limits>
#include <memory>
#include <optional>
#include <vector>

namespace balatro {

constexpr InstanceId MAX_RESTORABLE_SLOT = std::numeric_limits<InstanceId>::max() - 1;

struct JokerSlot {
    InstanceId slot = 0;
    std::unique_ptr<Joker> joker;
    int sell_value = 0;
};

class JokerCollection {
public:
    JokerCollection() = default;
    JokerCollection(JokerCollection&&) = default;
    JokerCollection& operator=(JokerCollection&&) = default;

    /**
     * Append a joker. Its sell value starts at half its cost (minimum 1).
     */
    InstanceId add(std::unique_ptr<Joker> joker);

    /**
     * Append with a known slot and sell value (save loading). Later slots
     * are issued above the highest one seen. Refuses a slot already held and
     * the highest representable slot, which would leave no handle to issue
     * next.
     */
    bool restore(InstanceId slot, std::unique_ptr<Joker> joker, int sell_value);

    std::unique_ptr<Joker> remove(InstanceId slot);

    Joker* find(InstanceId slot);
    const Joker* find(InstanceId slot) const;
    const JokerSlot* slot_of(InstanceId slot) const;
    std::optional<size_t> position_of(InstanceId slot) const;

    void adjust_sell_value(InstanceId slot, int delta);
    void adjust_all_sell_values(int delta);

    /** Snapshot of the roster in run order, as hooks see it. */
    std::vector<RosterEntry> roster() const;

    size_t size() const { return slots_.size(); }
    bool empty() const { return slots_.empty(); }
    void clear() { slots_.clear(); }

    JokerSlot& at(size_t position) { return slots_[position]; }
    const JokerSlot& at(size_t position) const { return slots_[position]; }
    std::vector<JokerSlot>::const_iterator begin() const { return slots_.begin(); }
    std::vector<JokerSlot>::const_iterator end() const { return slots_.end(); }

private:
    std::vector<JokerSlot> slots_;
    InstanceId next_slot_ = 1;
};

} // namespace balatro
