/**
 * Balatro Joker Engine - Joker State Store
 *
 * Per-run storage for jokers that keep their persistent data outside the
 * instance (the scaling framework). Entries are keyed by (JokerId, slot) and
 * hold a json object, so the store serializes together with the roster.
 */

#pragma once

#include "joker_id.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>
#include <unordered_map>

namespace balatro {

struct InstanceKey {
    JokerId id = JokerId::JOKER;
    InstanceId slot = 0;

    bool operator==(const InstanceKey& other) const {
        return id == other.id && slot == other.slot;
    }
};

struct InstanceKeyHash {
    size_t operator()(const InstanceKey& key) const {
        return (static_cast<size_t>(key.id) << 32) ^ static_cast<size_t>(key.slot);
    }
};

class JokerStateStore {
public:
    /**
     * Entry for a key, created as an empty json object on first access.
     */
    nlohmann::json& entry(const InstanceKey& key);

    /**
     * Entry for a key, or nullptr if the key has nothing stored.
     */
    const nlohmann::json* find(const InstanceKey& key) const;

    bool contains(const InstanceKey& key) const;
    void erase(const InstanceKey& key);
    void clear() { entries_.clear(); }
    size_t size() const { return entries_.size(); }

    // Typed field access with defaults for missing or mistyped fields
    double get_number(const InstanceKey& key, const char* field, double fallback) const;
    int64_t get_int(const InstanceKey& key, const char* field, int64_t fallback) const;
    void set(const InstanceKey& key, const char* field, nlohmann::json value);

    /**
     * Replace an entry wholesale. Non-object values are rejected.
     */
    bool restore(const InstanceKey& key, const nlohmann::json& value);

private:
    std::unordered_map<InstanceKey, nlohmann::json, InstanceKeyHash> entries_;
};

} // namespace balatro
