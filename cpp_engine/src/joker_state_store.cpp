/**
 * Balatro Joker Engine - Joker State Store Implementation
 */

#include "joker_state_store.hpp"

namespace balatro {

nlohmann::json& JokerStateStore::entry(const InstanceKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        it = entries_.emplace(key, nlohmann::json::object()).first;
    }
    return it->second;
}

const nlohmann::json* JokerStateStore::find(const InstanceKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

bool JokerStateStore::contains(const InstanceKey& key) const {
    return entries_.count(key) > 0;
}

void JokerStateStore::erase(const InstanceKey& key) {
    entries_.erase(key);
}

double JokerStateStore::get_number(const InstanceKey& key, const char* field,
                                   double fallback) const {
    const nlohmann::json* value = find(key);
    if (!value || !value->contains(field)) {
        return fallback;
    }
    const auto& v = (*value)[field];
    return v.is_number() ? v.get<double>() : fallback;
}

int64_t JokerStateStore::get_int(const InstanceKey& key, const char* field,
                                 int64_t fallback) const {
    const nlohmann::json* value = find(key);
    if (!value || !value->contains(field)) {
        return fallback;
    }
    const auto& v = (*value)[field];
    return v.is_number_integer() ? v.get<int64_t>() : fallback;
}

void JokerStateStore::set(const InstanceKey& key, const char* field, nlohmann::json value) {
    entry(key)[field] = std::move(value);
}

bool JokerStateStore::restore(const InstanceKey& key, const nlohmann::json& value) {
    if (!value.is_object()) {
        return false;
    }
    entries_[key] = value;
    return true;
}

} // namespace balatro
