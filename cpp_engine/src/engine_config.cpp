/**
 * Balatro Joker Engine - Engine Configuration Implementation
 *
 * Reads configuration files using nlohmann/json.
 */

#include "engine_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace balatro {

bool EngineConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[EngineConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);

        if (!data.is_object()) {
            std::cerr << "[EngineConfig] Top level must be an object" << std::endl;
            return false;
        }

        return apply(data);

    } catch (const json::parse_error& e) {
        std::cerr << "[EngineConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    }
}

namespace {

// Reads a count field; json's unsigned conversion would wrap negative values
template <typename T>
bool read_count(const json& data, const char* field, T& out) {
    if (!data.contains(field)) {
        return true;
    }
    const json& value = data[field];
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        std::cerr << "[EngineConfig] " << field << " must be a non-negative integer" << std::endl;
        return false;
    }
    out = value.get<T>();
    return true;
}

} // anonymous namespace

bool EngineConfig::apply(const json& data) {
    // Fields land in a copy; nothing changes unless every field is valid
    EngineConfig staged = *this;
    try {
        if (data.contains("max_mult")) {
            double value = data["max_mult"].get<double>();
            if (!(value > 0.0)) {
                std::cerr << "[EngineConfig] max_mult must be positive" << std::endl;
                return false;
            }
            staged.max_mult = value;
        }
        if (!read_count(data, "max_retriggers", staged.max_retriggers) ||
            !read_count(data, "max_retriggers_per_effect", staged.max_retriggers_per_effect) ||
            !read_count(data, "cache_max_entries", staged.cache_max_entries)) {
            return false;
        }
        staged.cache_enabled = data.value("cache_enabled", staged.cache_enabled);
        staged.trace_enabled = data.value("trace_enabled", staged.trace_enabled);
        staged.trace_dir = data.value("trace_dir", staged.trace_dir);
        if (data.contains("joker_slots")) {
            int slots = data["joker_slots"].get<int>();
            if (slots < 0) {
                std::cerr << "[EngineConfig] joker_slots must not be negative" << std::endl;
                return false;
            }
            staged.joker_slots = slots;
        }
        staged.seed = data.value("seed", staged.seed);

    } catch (const json::type_error& e) {
        std::cerr << "[EngineConfig] Bad field type: " << e.what() << std::endl;
        return false;
    }

    *this = std::move(staged);
    return true;
}

json EngineConfig::to_json() const {
    json out;
    out["max_mult"] = max_mult;
    out["max_retriggers"] = max_retriggers;
    out["max_retriggers_per_effect"] = max_retriggers_per_effect;
    out["cache_enabled"] = cache_enabled;
    out["cache_max_entries"] = cache_max_entries;
    out["trace_enabled"] = trace_enabled;
    out["trace_dir"] = trace_dir;
    out["joker_slots"] = joker_slots;
    out["seed"] = seed;
    return out;
}

} // namespace balatro
