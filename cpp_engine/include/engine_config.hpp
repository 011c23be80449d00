/**
 * Balatro Joker Engine - Engine Configuration
 *
 * Numeric bounds, cache sizing and trace output for a JokerEngine. Loaded
 * from a json file; missing fields keep their defaults.
 *
 * Example file:
 *   {
 *     "max_mult": 1000000,
 *     "max_retriggers": 100,
 *     "cache_enabled": true,
 *     "trace_enabled": true,
 *     "trace_dir": "cpp_engine/traces"
 *   }
 */

#pragma once

#include "effect.hpp"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace balatro {

struct EngineConfig {
    double max_mult = DEFAULT_MAX_MULT;
    uint32_t max_retriggers = 100;  // Extra card passes per hand
    uint32_t max_retriggers_per_effect = MAX_RETRIGGERS_PER_EFFECT;
    bool cache_enabled = true;
    size_t cache_max_entries = 1024;
    bool trace_enabled = false;
    std::string trace_dir = "cpp_engine/traces";
    int joker_slots = 5;
    uint64_t seed = 0;

    /**
     * Load settings from a json file.
     *
     * @return false if the file could not be opened or parsed; fields
     *         already applied stay applied
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Apply the fields present in a json object. Returns false on a
     * mistyped or out-of-range field.
     */
    bool apply(const nlohmann::json& data);

    nlohmann::json to_json() const;
};

} // namespace balatro
