/**
 * Balatro Joker Engine - C++ Implementation
 *
 * Joker scoring modifiers for a poker-hand roguelike: the capability model,
 * the four joker frameworks, the catalog and the two-pass scoring pipeline.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "card.hpp"
#include "effect.hpp"
#include "hand_eval.hpp"

// Context and capabilities
#include "game_context.hpp"
#include "joker.hpp"
#include "joker_errors.hpp"

// Frameworks
#include "static_joker.hpp"
#include "conditional_joker.hpp"
#include "advanced_joker.hpp"
#include "scaling_joker.hpp"
#include "legacy_joker.hpp"

// Registry and catalog
#include "joker_factory.hpp"
#include "joker_registry.hpp"
#include "jokers/joker_catalog.hpp"

// Engine
#include "joker_engine.hpp"

namespace balatro {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace balatro
