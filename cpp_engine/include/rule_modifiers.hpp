/**
 * Balatro Joker Engine - Rule Modifiers
 *
 * Passive changes a joker makes to the rules of the run. Queried when the
 * roster changes, never per scoring event.
 */

#pragma once

#include "hand_eval.hpp"

#include <cstdint>

namespace balatro {

struct RuleModifiers {
    int hand_size = 0;
    int discards = 0;
    int hands = 0;
    int joker_slots = 0;
    int debt_limit = 0;          // How far below $0 the wallet may go
    int free_rerolls = 0;
    int probability_scale = 1;   // Multiplies the numerator of every chance roll
    int retrigger_held = 0;      // Extra activations of held-in-hand abilities
    int shop_discount_percent = 0;

    bool four_fingers = false;
    bool shortcut = false;
    bool smeared_suits = false;
    bool pareidolia = false;
    bool splash = false;
    bool showman = false;
    bool prevents_death = false;
    bool disables_boss_blind = false;
    bool free_planets = false;

    /**
     * Merge another joker's modifiers into this one. Counts add, the
     * probability scale multiplies, flags OR.
     */
    void merge(const RuleModifiers& other) {
        hand_size += other.hand_size;
        discards += other.discards;
        hands += other.hands;
        joker_slots += other.joker_slots;
        debt_limit += other.debt_limit;
        free_rerolls += other.free_rerolls;
        probability_scale *= other.probability_scale;
        retrigger_held += other.retrigger_held;
        shop_discount_percent += other.shop_discount_percent;
        four_fingers = four_fingers || other.four_fingers;
        shortcut = shortcut || other.shortcut;
        smeared_suits = smeared_suits || other.smeared_suits;
        pareidolia = pareidolia || other.pareidolia;
        splash = splash || other.splash;
        showman = showman || other.showman;
        prevents_death = prevents_death || other.prevents_death;
        disables_boss_blind = disables_boss_blind || other.disables_boss_blind;
        free_planets = free_planets || other.free_planets;
    }

    HandRules hand_rules() const {
        HandRules rules;
        rules.four_fingers = four_fingers;
        rules.shortcut = shortcut;
        rules.splash = splash;
        rules.smeared_suits = smeared_suits;
        return rules;
    }
};

} // namespace balatro
