/**
 * Balatro Joker Engine - Hand Evaluation
 *
 * Classifies a played hand, records every hand type it contains and selects
 * the scoring cards. Rule-bending jokers (Four Fingers, Shortcut, Splash,
 * Smeared Joker) are passed in as HandRules.
 */

#pragma once

#include "card.hpp"

#include <vector>

namespace balatro {

struct HandRules {
    bool four_fingers = false;   // Flushes and straights need 4 cards
    bool shortcut = false;       // Straights may skip one rank
    bool splash = false;         // Every played card scores
    bool smeared_suits = false;  // Red and black suits merge
};

struct HandEvaluation {
    HandType type = HandType::HIGH_CARD;
    uint16_t contained_mask = 0;
    std::vector<size_t> scoring_indices;  // Indices into the played cards, in play order

    bool contains(HandType t) const {
        return (contained_mask & (1u << hand_index(t))) != 0;
    }
};

/**
 * Evaluate played cards. An empty hand yields HIGH_CARD with nothing
 * contained and no scoring cards.
 */
HandEvaluation evaluate_hand(const std::vector<Card>& cards, const HandRules& rules = {});

} // namespace balatro
