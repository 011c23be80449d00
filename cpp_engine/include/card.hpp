/**
 * Balatro Joker Engine - Playing Card
 *
 * Plain value type for a playing card as jokers see it. The game engine owns
 * the deck; jokers only read cards and request transforms through Effects.
 */

#pragma once

#include "types.hpp"

#include <string>

namespace balatro {

struct Card {
    uint32_t id = 0;
    Rank rank = Rank::TWO;
    Suit suit = Suit::SPADES;
    Enhancement enhancement = Enhancement::NONE;
    Edition edition = Edition::BASE;
    Seal seal = Seal::NONE;
    int bonus_chips = 0;           // Permanent chips added by Hiker
    bool debuffed = false;
    bool lucky_triggered = false;  // Set by the game engine when a Lucky roll hit

    Card() = default;
    Card(Rank r, Suit s, uint32_t card_id = 0) : id(card_id), rank(r), suit(s) {}

    /**
     * Chip value when scored: pips for 2-10, 10 for faces, 11 for aces,
     * 50 for stone cards, plus permanent bonus chips.
     */
    int chip_value() const;

    bool is_stone() const { return enhancement == Enhancement::STONE; }
    bool is_wild() const { return enhancement == Enhancement::WILD; }

    /**
     * Face check. Pareidolia makes every non-stone card a face card.
     */
    bool is_face(bool pareidolia = false) const;

    /**
     * Suit check. Wild cards match every suit, stone cards match none.
     * With smeared suits, hearts/diamonds and spades/clubs are merged.
     */
    bool is_suit(Suit s, bool smeared = false) const;

    bool is_even() const;  // 10, 8, 6, 4, 2
    bool is_odd() const;   // A, 9, 7, 5, 3

    std::string to_string() const;
};

} // namespace balatro
