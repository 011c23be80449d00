/**
 * Balatro Joker Engine - Core Type Definitions
 *
 * This file defines the enums and basic types shared by the card model,
 * the hand evaluator and the joker behaviors.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace balatro {

// ============================================================================
// ENUMS
// ============================================================================

enum class Rarity : uint8_t {
    COMMON,
    UNCOMMON,
    RARE,
    LEGENDARY
};

enum class Suit : uint8_t {
    SPADES,
    HEARTS,
    CLUBS,
    DIAMONDS
};

/**
 * Card ranks carry their natural order value (Jack = 11, Ace = 14).
 */
enum class Rank : uint8_t {
    TWO = 2,
    THREE = 3,
    FOUR = 4,
    FIVE = 5,
    SIX = 6,
    SEVEN = 7,
    EIGHT = 8,
    NINE = 9,
    TEN = 10,
    JACK = 11,
    QUEEN = 12,
    KING = 13,
    ACE = 14
};

enum class Enhancement : uint8_t {
    NONE,
    BONUS,
    MULT,
    WILD,
    GLASS,
    STEEL,
    STONE,
    GOLD,
    LUCKY
};

enum class Edition : uint8_t {
    BASE,
    FOIL,
    HOLOGRAPHIC,
    POLYCHROME,
    NEGATIVE
};

enum class Seal : uint8_t {
    NONE,
    GOLD,
    RED,
    BLUE,
    PURPLE
};

/**
 * Poker hand classifications, weakest first.
 */
enum class HandType : uint8_t {
    HIGH_CARD,
    PAIR,
    TWO_PAIR,
    THREE_OF_A_KIND,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    STRAIGHT_FLUSH,
    FIVE_OF_A_KIND,
    FLUSH_HOUSE,
    FLUSH_FIVE
};

constexpr size_t HAND_TYPE_COUNT = 12;

enum class Stage : uint8_t {
    PRE_BLIND,
    BLIND,
    POST_BLIND,
    SHOP,
    END
};

enum class BlindKind : uint8_t {
    SMALL,
    BIG,
    BOSS
};

/**
 * Things a joker may ask the game engine to create on its behalf.
 */
enum class CreationKind : uint8_t {
    TAROT,
    PLANET,
    SPECTRAL,
    JOKER,
    PLAYING_CARD,
    STONE_CARD,
    HAND_LEVEL_UP,
    DOUBLE_TAG,
    CONSUMABLE_COPY
};

/**
 * Run events reported by the game engine outside of hand scoring.
 */
enum class GameEventType : uint8_t {
    PACK_OPENED,
    PACK_SKIPPED,
    BLIND_SKIPPED,
    TAROT_USED,
    PLANET_USED,
    CARD_ADDED_TO_DECK,
    FACE_CARD_DESTROYED,
    GLASS_SHATTERED,
    CARD_SOLD,
    SHOP_REROLLED,
    SHOP_EXITED,
    BOSS_DEFEATED
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using InstanceId = uint32_t;  // Slot handle of a joker within a run
using HandTypeCounts = std::array<int, HAND_TYPE_COUNT>;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

inline size_t hand_index(HandType type) {
    return static_cast<size_t>(type);
}

inline int rank_value(Rank rank) {
    return static_cast<int>(rank);
}

inline const char* to_string(Rarity rarity) {
    switch (rarity) {
        case Rarity::COMMON: return "Common";
        case Rarity::UNCOMMON: return "Uncommon";
        case Rarity::RARE: return "Rare";
        case Rarity::LEGENDARY: return "Legendary";
    }
    return "Unknown";
}

inline const char* to_string(Suit suit) {
    switch (suit) {
        case Suit::SPADES: return "Spades";
        case Suit::HEARTS: return "Hearts";
        case Suit::CLUBS: return "Clubs";
        case Suit::DIAMONDS: return "Diamonds";
    }
    return "Unknown";
}

inline const char* to_string(Rank rank) {
    switch (rank) {
        case Rank::TWO: return "2";
        case Rank::THREE: return "3";
        case Rank::FOUR: return "4";
        case Rank::FIVE: return "5";
        case Rank::SIX: return "6";
        case Rank::SEVEN: return "7";
        case Rank::EIGHT: return "8";
        case Rank::NINE: return "9";
        case Rank::TEN: return "10";
        case Rank::JACK: return "J";
        case Rank::QUEEN: return "Q";
        case Rank::KING: return "K";
        case Rank::ACE: return "A";
    }
    return "?";
}

inline const char* to_string(Enhancement enhancement) {
    switch (enhancement) {
        case Enhancement::NONE: return "None";
        case Enhancement::BONUS: return "Bonus";
        case Enhancement::MULT: return "Mult";
        case Enhancement::WILD: return "Wild";
        case Enhancement::GLASS: return "Glass";
        case Enhancement::STEEL: return "Steel";
        case Enhancement::STONE: return "Stone";
        case Enhancement::GOLD: return "Gold";
        case Enhancement::LUCKY: return "Lucky";
    }
    return "Unknown";
}

inline const char* to_string(HandType type) {
    switch (type) {
        case HandType::HIGH_CARD: return "High Card";
        case HandType::PAIR: return "Pair";
        case HandType::TWO_PAIR: return "Two Pair";
        case HandType::THREE_OF_A_KIND: return "Three of a Kind";
        case HandType::STRAIGHT: return "Straight";
        case HandType::FLUSH: return "Flush";
        case HandType::FULL_HOUSE: return "Full House";
        case HandType::FOUR_OF_A_KIND: return "Four of a Kind";
        case HandType::STRAIGHT_FLUSH: return "Straight Flush";
        case HandType::FIVE_OF_A_KIND: return "Five of a Kind";
        case HandType::FLUSH_HOUSE: return "Flush House";
        case HandType::FLUSH_FIVE: return "Flush Five";
    }
    return "Unknown";
}

inline const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::PRE_BLIND: return "PreBlind";
        case Stage::BLIND: return "Blind";
        case Stage::POST_BLIND: return "PostBlind";
        case Stage::SHOP: return "Shop";
        case Stage::END: return "End";
    }
    return "Unknown";
}

inline const char* to_string(CreationKind kind) {
    switch (kind) {
        case CreationKind::TAROT: return "Tarot";
        case CreationKind::PLANET: return "Planet";
        case CreationKind::SPECTRAL: return "Spectral";
        case CreationKind::JOKER: return "Joker";
        case CreationKind::PLAYING_CARD: return "PlayingCard";
        case CreationKind::STONE_CARD: return "StoneCard";
        case CreationKind::HAND_LEVEL_UP: return "HandLevelUp";
        case CreationKind::DOUBLE_TAG: return "DoubleTag";
        case CreationKind::CONSUMABLE_COPY: return "ConsumableCopy";
    }
    return "Unknown";
}

inline const char* to_string(GameEventType type) {
    switch (type) {
        case GameEventType::PACK_OPENED: return "PackOpened";
        case GameEventType::PACK_SKIPPED: return "PackSkipped";
        case GameEventType::BLIND_SKIPPED: return "BlindSkipped";
        case GameEventType::TAROT_USED: return "TarotUsed";
        case GameEventType::PLANET_USED: return "PlanetUsed";
        case GameEventType::CARD_ADDED_TO_DECK: return "CardAddedToDeck";
        case GameEventType::FACE_CARD_DESTROYED: return "FaceCardDestroyed";
        case GameEventType::GLASS_SHATTERED: return "GlassShattered";
        case GameEventType::CARD_SOLD: return "CardSold";
        case GameEventType::SHOP_REROLLED: return "ShopRerolled";
        case GameEventType::SHOP_EXITED: return "ShopExited";
        case GameEventType::BOSS_DEFEATED: return "BossDefeated";
    }
    return "Unknown";
}

} // namespace balatro
