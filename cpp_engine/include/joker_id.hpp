/**
 * Balatro Joker Engine - Joker Identifiers
 *
 * Every joker kind the engine knows about, in collection order. Each tag has
 * a fixed snake_case key used in save blobs; keys never change once shipped.
 * RESERVED tags hold space for kinds that are not constructible yet so that
 * old saves keep their numbering.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace balatro {

enum class JokerId : uint16_t {
    JOKER,
    GREEDY_JOKER,
    LUSTY_JOKER,
    WRATHFUL_JOKER,
    GLUTTONOUS_JOKER,
    JOLLY_JOKER,
    ZANY_JOKER,
    MAD_JOKER,
    CRAZY_JOKER,
    DROLL_JOKER,
    SLY_JOKER,
    WILY_JOKER,
    CLEVER_JOKER,
    DEVIOUS_JOKER,
    CRAFTY_JOKER,
    HALF_JOKER,
    JOKER_STENCIL,
    FOUR_FINGERS,
    MIME,
    CREDIT_CARD,
    CEREMONIAL_DAGGER,
    BANNER,
    MYSTIC_SUMMIT,
    MARBLE_JOKER,
    LOYALTY_CARD,
    EIGHT_BALL,
    MISPRINT,
    DUSK,
    RAISED_FIST,
    CHAOS_THE_CLOWN,
    FIBONACCI,
    STEEL_JOKER,
    SCARY_FACE,
    ABSTRACT_JOKER,
    DELAYED_GRATIFICATION,
    HACK,
    PAREIDOLIA,
    GROS_MICHEL,
    EVEN_STEVEN,
    ODD_TODD,
    SCHOLAR,
    BUSINESS_CARD,
    SUPERNOVA,
    RIDE_THE_BUS,
    SPACE_JOKER,
    EGG,
    BURGLAR,
    BLACKBOARD,
    RUNNER,
    ICE_CREAM,
    DNA,
    SPLASH,
    BLUE_JOKER,
    SIXTH_SENSE,
    CONSTELLATION,
    HIKER,
    FACELESS_JOKER,
    GREEN_JOKER,
    SUPERPOSITION,
    TO_DO_LIST,
    CAVENDISH,
    CARD_SHARP,
    RED_CARD,
    MADNESS,
    SQUARE_JOKER,
    SEANCE,
    RIFF_RAFF,
    VAMPIRE,
    SHORTCUT,
    HOLOGRAM,
    VAGABOND,
    BARON,
    CLOUD_NINE,
    ROCKET,
    OBELISK,
    MIDAS_MASK,
    LUCHADOR,
    PHOTOGRAPH,
    GIFT_CARD,
    TURTLE_BEAN,
    EROSION,
    RESERVED_PARKING,
    MAIL_IN_REBATE,
    TO_THE_MOON,
    HALLUCINATION,
    FORTUNE_TELLER,
    JUGGLER,
    DRUNKARD,
    STONE_JOKER,
    GOLDEN_JOKER,
    LUCKY_CAT,
    BASEBALL_CARD,
    BULL,
    DIET_COLA,
    TRADING_CARD,
    FLASH_CARD,
    POPCORN,
    SPARE_TROUSERS,
    ANCIENT_JOKER,
    RAMEN,
    WALKIE_TALKIE,
    SELTZER,
    CASTLE,
    SMILEY_FACE,
    CAMPFIRE,
    GOLDEN_TICKET,
    MR_BONES,
    ACROBAT,
    SOCK_AND_BUSKIN,
    SWASHBUCKLER,
    TROUBADOUR,
    CERTIFICATE,
    SMEARED_JOKER,
    THROWBACK,
    HANGING_CHAD,
    ROUGH_GEM,
    BLOODSTONE,
    ARROWHEAD,
    ONYX_AGATE,
    GLASS_JOKER,
    SHOWMAN,
    FLOWER_POT,
    BLUEPRINT,
    WEE_JOKER,
    MERRY_ANDY,
    OOPS_ALL_SIXES,
    THE_IDOL,
    SEEING_DOUBLE,
    MATADOR,
    HIT_THE_ROAD,
    THE_DUO,
    THE_TRIO,
    THE_FAMILY,
    THE_ORDER,
    THE_TRIBE,
    STUNTMAN,
    INVISIBLE_JOKER,
    BRAINSTORM,
    SATELLITE,
    SHOOT_THE_MOON,
    DRIVERS_LICENSE,
    CARTOMANCER,
    ASTRONOMER,
    BURNT_JOKER,
    BOOTSTRAPS,
    CANIO,
    TRIBOULET,
    YORICK,
    CHICOT,
    PERKEO,
    RESERVED_1,
    RESERVED_2,
    RESERVED_3,
    RESERVED_4,
    RESERVED_5,
    RESERVED_6,
    RESERVED_7,
    RESERVED_8,
    RESERVED_9,
    RESERVED_10,
    RESERVED_11,
    RESERVED_12,
    RESERVED_13,
    RESERVED_14,
    RESERVED_15,
    RESERVED_16,
    RESERVED_17,
    RESERVED_18,
    RESERVED_19,
    RESERVED_20,
    RESERVED_21,
    RESERVED_22,
    RESERVED_23,
    RESERVED_24,
    RESERVED_25,
    RESERVED_26,
    RESERVED_27,
    RESERVED_28,
    RESERVED_29,
    RESERVED_30,
    RESERVED_31,
    RESERVED_32,
    RESERVED_33,
    RESERVED_34,
    RESERVED_35,
    RESERVED_36,
    RESERVED_37,
    RESERVED_38,
    RESERVED_39,
    RESERVED_40,
    RESERVED_41,
    RESERVED_42,
    RESERVED_43,
    RESERVED_44,
};

constexpr size_t JOKER_ID_COUNT = static_cast<size_t>(JokerId::RESERVED_44) + 1;
constexpr size_t PLAYABLE_JOKER_COUNT = static_cast<size_t>(JokerId::PERKEO) + 1;

/**
 * Stable save key for a joker id ("greedy_joker").
 */
const char* to_key(JokerId id);

/**
 * Reverse lookup of a save key. Returns nullopt for unknown keys.
 */
std::optional<JokerId> joker_id_from_key(const std::string& key);

inline bool is_reserved(JokerId id) {
    return static_cast<size_t>(id) >= PLAYABLE_JOKER_COUNT;
}

inline size_t joker_index(JokerId id) {
    return static_cast<size_t>(id);
}

} // namespace balatro
