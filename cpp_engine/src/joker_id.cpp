/**
 * Balatro Joker Engine - Joker Identifier Keys
 */

#include "joker_id.hpp"

#include <unordered_map>

namespace balatro {

namespace {

struct KeyEntry {
    JokerId id;
    const char* key;
};

// Order matches the enum; checked by the key lookup tests.
const KeyEntry g_joker_keys[] = {
    {JokerId::JOKER, "joker"},
    {JokerId::GREEDY_JOKER, "greedy_joker"},
    {JokerId::LUSTY_JOKER, "lusty_joker"},
    {JokerId::WRATHFUL_JOKER, "wrathful_joker"},
    {JokerId::GLUTTONOUS_JOKER, "gluttonous_joker"},
    {JokerId::JOLLY_JOKER, "jolly_joker"},
    {JokerId::ZANY_JOKER, "zany_joker"},
    {JokerId::MAD_JOKER, "mad_joker"},
    {JokerId::CRAZY_JOKER, "crazy_joker"},
    {JokerId::DROLL_JOKER, "droll_joker"},
    {JokerId::SLY_JOKER, "sly_joker"},
    {JokerId::WILY_JOKER, "wily_joker"},
    {JokerId::CLEVER_JOKER, "clever_joker"},
    {JokerId::DEVIOUS_JOKER, "devious_joker"},
    {JokerId::CRAFTY_JOKER, "crafty_joker"},
    {JokerId::HALF_JOKER, "half_joker"},
    {JokerId::JOKER_STENCIL, "joker_stencil"},
    {JokerId::FOUR_FINGERS, "four_fingers"},
    {JokerId::MIME, "mime"},
    {JokerId::CREDIT_CARD, "credit_card"},
    {JokerId::CEREMONIAL_DAGGER, "ceremonial_dagger"},
    {JokerId::BANNER, "banner"},
    {JokerId::MYSTIC_SUMMIT, "mystic_summit"},
    {JokerId::MARBLE_JOKER, "marble_joker"},
    {JokerId::LOYALTY_CARD, "loyalty_card"},
    {JokerId::EIGHT_BALL, "eight_ball"},
    {JokerId::MISPRINT, "misprint"},
    {JokerId::DUSK, "dusk"},
    {JokerId::RAISED_FIST, "raised_fist"},
    {JokerId::CHAOS_THE_CLOWN, "chaos_the_clown"},
    {JokerId::FIBONACCI, "fibonacci"},
    {JokerId::STEEL_JOKER, "steel_joker"},
    {JokerId::SCARY_FACE, "scary_face"},
    {JokerId::ABSTRACT_JOKER, "abstract_joker"},
    {JokerId::DELAYED_GRATIFICATION, "delayed_gratification"},
    {JokerId::HACK, "hack"},
    {JokerId::PAREIDOLIA, "pareidolia"},
    {JokerId::GROS_MICHEL, "gros_michel"},
    {JokerId::EVEN_STEVEN, "even_steven"},
    {JokerId::ODD_TODD, "odd_todd"},
    {JokerId::SCHOLAR, "scholar"},
    {JokerId::BUSINESS_CARD, "business_card"},
    {JokerId::SUPERNOVA, "supernova"},
    {JokerId::RIDE_THE_BUS, "ride_the_bus"},
    {JokerId::SPACE_JOKER, "space_joker"},
    {JokerId::EGG, "egg"},
    {JokerId::BURGLAR, "burglar"},
    {JokerId::BLACKBOARD, "blackboard"},
    {JokerId::RUNNER, "runner"},
    {JokerId::ICE_CREAM, "ice_cream"},
    {JokerId::DNA, "dna"},
    {JokerId::SPLASH, "splash"},
    {JokerId::BLUE_JOKER, "blue_joker"},
    {JokerId::SIXTH_SENSE, "sixth_sense"},
    {JokerId::CONSTELLATION, "constellation"},
    {JokerId::HIKER, "hiker"},
    {JokerId::FACELESS_JOKER, "faceless_joker"},
    {JokerId::GREEN_JOKER, "green_joker"},
    {JokerId::SUPERPOSITION, "superposition"},
    {JokerId::TO_DO_LIST, "to_do_list"},
    {JokerId::CAVENDISH, "cavendish"},
    {JokerId::CARD_SHARP, "card_sharp"},
    {JokerId::RED_CARD, "red_card"},
    {JokerId::MADNESS, "madness"},
    {JokerId::SQUARE_JOKER, "square_joker"},
    {JokerId::SEANCE, "seance"},
    {JokerId::RIFF_RAFF, "riff_raff"},
    {JokerId::VAMPIRE, "vampire"},
    {JokerId::SHORTCUT, "shortcut"},
    {JokerId::HOLOGRAM, "hologram"},
    {JokerId::VAGABOND, "vagabond"},
    {JokerId::BARON, "baron"},
    {JokerId::CLOUD_NINE, "cloud_nine"},
    {JokerId::ROCKET, "rocket"},
    {JokerId::OBELISK, "obelisk"},
    {JokerId::MIDAS_MASK, "midas_mask"},
    {JokerId::LUCHADOR, "luchador"},
    {JokerId::PHOTOGRAPH, "photograph"},
    {JokerId::GIFT_CARD, "gift_card"},
    {JokerId::TURTLE_BEAN, "turtle_bean"},
    {JokerId::EROSION, "erosion"},
    {JokerId::RESERVED_PARKING, "reserved_parking"},
    {JokerId::MAIL_IN_REBATE, "mail_in_rebate"},
    {JokerId::TO_THE_MOON, "to_the_moon"},
    {JokerId::HALLUCINATION, "hallucination"},
    {JokerId::FORTUNE_TELLER, "fortune_teller"},
    {JokerId::JUGGLER, "juggler"},
    {JokerId::DRUNKARD, "drunkard"},
    {JokerId::STONE_JOKER, "stone_joker"},
    {JokerId::GOLDEN_JOKER, "golden_joker"},
    {JokerId::LUCKY_CAT, "lucky_cat"},
    {JokerId::BASEBALL_CARD, "baseball_card"},
    {JokerId::BULL, "bull"},
    {JokerId::DIET_COLA, "diet_cola"},
    {JokerId::TRADING_CARD, "trading_card"},
    {JokerId::FLASH_CARD, "flash_card"},
    {JokerId::POPCORN, "popcorn"},
    {JokerId::SPARE_TROUSERS, "spare_trousers"},
    {JokerId::ANCIENT_JOKER, "ancient_joker"},
    {JokerId::RAMEN, "ramen"},
    {JokerId::WALKIE_TALKIE, "walkie_talkie"},
    {JokerId::SELTZER, "seltzer"},
    {JokerId::CASTLE, "castle"},
    {JokerId::SMILEY_FACE, "smiley_face"},
    {JokerId::CAMPFIRE, "campfire"},
    {JokerId::GOLDEN_TICKET, "golden_ticket"},
    {JokerId::MR_BONES, "mr_bones"},
    {JokerId::ACROBAT, "acrobat"},
    {JokerId::SOCK_AND_BUSKIN, "sock_and_buskin"},
    {JokerId::SWASHBUCKLER, "swashbuckler"},
    {JokerId::TROUBADOUR, "troubadour"},
    {JokerId::CERTIFICATE, "certificate"},
    {JokerId::SMEARED_JOKER, "smeared_joker"},
    {JokerId::THROWBACK, "throwback"},
    {JokerId::HANGING_CHAD, "hanging_chad"},
    {JokerId::ROUGH_GEM, "rough_gem"},
    {JokerId::BLOODSTONE, "bloodstone"},
    {JokerId::ARROWHEAD, "arrowhead"},
    {JokerId::ONYX_AGATE, "onyx_agate"},
    {JokerId::GLASS_JOKER, "glass_joker"},
    {JokerId::SHOWMAN, "showman"},
    {JokerId::FLOWER_POT, "flower_pot"},
    {JokerId::BLUEPRINT, "blueprint"},
    {JokerId::WEE_JOKER, "wee_joker"},
    {JokerId::MERRY_ANDY, "merry_andy"},
    {JokerId::OOPS_ALL_SIXES, "oops_all_sixes"},
    {JokerId::THE_IDOL, "the_idol"},
    {JokerId::SEEING_DOUBLE, "seeing_double"},
    {JokerId::MATADOR, "matador"},
    {JokerId::HIT_THE_ROAD, "hit_the_road"},
    {JokerId::THE_DUO, "the_duo"},
    {JokerId::THE_TRIO, "the_trio"},
    {JokerId::THE_FAMILY, "the_family"},
    {JokerId::THE_ORDER, "the_order"},
    {JokerId::THE_TRIBE, "the_tribe"},
    {JokerId::STUNTMAN, "stuntman"},
    {JokerId::INVISIBLE_JOKER, "invisible_joker"},
    {JokerId::BRAINSTORM, "brainstorm"},
    {JokerId::SATELLITE, "satellite"},
    {JokerId::SHOOT_THE_MOON, "shoot_the_moon"},
    {JokerId::DRIVERS_LICENSE, "drivers_license"},
    {JokerId::CARTOMANCER, "cartomancer"},
    {JokerId::ASTRONOMER, "astronomer"},
    {JokerId::BURNT_JOKER, "burnt_joker"},
    {JokerId::BOOTSTRAPS, "bootstraps"},
    {JokerId::CANIO, "canio"},
    {JokerId::TRIBOULET, "triboulet"},
    {JokerId::YORICK, "yorick"},
    {JokerId::CHICOT, "chicot"},
    {JokerId::PERKEO, "perkeo"},
    {JokerId::RESERVED_1, "reserved_1"},
    {JokerId::RESERVED_2, "reserved_2"},
    {JokerId::RESERVED_3, "reserved_3"},
    {JokerId::RESERVED_4, "reserved_4"},
    {JokerId::RESERVED_5, "reserved_5"},
    {JokerId::RESERVED_6, "reserved_6"},
    {JokerId::RESERVED_7, "reserved_7"},
    {JokerId::RESERVED_8, "reserved_8"},
    {JokerId::RESERVED_9, "reserved_9"},
    {JokerId::RESERVED_10, "reserved_10"},
    {JokerId::RESERVED_11, "reserved_11"},
    {JokerId::RESERVED_12, "reserved_12"},
    {JokerId::RESERVED_13, "reserved_13"},
    {JokerId::RESERVED_14, "reserved_14"},
    {JokerId::RESERVED_15, "reserved_15"},
    {JokerId::RESERVED_16, "reserved_16"},
    {JokerId::RESERVED_17, "reserved_17"},
    {JokerId::RESERVED_18, "reserved_18"},
    {JokerId::RESERVED_19, "reserved_19"},
    {JokerId::RESERVED_20, "reserved_20"},
    {JokerId::RESERVED_21, "reserved_21"},
    {JokerId::RESERVED_22, "reserved_22"},
    {JokerId::RESERVED_23, "reserved_23"},
    {JokerId::RESERVED_24, "reserved_24"},
    {JokerId::RESERVED_25, "reserved_25"},
    {JokerId::RESERVED_26, "reserved_26"},
    {JokerId::RESERVED_27, "reserved_27"},
    {JokerId::RESERVED_28, "reserved_28"},
    {JokerId::RESERVED_29, "reserved_29"},
    {JokerId::RESERVED_30, "reserved_30"},
    {JokerId::RESERVED_31, "reserved_31"},
    {JokerId::RESERVED_32, "reserved_32"},
    {JokerId::RESERVED_33, "reserved_33"},
    {JokerId::RESERVED_34, "reserved_34"},
    {JokerId::RESERVED_35, "reserved_35"},
    {JokerId::RESERVED_36, "reserved_36"},
    {JokerId::RESERVED_37, "reserved_37"},
    {JokerId::RESERVED_38, "reserved_38"},
    {JokerId::RESERVED_39, "reserved_39"},
    {JokerId::RESERVED_40, "reserved_40"},
    {JokerId::RESERVED_41, "reserved_41"},
    {JokerId::RESERVED_42, "reserved_42"},
    {JokerId::RESERVED_43, "reserved_43"},
    {JokerId::RESERVED_44, "reserved_44"},
};

static_assert(sizeof(g_joker_keys) / sizeof(g_joker_keys[0]) == JOKER_ID_COUNT,
              "joker key table out of sync with JokerId");

const std::unordered_map<std::string, JokerId>& key_index() {
    static const std::unordered_map<std::string, JokerId> index = [] {
        std::unordered_map<std::string, JokerId> built;
        built.reserve(JOKER_ID_COUNT);
        for (const auto& entry : g_joker_keys) {
            built.emplace(entry.key, entry.id);
        }
        return built;
    }();
    return index;
}

} // anonymous namespace

const char* to_key(JokerId id) {
    size_t index = joker_index(id);
    if (index >= JOKER_ID_COUNT) {
        return "unknown";
    }
    return g_joker_keys[index].key;
}

std::optional<JokerId> joker_id_from_key(const std::string& key) {
    const auto& index = key_index();
    auto it = index.find(key);
    if (it == index.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace balatro
