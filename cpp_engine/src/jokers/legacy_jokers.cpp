/**
 * Legacy Jokers
 *
 * Jokers still written against the single-evaluate() LegacyJoker model.
 * They reach the roster through bridge_legacy().
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

/**
 * Shared metadata plumbing for the legacy jokers in this file.
 */
class LegacyBase : public LegacyJoker {
public:
    explicit LegacyBase(const JokerMeta& meta) : meta_(meta) {}

    JokerId id() const override { return meta_.id; }
    const char* name() const override { return meta_.name; }
    const char* description() const override { return meta_.description; }
    Rarity rarity() const override { return meta_.rarity; }
    int cost() const override { return meta_.cost; }

protected:
    JokerMeta meta_;
};

/**
 * Reads one non-negative integer field from a saved state.
 */
bool load_counter(const nlohmann::json& state, const char* field, int& out, std::string& error) {
    if (!state.is_object() || !state.contains(field) || !state[field].is_number_integer()) {
        error = std::string("missing integer field '") + field + "'";
        return false;
    }
    int value = state[field].get<int>();
    if (value < 0) {
        error = std::string("negative value for '") + field + "'";
        return false;
    }
    out = value;
    return true;
}

// ============================================================================
// SUIT SINS
// ============================================================================

class SinJoker : public LegacyBase {
public:
    SinJoker(const JokerMeta& meta, Suit suit) : LegacyBase(meta), suit_(suit) {}

    Effect evaluate(const LegacyCall& call, GameContext& ctx) override {
        if (call.event != LegacyEvent::CARD_SCORED || !call.card) {
            return {};
        }
        return ctx.is_suit(*call.card, suit_) ? Effect::add_mult(3) : Effect{};
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<SinJoker>(meta_, suit_);
    }

private:
    Suit suit_;
};

// ============================================================================
// FOOD
// ============================================================================

const JokerMeta ICE_CREAM_META{JokerId::ICE_CREAM, "Ice Cream",
                               "+100 Chips, -5 Chips for every hand played", Rarity::COMMON, 5};
const JokerMeta POPCORN_META{JokerId::POPCORN, "Popcorn", "+20 Mult, -4 Mult per round played",
                             Rarity::COMMON, 5};
const JokerMeta TURTLE_BEAN_META{JokerId::TURTLE_BEAN, "Turtle Bean",
                                 "+5 hand size, reduces by 1 every round", Rarity::UNCOMMON, 6};

/**
 * Ice Cream: +100 Chips, -5 Chips for every hand played.
 */
class IceCream : public LegacyBase {
public:
    IceCream() : LegacyBase(ICE_CREAM_META) {}

    Effect evaluate(const LegacyCall& call, GameContext& ctx) override {
        if (call.event != LegacyEvent::HAND_PLAYED || ctx.is_retrigger()) {
            return {};
        }
        Effect effect = Effect::add_chips(chips_);
        chips_ -= 5;
        if (chips_ <= 0) {
            chips_ = 0;
            effect.destroy_self = true;
            effect.message = "Melted!";
        }
        return effect;
    }

    bool has_state() const override { return true; }
    nlohmann::json save_state() const override { return {{"chips", chips_}}; }
    bool load_state(const nlohmann::json& state, std::string& error) override {
        return load_counter(state, "chips", chips_, error);
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<IceCream>(*this);
    }

private:
    int chips_ = 100;
};

/**
 * Popcorn: +20 Mult, -4 Mult per round played.
 */
class Popcorn : public LegacyBase {
public:
    Popcorn() : LegacyBase(POPCORN_META) {}

    Effect evaluate(const LegacyCall& call, GameContext&) override {
        switch (call.event) {
            case LegacyEvent::HAND_PLAYED:
                return mult_ > 0 ? Effect::add_mult(mult_) : Effect{};
            case LegacyEvent::ROUND_END: {
                mult_ -= 4;
                Effect effect;
                if (mult_ <= 0) {
                    mult_ = 0;
                    effect.destroy_self = true;
                    effect.message = "Eaten!";
                }
                return effect;
            }
            default:
                return {};
        }
    }

    bool has_state() const override { return true; }
    nlohmann::json save_state() const override { return {{"mult", mult_}}; }
    bool load_state(const nlohmann::json& state, std::string& error) override {
        return load_counter(state, "mult", mult_, error);
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<Popcorn>(*this);
    }

private:
    int mult_ = 20;
};

/**
 * Gros Michel and Cavendish: a flat bonus with a chance of going extinct
 * at the end of every round.
 */
class BananaJoker : public LegacyBase {
public:
    BananaJoker(const JokerMeta& meta, Effect bonus, int extinction_odds)
        : LegacyBase(meta), bonus_(std::move(bonus)), odds_(extinction_odds) {}

    Effect evaluate(const LegacyCall& call, GameContext& ctx) override {
        switch (call.event) {
            case LegacyEvent::HAND_PLAYED:
                return bonus_;
            case LegacyEvent::ROUND_END:
                if (ctx.rng().chance(1, odds_)) {
                    Effect effect;
                    effect.destroy_self = true;
                    effect.message = "Extinct!";
                    return effect;
                }
                return {};
            default:
                return {};
        }
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<BananaJoker>(meta_, bonus_, odds_);
    }

private:
    Effect bonus_;
    int odds_;
};

/**
 * Turtle Bean: +5 hand size, reduces by 1 every round.
 */
class TurtleBean : public LegacyBase {
public:
    TurtleBean() : LegacyBase(TURTLE_BEAN_META) {}

    Effect evaluate(const LegacyCall& call, GameContext&) override {
        if (call.event != LegacyEvent::ROUND_END) {
            return {};
        }
        Effect effect;
        if (--hand_size_ <= 0) {
            hand_size_ = 0;
            effect.destroy_self = true;
            effect.message = "Eaten!";
        }
        return effect;
    }

    bool has_passive_modifiers() const override { return true; }
    RuleModifiers passive_modifiers() const override {
        RuleModifiers m;
        m.hand_size = hand_size_;
        return m;
    }

    bool has_state() const override { return true; }
    nlohmann::json save_state() const override { return {{"hand_size", hand_size_}}; }
    bool load_state(const nlohmann::json& state, std::string& error) override {
        return load_counter(state, "hand_size", hand_size_, error);
    }

    std::unique_ptr<LegacyJoker> clone() const override {
        return std::make_unique<TurtleBean>(*this);
    }

private:
    int hand_size_ = 5;
};

template <typename Make>
void add_legacy(JokerRegistry& registry, const JokerMeta& meta, Make make,
                const UnlockCondition& unlock = {}) {
    registry.register_joker(
        make_info(meta, ConstructionStyle::LEGACY, unlock),
        [make](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(bridge_legacy(make()));
        });
}

} // anonymous namespace

void register_legacy_jokers(JokerRegistry& registry) {
    const JokerMeta greedy{JokerId::GREEDY_JOKER, "Greedy Joker",
                           "Played cards with Diamond suit give +3 Mult when scored",
                           Rarity::COMMON, 5};
    const JokerMeta lusty{JokerId::LUSTY_JOKER, "Lusty Joker",
                          "Played cards with Heart suit give +3 Mult when scored",
                          Rarity::COMMON, 5};
    const JokerMeta wrathful{JokerId::WRATHFUL_JOKER, "Wrathful Joker",
                             "Played cards with Spade suit give +3 Mult when scored",
                             Rarity::COMMON, 5};
    const JokerMeta gluttonous{JokerId::GLUTTONOUS_JOKER, "Gluttonous Joker",
                               "Played cards with Club suit give +3 Mult when scored",
                               Rarity::COMMON, 5};

    add_legacy(registry, greedy,
               [greedy] { return std::make_unique<SinJoker>(greedy, Suit::DIAMONDS); });
    add_legacy(registry, lusty,
               [lusty] { return std::make_unique<SinJoker>(lusty, Suit::HEARTS); });
    add_legacy(registry, wrathful,
               [wrathful] { return std::make_unique<SinJoker>(wrathful, Suit::SPADES); });
    add_legacy(registry, gluttonous,
               [gluttonous] { return std::make_unique<SinJoker>(gluttonous, Suit::CLUBS); });

    add_legacy(registry, ICE_CREAM_META, [] { return std::make_unique<IceCream>(); });
    add_legacy(registry, POPCORN_META, [] { return std::make_unique<Popcorn>(); });
    add_legacy(registry, TURTLE_BEAN_META, [] { return std::make_unique<TurtleBean>(); });

    const JokerMeta gros_michel{JokerId::GROS_MICHEL, "Gros Michel",
                                "+15 Mult, 1 in 6 chance this is destroyed at the end of round",
                                Rarity::COMMON, 5};
    const JokerMeta cavendish{JokerId::CAVENDISH, "Cavendish",
                              "X3 Mult, 1 in 1000 chance this card is destroyed at the end of round",
                              Rarity::COMMON, 4};
    add_legacy(registry, gros_michel, [gros_michel] {
        return std::make_unique<BananaJoker>(gros_michel, Effect::add_mult(15), 6);
    });
    add_legacy(registry, cavendish, [cavendish] {
        return std::make_unique<BananaJoker>(cavendish, Effect::times_mult(3), 1000);
    });
}

} // namespace jokers
} // namespace balatro
