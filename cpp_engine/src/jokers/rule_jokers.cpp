/**
 * Rule Jokers
 *
 * Jokers with no scoring hook at all. They only change the rules of the
 * run (hand evaluation, hand size, probabilities), which the engine
 * queries whenever the roster changes.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

class RuleJoker : public MetaJoker, public JokerModifiers {
public:
    RuleJoker(const JokerMeta& meta, const RuleModifiers& rules)
        : MetaJoker(meta), rules_(rules) {}

    const JokerModifiers* modifiers() const override { return this; }
    RuleModifiers rule_modifiers() const override { return rules_; }

    std::unique_ptr<Joker> clone() const override {
        return std::make_unique<RuleJoker>(meta_, rules_);
    }

private:
    RuleModifiers rules_;
};

template <typename Setter>
void add_rule(JokerRegistry& registry, const JokerMeta& meta, Setter setter,
              const UnlockCondition& unlock = {}) {
    RuleModifiers rules;
    setter(rules);
    registry.register_joker(
        make_info(meta, ConstructionStyle::CUSTOM, unlock),
        [meta, rules](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(std::make_unique<RuleJoker>(meta, rules));
        });
}

} // anonymous namespace

void register_rule_jokers(JokerRegistry& registry) {
    // Hand evaluation
    add_rule(registry, {JokerId::FOUR_FINGERS, "Four Fingers",
                        "All Flushes and Straights can be made with 4 cards", Rarity::UNCOMMON, 7},
             [](RuleModifiers& m) { m.four_fingers = true; });
    add_rule(registry, {JokerId::SHORTCUT, "Shortcut",
                        "Allows Straights to be made with gaps of 1 rank", Rarity::UNCOMMON, 7},
             [](RuleModifiers& m) { m.shortcut = true; });
    add_rule(registry, {JokerId::SMEARED_JOKER, "Smeared Joker",
                        "Hearts and Diamonds count as the same suit, Spades and Clubs count as the same suit",
                        Rarity::UNCOMMON, 7},
             [](RuleModifiers& m) { m.smeared_suits = true; }, reach_ante(4));
    add_rule(registry, {JokerId::PAREIDOLIA, "Pareidolia",
                        "All cards are considered face cards", Rarity::UNCOMMON, 5},
             [](RuleModifiers& m) { m.pareidolia = true; });
    add_rule(registry, {JokerId::SPLASH, "Splash",
                        "Every played card counts in scoring", Rarity::COMMON, 3},
             [](RuleModifiers& m) { m.splash = true; });

    // Hands, discards and hand size
    add_rule(registry, {JokerId::JUGGLER, "Juggler", "+1 hand size", Rarity::COMMON, 4},
             [](RuleModifiers& m) { m.hand_size = 1; });
    add_rule(registry, {JokerId::DRUNKARD, "Drunkard", "+1 discard each round", Rarity::COMMON, 4},
             [](RuleModifiers& m) { m.discards = 1; });
    add_rule(registry, {JokerId::TROUBADOUR, "Troubadour",
                        "+2 hand size, -1 hand per round", Rarity::UNCOMMON, 6},
             [](RuleModifiers& m) {
                 m.hand_size = 2;
                 m.hands = -1;
             }, win_runs(5));
    add_rule(registry, {JokerId::MERRY_ANDY, "Merry Andy",
                        "+3 discards each round, -1 hand size", Rarity::UNCOMMON, 7},
             [](RuleModifiers& m) {
                 m.discards = 3;
                 m.hand_size = -1;
             }, win_runs(1));

    // Economy and shop
    add_rule(registry, {JokerId::CREDIT_CARD, "Credit Card", "Go up to -$20 in debt",
                        Rarity::COMMON, 1},
             [](RuleModifiers& m) { m.debt_limit = 20; });
    add_rule(registry, {JokerId::CHAOS_THE_CLOWN, "Chaos the Clown",
                        "1 free Reroll per shop", Rarity::COMMON, 4},
             [](RuleModifiers& m) { m.free_rerolls = 1; });
    add_rule(registry, {JokerId::SHOWMAN, "Showman",
                        "Joker, Tarot, Planet, and Spectral cards may appear multiple times",
                        Rarity::UNCOMMON, 5},
             [](RuleModifiers& m) { m.showman = true; }, reach_ante(4));
    add_rule(registry, {JokerId::ASTRONOMER, "Astronomer",
                        "All Planet cards and Celestial Packs in the shop are free",
                        Rarity::UNCOMMON, 8},
             [](RuleModifiers& m) { m.free_planets = true; });

    // Chance and survival
    add_rule(registry, {JokerId::OOPS_ALL_SIXES, "Oops! All 6s",
                        "Doubles all listed probabilities", Rarity::UNCOMMON, 4},
             [](RuleModifiers& m) { m.probability_scale = 2; });
    add_rule(registry, {JokerId::MR_BONES, "Mr. Bones",
                        "Prevents Death if chips scored are at least 25% of required chips",
                        Rarity::UNCOMMON, 5},
             [](RuleModifiers& m) { m.prevents_death = true; });
    add_rule(registry, {JokerId::MIME, "Mime",
                        "Retrigger all card held in hand abilities", Rarity::UNCOMMON, 5},
             [](RuleModifiers& m) { m.retrigger_held = 1; });
    add_rule(registry, {JokerId::CHICOT, "Chicot",
                        "Disables effect of every Boss Blind", Rarity::LEGENDARY, 20},
             [](RuleModifiers& m) { m.disables_boss_blind = true; }, soul());
}

} // namespace jokers
} // namespace balatro
