/**
 * Copy Jokers
 *
 * Blueprint and Brainstorm run the gameplay hooks of another roster
 * position as if they were that joker. The context refuses self copies
 * and bounds nested copies by the roster size, so two copy jokers
 * pointing at each other stop instead of recursing.
 */

#include "jokers/joker_catalog.hpp"

namespace balatro {
namespace jokers {

namespace {

enum class CopyTarget : uint8_t {
    RIGHT_NEIGHBOUR,
    LEFTMOST
};

class CopyJoker : public MetaJoker, public JokerGameplay {
public:
    CopyJoker(const JokerMeta& meta, CopyTarget target) : MetaJoker(meta), target_(target) {}

    JokerGameplay* gameplay() override { return this; }
    bool copyable() const override { return true; }

    std::unique_ptr<Joker> clone() const override {
        return std::make_unique<CopyJoker>(meta_, target_);
    }

    Effect on_hand_played(GameContext& ctx) override {
        return ctx.copy_joker_effect(target_position(ctx), nullptr);
    }

    Effect on_card_scored(GameContext& ctx, const Card& card) override {
        return ctx.copy_joker_effect(target_position(ctx), &card);
    }

private:
    size_t target_position(const GameContext& ctx) const {
        return target_ == CopyTarget::LEFTMOST ? 0 : ctx.position() + 1;
    }

    CopyTarget target_;
};

void add_copy(JokerRegistry& registry, const JokerMeta& meta, CopyTarget target,
              const UnlockCondition& unlock = {}) {
    registry.register_joker(
        make_info(meta, ConstructionStyle::CUSTOM, unlock),
        [meta, target](const ConstructionArgs& a) {
            std::string error;
            if (!args::check_fields(a, {}, error)) {
                return CreateResult::fail(error);
            }
            return CreateResult::ok(std::make_unique<CopyJoker>(meta, target));
        });
}

} // anonymous namespace

void register_copy_jokers(JokerRegistry& registry) {
    add_copy(registry, {JokerId::BLUEPRINT, "Blueprint",
                        "Copies ability of Joker to the right", Rarity::RARE, 10},
             CopyTarget::RIGHT_NEIGHBOUR, win_runs(1));
    add_copy(registry, {JokerId::BRAINSTORM, "Brainstorm",
                        "Copies the ability of leftmost Joker", Rarity::RARE, 10},
             CopyTarget::LEFTMOST, reach_ante(6));
}

} // namespace jokers
} // namespace balatro
