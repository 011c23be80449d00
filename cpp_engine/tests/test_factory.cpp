/**
 * Tests for the joker factory and construction arguments
 */

#include <sstream>
#include "joker_factory.hpp"
#include "static_joker.hpp"

using namespace balatro;
using namespace balatro::testing;

namespace {

JokerConstructor plain_joker() {
    return [](const ConstructionArgs&) {
        return CreateResult::ok(std::make_unique<FixedJoker>(Effect::add_mult(4)));
    };
}

} // anonymous namespace

// ============================================================================
// FACTORY TESTS
// ============================================================================

TEST(Factory, CreatesRegisteredJoker) {
    JokerFactory factory;
    TEST_ASSERT_TRUE(factory.add(JokerId::JOKER, plain_joker()));

    CreateResult made = factory.create(JokerId::JOKER);
    TEST_ASSERT_TRUE(made.success);
    TEST_ASSERT_NOT_NULL(made.joker.get());
    TEST_ASSERT_TRUE(made.joker->id() == JokerId::JOKER);
}

TEST(Factory, RejectsDuplicateConstructor) {
    JokerFactory factory;
    TEST_ASSERT_TRUE(factory.add(JokerId::JOKER, plain_joker()));
    TEST_ASSERT_FALSE(factory.add(JokerId::JOKER, plain_joker()));
    TEST_ASSERT_EQ(1u, factory.size());
}

TEST(Factory, ReservedIdsAreNeverConstructible) {
    JokerFactory factory;
    TEST_ASSERT_FALSE(factory.add(JokerId::RESERVED_1, plain_joker()));

    CreateResult made = factory.create(JokerId::RESERVED_1);
    TEST_ASSERT_FALSE(made.success);
    TEST_ASSERT_NULL(made.joker.get());
    TEST_ASSERT_TRUE(made.error.find("reserved") != std::string::npos);
}

TEST(Factory, UnregisteredIdIsConstructionError) {
    JokerFactory factory;
    CreateResult made = factory.create(JokerId::BLUEPRINT);
    TEST_ASSERT_FALSE(made.success);
    TEST_ASSERT_FALSE(made.error.empty());
}

TEST(Factory, OutOfRangeIdIsConstructionError) {
    JokerFactory factory;
    CreateResult made = factory.create(static_cast<JokerId>(60000));
    TEST_ASSERT_FALSE(made.success);
}

// ============================================================================
// ARGUMENT TESTS
// ============================================================================

TEST(FactoryArgs, ParseHelpers) {
    TEST_ASSERT_TRUE(args::parse_suit("hearts") == Suit::HEARTS);
    TEST_ASSERT_FALSE(args::parse_suit("cups").has_value());
    TEST_ASSERT_TRUE(args::parse_rank("A") == Rank::ACE);
    TEST_ASSERT_TRUE(args::parse_rank("10") == Rank::TEN);
    TEST_ASSERT_TRUE(args::parse_rank("7") == Rank::SEVEN);
    TEST_ASSERT_FALSE(args::parse_rank("1").has_value());
    TEST_ASSERT_TRUE(args::parse_hand_type("flush") == HandType::FLUSH);
    TEST_ASSERT_EQ(std::string("two_pair"), std::string(args::hand_type_key(HandType::TWO_PAIR)));
}

TEST(FactoryArgs, CheckFields) {
    std::string error;
    TEST_ASSERT_TRUE(args::check_fields(nullptr, {}, error));
    TEST_ASSERT_TRUE(args::check_fields({{"suit", "hearts"}}, {"suit"}, error));
    TEST_ASSERT_FALSE(args::check_fields({{"colour", "red"}}, {"suit"}, error));
    TEST_ASSERT_TRUE(error.find("colour") != std::string::npos);
    TEST_ASSERT_FALSE(args::check_fields(nlohmann::json::array(), {}, error));
}

TEST(FactoryArgs, ParameterizedJokerReadsSuit) {
    auto registry = get_joker_registry();
    CreateResult made = registry->create(JokerId::ANCIENT_JOKER, {{"suit", "clubs"}});
    TEST_ASSERT_TRUE(made.success);

    const JokerState* state = made.joker->state();
    TEST_ASSERT_NOT_NULL(state);
    nlohmann::json saved = state->serialize_state();
    TEST_ASSERT_EQ(static_cast<int>(Suit::CLUBS), saved["data"]["suit"].get<int>());
    TEST_ASSERT_TRUE(saved["flags"]["fixed"].get<bool>());
}

TEST(FactoryArgs, InvalidArgumentIsConstructionError) {
    auto registry = get_joker_registry();

    CreateResult bad_value = registry->create(JokerId::ANCIENT_JOKER, {{"suit", "cups"}});
    TEST_ASSERT_FALSE(bad_value.success);
    TEST_ASSERT_TRUE(bad_value.error.find("cups") != std::string::npos);

    CreateResult bad_field = registry->create(JokerId::TO_DO_LIST, {{"suit", "hearts"}});
    TEST_ASSERT_FALSE(bad_field.success);

    CreateResult half_card = registry->create(JokerId::THE_IDOL, {{"rank", "K"}});
    TEST_ASSERT_FALSE(half_card.success);
}

TEST(FactoryArgs, PlainJokerRejectsArguments) {
    auto registry = get_joker_registry();
    CreateResult made = registry->create(JokerId::JOKER, {{"suit", "hearts"}});
    TEST_ASSERT_FALSE(made.success);
    TEST_ASSERT_TRUE(registry->create(JokerId::JOKER).success);
}

TEST(FactoryArgs, DefaultsWhenNoArguments) {
    auto registry = get_joker_registry();
    CreateResult made = registry->create(JokerId::TO_DO_LIST);
    TEST_ASSERT_TRUE(made.success);
    nlohmann::json saved = made.joker->state()->serialize_state();
    TEST_ASSERT_EQ(static_cast<int>(HandType::PAIR), saved["data"]["hand"].get<int>());
}
