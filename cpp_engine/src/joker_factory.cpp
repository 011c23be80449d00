/**
 * Balatro Joker Engine - Joker Factory Implementation
 */

#include "joker_factory.hpp"

namespace balatro {

JokerFactory::JokerFactory() : constructors_(JOKER_ID_COUNT) {}

bool JokerFactory::add(JokerId id, JokerConstructor constructor) {
    size_t index = joker_index(id);
    if (index >= JOKER_ID_COUNT || is_reserved(id) || !constructor) {
        return false;
    }
    if (constructors_[index]) {
        return false;
    }
    constructors_[index] = std::move(constructor);
    ++count_;
    return true;
}

bool JokerFactory::can_create(JokerId id) const {
    size_t index = joker_index(id);
    return index < JOKER_ID_COUNT && static_cast<bool>(constructors_[index]);
}

CreateResult JokerFactory::create(JokerId id, const ConstructionArgs& args) const {
    size_t index = joker_index(id);
    if (index >= JOKER_ID_COUNT) {
        return CreateResult::fail("unknown joker id " + std::to_string(index));
    }
    if (is_reserved(id)) {
        return CreateResult::fail(std::string("joker id '") + to_key(id) + "' is reserved");
    }
    if (!constructors_[index]) {
        return CreateResult::fail(std::string("no constructor registered for '") + to_key(id) + "'");
    }

    CreateResult result = constructors_[index](args);
    if (result.success && !result.joker) {
        return CreateResult::fail(std::string("constructor for '") + to_key(id) + "' returned nothing");
    }
    return result;
}

// ============================================================================
// ARGUMENT HELPERS
// ============================================================================

namespace args {

std::optional<Suit> parse_suit(const std::string& text) {
    if (text == "spades") return Suit::SPADES;
    if (text == "hearts") return Suit::HEARTS;
    if (text == "clubs") return Suit::CLUBS;
    if (text == "diamonds") return Suit::DIAMONDS;
    return std::nullopt;
}

std::optional<Rank> parse_rank(const std::string& text) {
    if (text == "A" || text == "ace") return Rank::ACE;
    if (text == "K" || text == "king") return Rank::KING;
    if (text == "Q" || text == "queen") return Rank::QUEEN;
    if (text == "J" || text == "jack") return Rank::JACK;
    if (text == "10") return Rank::TEN;
    if (text.size() == 1 && text[0] >= '2' && text[0] <= '9') {
        return static_cast<Rank>(text[0] - '0');
    }
    return std::nullopt;
}

std::optional<HandType> parse_hand_type(const std::string& text) {
    for (size_t i = 0; i < HAND_TYPE_COUNT; ++i) {
        HandType type = static_cast<HandType>(i);
        if (text == hand_type_key(type)) return type;
    }
    return std::nullopt;
}

const char* suit_key(Suit suit) {
    switch (suit) {
        case Suit::SPADES: return "spades";
        case Suit::HEARTS: return "hearts";
        case Suit::CLUBS: return "clubs";
        case Suit::DIAMONDS: return "diamonds";
    }
    return "spades";
}

const char* hand_type_key(HandType type) {
    switch (type) {
        case HandType::HIGH_CARD: return "high_card";
        case HandType::PAIR: return "pair";
        case HandType::TWO_PAIR: return "two_pair";
        case HandType::THREE_OF_A_KIND: return "three_of_a_kind";
        case HandType::STRAIGHT: return "straight";
        case HandType::FLUSH: return "flush";
        case HandType::FULL_HOUSE: return "full_house";
        case HandType::FOUR_OF_A_KIND: return "four_of_a_kind";
        case HandType::STRAIGHT_FLUSH: return "straight_flush";
        case HandType::FIVE_OF_A_KIND: return "five_of_a_kind";
        case HandType::FLUSH_HOUSE: return "flush_house";
        case HandType::FLUSH_FIVE: return "flush_five";
    }
    return "high_card";
}

bool check_fields(const ConstructionArgs& args, std::initializer_list<const char*> allowed,
                  std::string& error) {
    if (args.is_null()) {
        return true;
    }
    if (!args.is_object()) {
        error = "construction arguments must be an object";
        return false;
    }
    for (auto it = args.begin(); it != args.end(); ++it) {
        bool known = false;
        for (const char* field : allowed) {
            if (it.key() == field) {
                known = true;
                break;
            }
        }
        if (!known) {
            error = "unexpected argument '" + it.key() + "'";
            return false;
        }
    }
    return true;
}

namespace {

template <typename T, typename Parser>
bool read_field(const ConstructionArgs& args, const char* field, std::optional<T>& out,
                std::string& error, Parser parse) {
    if (!args.is_object() || !args.contains(field)) {
        return true;
    }
    const auto& value = args[field];
    if (!value.is_string()) {
        error = std::string("argument '") + field + "' must be a string";
        return false;
    }
    auto parsed = parse(value.template get<std::string>());
    if (!parsed) {
        error = std::string("argument '") + field + "' has invalid value '" +
                value.template get<std::string>() + "'";
        return false;
    }
    out = *parsed;
    return true;
}

} // anonymous namespace

bool read_suit(const ConstructionArgs& args, const char* field, std::optional<Suit>& out,
               std::string& error) {
    return read_field(args, field, out, error, parse_suit);
}

bool read_rank(const ConstructionArgs& args, const char* field, std::optional<Rank>& out,
               std::string& error) {
    return read_field(args, field, out, error, parse_rank);
}

bool read_hand_type(const ConstructionArgs& args, const char* field,
                    std::optional<HandType>& out, std::string& error) {
    return read_field(args, field, out, error, parse_hand_type);
}

} // namespace args

} // namespace balatro
