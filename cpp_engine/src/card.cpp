/**
 * Balatro Joker Engine - Playing Card Implementation
 */

#include "card.hpp"

namespace balatro {

namespace {

bool is_red(Suit s) {
    return s == Suit::HEARTS || s == Suit::DIAMONDS;
}

} // anonymous namespace

int Card::chip_value() const {
    if (is_stone()) {
        return 50 + bonus_chips;
    }
    int value = rank_value(rank);
    if (rank == Rank::ACE) {
        value = 11;
    } else if (value > 10) {
        value = 10;
    }
    if (enhancement == Enhancement::BONUS) {
        value += 30;
    }
    return value + bonus_chips;
}

bool Card::is_face(bool pareidolia) const {
    if (is_stone()) {
        return false;
    }
    if (pareidolia) {
        return true;
    }
    return rank == Rank::JACK || rank == Rank::QUEEN || rank == Rank::KING;
}

bool Card::is_suit(Suit s, bool smeared) const {
    if (is_stone()) {
        return false;
    }
    if (is_wild() || suit == s) {
        return true;
    }
    return smeared && is_red(suit) == is_red(s);
}

bool Card::is_even() const {
    if (is_stone()) {
        return false;
    }
    int value = rank_value(rank);
    return value <= 10 && value % 2 == 0;
}

bool Card::is_odd() const {
    if (is_stone()) {
        return false;
    }
    if (rank == Rank::ACE) {
        return true;
    }
    int value = rank_value(rank);
    return value <= 10 && value % 2 == 1;
}

std::string Card::to_string() const {
    if (is_stone()) {
        return "Stone";
    }
    std::string out = balatro::to_string(rank);
    out += balatro::to_string(suit)[0];
    if (enhancement != Enhancement::NONE) {
        out += "(";
        out += balatro::to_string(enhancement);
        out += ")";
    }
    return out;
}

} // namespace balatro
