/**
 * Tests for hand classification and card helpers
 */

#include <sstream>
#include "hand_eval.hpp"

using namespace balatro;
using namespace balatro::testing;

// ============================================================================
// CARD TESTS
// ============================================================================

TEST(Card, ChipValues) {
    TEST_ASSERT_EQ(7, card(Rank::SEVEN, Suit::CLUBS).chip_value());
    TEST_ASSERT_EQ(10, card(Rank::QUEEN, Suit::CLUBS).chip_value());
    TEST_ASSERT_EQ(11, card(Rank::ACE, Suit::CLUBS).chip_value());

    Card stone = card(Rank::TWO, Suit::CLUBS);
    stone.enhancement = Enhancement::STONE;
    TEST_ASSERT_EQ(50, stone.chip_value());
}

TEST(Card, WildMatchesEverySuit) {
    Card wild = card(Rank::FIVE, Suit::SPADES);
    wild.enhancement = Enhancement::WILD;
    TEST_ASSERT_TRUE(wild.is_suit(Suit::HEARTS));
    TEST_ASSERT_TRUE(wild.is_suit(Suit::CLUBS));
}

TEST(Card, SmearedSuits) {
    Card heart = card(Rank::FIVE, Suit::HEARTS);
    TEST_ASSERT_FALSE(heart.is_suit(Suit::DIAMONDS));
    TEST_ASSERT_TRUE(heart.is_suit(Suit::DIAMONDS, true));
    TEST_ASSERT_FALSE(heart.is_suit(Suit::SPADES, true));
}

TEST(Card, PareidoliaMakesFaces) {
    Card five = card(Rank::FIVE, Suit::HEARTS);
    TEST_ASSERT_FALSE(five.is_face());
    TEST_ASSERT_TRUE(five.is_face(true));
    TEST_ASSERT_TRUE(card(Rank::JACK, Suit::HEARTS).is_face());
}

// ============================================================================
// HAND EVALUATION TESTS
// ============================================================================

TEST(HandEval, EmptyHand) {
    HandEvaluation eval = evaluate_hand({});
    TEST_ASSERT_TRUE(eval.type == HandType::HIGH_CARD);
    TEST_ASSERT_EQ(0, eval.contained_mask);
    TEST_ASSERT_TRUE(eval.scoring_indices.empty());
}

TEST(HandEval, HighCardScoresOnlyHighest) {
    auto hand = cards({{Rank::TWO, Suit::SPADES}, {Rank::KING, Suit::HEARTS},
                       {Rank::SEVEN, Suit::CLUBS}});
    HandEvaluation eval = evaluate_hand(hand);
    TEST_ASSERT_TRUE(eval.type == HandType::HIGH_CARD);
    TEST_ASSERT_EQ(1u, eval.scoring_indices.size());
    TEST_ASSERT_EQ(1u, eval.scoring_indices[0]);
}

TEST(HandEval, PairScoresPairOnly) {
    auto hand = cards({{Rank::KING, Suit::SPADES}, {Rank::TWO, Suit::HEARTS},
                       {Rank::KING, Suit::CLUBS}});
    HandEvaluation eval = evaluate_hand(hand);
    TEST_ASSERT_TRUE(eval.type == HandType::PAIR);
    TEST_ASSERT_EQ(2u, eval.scoring_indices.size());
    TEST_ASSERT_EQ(0u, eval.scoring_indices[0]);
    TEST_ASSERT_EQ(2u, eval.scoring_indices[1]);
}

TEST(HandEval, FullHouseContainsLowerHands) {
    auto hand = cards({{Rank::NINE, Suit::SPADES}, {Rank::NINE, Suit::HEARTS},
                       {Rank::NINE, Suit::CLUBS}, {Rank::FOUR, Suit::SPADES},
                       {Rank::FOUR, Suit::DIAMONDS}});
    HandEvaluation eval = evaluate_hand(hand);
    TEST_ASSERT_TRUE(eval.type == HandType::FULL_HOUSE);
    TEST_ASSERT_TRUE(eval.contains(HandType::PAIR));
    TEST_ASSERT_TRUE(eval.contains(HandType::TWO_PAIR));
    TEST_ASSERT_TRUE(eval.contains(HandType::THREE_OF_A_KIND));
    TEST_ASSERT_FALSE(eval.contains(HandType::FLUSH));
    TEST_ASSERT_EQ(5u, eval.scoring_indices.size());
}

TEST(HandEval, AceLowStraight) {
    auto hand = cards({{Rank::ACE, Suit::SPADES}, {Rank::TWO, Suit::HEARTS},
                       {Rank::THREE, Suit::CLUBS}, {Rank::FOUR, Suit::SPADES},
                       {Rank::FIVE, Suit::DIAMONDS}});
    TEST_ASSERT_TRUE(evaluate_hand(hand).type == HandType::STRAIGHT);
}

TEST(HandEval, StraightFlush) {
    auto hand = cards({{Rank::SIX, Suit::HEARTS}, {Rank::SEVEN, Suit::HEARTS},
                       {Rank::EIGHT, Suit::HEARTS}, {Rank::NINE, Suit::HEARTS},
                       {Rank::TEN, Suit::HEARTS}});
    HandEvaluation eval = evaluate_hand(hand);
    TEST_ASSERT_TRUE(eval.type == HandType::STRAIGHT_FLUSH);
    TEST_ASSERT_TRUE(eval.contains(HandType::STRAIGHT));
    TEST_ASSERT_TRUE(eval.contains(HandType::FLUSH));
}

TEST(HandEval, FourFingersFlush) {
    auto hand = cards({{Rank::TWO, Suit::CLUBS}, {Rank::SIX, Suit::CLUBS},
                       {Rank::NINE, Suit::CLUBS}, {Rank::KING, Suit::CLUBS}});
    TEST_ASSERT_TRUE(evaluate_hand(hand).type == HandType::HIGH_CARD);

    HandRules rules;
    rules.four_fingers = true;
    TEST_ASSERT_TRUE(evaluate_hand(hand, rules).type == HandType::FLUSH);
}

TEST(HandEval, ShortcutStraight) {
    auto hand = cards({{Rank::TWO, Suit::CLUBS}, {Rank::FOUR, Suit::HEARTS},
                       {Rank::SIX, Suit::CLUBS}, {Rank::EIGHT, Suit::SPADES},
                       {Rank::TEN, Suit::DIAMONDS}});
    TEST_ASSERT_FALSE(evaluate_hand(hand).contains(HandType::STRAIGHT));

    HandRules rules;
    rules.shortcut = true;
    TEST_ASSERT_TRUE(evaluate_hand(hand, rules).type == HandType::STRAIGHT);
}

TEST(HandEval, SplashScoresEveryCard) {
    auto hand = cards({{Rank::KING, Suit::SPADES}, {Rank::TWO, Suit::HEARTS},
                       {Rank::KING, Suit::CLUBS}});
    HandRules rules;
    rules.splash = true;
    TEST_ASSERT_EQ(3u, evaluate_hand(hand, rules).scoring_indices.size());
}

TEST(HandEval, StoneCardsAlwaysScore) {
    auto hand = cards({{Rank::KING, Suit::SPADES}, {Rank::TWO, Suit::HEARTS}});
    hand[1].enhancement = Enhancement::STONE;
    HandEvaluation eval = evaluate_hand(hand);
    TEST_ASSERT_EQ(2u, eval.scoring_indices.size());
}

TEST(HandView, BuildsScoringCopies) {
    HandView view = HandView::build(pair_of_kings(), {card(Rank::TWO, Suit::CLUBS, 9)});
    TEST_ASSERT_EQ(2u, view.scoring.size());
    TEST_ASSERT_EQ(1u, view.held.size());
    TEST_ASSERT_TRUE(view.scoring[0].rank == Rank::KING);
}
