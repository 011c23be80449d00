/**
 * Balatro Joker Engine - Hand Evaluation Implementation
 */

#include "hand_eval.hpp"

#include <algorithm>
#include <map>

namespace balatro {

namespace {

struct RankGroup {
    int rank = 0;
    std::vector<size_t> indices;
};

void mark(HandEvaluation& eval, HandType type) {
    eval.contained_mask |= static_cast<uint16_t>(1u << hand_index(type));
}

std::vector<RankGroup> group_by_rank(const std::vector<Card>& cards) {
    std::map<int, std::vector<size_t>> by_rank;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (cards[i].is_stone()) continue;
        by_rank[rank_value(cards[i].rank)].push_back(i);
    }

    std::vector<RankGroup> groups;
    for (auto& [rank, indices] : by_rank) {
        groups.push_back({rank, std::move(indices)});
    }
    std::sort(groups.begin(), groups.end(), [](const RankGroup& a, const RankGroup& b) {
        if (a.indices.size() != b.indices.size()) {
            return a.indices.size() > b.indices.size();
        }
        return a.rank > b.rank;
    });
    return groups;
}

std::vector<size_t> find_flush(const std::vector<Card>& cards, const HandRules& rules) {
    size_t need = rules.four_fingers ? 4 : 5;
    std::vector<size_t> best;
    for (Suit s : {Suit::SPADES, Suit::HEARTS, Suit::CLUBS, Suit::DIAMONDS}) {
        std::vector<size_t> matching;
        for (size_t i = 0; i < cards.size(); ++i) {
            if (cards[i].is_suit(s, rules.smeared_suits)) {
                matching.push_back(i);
            }
        }
        if (matching.size() > best.size()) {
            best = std::move(matching);
        }
    }
    if (best.size() < need) {
        best.clear();
    }
    return best;
}

std::vector<size_t> find_straight(const std::vector<Card>& cards, const HandRules& rules) {
    size_t need = rules.four_fingers ? 4 : 5;
    int max_gap = rules.shortcut ? 2 : 1;

    // present[v] -> first card index holding value v (ace is both 1 and 14)
    std::vector<int> present(15, -1);
    for (size_t i = 0; i < cards.size(); ++i) {
        if (cards[i].is_stone()) continue;
        int v = rank_value(cards[i].rank);
        if (present[v] < 0) present[v] = static_cast<int>(i);
        if (v == 14 && present[1] < 0) present[1] = static_cast<int>(i);
    }

    std::vector<int> best_run;
    std::vector<int> run;
    int last = -10;
    for (int v = 1; v <= 14; ++v) {
        if (present[v] < 0) continue;
        if (!run.empty() && v - last > max_gap) {
            if (run.size() > best_run.size()) best_run = run;
            run.clear();
        }
        run.push_back(v);
        last = v;
    }
    if (run.size() > best_run.size()) best_run = run;

    std::vector<size_t> indices;
    if (best_run.size() < need) {
        return indices;
    }
    for (int v : best_run) {
        size_t index = static_cast<size_t>(present[v]);
        if (std::find(indices.begin(), indices.end(), index) == indices.end()) {
            indices.push_back(index);
        }
    }
    if (indices.size() < need) {
        indices.clear();
    }
    return indices;
}

void append_unique(std::vector<size_t>& out, const std::vector<size_t>& in) {
    for (size_t index : in) {
        if (std::find(out.begin(), out.end(), index) == out.end()) {
            out.push_back(index);
        }
    }
}

} // anonymous namespace

HandEvaluation evaluate_hand(const std::vector<Card>& cards, const HandRules& rules) {
    HandEvaluation eval;
    if (cards.empty()) {
        return eval;
    }

    std::vector<RankGroup> groups = group_by_rank(cards);
    std::vector<size_t> flush = find_flush(cards, rules);
    std::vector<size_t> straight = find_straight(cards, rules);

    size_t largest = groups.empty() ? 0 : groups[0].indices.size();
    size_t second = groups.size() > 1 ? groups[1].indices.size() : 0;
    size_t pairs = 0;
    for (const auto& g : groups) {
        if (g.indices.size() >= 2) ++pairs;
    }

    bool has_flush = !flush.empty();
    bool has_straight = !straight.empty();
    bool full_house = largest >= 3 && second >= 2;

    mark(eval, HandType::HIGH_CARD);
    if (largest >= 2) mark(eval, HandType::PAIR);
    if (pairs >= 2 || largest >= 4) mark(eval, HandType::TWO_PAIR);
    if (largest >= 3) mark(eval, HandType::THREE_OF_A_KIND);
    if (has_straight) mark(eval, HandType::STRAIGHT);
    if (has_flush) mark(eval, HandType::FLUSH);
    if (full_house) mark(eval, HandType::FULL_HOUSE);
    if (largest >= 4) mark(eval, HandType::FOUR_OF_A_KIND);
    if (has_straight && has_flush) mark(eval, HandType::STRAIGHT_FLUSH);
    if (largest >= 5) mark(eval, HandType::FIVE_OF_A_KIND);
    if (full_house && has_flush) mark(eval, HandType::FLUSH_HOUSE);
    if (largest >= 5 && has_flush) mark(eval, HandType::FLUSH_FIVE);

    std::vector<size_t> scoring;
    if (largest >= 5 && has_flush) {
        eval.type = HandType::FLUSH_FIVE;
        append_unique(scoring, groups[0].indices);
        append_unique(scoring, flush);
    } else if (full_house && has_flush) {
        eval.type = HandType::FLUSH_HOUSE;
        append_unique(scoring, groups[0].indices);
        append_unique(scoring, groups[1].indices);
        append_unique(scoring, flush);
    } else if (largest >= 5) {
        eval.type = HandType::FIVE_OF_A_KIND;
        append_unique(scoring, groups[0].indices);
    } else if (has_straight && has_flush) {
        eval.type = HandType::STRAIGHT_FLUSH;
        append_unique(scoring, straight);
        append_unique(scoring, flush);
    } else if (largest >= 4) {
        eval.type = HandType::FOUR_OF_A_KIND;
        append_unique(scoring, groups[0].indices);
    } else if (full_house) {
        eval.type = HandType::FULL_HOUSE;
        append_unique(scoring, groups[0].indices);
        append_unique(scoring, groups[1].indices);
    } else if (has_flush) {
        eval.type = HandType::FLUSH;
        append_unique(scoring, flush);
    } else if (has_straight) {
        eval.type = HandType::STRAIGHT;
        append_unique(scoring, straight);
    } else if (largest >= 3) {
        eval.type = HandType::THREE_OF_A_KIND;
        append_unique(scoring, groups[0].indices);
    } else if (pairs >= 2) {
        eval.type = HandType::TWO_PAIR;
        append_unique(scoring, groups[0].indices);
        append_unique(scoring, groups[1].indices);
    } else if (largest >= 2) {
        eval.type = HandType::PAIR;
        append_unique(scoring, groups[0].indices);
    } else {
        eval.type = HandType::HIGH_CARD;
        if (!groups.empty()) {
            // Groups are all singletons here, sorted high rank first
            scoring.push_back(groups[0].indices[0]);
        }
    }

    if (rules.splash) {
        scoring.clear();
        for (size_t i = 0; i < cards.size(); ++i) scoring.push_back(i);
    } else {
        for (size_t i = 0; i < cards.size(); ++i) {
            if (cards[i].is_stone() &&
                std::find(scoring.begin(), scoring.end(), i) == scoring.end()) {
                scoring.push_back(i);
            }
        }
    }

    std::sort(scoring.begin(), scoring.end());
    eval.scoring_indices = std::move(scoring);
    return eval;
}

} // namespace balatro
