/**
 * Balatro Joker Engine - Interactive Test Console
 *
 * Simple REPL for manual testing of joker scoring.
 * Buy jokers, play and discard hands, move through rounds, save and load.
 *
 * Usage:
 *   joker_console                     interactive
 *   joker_console joker green_joker   buy these and score a sample hand
 */

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "balatro_engine.hpp"

using namespace balatro;

// ============================================================================
// BASE HAND VALUES (level 1)
// ============================================================================

struct HandBase {
    int64_t chips;
    double mult;
};

const HandBase BASE_VALUES[HAND_TYPE_COUNT] = {
    {5, 1},     // High Card
    {10, 2},    // Pair
    {20, 2},    // Two Pair
    {30, 3},    // Three of a Kind
    {30, 4},    // Straight
    {35, 4},    // Flush
    {40, 4},    // Full House
    {60, 7},    // Four of a Kind
    {100, 8},   // Straight Flush
    {120, 12},  // Five of a Kind
    {140, 14},  // Flush House
    {160, 16},  // Flush Five
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

/**
 * Parse "KS", "10H", "AD" into a card. The last character is the suit.
 */
bool parse_card(const std::string& text, uint32_t id, Card& out) {
    if (text.size() < 2) {
        return false;
    }
    std::string rank_text = text.substr(0, text.size() - 1);
    std::transform(rank_text.begin(), rank_text.end(), rank_text.begin(), ::toupper);
    auto rank = args::parse_rank(rank_text);
    if (!rank) {
        return false;
    }

    Suit suit;
    switch (::toupper(text.back())) {
        case 'S': suit = Suit::SPADES; break;
        case 'H': suit = Suit::HEARTS; break;
        case 'C': suit = Suit::CLUBS; break;
        case 'D': suit = Suit::DIAMONDS; break;
        default: return false;
    }
    out = Card(*rank, suit, id);
    return true;
}

bool parse_cards(const std::vector<std::string>& tokens, size_t first, std::vector<Card>& out) {
    out.clear();
    for (size_t i = first; i < tokens.size(); ++i) {
        Card card;
        if (!parse_card(tokens[i], static_cast<uint32_t>(i), card)) {
            std::cout << "Bad card: '" << tokens[i] << "' (expected e.g. KS, 10H, AD)" << std::endl;
            return false;
        }
        out.push_back(card);
    }
    return true;
}

void print_errors(const std::vector<JokerError>& errors) {
    for (const auto& error : errors) {
        std::cout << "  ! " << error.describe() << std::endl;
    }
}

void print_effect(const Effect& effect) {
    std::cout << "  Effect: " << ScoreTraceLogger::format_effect(effect) << std::endl;
}

// ============================================================================
// PRINT HELP
// ============================================================================

void print_help() {
    std::cout << R"(
=== Balatro Joker Engine Test Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Collection:
  list [rarity]           - List registered jokers (common/uncommon/rare/legendary)
  buy <key> [json]        - Acquire a joker, optionally with construction arguments
  sell <slot>             - Sell a joker by slot handle
  jokers / j              - Show owned jokers, sell values and state

Playing:
  play <cards...>         - Score a hand, e.g. play KS KH 2C
  discard <cards...>      - Discard cards
  round start|end         - Round boundary notifications
  money <amount>          - Set the wallet
  hands <n>               - Set hands remaining after the next one

Persistence:
  save <path>             - Write the joker state blob
  load <path>             - Restore jokers from a blob
  config <path>           - Reload the engine configuration (clears jokers)

Examples:
  buy joker
  buy ancient_joker {"suit": "hearts"}
  play KH KS 7D
)" << std::endl;
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    EngineConfig config;
    std::unique_ptr<JokerEngine> engine;
    RunSnapshot run;

    Console() {
        config.trace_enabled = true;
        engine = std::make_unique<JokerEngine>(config);
        run.money = 4;
        std::cout << "Registered jokers: " << engine->registry().size() << std::endl;
        if (engine->trace()) {
            std::cout << "Scoring trace: " << engine->trace()->get_log_path() << std::endl;
        }
    }

    void cmd_list(const std::vector<std::string>& args) {
        const JokerRegistry& registry = engine->registry();
        std::vector<JokerId> ids = registry.all_ids();
        if (args.size() > 1) {
            std::string wanted = args[1];
            ids = registry.eligible_for([&wanted](const JokerInfo& info) {
                std::string rarity = to_string(info.rarity);
                std::transform(rarity.begin(), rarity.end(), rarity.begin(), ::tolower);
                return rarity == wanted;
            });
        }

        std::cout << "\n=== Jokers (" << ids.size() << ") ===" << std::endl;
        for (JokerId id : ids) {
            const JokerInfo* info = registry.get_info(id);
            std::cout << "  " << std::left << std::setw(22) << to_key(id) << " $" << info->cost
                      << "  " << to_string(info->rarity)
                      << (info->parameterized ? "  [args]" : "") << "\n      "
                      << info->description << std::endl;
        }
    }

    void cmd_buy(const std::vector<std::string>& args, const std::string& line) {
        if (args.size() < 2) {
            std::cout << "Usage: buy <key> [json]" << std::endl;
            return;
        }
        auto id = joker_id_from_key(args[1]);
        if (!id) {
            std::cout << "Unknown joker key: " << args[1] << std::endl;
            return;
        }

        nlohmann::json construction = nullptr;
        size_t brace = line.find('{');
        if (brace != std::string::npos) {
            try {
                construction = nlohmann::json::parse(line.substr(brace));
            } catch (const nlohmann::json::parse_error& e) {
                std::cout << "Bad arguments: " << e.what() << std::endl;
                return;
            }
        }

        AcquireResult result = engine->acquire(*id, construction, run);
        if (!result.success) {
            std::cout << "Cannot buy " << args[1] << ": " << result.error << std::endl;
            return;
        }
        std::cout << "Bought " << engine->jokers().find(result.handle)->name() << " (slot "
                  << result.handle << ")" << std::endl;
    }

    void cmd_sell(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: sell <slot>" << std::endl;
            return;
        }
        InstanceId slot = static_cast<InstanceId>(std::stoul(args[1]));
        SellResult result = engine->sell(slot, run);
        if (!result.success) {
            std::cout << result.error << std::endl;
            return;
        }
        run.money += result.sell_value + result.effect.money;
        std::cout << "Sold for $" << result.sell_value << " (wallet $" << run.money << ")"
                  << std::endl;
        print_errors(result.errors);
    }

    void cmd_jokers() {
        std::cout << "\n=== Jokers (" << engine->jokers().size() << "/"
                  << config.joker_slots + engine->rule_modifiers().joker_slots << ") ==="
                  << std::endl;
        for (const auto& slot : engine->jokers()) {
            const Joker& joker = *slot.joker;
            std::cout << "  [" << slot.slot << "] " << joker.name() << " - sell $"
                      << slot.sell_value;
            if (const JokerState* state = joker.state()) {
                std::cout << " - " << state->serialize_state().dump();
            }
            const nlohmann::json* stored =
                engine->state_store().find(InstanceKey{joker.id(), slot.slot});
            if (stored) {
                std::cout << " - " << stored->dump();
            }
            std::cout << std::endl;
        }
        std::cout << "  Wallet: $" << run.money << " | Hands left: " << run.hands_remaining
                  << std::endl;
    }

    void cmd_play(const std::vector<std::string>& args) {
        std::vector<Card> played;
        if (args.size() < 2 || !parse_cards(args, 1, played)) {
            std::cout << "Usage: play <cards...>" << std::endl;
            return;
        }

        HandView hand = engine->make_hand(played);
        HandType type = hand.evaluation.type;
        const HandBase& base = BASE_VALUES[hand_index(type)];
        int64_t chips = base.chips;
        for (const auto& card : hand.scoring) {
            chips += card.chip_value();
        }

        run.hand_type_plays[hand_index(type)]++;
        run.base_chips = chips;
        run.base_mult = base.mult;

        ProcessResult result = engine->process(hand, run);
        ScoreApplication applied = engine->apply_effect(result.aggregate, chips, base.mult, run.money);
        run.money = applied.wallet;

        std::cout << "\n" << to_string(type) << " (" << hand.scoring.size() << " scoring)"
                  << std::endl;
        print_effect(result.aggregate);
        std::cout << "  " << applied.chips << " x " << applied.mult << " = " << applied.score
                  << std::endl;
        if (result.metrics.retriggers > 0) {
            std::cout << "  Retriggers: " << result.metrics.retriggers << std::endl;
        }
        print_errors(result.errors);

        size_t removed = engine->apply_removals(result, run);
        if (removed > 0) {
            std::cout << "  " << removed << " joker(s) removed" << std::endl;
        }
        if (run.hands_remaining > 0) {
            run.hands_remaining--;
        }
    }

    void cmd_discard(const std::vector<std::string>& args) {
        std::vector<Card> discarded;
        if (args.size() < 2 || !parse_cards(args, 1, discarded)) {
            std::cout << "Usage: discard <cards...>" << std::endl;
            return;
        }
        ProcessResult result = engine->notify_discard(discarded, run);
        run.money = engine->apply_effect(result.aggregate, 0, 0.0, run.money).wallet;
        print_effect(result.aggregate);
        print_errors(result.errors);
        engine->apply_removals(result, run);
        if (run.discards_remaining > 0) {
            run.discards_remaining--;
        }
    }

    void cmd_round(const std::vector<std::string>& args) {
        if (args.size() < 2 || (args[1] != "start" && args[1] != "end")) {
            std::cout << "Usage: round start|end" << std::endl;
            return;
        }

        ProcessResult result;
        if (args[1] == "start") {
            run.round++;
            run.hands_remaining = 3 + engine->rule_modifiers().hands;
            run.discards_remaining = 3 + engine->rule_modifiers().discards;
            result = engine->start_round(run);
        } else {
            result = engine->end_round(run);
            int64_t interest = std::min<int64_t>(run.money / 5, 5) +
                               result.aggregate.interest_bonus * (run.money / 5);
            run.money += interest;
        }

        run.money = engine->apply_effect(result.aggregate, 0, 0.0, run.money).wallet;
        print_effect(result.aggregate);
        print_errors(result.errors);
        engine->apply_removals(result, run);
        std::cout << "  Round " << run.round << " | Wallet $" << run.money << std::endl;
    }

    void cmd_save(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: save <path>" << std::endl;
            return;
        }
        std::ofstream out(args[1]);
        if (!out.is_open()) {
            std::cout << "Cannot write " << args[1] << std::endl;
            return;
        }
        out << engine->serialize_all().dump(2) << std::endl;
        std::cout << "Saved " << engine->jokers().size() << " joker(s)" << std::endl;
    }

    void cmd_load(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: load <path>" << std::endl;
            return;
        }
        std::ifstream in(args[1]);
        if (!in.is_open()) {
            std::cout << "Cannot read " << args[1] << std::endl;
            return;
        }

        nlohmann::json blob;
        try {
            blob = nlohmann::json::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            std::cout << "Bad save file: " << e.what() << std::endl;
            return;
        }

        LoadResult result = engine->deserialize_all(blob);
        if (!result.success) {
            std::cout << "Load failed" << std::endl;
            print_errors(result.errors);
            return;
        }
        std::cout << "Loaded " << result.loaded << " joker(s) from version " << result.version
                  << std::endl;
        for (const auto& lost : result.lost) {
            std::cout << "  Lost " << lost.key << " (slot " << lost.slot << "): " << lost.reason
                      << std::endl;
        }
    }

    void cmd_config(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << config.to_json().dump(2) << std::endl;
            return;
        }
        EngineConfig loaded = config;
        if (!loaded.load_from_json(args[1])) {
            std::cout << "Config not changed" << std::endl;
            return;
        }
        config = loaded;
        engine = std::make_unique<JokerEngine>(config);
        std::cout << "Engine rebuilt with " << args[1] << std::endl;
    }

    void run_loop() {
        std::cout << "Balatro Joker Engine " << get_version() << " Test Console" << std::endl;
        std::cout << "=====================================\n" << std::endl;

        run.round = 0;
        std::vector<std::string> start = {"round", "start"};
        cmd_round(start);

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            try {
                if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                    break;
                } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                    print_help();
                } else if (cmd == "list") {
                    cmd_list(args);
                } else if (cmd == "buy") {
                    cmd_buy(args, line);
                } else if (cmd == "sell") {
                    cmd_sell(args);
                } else if (cmd == "jokers" || cmd == "j") {
                    cmd_jokers();
                } else if (cmd == "play" || cmd == "p") {
                    cmd_play(args);
                } else if (cmd == "discard" || cmd == "d") {
                    cmd_discard(args);
                } else if (cmd == "round") {
                    cmd_round(args);
                } else if (cmd == "money" && args.size() > 1) {
                    run.money = std::stoll(args[1]);
                } else if (cmd == "hands" && args.size() > 1) {
                    run.hands_remaining = std::stoi(args[1]);
                } else if (cmd == "save") {
                    cmd_save(args);
                } else if (cmd == "load") {
                    cmd_load(args);
                } else if (cmd == "config") {
                    cmd_config(args);
                } else {
                    std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands."
                              << std::endl;
                }
            } catch (const std::invalid_argument&) {
                std::cout << "Expected a number" << std::endl;
            } catch (const std::out_of_range&) {
                std::cout << "Number out of range" << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    Console console;
    if (argc < 2) {
        console.run_loop();
        return 0;
    }

    // Non-interactive: buy each joker key given, then score a sample hand
    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        console.cmd_buy({"buy", key}, "buy " + key);
    }
    console.cmd_jokers();
    console.cmd_play({"play", "AS", "AH", "KD", "KC", "7S"});
    return 0;
}
