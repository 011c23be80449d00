/**
 * Balatro Joker Engine - Score Trace Logger Implementation
 */

#include "score_trace_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace balatro {

ScoreTraceLogger::ScoreTraceLogger(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[ScoreTrace] Failed to create directory " << output_dir << ": "
                  << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    // Create timestamped log file
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::ostringstream filename;
    filename << output_dir << "/trace_scoring_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
             << std::setw(6) << std::setfill('0') << micros << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[ScoreTrace] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "SCORE TRACE - JOKER EVALUATION LOG\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";
}

ScoreTraceLogger::~ScoreTraceLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string ScoreTraceLogger::format_effect(const Effect& effect) {
    if (effect.is_identity()) {
        return "(no effect)";
    }

    std::ostringstream out;
    const char* sep = "";
    if (effect.chips != 0) { out << sep << "+" << effect.chips << " chips"; sep = ", "; }
    if (effect.mult != 0.0) { out << sep << "+" << effect.mult << " mult"; sep = ", "; }
    if (effect.mult_multiplier != 1.0) { out << sep << "x" << effect.mult_multiplier; sep = ", "; }
    if (effect.money != 0) { out << sep << "$" << effect.money; sep = ", "; }
    if (effect.interest_bonus != 0) { out << sep << "interest+" << effect.interest_bonus; sep = ", "; }
    if (effect.retrigger != 0) { out << sep << "retrigger x" << effect.retrigger; sep = ", "; }
    if (effect.destroy_self) { out << sep << "DESTROY SELF"; sep = ", "; }
    if (!effect.destroy_others.empty()) {
        out << sep << "destroy " << effect.destroy_others.size() << " sibling(s)";
        sep = ", ";
    }
    if (!effect.transform_cards.empty()) {
        out << sep << effect.transform_cards.size() << " card transform(s)";
        sep = ", ";
    }
    for (const auto& creation : effect.creations) {
        out << sep << "create " << creation.count << " " << to_string(creation.kind);
        sep = ", ";
    }
    if (effect.hand_size_mod != 0) { out << sep << "hand size " << effect.hand_size_mod; sep = ", "; }
    if (effect.discard_mod != 0) { out << sep << "discards " << effect.discard_mod; sep = ", "; }
    if (effect.hands_mod != 0) { out << sep << "hands " << effect.hands_mod; sep = ", "; }
    if (effect.sell_value_delta != 0) { out << sep << "sell value " << effect.sell_value_delta; sep = ", "; }
    if (effect.global_sell_value_delta != 0) {
        out << sep << "all sell values " << effect.global_sell_value_delta;
        sep = ", ";
    }
    if (effect.disable_boss_blind) { out << sep << "disable boss"; sep = ", "; }
    if (!effect.message.empty()) { out << sep << "\"" << effect.message << "\""; }
    return out.str();
}

void ScoreTraceLogger::log_hand(uint64_t hand_number, const RunSnapshot& run, const HandView& hand) {
    if (!enabled_) return;

    log_file_ << std::string(80, '-') << "\n";
    log_file_ << "HAND " << hand_number << " | Ante " << run.ante << " | Round " << run.round
              << " | Stage " << to_string(run.stage) << "\n";
    log_file_ << "  Type: " << to_string(hand.evaluation.type)
              << " | Base: " << run.base_chips << " x " << run.base_mult
              << " | Money: $" << run.money
              << " | Hands left: " << run.hands_remaining
              << " | Discards left: " << run.discards_remaining << "\n";

    log_file_ << "  Played: [";
    for (size_t i = 0; i < hand.played.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << hand.played[i].to_string();
    }
    log_file_ << "]\n";

    log_file_ << "  Scoring: [";
    for (size_t i = 0; i < hand.scoring.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << hand.scoring[i].to_string();
    }
    log_file_ << "]\n";

    log_file_ << "  Held: [";
    for (size_t i = 0; i < hand.held.size(); i++) {
        if (i > 0) log_file_ << ", ";
        log_file_ << hand.held[i].to_string();
    }
    log_file_ << "]\n";
    log_file_.flush();
}

void ScoreTraceLogger::log_notification(const std::string& label, const RunSnapshot& run) {
    if (!enabled_) return;

    log_file_ << std::string(80, '-') << "\n";
    log_file_ << label << " | Ante " << run.ante << " | Round " << run.round
              << " | Money: $" << run.money << "\n";
    log_file_.flush();
}

void ScoreTraceLogger::log_contribution(const std::string& pass, size_t position,
                                        const char* joker_name, const Card* card,
                                        const Effect& effect) {
    if (!enabled_) return;

    log_file_ << "  [" << pass << "] #" << position << " " << joker_name;
    if (card) {
        log_file_ << " on " << card->to_string();
    }
    log_file_ << ": " << format_effect(effect) << "\n";
}

void ScoreTraceLogger::log_error(const JokerError& error) {
    if (!enabled_) return;

    log_file_ << "  !! " << error.describe() << "\n";
    log_file_.flush();
}

void ScoreTraceLogger::log_aggregate(const Effect& aggregate, size_t removals, size_t errors) {
    if (!enabled_) return;

    log_file_ << "  TOTAL: " << format_effect(aggregate);
    if (removals > 0) {
        log_file_ << " | removals: " << removals;
    }
    if (errors > 0) {
        log_file_ << " | errors: " << errors;
    }
    log_file_ << "\n\n";
    log_file_.flush();
}

} // namespace balatro
