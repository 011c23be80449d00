/**
 * Balatro Joker Engine - Score Trace Logger
 *
 * Complete visibility into joker scoring for debugging. Every hand gets a
 * context header, one line per joker contribution in each pass, any
 * surfaced errors and the aggregate effect. Round and discard notifications
 * are traced the same way.
 */

#pragma once

#include "effect.hpp"
#include "game_context.hpp"
#include "joker_errors.hpp"

#include <fstream>
#include <string>

namespace balatro {

class ScoreTraceLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for trace files (default: cpp_engine/traces)
     */
    explicit ScoreTraceLogger(const std::string& output_dir = "cpp_engine/traces");

    ~ScoreTraceLogger();

    /**
     * Log the header of a hand evaluation.
     *
     * @param hand_number Hands processed so far by this engine
     * @param run Run snapshot handed to the engine
     * @param hand Played hand
     */
    void log_hand(uint64_t hand_number, const RunSnapshot& run, const HandView& hand);

    /**
     * Log a lifecycle dispatch header ("ROUND START", "DISCARD", ...).
     */
    void log_notification(const std::string& label, const RunSnapshot& run);

    /**
     * Log one joker's contribution.
     *
     * @param pass "HAND", "CARD", "RETRIGGER" or a lifecycle label
     * @param position Position in run order
     * @param joker_name Display name
     * @param card Scored card, or nullptr for hand-level hooks
     * @param effect Effect the hook returned
     */
    void log_contribution(const std::string& pass, size_t position, const char* joker_name,
                          const Card* card, const Effect& effect);

    void log_error(const JokerError& error);

    /**
     * Log the aggregate after all passes.
     */
    void log_aggregate(const Effect& aggregate, size_t removals, size_t errors);

    bool is_enabled() const { return enabled_; }
    const std::string& get_log_path() const { return log_path_; }

    static std::string format_effect(const Effect& effect);

private:
    std::ofstream log_file_;
    std::string log_path_;
    bool enabled_ = true;
};

} // namespace balatro
