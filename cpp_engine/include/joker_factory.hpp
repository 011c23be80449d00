/**
 * Balatro Joker Engine - Joker Factory
 *
 * Maps a JokerId (plus optional json construction arguments) to a fresh
 * joker instance. Creation is pure: it touches no process-wide state, so
 * any number of threads may create jokers from a published factory.
 *
 * Parameterized jokers read their arguments from a json object:
 *   factory.create(JokerId::ANCIENT_JOKER, {{"suit", "hearts"}});
 *   factory.create(JokerId::TO_DO_LIST, {{"hand", "flush"}});
 */

#pragma once

#include "joker.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace balatro {

using ConstructionArgs = nlohmann::json;

/**
 * Result of constructing a joker.
 */
struct CreateResult {
    std::unique_ptr<Joker> joker;
    bool success = false;
    std::string error;

    static CreateResult ok(std::unique_ptr<Joker> joker) {
        CreateResult r;
        r.joker = std::move(joker);
        r.success = true;
        return r;
    }

    static CreateResult fail(std::string message) {
        CreateResult r;
        r.error = std::move(message);
        return r;
    }
};

using JokerConstructor = std::function<CreateResult(const ConstructionArgs& args)>;

class JokerFactory {
public:
    JokerFactory();

    /**
     * Install the constructor for an id. Returns false for reserved ids or
     * an id that already has one.
     */
    bool add(JokerId id, JokerConstructor constructor);

    /**
     * Construct a joker. Unknown or reserved ids and invalid arguments are
     * construction errors, never exceptions.
     */
    CreateResult create(JokerId id, const ConstructionArgs& args = nullptr) const;

    bool can_create(JokerId id) const;
    size_t size() const { return count_; }

private:
    std::vector<JokerConstructor> constructors_;  // Indexed by JokerId
    size_t count_ = 0;
};

// ============================================================================
// ARGUMENT HELPERS
// ============================================================================

namespace args {

/**
 * Read an optional string field and map it through a parser. Leaves out
 * untouched and returns true when the field is absent; returns false and
 * fills error when the field is present but invalid.
 */
bool read_suit(const ConstructionArgs& args, const char* field, std::optional<Suit>& out,
               std::string& error);
bool read_rank(const ConstructionArgs& args, const char* field, std::optional<Rank>& out,
               std::string& error);
bool read_hand_type(const ConstructionArgs& args, const char* field,
                    std::optional<HandType>& out, std::string& error);

/**
 * Arguments must be null or an object containing only the allowed fields.
 */
bool check_fields(const ConstructionArgs& args, std::initializer_list<const char*> allowed,
                  std::string& error);

std::optional<Suit> parse_suit(const std::string& text);
std::optional<Rank> parse_rank(const std::string& text);
std::optional<HandType> parse_hand_type(const std::string& text);
const char* suit_key(Suit suit);
const char* hand_type_key(HandType type);

} // namespace args

} // namespace balatro
