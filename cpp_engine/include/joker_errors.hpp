/**
 * Balatro Joker Engine - Error Types
 *
 * Per-joker failures are reported as JokerError values inside result
 * structs; they never abort a scoring pass. Hooks may throw JokerStateError
 * (or any std::exception), which the pipeline turns into HOOK_INVOCATION
 * errors.
 */

#pragma once

#include "joker_id.hpp"
#include "types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace balatro {

enum class ErrorKind : uint8_t {
    CONSTRUCTION,
    STATE_DESERIALIZE,
    HOOK_INVOCATION,
    NUMERIC_BOUND,
    UNSUPPORTED_VERSION,
    CORRUPT_BLOB
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONSTRUCTION: return "Construction";
        case ErrorKind::STATE_DESERIALIZE: return "StateDeserialize";
        case ErrorKind::HOOK_INVOCATION: return "HookInvocation";
        case ErrorKind::NUMERIC_BOUND: return "NumericBound";
        case ErrorKind::UNSUPPORTED_VERSION: return "UnsupportedVersion";
        case ErrorKind::CORRUPT_BLOB: return "CorruptBlob";
    }
    return "Unknown";
}

struct JokerError {
    ErrorKind kind = ErrorKind::CONSTRUCTION;
    std::optional<JokerId> joker_id;
    InstanceId slot = 0;
    std::string message;

    std::string describe() const {
        std::string out = "[";
        out += to_string(kind);
        out += "] ";
        if (joker_id) {
            out += to_key(*joker_id);
            out += "#" + std::to_string(slot) + ": ";
        }
        out += message;
        return out;
    }
};

/**
 * Thrown by behaviors whose state cannot support the requested operation.
 */
class JokerStateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Result of restoring a behavior's state.
 */
struct StateResult {
    bool success = true;
    std::string error;

    static StateResult ok() { return {}; }
    static StateResult fail(std::string message) { return {false, std::move(message)}; }
};

} // namespace balatro
