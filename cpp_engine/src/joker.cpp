/**
 * Balatro Joker Engine - Joker Capability Queries
 */

#include "joker.hpp"

namespace balatro {

bool Joker::supports(Capability capability) const {
    return (capabilities() & static_cast<uint8_t>(capability)) != 0;
}

uint8_t Joker::capabilities() const {
    // Capability accessors are non-const for mutable hooks; querying presence is not
    auto* self = const_cast<Joker*>(this);
    uint8_t caps = static_cast<uint8_t>(Capability::IDENTITY);
    if (self->lifecycle()) caps |= static_cast<uint8_t>(Capability::LIFECYCLE);
    if (self->gameplay()) caps |= static_cast<uint8_t>(Capability::GAMEPLAY);
    if (modifiers()) caps |= static_cast<uint8_t>(Capability::MODIFIERS);
    if (state()) caps |= static_cast<uint8_t>(Capability::STATE);
    return caps;
}

} // namespace balatro
