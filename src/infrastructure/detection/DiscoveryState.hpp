#pragma once

#include <string>

namespace lanscout::infra {

/**
 * @brief Lifecycle of a passive detector's background listener.
 *
 * NotStarted moves to Listening on the first lookup, or to Degraded when the
 * socket cannot be opened. Degraded is terminal: lookups return nothing.
 */
enum class DiscoveryState { NotStarted, Listening, Degraded };

inline std::string toString(DiscoveryState state) {
    switch (state) {
    case DiscoveryState::NotStarted:
        return "NotStarted";
    case DiscoveryState::Listening:
        return "Listening";
    case DiscoveryState::Degraded:
        return "Degraded";
    }
    return "Unknown";
}

} // namespace lanscout::infra
