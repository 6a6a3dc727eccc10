/**
 * @file PingResult.hpp
 * @brief Result of a single ICMP echo probe.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lanscout::core {

/**
 * @brief Result of a single ICMP ping operation.
 *
 * Probe failures of any kind (unreachable host, timeout, missing privileges,
 * cancellation) are reported through @c success and @c errorMessage rather
 * than exceptions.
 */
struct PingResult {
    std::string address;     ///< Address that was probed
    std::chrono::system_clock::time_point timestamp; ///< When the ping was performed
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};     ///< Whether an echo reply was received
    std::optional<int> ttl;  ///< Time-to-live from the reply (if available)
    std::string errorMessage; ///< Error message if the ping failed

    bool operator==(const PingResult& other) const = default;
};

} // namespace lanscout::core
