/**
 * @file IPingProbe.hpp
 * @brief Interface for single-shot ICMP reachability probes.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <stop_token>
#include <string>

namespace lanscout::core {

/**
 * @brief Sends one ICMP echo and waits for the matching reply.
 *
 * Implementations block the calling thread for at most @p timeout and must
 * never throw; every failure is reported through PingResult::success.
 */
class IPingProbe {
public:
    virtual ~IPingProbe() = default;

    /**
     * @brief Pings an IPv4 address once.
     * @param address Dotted-quad IPv4 address.
     * @param timeout Maximum time to wait for the echo reply.
     * @param stopToken Requests early abandonment of the probe.
     * @return Probe outcome with round-trip time on success.
     */
    virtual PingResult probe(const std::string& address, std::chrono::milliseconds timeout,
                             std::stop_token stopToken) = 0;
};

} // namespace lanscout::core
