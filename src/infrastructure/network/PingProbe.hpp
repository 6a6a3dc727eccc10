#pragma once

#include "core/services/IPingProbe.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace lanscout::infra {

/**
 * @brief ICMP echo probe for sweep workers.
 *
 * Uses a raw ICMP socket when permitted and falls back to the unprivileged
 * datagram ICMP socket (net.ipv4.ping_group_range) otherwise. Each call owns
 * its socket, so probes for different addresses run independently.
 *
 * @note Blocks the calling thread for at most the requested timeout. Never
 *       call it from an I/O worker thread.
 */
class PingProbe : public core::IPingProbe {
public:
    PingProbe();

    core::PingResult probe(const std::string& address, std::chrono::milliseconds timeout,
                           std::stop_token stopToken) override;

    /**
     * @brief Internet checksum (RFC 1071) over @p length bytes.
     */
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);

    /**
     * @brief Builds a 64-byte echo request with a timestamp payload.
     */
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

    /**
     * @brief Checks whether a received datagram is the reply to our request.
     *
     * @param data Received bytes.
     * @param length Number of valid bytes.
     * @param hasIpHeader True for raw sockets, which deliver the IP header.
     * @param identifier Expected identifier, ignored when nullopt (datagram
     *        sockets have the kernel rewrite it).
     * @param sequence Expected sequence number.
     * @return The reply TTL (or -1 when unknown) on match, nullopt otherwise.
     */
    static std::optional<int> matchEchoReply(const uint8_t* data, size_t length, bool hasIpHeader,
                                             std::optional<uint16_t> identifier,
                                             uint16_t sequence);

private:
    core::PingResult exchange(int fd, bool rawSocket, const std::string& address,
                              std::chrono::milliseconds timeout, std::stop_token stopToken,
                              core::PingResult result);

    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace lanscout::infra
