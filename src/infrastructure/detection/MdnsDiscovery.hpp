/**
 * @file MdnsDiscovery.hpp
 * @brief Background multicast DNS listener for service announcements.
 */

#pragma once

#include "infrastructure/detection/DnsMessage.hpp"
#include "infrastructure/detection/PassiveDiscoveryCache.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lanscout::infra {

/**
 * @brief Queries well-known DNS-SD service types and turns the answers into
 *        per-address labels such as "Office Printer - Printer (mDNS)".
 *
 * Binds 224.0.0.251:5353 when the port is free. Otherwise (another responder
 * owns it) an ephemeral port is used and queries ask for unicast replies.
 * Handlers hold a shared_ptr to the listener, so close() may be called while
 * operations are pending.
 */
class MdnsDiscovery : public std::enable_shared_from_this<MdnsDiscovery> {
public:
    static constexpr const char* MULTICAST_ADDRESS = "224.0.0.251";
    static constexpr uint16_t MULTICAST_PORT = 5353;

    MdnsDiscovery(AsioContext& context, std::shared_ptr<PassiveDiscoveryCache> cache);

    /**
     * @brief Service types queried on start, e.g. "_printer._tcp.local".
     */
    static const std::vector<std::string>& serviceTypes();

    /**
     * @brief Maps a service type to a readable category ("_hue._tcp" -> "Philips Hue").
     */
    static std::optional<std::string> serviceHint(const std::string& serviceType);

    /**
     * @brief Derives (address, label) pairs from a response.
     * @param message Parsed response.
     * @param senderAddress Used when the response carries no A records.
     */
    static std::vector<std::pair<std::string, std::string>> extractLabels(
        const DnsMessage& message, const std::string& senderAddress);

    /**
     * @brief Opens the socket, starts receiving and sends the first query round.
     * @return False when no UDP socket could be opened.
     */
    bool start();

    void sendQueries();

    /**
     * @brief Sends a query round unless one went out within @p minSpacing.
     */
    bool sendQueriesIfIdle(std::chrono::steady_clock::duration minSpacing);

    /**
     * @brief Leaves the group and closes the socket, waiting for the strand.
     */
    void close();

    [[nodiscard]] bool isOpen() const { return socket_.is_open(); }

    /**
     * @brief Processes one received datagram; malformed data is dropped.
     */
    void handleDatagram(const uint8_t* data, size_t length, const std::string& senderAddress);

    [[nodiscard]] bool usesUnicastResponses() const { return unicastResponses_; }

private:
    void receive();

    AsioContext& context_;
    std::shared_ptr<PassiveDiscoveryCache> cache_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket socket_;
    std::array<uint8_t, 9000> buffer_{};
    asio::ip::udp::endpoint sender_;
    bool joinedGroup_{false};
    bool unicastResponses_{false};
    std::atomic<bool> closed_{false};
    std::atomic<std::chrono::steady_clock::rep> lastQuery_{0};
};

} // namespace lanscout::infra
