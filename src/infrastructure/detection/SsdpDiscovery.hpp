/**
 * @file SsdpDiscovery.hpp
 * @brief Background SSDP listener that resolves UPnP device descriptions.
 */

#pragma once

#include "infrastructure/detection/PassiveDiscoveryCache.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HttpClient.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lanscout::infra {

/**
 * @brief Sends M-SEARCH requests, hears responses and NOTIFY announcements,
 *        and fills a PassiveDiscoveryCache with labels from device descriptions.
 *
 * Each LOCATION is fetched at most once per refresh interval; repeated
 * announcements only refresh the cached entry. Handlers hold a shared_ptr to
 * the listener, so close() may be called while operations are pending.
 *
 * @note The HttpClient must outlive the listener.
 */
class SsdpDiscovery : public std::enable_shared_from_this<SsdpDiscovery> {
public:
    struct Settings {
        std::chrono::seconds searchInterval{30};           ///< M-SEARCH repeat period
        std::chrono::milliseconds descriptionTimeout{3000}; ///< Description GET deadline
        std::chrono::minutes descriptionRefresh{10};       ///< Re-fetch period per LOCATION
        bool listenForNotify{true};                        ///< Join the group on port 1900
    };

    SsdpDiscovery(AsioContext& context, HttpClient& httpClient,
                  std::shared_ptr<PassiveDiscoveryCache> cache, Settings settings);

    /**
     * @brief Opens the sockets, starts receiving and sends the first M-SEARCH.
     * @return False when the search socket cannot be opened.
     */
    bool start();

    /**
     * @brief Sends an M-SEARCH now.
     */
    void sendSearch();

    /**
     * @brief Sends an M-SEARCH unless one went out within @p minSpacing.
     * @return True if a search was sent.
     */
    bool sendSearchIfIdle(std::chrono::steady_clock::duration minSpacing);

    /**
     * @brief Stops the timer, leaves the group and closes both sockets.
     *
     * Returns once that has happened on the strand, so the I/O pool may be
     * stopped right afterwards.
     */
    void close();

    [[nodiscard]] bool isOpen() const {
        return searchSocket_.is_open() || notifySocket_.is_open();
    }

    /**
     * @brief Processes one received datagram.
     * @param datagram Raw SSDP text.
     * @param senderAddress IPv4 address the datagram came from.
     */
    void handleDatagram(const std::string& datagram, const std::string& senderAddress);

private:
    struct ReceiveSlot {
        std::array<char, 4096> buffer{};
        asio::ip::udp::endpoint sender;
    };

    struct DescriptionRecord {
        std::string address;
        std::string label;
        std::chrono::steady_clock::time_point fetchedAt;
        bool inFlight{false};
    };

    void receive(asio::ip::udp::socket& socket, ReceiveSlot& slot);
    void scheduleSearch();
    void fetchDescription(const std::string& location, const std::string& address,
                          const std::string& server);
    void onDescription(const std::string& location, const std::string& address,
                       const std::string& server, const HttpResponse& response);

    AsioContext& context_;
    HttpClient& httpClient_;
    std::shared_ptr<PassiveDiscoveryCache> cache_;
    Settings settings_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::udp::socket searchSocket_;
    asio::ip::udp::socket notifySocket_;
    asio::steady_timer searchTimer_;
    ReceiveSlot searchSlot_;
    ReceiveSlot notifySlot_;
    std::atomic<bool> closed_{false};
    std::atomic<std::chrono::steady_clock::rep> lastSearch_{0};

    std::mutex descriptionsMutex_;
    std::map<std::string, DescriptionRecord> descriptions_; ///< Keyed by LOCATION
};

} // namespace lanscout::infra
