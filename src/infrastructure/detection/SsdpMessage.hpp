/**
 * @file SsdpMessage.hpp
 * @brief SSDP (UPnP discovery) datagram parsing and M-SEARCH construction.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace lanscout::infra {

/**
 * @brief One SSDP datagram: a search response, a NOTIFY or an M-SEARCH.
 */
struct SsdpMessage {
    enum class Kind { SearchResponse, Notify, Search };

    static constexpr const char* MULTICAST_ADDRESS = "239.255.255.250";
    static constexpr uint16_t MULTICAST_PORT = 1900;

    Kind kind{Kind::SearchResponse};
    std::string startLine;
    std::map<std::string, std::string> headers; ///< Keys upper-cased

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> location() const { return header("LOCATION"); }
    [[nodiscard]] std::optional<std::string> server() const { return header("SERVER"); }

    /**
     * @brief True for search responses and "ssdp:alive" notifications.
     */
    [[nodiscard]] bool announcesDevice() const;

    /**
     * @brief Parses a datagram. Returns nullopt for anything that is not SSDP.
     */
    static std::optional<SsdpMessage> parse(std::string_view datagram);

    /**
     * @brief Builds an M-SEARCH request for the multicast group.
     * @param searchTarget ST header value.
     * @param mx Maximum response delay in seconds.
     */
    static std::string buildSearchRequest(const std::string& searchTarget = "ssdp:all",
                                          int mx = 3);
};

} // namespace lanscout::infra
