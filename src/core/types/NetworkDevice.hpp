/**
 * @file NetworkDevice.hpp
 * @brief Device inventory entry produced by network sweeps.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lanscout::core {

/**
 * @brief A host observed on the local network, keyed by its IPv4 address.
 *
 * Entries are created when an address first answers a ping and are updated in
 * place on every sweep that includes the address. They are never removed
 * automatically; offline entries keep their last known name and type.
 */
struct NetworkDevice {
    std::string address;                     ///< Dotted-quad IPv4 address (identity key)
    std::string name;                        ///< Resolved hostname or placeholder
    std::string type;                        ///< Classification label, empty if never classified
    std::optional<std::string> macAddress;   ///< Hardware address when resolvable
    bool isOnline{false};                    ///< Result of the most recent ping
    std::optional<std::chrono::system_clock::time_point> lastSeen; ///< Last successful ping
    std::chrono::microseconds responseTime{0}; ///< Last round-trip time (zero while offline)

    /**
     * @brief Converts the response time to milliseconds.
     * @return Response time as a floating-point number of milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    /**
     * @brief Returns the type label, or "Unknown" when never classified.
     */
    [[nodiscard]] std::string displayType() const;

    /**
     * @brief Builds the placeholder name used when no hostname is known.
     * @param address IPv4 address of the device.
     * @return "DEVICE_" followed by the last octet, e.g. "DEVICE_42".
     */
    static std::string placeholderName(const std::string& address);

    bool operator==(const NetworkDevice& other) const = default;
};

} // namespace lanscout::core
