/**
 * @file NetworkInterface.hpp
 * @brief Local network interface enumeration.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lanscout::core {

/**
 * @brief An IPv4 address assigned to a local network interface.
 */
struct NetworkInterface {
    std::string name;            ///< System name of the interface (e.g., "eth0")
    std::string ipAddress;       ///< IPv4 address assigned to the interface
    std::string netmask;         ///< IPv4 netmask in dotted form
    bool isUp{false};            ///< Whether the interface is currently up
    bool isLoopback{false};      ///< Whether this is a loopback interface

    /**
     * @brief Returns the first three octets of the address, e.g. "192.168.1".
     */
    [[nodiscard]] std::string subnetBase() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 interface addresses on the system.
     * @return Vector of NetworkInterface objects, in system order.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Picks the first interface that is up and not a loopback.
     * @param interfaces Candidates, usually the result of enumerate().
     * @return The selected interface, or nullopt if none qualifies.
     */
    static std::optional<NetworkInterface> findPrimary(
        const std::vector<NetworkInterface>& interfaces);
};

} // namespace lanscout::core
