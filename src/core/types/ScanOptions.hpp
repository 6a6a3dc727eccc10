/**
 * @file ScanOptions.hpp
 * @brief Configuration structures for sweeps, port probes and detectors.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lanscout::core {

/**
 * @brief A TCP port paired with the label reported when it is found open.
 */
struct ServicePort {
    uint16_t port{0};   ///< TCP port number
    std::string label;  ///< Human-readable service description

    bool operator==(const ServicePort& other) const = default;
};

/**
 * @brief Options governing the subnet sweep and the background scheduler.
 */
struct ScannerOptions {
    std::string subnetBase{"auto"};    ///< "auto" or three dotted octets, e.g. "192.168.1"
    int startIp{1};                    ///< First host octet to probe
    int endIp{254};                    ///< Last host octet to probe (inclusive)
    int scanIntervalMinutes{5};        ///< Delay between background sweeps
    int maxConcurrentConnections{20};  ///< Upper bound on addresses probed at once
    int pingTimeoutMs{2000};           ///< ICMP echo timeout
    int networkThrottleDelayMs{50};    ///< Pause inserted every devicesBeforeThrottle addresses
    int devicesBeforeThrottle{10};     ///< Addresses dispatched between throttle pauses
    bool enableContinuousScanning{true}; ///< Whether the host starts background scanning
    bool resolveHostnames{true};       ///< Query reverse DNS for online devices
    bool resolveMacAddresses{true};    ///< Look up hardware addresses in the neighbour table

    [[nodiscard]] std::chrono::milliseconds pingTimeout() const {
        return std::chrono::milliseconds(pingTimeoutMs);
    }

    [[nodiscard]] std::chrono::minutes scanInterval() const {
        return std::chrono::minutes(scanIntervalMinutes);
    }

    /**
     * @brief Checks ranges and intervals.
     * @throws ConfigurationError on the first invalid value.
     */
    void validate() const;
};

/**
 * @brief Port tables and timeouts used by the active TCP detectors.
 */
struct PortDetectionOptions {
    std::vector<uint16_t> customIoTPorts{5000, 8000, 8080, 8443}; ///< Probed before standard ports
    std::vector<uint16_t> standardHttpPorts{80, 443};
    uint16_t sshPort{22};
    int portConnectionTimeoutMs{1000};  ///< Connect and read timeout per port

    /// Ordered; the first open port decides the label.
    std::vector<ServicePort> serviceEndpoints{
        {8974, "IoT Service Endpoint 3"},
        {8975, "IoT Service Endpoint 1"},
        {12050, "IoT Service Endpoint 2"},
    };

    /// Ordered; the first open port decides the label.
    std::vector<ServicePort> windowsServicePorts{
        {3389, "Remote Desktop Protocol"},
        {5985, "WinRM HTTP"},
        {5986, "WinRM HTTPS"},
        {445, "SMB"},
        {139, "NetBIOS"},
        {135, "RPC"},
    };

    [[nodiscard]] std::chrono::milliseconds connectionTimeout() const {
        return std::chrono::milliseconds(portConnectionTimeoutMs);
    }

    /**
     * @brief Checks port tables for zero ports, duplicates and empty labels.
     * @throws ConfigurationError on the first invalid entry.
     */
    void validate() const;
};

/**
 * @brief Which detectors are registered and how the passive ones behave.
 */
struct DetectorOptions {
    std::vector<std::string> enabled{"upnp",  "mdns", "service_endpoint",
                                     "http",  "ssh",  "windows_services"};
    int ssdpSearchIntervalSeconds{30};   ///< M-SEARCH re-announcement period
    int upnpGracePeriodMs{2000};         ///< Wait after re-triggering SSDP on a cache miss
    int mdnsGracePeriodMs{1500};         ///< Wait after re-triggering mDNS on a cache miss
    int mdnsRequeryIntervalSeconds{60};  ///< Minimum spacing between mDNS query rounds
    int passiveCacheTtlMinutes{30};      ///< Lifetime of passive discovery entries

    /**
     * @brief Checks the detector names and timing values.
     * @throws ConfigurationError on the first invalid value.
     */
    void validate() const;
};

} // namespace lanscout::core
