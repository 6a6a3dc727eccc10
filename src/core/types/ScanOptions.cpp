#include "core/types/ScanOptions.hpp"

#include "core/types/ConfigurationError.hpp"

#include <set>

namespace lanscout::core {

namespace {

void requirePositive(int value, const char* name) {
    if (value <= 0) {
        throw ConfigurationError(std::string(name) + " must be positive, got " +
                                 std::to_string(value));
    }
}

void validatePortTable(const std::vector<ServicePort>& table, const char* name) {
    std::set<uint16_t> seen;
    for (const auto& entry : table) {
        if (entry.port == 0) {
            throw ConfigurationError(std::string(name) + " contains port 0");
        }
        if (entry.label.empty()) {
            throw ConfigurationError(std::string(name) + " has an empty label for port " +
                                     std::to_string(entry.port));
        }
        if (!seen.insert(entry.port).second) {
            throw ConfigurationError(std::string(name) + " lists port " +
                                     std::to_string(entry.port) + " twice");
        }
    }
}

void validatePortList(const std::vector<uint16_t>& ports, const char* name) {
    std::set<uint16_t> seen;
    for (uint16_t port : ports) {
        if (port == 0) {
            throw ConfigurationError(std::string(name) + " contains port 0");
        }
        if (!seen.insert(port).second) {
            throw ConfigurationError(std::string(name) + " lists port " + std::to_string(port) +
                                     " twice");
        }
    }
}

} // namespace

void ScannerOptions::validate() const {
    if (startIp < 1 || endIp > 254 || startIp > endIp) {
        throw ConfigurationError("Invalid host range " + std::to_string(startIp) + ".." +
                                 std::to_string(endIp) + " (expected 1 <= start <= end <= 254)");
    }
    requirePositive(scanIntervalMinutes, "scan_interval_minutes");
    requirePositive(maxConcurrentConnections, "max_concurrent_connections");
    requirePositive(pingTimeoutMs, "ping_timeout_ms");
    requirePositive(devicesBeforeThrottle, "devices_before_throttle");
    if (networkThrottleDelayMs < 0) {
        throw ConfigurationError("network_throttle_delay_ms must not be negative");
    }
}

void PortDetectionOptions::validate() const {
    validatePortList(customIoTPorts, "custom_iot_ports");
    validatePortList(standardHttpPorts, "standard_http_ports");
    validatePortTable(serviceEndpoints, "service_endpoints");
    validatePortTable(windowsServicePorts, "windows_service_ports");
    if (sshPort == 0) {
        throw ConfigurationError("ssh_port must not be 0");
    }
    requirePositive(portConnectionTimeoutMs, "port_connection_timeout_ms");
}

void DetectorOptions::validate() const {
    static const std::set<std::string> known{"upnp", "mdns",      "service_endpoint",
                                             "http", "ssh",       "windows_services"};
    for (const auto& name : enabled) {
        if (!known.contains(name)) {
            throw ConfigurationError("Unknown detector: " + name);
        }
    }
    if (std::set<std::string>(enabled.begin(), enabled.end()).size() != enabled.size()) {
        throw ConfigurationError("Detector enabled twice");
    }
    requirePositive(ssdpSearchIntervalSeconds, "ssdp_search_interval_seconds");
    requirePositive(upnpGracePeriodMs, "upnp_grace_period_ms");
    requirePositive(mdnsGracePeriodMs, "mdns_grace_period_ms");
    requirePositive(mdnsRequeryIntervalSeconds, "mdns_requery_interval_seconds");
    requirePositive(passiveCacheTtlMinutes, "passive_cache_ttl_minutes");
}

} // namespace lanscout::core
