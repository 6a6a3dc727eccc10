#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/ConfigurationError.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace lanscout::infra {

namespace {

nlohmann::json servicePortsToJson(const std::vector<core::ServicePort>& ports) {
    auto array = nlohmann::json::array();
    for (const auto& entry : ports) {
        array.push_back({{"port", entry.port}, {"label", entry.label}});
    }
    return array;
}

// nlohmann narrows integers without a range check, so 70000 would load as 4464.
uint16_t portFromJson(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw core::ConfigurationError(key + " must be an integer port number");
    }
    auto port = value.get<int64_t>();
    if (port < 1 || port > 65535) {
        throw core::ConfigurationError(key + " port " + std::to_string(port) +
                                       " is outside 1-65535");
    }
    return static_cast<uint16_t>(port);
}

std::vector<uint16_t> portListFromJson(const nlohmann::json& array, const std::string& key) {
    std::vector<uint16_t> ports;
    for (const auto& entry : array) {
        ports.push_back(portFromJson(entry, key));
    }
    return ports;
}

std::vector<core::ServicePort> servicePortsFromJson(const nlohmann::json& array,
                                                    const std::string& key) {
    std::vector<core::ServicePort> ports;
    for (const auto& entry : array) {
        ports.push_back({portFromJson(entry.at("port"), key), entry.at("label").get<std::string>()});
    }
    return ports;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        config_ = fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson(config_);

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson(const AppConfig& config) {
    nlohmann::json j;

    // Scanner
    const auto& s = config.scanner;
    j["scanner"]["subnet_base"] = s.subnetBase;
    j["scanner"]["start_ip"] = s.startIp;
    j["scanner"]["end_ip"] = s.endIp;
    j["scanner"]["scan_interval_minutes"] = s.scanIntervalMinutes;
    j["scanner"]["max_concurrent_connections"] = s.maxConcurrentConnections;
    j["scanner"]["ping_timeout_ms"] = s.pingTimeoutMs;
    j["scanner"]["network_throttle_delay_ms"] = s.networkThrottleDelayMs;
    j["scanner"]["devices_before_throttle"] = s.devicesBeforeThrottle;
    j["scanner"]["enable_continuous_scanning"] = s.enableContinuousScanning;
    j["scanner"]["resolve_hostnames"] = s.resolveHostnames;
    j["scanner"]["resolve_mac_addresses"] = s.resolveMacAddresses;

    // Ports
    const auto& p = config.ports;
    j["ports"]["custom_iot_ports"] = p.customIoTPorts;
    j["ports"]["standard_http_ports"] = p.standardHttpPorts;
    j["ports"]["ssh_port"] = p.sshPort;
    j["ports"]["port_connection_timeout_ms"] = p.portConnectionTimeoutMs;
    j["ports"]["service_endpoints"] = servicePortsToJson(p.serviceEndpoints);
    j["ports"]["windows_service_ports"] = servicePortsToJson(p.windowsServicePorts);

    // Detectors
    const auto& d = config.detectors;
    j["detectors"]["enabled"] = d.enabled;
    j["detectors"]["ssdp_search_interval_seconds"] = d.ssdpSearchIntervalSeconds;
    j["detectors"]["upnp_grace_period_ms"] = d.upnpGracePeriodMs;
    j["detectors"]["mdns_grace_period_ms"] = d.mdnsGracePeriodMs;
    j["detectors"]["mdns_requery_interval_seconds"] = d.mdnsRequeryIntervalSeconds;
    j["detectors"]["passive_cache_ttl_minutes"] = d.passiveCacheTtlMinutes;

    // Logging
    j["logging"]["level"] = config.logLevel;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig config;

    // Scanner
    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        auto& out = config.scanner;
        out.subnetBase = s.value("subnet_base", out.subnetBase);
        out.startIp = s.value("start_ip", out.startIp);
        out.endIp = s.value("end_ip", out.endIp);
        out.scanIntervalMinutes = s.value("scan_interval_minutes", out.scanIntervalMinutes);
        out.maxConcurrentConnections =
            s.value("max_concurrent_connections", out.maxConcurrentConnections);
        out.pingTimeoutMs = s.value("ping_timeout_ms", out.pingTimeoutMs);
        out.networkThrottleDelayMs =
            s.value("network_throttle_delay_ms", out.networkThrottleDelayMs);
        out.devicesBeforeThrottle = s.value("devices_before_throttle", out.devicesBeforeThrottle);
        out.enableContinuousScanning =
            s.value("enable_continuous_scanning", out.enableContinuousScanning);
        out.resolveHostnames = s.value("resolve_hostnames", out.resolveHostnames);
        out.resolveMacAddresses = s.value("resolve_mac_addresses", out.resolveMacAddresses);
    }

    // Ports
    if (j.contains("ports")) {
        const auto& p = j["ports"];
        auto& out = config.ports;
        if (p.contains("custom_iot_ports")) {
            out.customIoTPorts = portListFromJson(p["custom_iot_ports"], "custom_iot_ports");
        }
        if (p.contains("standard_http_ports")) {
            out.standardHttpPorts =
                portListFromJson(p["standard_http_ports"], "standard_http_ports");
        }
        if (p.contains("ssh_port")) {
            out.sshPort = portFromJson(p["ssh_port"], "ssh_port");
        }
        out.portConnectionTimeoutMs =
            p.value("port_connection_timeout_ms", out.portConnectionTimeoutMs);
        if (p.contains("service_endpoints")) {
            out.serviceEndpoints =
                servicePortsFromJson(p["service_endpoints"], "service_endpoints");
        }
        if (p.contains("windows_service_ports")) {
            out.windowsServicePorts =
                servicePortsFromJson(p["windows_service_ports"], "windows_service_ports");
        }
    }

    // Detectors
    if (j.contains("detectors")) {
        const auto& d = j["detectors"];
        auto& out = config.detectors;
        out.enabled = d.value("enabled", out.enabled);
        out.ssdpSearchIntervalSeconds =
            d.value("ssdp_search_interval_seconds", out.ssdpSearchIntervalSeconds);
        out.upnpGracePeriodMs = d.value("upnp_grace_period_ms", out.upnpGracePeriodMs);
        out.mdnsGracePeriodMs = d.value("mdns_grace_period_ms", out.mdnsGracePeriodMs);
        out.mdnsRequeryIntervalSeconds =
            d.value("mdns_requery_interval_seconds", out.mdnsRequeryIntervalSeconds);
        out.passiveCacheTtlMinutes =
            d.value("passive_cache_ttl_minutes", out.passiveCacheTtlMinutes);
    }

    // Logging
    if (j.contains("logging")) {
        config.logLevel = j["logging"].value("level", config.logLevel);
    }

    return config;
}

std::filesystem::path ConfigManager::devicesPath() const {
    return configDir_ / "known_devices.json";
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "lanscout.log";
}

} // namespace lanscout::infra
