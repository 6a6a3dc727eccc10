#include <catch2/catch_test_macros.hpp>

#include "core/types/ConfigurationError.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace lanscout::infra;
using namespace lanscout::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "lanscout_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const nlohmann::json& j) const {
        std::ofstream file(configDir_ / "config.json");
        file << j.dump(2);
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "lanscout_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Path helpers live in the config directory") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.devicesPath() == testDir.path() / "known_devices.json");
        REQUIRE(manager.logPath() == testDir.path() / "lanscout.log");
        REQUIRE(manager.configDir() == testDir.path().string());
    }
}

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("load writes defaults when the file does not exist") {
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.scanner.subnetBase == "auto");
        REQUIRE(config.scanner.startIp == 1);
        REQUIRE(config.scanner.endIp == 254);
        REQUIRE(config.scanner.scanIntervalMinutes == 5);
        REQUIRE(config.scanner.maxConcurrentConnections == 20);
        REQUIRE(config.scanner.pingTimeoutMs == 2000);
        REQUIRE(config.ports.sshPort == 22);
        REQUIRE(config.ports.serviceEndpoints.size() == 3);
        REQUIRE(config.detectors.enabled.size() == 6);
        REQUIRE(config.detectors.passiveCacheTtlMinutes == 30);
        REQUIRE(config.logLevel == "info");
    }

    SECTION("load reads an existing file") {
        nlohmann::json j;
        j["scanner"]["subnet_base"] = "10.0.0";
        j["scanner"]["start_ip"] = 10;
        j["scanner"]["end_ip"] = 20;
        j["scanner"]["resolve_mac_addresses"] = false;
        j["ports"]["ssh_port"] = 2222;
        j["ports"]["service_endpoints"] = {{{"port", 9000}, {"label", "Sensor Hub"}}};
        j["detectors"]["enabled"] = {"http", "ssh"};
        j["logging"]["level"] = "debug";
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.scanner.subnetBase == "10.0.0");
        REQUIRE(config.scanner.startIp == 10);
        REQUIRE(config.scanner.endIp == 20);
        REQUIRE_FALSE(config.scanner.resolveMacAddresses);
        REQUIRE(config.ports.sshPort == 2222);
        REQUIRE(config.ports.serviceEndpoints.size() == 1);
        REQUIRE(config.ports.serviceEndpoints[0].port == 9000);
        REQUIRE(config.ports.serviceEndpoints[0].label == "Sensor Hub");
        REQUIRE(config.detectors.enabled == std::vector<std::string>{"http", "ssh"});
        REQUIRE(config.logLevel == "debug");
    }

    SECTION("load keeps defaults for missing keys") {
        nlohmann::json j;
        j["scanner"]["scan_interval_minutes"] = 15;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        manager.load();

        REQUIRE(manager.config().scanner.scanIntervalMinutes == 15);
        REQUIRE(manager.config().scanner.maxConcurrentConnections == 20);
        REQUIRE(manager.config().ports.windowsServicePorts.size() == 6);
        REQUIRE(manager.config().detectors.upnpGracePeriodMs == 2000);
    }

    SECTION("load returns false for invalid JSON") {
        std::ofstream file(testDir.path() / "config.json");
        file << "{ invalid json content }}}";
        file.close();

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }

    SECTION("Ports outside 1-65535 are rejected instead of wrapped") {
        nlohmann::json tooLarge;
        tooLarge["ports"]["ssh_port"] = 70000;
        REQUIRE_THROWS_AS(ConfigManager::fromJson(tooLarge), ConfigurationError);

        nlohmann::json negative;
        negative["ports"]["custom_iot_ports"] = {8080, -1};
        REQUIRE_THROWS_AS(ConfigManager::fromJson(negative), ConfigurationError);

        nlohmann::json endpoint;
        endpoint["ports"]["service_endpoints"] = {{{"port", 65558}, {"label", "Sensor Hub"}}};
        REQUIRE_THROWS_AS(ConfigManager::fromJson(endpoint), ConfigurationError);
    }

    SECTION("load keeps defaults when a port is out of range") {
        nlohmann::json j;
        j["ports"]["ssh_port"] = 70000;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().ports.sshPort == 22);
    }

    SECTION("Boundary ports are accepted") {
        nlohmann::json j;
        j["ports"]["ssh_port"] = 65535;
        j["ports"]["standard_http_ports"] = {1};

        auto config = ConfigManager::fromJson(j);
        REQUIRE(config.ports.sshPort == 65535);
        REQUIRE(config.ports.standardHttpPorts == std::vector<uint16_t>{1});
    }

    SECTION("Out-of-range values load but fail validation") {
        nlohmann::json j;
        j["scanner"]["start_ip"] = 200;
        j["scanner"]["end_ip"] = 100;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE_THROWS_AS(manager.config().scanner.validate(), ConfigurationError);
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Saved values survive a reload") {
        {
            ConfigManager manager(testDir.path());
            manager.config().scanner.subnetBase = "192.168.50";
            manager.config().scanner.maxConcurrentConnections = 8;
            manager.config().ports.customIoTPorts = {8123};
            manager.config().detectors.enabled = {"upnp"};
            manager.config().logLevel = "warn";
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());

        const auto& config = reloaded.config();
        REQUIRE(config.scanner.subnetBase == "192.168.50");
        REQUIRE(config.scanner.maxConcurrentConnections == 8);
        REQUIRE(config.ports.customIoTPorts == std::vector<uint16_t>{8123});
        REQUIRE(config.detectors.enabled == std::vector<std::string>{"upnp"});
        REQUIRE(config.logLevel == "warn");
    }

    SECTION("Saved file uses snake_case sections") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.save());

        std::ifstream file(manager.configPath());
        nlohmann::json j;
        file >> j;

        REQUIRE(j.contains("scanner"));
        REQUIRE(j["scanner"].contains("max_concurrent_connections"));
        REQUIRE(j["ports"]["windows_service_ports"][0]["port"] == 3389);
        REQUIRE(j["detectors"].contains("mdns_requery_interval_seconds"));
        REQUIRE(j["logging"]["level"] == "info");
    }
}
