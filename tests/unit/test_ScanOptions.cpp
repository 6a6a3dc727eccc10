#include <catch2/catch_test_macros.hpp>

#include "core/types/ConfigurationError.hpp"
#include "core/types/ScanOptions.hpp"

using namespace lanscout::core;

TEST_CASE("ScannerOptions validation", "[ScanOptions]") {
    ScannerOptions options;

    SECTION("Defaults are valid") {
        REQUIRE_NOTHROW(options.validate());
        REQUIRE(options.pingTimeout() == std::chrono::milliseconds(2000));
        REQUIRE(options.scanInterval() == std::chrono::minutes(5));
    }

    SECTION("Single address range is valid") {
        options.startIp = 42;
        options.endIp = 42;
        REQUIRE_NOTHROW(options.validate());
    }

    SECTION("Inverted range is rejected") {
        options.startIp = 10;
        options.endIp = 5;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("Octets outside 1..254 are rejected") {
        options.startIp = 0;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);

        options.startIp = 1;
        options.endIp = 255;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("Non-positive concurrency is rejected") {
        options.maxConcurrentConnections = 0;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("Negative throttle delay is rejected, zero is allowed") {
        options.networkThrottleDelayMs = 0;
        REQUIRE_NOTHROW(options.validate());

        options.networkThrottleDelayMs = -1;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }
}

TEST_CASE("PortDetectionOptions validation", "[ScanOptions]") {
    PortDetectionOptions options;

    SECTION("Default tables are valid") {
        REQUIRE_NOTHROW(options.validate());
        REQUIRE(options.customIoTPorts == std::vector<uint16_t>{5000, 8000, 8080, 8443});
        REQUIRE(options.standardHttpPorts == std::vector<uint16_t>{80, 443});
        REQUIRE(options.windowsServicePorts.front().port == 3389);
    }

    SECTION("Duplicate ports are rejected") {
        options.serviceEndpoints.push_back({8974, "Again"});
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("Port zero is rejected") {
        options.customIoTPorts.push_back(0);
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("Empty labels are rejected") {
        options.windowsServicePorts.push_back({3390, ""});
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }
}

TEST_CASE("DetectorOptions validation", "[ScanOptions]") {
    DetectorOptions options;

    SECTION("Defaults enable every detector") {
        REQUIRE_NOTHROW(options.validate());
        REQUIRE(options.enabled.size() == 6);
    }

    SECTION("Unknown detector names are rejected") {
        options.enabled = {"upnp", "netbios"};
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("Duplicate detector names are rejected") {
        options.enabled = {"http", "http"};
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("An empty set is allowed") {
        options.enabled.clear();
        REQUIRE_NOTHROW(options.validate());
    }
}
