#include <catch2/catch_test_macros.hpp>

#include "infrastructure/detection/WindowsServicesDetector.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "support/LoopbackServer.hpp"

using namespace lanscout::infra;
using namespace lanscout::core;
using lanscout::test::closedLoopbackPort;
using lanscout::test::LoopbackServer;

TEST_CASE("WindowsServicesDetector labels ports", "[WindowsServicesDetector]") {
    REQUIRE(WindowsServicesDetector::classifyPort({3389, "Remote Desktop Protocol"}) ==
            "Windows Server (Remote Desktop Protocol)");
    REQUIRE(WindowsServicesDetector::classifyPort({5985, "WinRM HTTP"}) ==
            "Windows Server (WinRM HTTP)");
    REQUIRE(WindowsServicesDetector::classifyPort({5986, "WinRM HTTPS"}) ==
            "Windows Server (WinRM HTTPS)");
    REQUIRE(WindowsServicesDetector::classifyPort({445, "SMB"}) == "Windows Client (SMB)");
    REQUIRE(WindowsServicesDetector::classifyPort({135, "RPC"}) == "Windows Client (RPC)");
}

TEST_CASE("WindowsServicesDetector reports the first open port", "[WindowsServicesDetector]") {
    AsioContext asio(2);
    asio.start();
    TcpProbe probe(asio);
    LoopbackServer server("", false);

    PortDetectionOptions options;
    options.portConnectionTimeoutMs = 500;

    SECTION("Table order decides the label") {
        options.windowsServicePorts = {{closedLoopbackPort(), "Remote Desktop Protocol"},
                                       {server.port(), "SMB"}};

        WindowsServicesDetector detector(probe, options);
        REQUIRE(detector.detectDeviceType("127.0.0.1", {}) == "Windows Client (SMB)");
    }

    SECTION("Nothing open yields nothing") {
        options.windowsServicePorts = {{closedLoopbackPort(), "SMB"}};

        WindowsServicesDetector detector(probe, options);
        REQUIRE_FALSE(detector.detectDeviceType("127.0.0.1", {}).has_value());
    }

    asio.stop();
}
