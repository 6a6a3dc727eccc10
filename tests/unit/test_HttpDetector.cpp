#include <catch2/catch_test_macros.hpp>

#include "infrastructure/detection/HttpDetector.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "support/LoopbackServer.hpp"

using namespace lanscout::infra;
using namespace lanscout::core;
using lanscout::test::closedLoopbackPort;
using lanscout::test::LoopbackServer;

TEST_CASE("HttpDetector classifies responses", "[HttpDetector]") {
    SECTION("Server headers") {
        REQUIRE(HttpDetector::classifyResponse(
                    "HTTP/1.1 200 OK\r\nServer: Microsoft-IIS/10.0\r\n\r\n", 80) ==
                "Windows Server 2016/2019/2022 (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(
                    "HTTP/1.1 200 OK\r\nServer: Microsoft-IIS/8.5\r\n\r\n", 80) ==
                "Windows Server 2012 R2 (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(
                    "HTTP/1.1 200 OK\r\nServer: Microsoft-IIS/7.5\r\n\r\n", 80) ==
                "Windows Server (HTTP)");
        REQUIRE(HttpDetector::classifyResponse("HTTP/1.1 200 OK\r\nServer: Kestrel\r\n\r\n",
                                               5000) == "Windows/Linux (.NET) (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(
                    "HTTP/1.1 200 OK\r\nServer: Apache/2.4.57 (Debian)\r\n\r\n", 80) ==
                "Linux Server (HTTP)");
    }

    SECTION("Framework markers") {
        REQUIRE(HttpDetector::classifyResponse(
                    "HTTP/1.1 200 OK\r\nX-Powered-By: ASP.NET\r\n\r\n", 80) ==
                "Windows Server (.NET) (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(
                    "HTTP/1.1 404 Not Found\r\nServer: Microsoft-HTTPAPI/2.0\r\n\r\n", 80) ==
                "Windows Server (HTTP)");
    }

    SECTION("Unrecognised servers fall back to the port label") {
        const std::string plain = "HTTP/1.1 200 OK\r\nServer: tinyhttpd\r\n\r\n";
        REQUIRE(HttpDetector::classifyResponse(plain, 5000) == "Unknown (.NET App) (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(plain, 8080) == "Unknown (Web App) (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(plain, 8443) == "Unknown (Secure Web) (HTTP)");
        REQUIRE(HttpDetector::classifyResponse(plain, 80) == "Unknown (HTTP)");
    }

    SECTION("Non-HTTP replies are not classified") {
        REQUIRE_FALSE(HttpDetector::classifyResponse("SSH-2.0-OpenSSH_9.6\r\n", 80).has_value());
    }
}

TEST_CASE("HttpDetector probes configured ports", "[HttpDetector]") {
    AsioContext asio(2);
    asio.start();
    TcpProbe probe(asio);

    LoopbackServer server("HTTP/1.1 200 OK\r\nServer: nginx/1.24.0\r\nContent-Length: 0\r\n\r\n");

    PortDetectionOptions options;
    options.portConnectionTimeoutMs = 500;

    SECTION("A server on a later port is found") {
        options.customIoTPorts = {closedLoopbackPort()};
        options.standardHttpPorts = {server.port()};

        HttpDetector detector(probe, options);
        REQUIRE(detector.detectDeviceType("127.0.0.1", {}) == "Linux Server (HTTP)");
        REQUIRE(server.lastRequest().rfind("HEAD / HTTP/1.1\r\n", 0) == 0);
    }

    SECTION("No listening ports yields nothing") {
        options.customIoTPorts = {closedLoopbackPort()};
        options.standardHttpPorts.clear();

        HttpDetector detector(probe, options);
        REQUIRE_FALSE(detector.detectDeviceType("127.0.0.1", {}).has_value());
    }

    asio.stop();
}
