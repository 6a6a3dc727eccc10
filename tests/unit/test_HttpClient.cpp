#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "support/LoopbackServer.hpp"

using namespace lanscout::infra;
using lanscout::test::closedLoopbackPort;
using lanscout::test::LoopbackServer;
using namespace std::chrono_literals;

TEST_CASE("HttpUrl parsing", "[HttpClient]") {
    SECTION("Host, port and path") {
        auto url = HttpUrl::parse("http://192.168.1.40:49152/description.xml");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "192.168.1.40");
        REQUIRE(url->port == 49152);
        REQUIRE(url->path == "/description.xml");
    }

    SECTION("Defaults to port 80 and root path") {
        auto url = HttpUrl::parse("http://router.local");
        REQUIRE(url.has_value());
        REQUIRE(url->host == "router.local");
        REQUIRE(url->port == 80);
        REQUIRE(url->path == "/");
    }

    SECTION("Rejects other schemes and bad ports") {
        REQUIRE_FALSE(HttpUrl::parse("https://192.168.1.1/").has_value());
        REQUIRE_FALSE(HttpUrl::parse("http://192.168.1.1:0/").has_value());
        REQUIRE_FALSE(HttpUrl::parse("http://192.168.1.1:99999/").has_value());
        REQUIRE_FALSE(HttpUrl::parse("http://:80/").has_value());
    }
}

TEST_CASE("HttpResponse parsing", "[HttpClient]") {
    SECTION("Status, lower-cased headers and body") {
        auto response = HttpResponse::parse(
            "HTTP/1.1 200 OK\r\nServer: nginx/1.24\r\nContent-Length: 5\r\n\r\nhello trailing");

        REQUIRE(response.success);
        REQUIRE(response.statusCode == 200);
        REQUIRE(response.header("server") == "nginx/1.24");
        REQUIRE(response.header("SERVER") == "nginx/1.24");
        REQUIRE(response.body == "hello");
    }

    SECTION("Chunked bodies are decoded") {
        auto response = HttpResponse::parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                                            "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");

        REQUIRE(response.success);
        REQUIRE(response.body == "hello world");
    }

    SECTION("Garbage is not a response") {
        auto response = HttpResponse::parse("SSH-2.0-OpenSSH_9.6\r\n");
        REQUIRE_FALSE(response.success);
        REQUIRE_FALSE(response.errorMessage.empty());
    }
}

TEST_CASE("HttpClient GET over loopback", "[HttpClient]") {
    AsioContext asio(2);
    asio.start();
    TcpProbe probe(asio);
    HttpClient client(probe);

    SECTION("Fetches a document") {
        LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Type: text/xml\r\n\r\n<root/>");

        auto url = "http://127.0.0.1:" + std::to_string(server.port()) + "/desc.xml";
        auto response = client.get(url, 2000ms);

        REQUIRE(response.success);
        REQUIRE(response.statusCode == 200);
        REQUIRE(response.body == "<root/>");
        REQUIRE(server.lastRequest().rfind("GET /desc.xml HTTP/1.1\r\n", 0) == 0);
    }

    SECTION("Connection refused is reported") {
        auto url = "http://127.0.0.1:" + std::to_string(closedLoopbackPort()) + "/";
        auto response = client.get(url, 1000ms);

        REQUIRE_FALSE(response.success);
        REQUIRE_FALSE(response.errorMessage.empty());
    }

    SECTION("Hostnames are not resolved") {
        auto response = client.get("http://printer.local/desc.xml", 1000ms);
        REQUIRE_FALSE(response.success);
    }

    asio.stop();
}
