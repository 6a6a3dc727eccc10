#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/TcpProbe.hpp"
#include "support/LoopbackServer.hpp"

#include <future>

using namespace lanscout::infra;
using lanscout::test::closedLoopbackPort;
using lanscout::test::LoopbackServer;
using namespace std::chrono_literals;

TEST_CASE("TcpProbe port checks", "[TcpProbe]") {
    AsioContext asio(2);
    asio.start();
    TcpProbe probe(asio);

    SECTION("Open loopback port is reported open") {
        LoopbackServer server("", false);
        REQUIRE(probe.isPortOpen("127.0.0.1", server.port(), 1000ms));
    }

    SECTION("Closed port is reported closed") {
        REQUIRE_FALSE(probe.isPortOpen("127.0.0.1", closedLoopbackPort(), 1000ms));
    }

    SECTION("Invalid addresses fail without connecting") {
        TcpRequest request;
        request.address = "not-an-ip";
        request.port = 80;

        auto result = probe.exchange(request);
        REQUIRE_FALSE(result.connected);
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.errorMessage.empty());
    }
}

TEST_CASE("TcpProbe exchanges", "[TcpProbe]") {
    AsioContext asio(2);
    asio.start();
    TcpProbe probe(asio);

    SECTION("Reads a banner without sending anything") {
        LoopbackServer server("SSH-2.0-OpenSSH_9.6\r\n", false);

        TcpRequest request;
        request.address = "127.0.0.1";
        request.port = server.port();
        request.maxResponseBytes = 256;

        auto result = probe.exchange(request);
        REQUIRE(result.connected);
        REQUIRE(result.success);
        REQUIRE(result.response == "SSH-2.0-OpenSSH_9.6\r\n");
    }

    SECTION("Writes the payload and reads until EOF") {
        LoopbackServer server("pong");

        TcpRequest request;
        request.address = "127.0.0.1";
        request.port = server.port();
        request.payload = "ping";
        request.maxResponseBytes = 1024;
        request.readUntilEof = true;

        auto result = probe.exchange(request);
        REQUIRE(result.success);
        REQUIRE(result.response == "pong");
        REQUIRE(server.lastRequest() == "ping");
    }

    SECTION("Responses are capped at maxResponseBytes") {
        LoopbackServer server(std::string(4096, 'x'), false);

        TcpRequest request;
        request.address = "127.0.0.1";
        request.port = server.port();
        request.maxResponseBytes = 100;
        request.readUntilEof = true;

        auto result = probe.exchange(request);
        REQUIRE(result.response.size() <= 100);
    }

    SECTION("A pre-stopped token cancels immediately") {
        std::stop_source stop;
        stop.request_stop();

        TcpRequest request;
        request.address = "127.0.0.1";
        request.port = closedLoopbackPort();

        auto result = probe.exchange(request, stop.get_token());
        REQUIRE_FALSE(result.connected);
        REQUIRE(result.errorMessage == "Cancelled");
    }

    SECTION("exchangeAsync reports exactly once") {
        LoopbackServer server("hello", false);

        TcpRequest request;
        request.address = "127.0.0.1";
        request.port = server.port();
        request.maxResponseBytes = 64;
        request.readUntilEof = true;

        std::atomic<int> callbacks{0};
        std::promise<TcpExchangeResult> done;
        auto cancel = probe.exchangeAsync(request, [&](TcpExchangeResult result) {
            if (++callbacks == 1) {
                done.set_value(std::move(result));
            }
        });

        auto result = done.get_future().get();
        cancel();
        std::this_thread::sleep_for(50ms);

        REQUIRE(result.response == "hello");
        REQUIRE(callbacks == 1);
    }

    asio.stop();
}
