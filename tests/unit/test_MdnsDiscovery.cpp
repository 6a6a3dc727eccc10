#include <catch2/catch_test_macros.hpp>

#include "infrastructure/detection/MdnsDiscovery.hpp"
#include "support/DnsBuilder.hpp"

#include <algorithm>

using namespace lanscout::infra;
using lanscout::test::DnsBuilder;
using namespace std::chrono_literals;

namespace {

DnsMessage parse(const DnsBuilder& builder) {
    auto bytes = builder.build();
    return DnsMessage::parse(bytes.data(), bytes.size());
}

} // namespace

TEST_CASE("MdnsDiscovery service tables", "[MdnsDiscovery]") {
    const auto& types = MdnsDiscovery::serviceTypes();

    REQUIRE(types.size() == 25);
    REQUIRE(std::all_of(types.begin(), types.end(), [](const std::string& type) {
        return type.front() == '_' && type.ends_with("._tcp.local");
    }));

    REQUIRE(MdnsDiscovery::serviceHint("_ipp._tcp.local") == std::nullopt);
    REQUIRE(MdnsDiscovery::serviceHint("_printer._tcp.local") == "Printer");
    REQUIRE(MdnsDiscovery::serviceHint("_googlecast._tcp.local") == "Chromecast");
    REQUIRE(MdnsDiscovery::serviceHint("_hap._tcp.local") == "HomeKit Device");
    REQUIRE(MdnsDiscovery::serviceHint("_https._tcp.local") == "Web Server");
    REQUIRE(MdnsDiscovery::serviceHint("_sftp-ssh._tcp.local") == "SSH Server");
}

TEST_CASE("MdnsDiscovery extracts labels", "[MdnsDiscovery]") {
    SECTION("Instance name, service hint and SRV host address") {
        DnsBuilder builder;
        builder.ptr("_googlecast._tcp.local", "Kitchen Speaker._googlecast._tcp.local")
            .srv("Kitchen Speaker._googlecast._tcp.local", "speaker-1.local", 8009)
            .a("speaker-1.local", {192, 168, 1, 31})
            .a("other.local", {192, 168, 1, 99});

        auto labels = MdnsDiscovery::extractLabels(parse(builder), "192.168.1.200");

        REQUIRE(labels.size() == 1);
        REQUIRE(labels[0].first == "192.168.1.31");
        REQUIRE(labels[0].second == "Kitchen Speaker - Chromecast (mDNS)");
    }

    SECTION("Without a hint the SRV host describes the device") {
        DnsBuilder builder;
        builder.ptr("_ipp._tcp.local", "Office._ipp._tcp.local")
            .srv("Office._ipp._tcp.local", "brother-hl.local", 631)
            .a("brother-hl.local", {192, 168, 1, 20});

        auto labels = MdnsDiscovery::extractLabels(parse(builder), "192.168.1.20");

        REQUIRE(labels.size() == 1);
        REQUIRE(labels[0].second == "Office - brother-hl (mDNS)");
    }

    SECTION("Without SRV every A record is labelled") {
        DnsBuilder builder;
        builder.ptr("_http._tcp.local", "Dashboard._http._tcp.local")
            .a("dash.local", {192, 168, 1, 40})
            .a("dash.local", {192, 168, 1, 41});

        auto labels = MdnsDiscovery::extractLabels(parse(builder), "192.168.1.200");

        REQUIRE(labels.size() == 2);
        REQUIRE(labels[0].first == "192.168.1.40");
        REQUIRE(labels[1].first == "192.168.1.41");
        REQUIRE(labels[1].second == "Dashboard - Web Server (mDNS)");
    }

    SECTION("Without addresses the sender is labelled") {
        DnsBuilder builder;
        builder.ptr("_hue._tcp.local", "Hue Bridge._hue._tcp.local");

        auto labels = MdnsDiscovery::extractLabels(parse(builder), "192.168.1.77");

        REQUIRE(labels.size() == 1);
        REQUIRE(labels[0].first == "192.168.1.77");
        REQUIRE(labels[0].second == "Hue Bridge - Philips Hue (mDNS)");
    }

    SECTION("Service enumeration answers and non-service PTRs are skipped") {
        DnsBuilder builder;
        builder.ptr("_services._dns-sd._udp.local", "_http._tcp.local")
            .ptr("20.1.168.192.in-addr.arpa", "printer.local");

        REQUIRE(MdnsDiscovery::extractLabels(parse(builder), "192.168.1.20").empty());
    }
}

TEST_CASE("MdnsDiscovery caches labels from datagrams", "[MdnsDiscovery]") {
    AsioContext asio(1);
    auto cache = std::make_shared<PassiveDiscoveryCache>(30min);
    auto discovery = std::make_shared<MdnsDiscovery>(asio, cache);

    SECTION("Responses are stored") {
        DnsBuilder builder;
        builder.ptr("_airplay._tcp.local", "Apple TV._airplay._tcp.local")
            .srv("Apple TV._airplay._tcp.local", "apple-tv.local", 7000)
            .a("apple-tv.local", {192, 168, 1, 60});
        auto bytes = builder.build();

        discovery->handleDatagram(bytes.data(), bytes.size(), "192.168.1.60");

        REQUIRE(cache->find("192.168.1.60") == "Apple TV - AirPlay Device (mDNS)");
    }

    SECTION("The more descriptive label is kept") {
        DnsBuilder detailed;
        detailed.ptr("_airplay._tcp.local", "Apple TV._airplay._tcp.local")
            .a("apple-tv.local", {192, 168, 1, 60});
        DnsBuilder vague;
        vague.ptr("_rfb._tcp.local", "x._rfb._tcp.local").a("apple-tv.local", {192, 168, 1, 60});

        auto first = detailed.build();
        auto second = vague.build();
        discovery->handleDatagram(first.data(), first.size(), "192.168.1.60");
        discovery->handleDatagram(second.data(), second.size(), "192.168.1.60");

        REQUIRE(cache->find("192.168.1.60") == "Apple TV - AirPlay Device (mDNS)");
    }

    SECTION("Queries and malformed datagrams are ignored") {
        auto query = DnsMessage::buildQuery({"_http._tcp.local"}, dns::TYPE_PTR, false);
        discovery->handleDatagram(query.data(), query.size(), "192.168.1.5");

        std::vector<uint8_t> junk{0x01, 0x02, 0x03};
        discovery->handleDatagram(junk.data(), junk.size(), "192.168.1.6");

        REQUIRE(cache->size() == 0);
    }
}

TEST_CASE("MdnsDiscovery close completes synchronously", "[MdnsDiscovery]") {
    AsioContext asio(2);
    asio.start();
    auto cache = std::make_shared<PassiveDiscoveryCache>(30min);
    auto discovery = std::make_shared<MdnsDiscovery>(asio, cache);

    REQUIRE(discovery->start());
    REQUIRE(discovery->isOpen());

    discovery->close();
    REQUIRE_FALSE(discovery->isOpen());

    asio.stop();
}
