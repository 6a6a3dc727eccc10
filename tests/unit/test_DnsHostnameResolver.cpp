#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/DnsHostnameResolver.hpp"

using namespace lanscout::infra;

TEST_CASE("DnsHostnameResolver formats names", "[DnsHostnameResolver]") {
    SECTION("Single label names are upper-cased") {
        REQUIRE(DnsHostnameResolver::formatHostname("nas", "192.168.1.5") == "NAS");
    }

    SECTION("A descriptive domain label is appended") {
        REQUIRE(DnsHostnameResolver::formatHostname("desktop-42.corp.example.com.",
                                                    "192.168.1.5") == "DESKTOP-42 (corp)");
        REQUIRE(DnsHostnameResolver::formatHostname("printer.local", "192.168.1.5") ==
                "PRINTER (local)");
    }

    SECTION("Only domain labels longer than two characters are kept") {
        REQUIRE(DnsHostnameResolver::formatHostname("laptop.lan", "192.168.1.5") == "LAPTOP (lan)");
        REQUIRE(DnsHostnameResolver::formatHostname("laptop.fritz.box", "192.168.1.5") ==
                "LAPTOP (fritz)");
        REQUIRE(DnsHostnameResolver::formatHostname("laptop.ad.example", "192.168.1.5") ==
                "LAPTOP");
    }

    SECTION("Echoed addresses and empty names are not names") {
        REQUIRE_FALSE(DnsHostnameResolver::formatHostname("192.168.1.5", "192.168.1.5"));
        REQUIRE_FALSE(DnsHostnameResolver::formatHostname(".", "192.168.1.5"));
    }
}
