#include <catch2/catch_test_macros.hpp>

#include "infrastructure/detection/DetectorChain.hpp"
#include "support/Fakes.hpp"

using namespace lanscout::infra;
using lanscout::test::FakeDetector;

TEST_CASE("DetectorChain orders detectors by priority", "[DetectorChain]") {
    auto low = std::make_shared<FakeDetector>("low", 10, "Low Label");
    auto high = std::make_shared<FakeDetector>("high", 90, "High Label");
    auto mid = std::make_shared<FakeDetector>("mid", 50, "Mid Label");

    DetectorChain chain;
    chain.add(low);
    chain.add(high);
    chain.add(mid);

    SECTION("Highest priority answers first and stops the chain") {
        REQUIRE(chain.classify("192.168.1.10") == "High Label");
        REQUIRE(high->calls() == 1);
        REQUIRE(mid->calls() == 0);
        REQUIRE(low->calls() == 0);
    }

    SECTION("detectors() reports descending priority") {
        auto ordered = chain.detectors();
        REQUIRE(ordered.size() == 3);
        REQUIRE(ordered[0]->name() == "high");
        REQUIRE(ordered[1]->name() == "mid");
        REQUIRE(ordered[2]->name() == "low");
    }
}

TEST_CASE("DetectorChain falls through on no match", "[DetectorChain]") {
    auto none = std::make_shared<FakeDetector>("none", 90, std::nullopt);
    auto empty = std::make_shared<FakeDetector>("empty", 80, std::string());
    auto answer = std::make_shared<FakeDetector>("answer", 40, "Linux/Unix (SSH)");

    DetectorChain chain({none, empty, answer});

    REQUIRE(chain.classify("192.168.1.10") == "Linux/Unix (SSH)");
    REQUIRE(none->calls() == 1);
    REQUIRE(empty->calls() == 1);
    REQUIRE(answer->calls() == 1);
}

TEST_CASE("DetectorChain isolates failing detectors", "[DetectorChain]") {
    auto failing = std::make_shared<FakeDetector>("failing", 90, "never", true);
    auto fallback = std::make_shared<FakeDetector>("fallback", 10, "Windows Client (SMB)");

    DetectorChain chain({failing, fallback});

    REQUIRE(chain.classify("192.168.1.10") == "Windows Client (SMB)");
    REQUIRE(failing->calls() == 1);
}

TEST_CASE("DetectorChain isolates detectors throwing non-standard values", "[DetectorChain]") {
    auto odd = std::make_shared<FakeDetector>("odd", 90, "never");
    odd->throwNonStandard();
    auto http = std::make_shared<FakeDetector>("http", 50, "Linux Server (HTTP)");

    DetectorChain chain({odd, http});

    std::optional<std::string> label;
    REQUIRE_NOTHROW(label = chain.classify("192.168.1.10"));
    REQUIRE(label == "Linux Server (HTTP)");
    REQUIRE(odd->calls() == 1);
    REQUIRE(http->calls() == 1);
}

TEST_CASE("DetectorChain keeps registration order for equal priorities", "[DetectorChain]") {
    auto first = std::make_shared<FakeDetector>("first", 50, "First");
    auto second = std::make_shared<FakeDetector>("second", 50, "Second");

    DetectorChain chain;
    chain.add(first);
    chain.add(second);

    REQUIRE(chain.classify("192.168.1.10") == "First");
    REQUIRE(second->calls() == 0);
}

TEST_CASE("DetectorChain edge cases", "[DetectorChain]") {
    SECTION("An empty chain classifies nothing") {
        DetectorChain chain;
        REQUIRE(chain.size() == 0);
        REQUIRE_FALSE(chain.classify("192.168.1.10").has_value());
    }

    SECTION("Null detectors are ignored") {
        DetectorChain chain;
        chain.add(nullptr);
        REQUIRE(chain.size() == 0);
    }

    SECTION("A stopped token skips every detector") {
        auto detector = std::make_shared<FakeDetector>("d", 50, "Label");
        DetectorChain chain({detector});

        std::stop_source stop;
        stop.request_stop();

        REQUIRE_FALSE(chain.classify("192.168.1.10", stop.get_token()).has_value());
        REQUIRE(detector->calls() == 0);
    }
}
