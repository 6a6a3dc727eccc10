#include <catch2/catch_test_macros.hpp>

#include "infrastructure/scanner/NetworkScanner.hpp"
#include "support/EventRecorder.hpp"
#include "support/Fakes.hpp"

#include <functional>
#include <thread>

using namespace lanscout::core;
using namespace lanscout::infra;
using namespace lanscout::test;
using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

ScannerOptions backgroundOptions() {
    ScannerOptions options;
    options.subnetBase = "10.0.0";
    options.startIp = 1;
    options.endIp = 4;
    options.scanIntervalMinutes = 60;
    options.networkThrottleDelayMs = 0;
    options.resolveHostnames = false;
    options.resolveMacAddresses = false;
    return options;
}

NetworkScanner::Dependencies dependenciesWith(std::shared_ptr<FakePingProbe> ping) {
    NetworkScanner::Dependencies deps;
    deps.pingProbe = std::move(ping);
    deps.subnetProvider = std::make_shared<FakeSubnetProvider>();
    return deps;
}

} // namespace

TEST_CASE("Background scanning lifecycle", "[NetworkScanner][lifecycle]") {
    auto ping = std::make_shared<FakePingProbe>(std::set<std::string>{"10.0.0.2"});
    NetworkScanner scanner(backgroundOptions(), dependenciesWith(ping));
    EventRecorder recorder(scanner);

    REQUIRE(scanner.state() == ScannerState::Stopped);

    scanner.startScanning();
    REQUIRE(scanner.state() == ScannerState::Running);

    SECTION("The first sweep runs immediately and schedules the next one") {
        REQUIRE(waitUntil([&] { return scanner.nextScanTime().has_value(); }));
        REQUIRE(scanner.lastScanTime().has_value());
        REQUIRE(*scanner.nextScanTime() > *scanner.lastScanTime() + 59min);
        REQUIRE(scanner.discoveredDevices().size() == 1);

        scanner.flushEvents();
        REQUIRE_FALSE(recorder.events(ScanEventType::NextScanTimeChanged).empty());
        REQUIRE(recorder.events(ScanEventType::LastScanTimeChanged).size() == 1);
    }

    SECTION("Starting twice keeps a single scheduler") {
        REQUIRE(waitUntil([&] { return scanner.nextScanTime().has_value(); }));
        scanner.startScanning();
        std::this_thread::sleep_for(50ms);

        REQUIRE(ping->calls() == 4);
    }

    SECTION("Pause clears the next scan time and resume sweeps again") {
        REQUIRE(waitUntil([&] { return scanner.nextScanTime().has_value(); }));
        auto firstSweep = *scanner.lastScanTime();

        scanner.pauseScanning();
        REQUIRE(scanner.state() == ScannerState::Paused);
        REQUIRE_FALSE(scanner.nextScanTime().has_value());

        std::this_thread::sleep_for(20ms);
        scanner.resumeScanning();
        REQUIRE(scanner.state() == ScannerState::Running);

        REQUIRE(waitUntil([&] {
            auto last = scanner.lastScanTime();
            return last && *last > firstSweep && scanner.nextScanTime().has_value();
        }));
        REQUIRE(ping->calls() == 8);
    }

    SECTION("Stop ends the scheduler") {
        REQUIRE(waitUntil([&] { return scanner.nextScanTime().has_value(); }));

        scanner.stopScanning();
        REQUIRE(scanner.state() == ScannerState::Stopped);
        REQUIRE_FALSE(scanner.nextScanTime().has_value());
        REQUIRE_FALSE(scanner.isScanning());

        scanner.flushEvents();
        auto times = recorder.events(ScanEventType::NextScanTimeChanged);
        REQUIRE_FALSE(times.back().time.has_value());
    }

    scanner.stopScanning();
}

TEST_CASE("Pausing cancels the sweep in progress", "[NetworkScanner][lifecycle]") {
    auto ping = std::make_shared<FakePingProbe>(std::set<std::string>{"10.0.0.1", "10.0.0.4"},
                                                200ms);
    auto options = backgroundOptions();
    options.maxConcurrentConnections = 1;

    NetworkScanner scanner(options, dependenciesWith(ping));
    EventRecorder recorder(scanner);

    scanner.startScanning();
    REQUIRE(waitUntil([&] { return scanner.isScanning(); }));

    scanner.pauseScanning();
    REQUIRE(waitUntil([&] { return !scanner.isScanning(); }));
    scanner.flushEvents();

    SECTION("Nothing partial is committed") {
        REQUIRE_FALSE(scanner.lastScanTime().has_value());
        REQUIRE(ping->calls() < 4);
        REQUIRE(scanner.discoveredDevices().empty());
        REQUIRE(recorder.progressMessages().back() == "Scan cancelled");
        REQUIRE(recorder.events(ScanEventType::LastScanTimeChanged).empty());
    }

    SECTION("Manual sweeps still work while paused") {
        auto devices = scanner.scanNetwork();
        REQUIRE(devices.size() == 2);
        REQUIRE(scanner.lastScanTime().has_value());
        REQUIRE(scanner.state() == ScannerState::Paused);
    }

    scanner.stopScanning();
}

TEST_CASE("Pausing during classification commits nothing", "[NetworkScanner][lifecycle]") {
    auto ping = std::make_shared<FakePingProbe>(std::set<std::string>{"10.0.0.1"});
    auto slow = std::make_shared<FakeDetector>("slow", 90, "Linux Server (HTTP)");
    slow->setDelay(5000ms);

    auto options = backgroundOptions();
    options.maxConcurrentConnections = 1;

    auto deps = dependenciesWith(ping);
    deps.detectorChain = std::make_shared<DetectorChain>();
    deps.detectorChain->add(slow);

    NetworkScanner scanner(options, deps);
    EventRecorder recorder(scanner);

    scanner.startScanning();
    REQUIRE(waitUntil([&] { return slow->running(); }));

    scanner.pauseScanning();
    REQUIRE(waitUntil([&] { return !scanner.isScanning(); }));
    scanner.flushEvents();

    REQUIRE(scanner.discoveredDevices().empty());
    REQUIRE(recorder.events(ScanEventType::DeviceDiscovered).empty());
    REQUIRE(recorder.progressMessages().back() == "Scan cancelled");
    REQUIRE_FALSE(scanner.lastScanTime().has_value());

    scanner.stopScanning();
}

TEST_CASE("Destroying a running scanner stops it", "[NetworkScanner][lifecycle]") {
    auto ping = std::make_shared<FakePingProbe>(std::set<std::string>{}, 100ms);
    {
        NetworkScanner scanner(backgroundOptions(), dependenciesWith(ping));
        scanner.startScanning();
        REQUIRE(waitUntil([&] { return ping->calls() > 0; }));
    }
    REQUIRE(ping->calls() <= 4);
}
