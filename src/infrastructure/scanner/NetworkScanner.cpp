#include "infrastructure/scanner/NetworkScanner.hpp"

#include "core/types/ConfigurationError.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <semaphore>

namespace lanscout::infra {

namespace {

class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<>& slots) : slots_(slots) {}
    ~SlotGuard() { slots_.release(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::counting_semaphore<>& slots_;
};

void sleepFor(std::chrono::milliseconds duration, std::stop_token stopToken) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stopToken, duration, [] { return false; });
}

} // namespace

NetworkScanner::NetworkScanner(core::ScannerOptions options, Dependencies dependencies)
    : options_(std::move(options)), deps_(std::move(dependencies)) {
    options_.validate();
    if (!deps_.pingProbe) {
        throw core::ConfigurationError("NetworkScanner requires a ping probe");
    }
    if (!deps_.subnetProvider) {
        throw core::ConfigurationError("NetworkScanner requires a subnet provider");
    }
    if (!deps_.detectorChain) {
        deps_.detectorChain = std::make_shared<DetectorChain>();
    }
}

NetworkScanner::~NetworkScanner() {
    stopScanning();
    shutdown_.request_stop();
    cancelSweep();
}

std::stop_token NetworkScanner::beginSweep() {
    std::lock_guard lock(sweepMutex_);
    sweepStop_ = std::stop_source();
    return sweepStop_.get_token();
}

void NetworkScanner::cancelSweep() {
    std::lock_guard lock(sweepMutex_);
    sweepStop_.request_stop();
}

std::vector<core::NetworkDevice> NetworkScanner::scanNetwork() {
    if (scanning_.exchange(true)) {
        spdlog::info("Scan already in progress, returning current devices");
        return table_.snapshot();
    }

    struct ScanningReset {
        NetworkScanner& scanner;
        ~ScanningReset() {
            scanner.scanning_ = false;
            scanner.publishScanning(false);
        }
    } reset{*this};

    publishScanning(true);
    publishProgress("Starting network scan...");

    std::optional<IpRange> range;
    try {
        range.emplace(IpRangeEnumerator::resolve(options_.subnetBase, options_.startIp,
                                                 options_.endIp, *deps_.subnetProvider));
    } catch (const core::ConfigurationError& e) {
        spdlog::error("Cannot start scan: {}", e.what());
        publishProgress(std::string("Error: ") + e.what());
        throw;
    }

    spdlog::info("Scanning {}.{}-{} ({} addresses, {} concurrent)", range->base(),
                 range->startOctet(), range->endOctet(), range->size(),
                 options_.maxConcurrentConnections);
    publishProgress("Scanning network " + range->base() + ".x...");

    auto stopToken = beginSweep();
    auto outcome = sweep(*range, stopToken);

    if (!outcome.completed) {
        spdlog::info("Scan cancelled");
        publishProgress("Scan cancelled");
        return table_.snapshot();
    }

    for (const auto& device : table_.markOfflineExcept(outcome.seenOnline)) {
        publishDevice(device);
    }

    auto now = std::chrono::system_clock::now();
    {
        std::lock_guard lock(timesMutex_);
        lastScanTime_ = now;
    }
    core::ScanEvent lastScan;
    lastScan.type = core::ScanEventType::LastScanTimeChanged;
    lastScan.time = now;
    events_.publish(std::move(lastScan));

    auto online = table_.onlineCount();
    auto offline = table_.size() - online;
    spdlog::info("Scan complete: {} online, {} offline", online, offline);
    publishProgress("Scan complete - found " + std::to_string(online) + " online devices, " +
                    std::to_string(offline) + " offline");

    return table_.snapshot();
}

std::vector<core::NetworkDevice> NetworkScanner::scanSingleDevice(const std::string& address) {
    if (!IpRangeEnumerator::isValidIpv4(address)) {
        spdlog::warn("Rejecting single-device scan of '{}': not an IPv4 address", address);
        publishProgress("Error: Invalid IP address format");
        return {};
    }

    publishProgress("Scanning device " + address + "...");
    processAddress(address, shutdown_.get_token(), true);

    auto device = table_.find(address);
    if (!device) {
        return {};
    }

    publishProgress("Device " + address + (device->isOnline ? " is online" : " is offline"));
    return {*device};
}

NetworkScanner::SweepOutcome NetworkScanner::sweep(const IpRange& range,
                                                   std::stop_token stopToken) {
    SweepOutcome outcome;
    std::mutex seenMutex;
    std::counting_semaphore<> slots(options_.maxConcurrentConnections);
    std::vector<std::future<void>> workers;
    workers.reserve(range.size());

    size_t dispatched = 0;
    for (auto address : range) {
        if (stopToken.stop_requested()) {
            break;
        }

        slots.acquire();
        if (stopToken.stop_requested()) {
            slots.release();
            break;
        }

        workers.push_back(std::async(
            std::launch::async, [this, address, stopToken, &slots, &seenMutex, &outcome]() {
                SlotGuard guard(slots);
                if (processAddress(address, stopToken, false)) {
                    std::lock_guard lock(seenMutex);
                    outcome.seenOnline.insert(address);
                }
            }));

        ++dispatched;
        if (options_.networkThrottleDelayMs > 0 &&
            dispatched % static_cast<size_t>(options_.devicesBeforeThrottle) == 0) {
            sleepFor(std::chrono::milliseconds(options_.networkThrottleDelayMs), stopToken);
        }
    }

    for (auto& worker : workers) {
        worker.get();
    }

    outcome.completed = !stopToken.stop_requested() && dispatched == range.size();
    return outcome;
}

DeviceObservation NetworkScanner::observe(const std::string& address,
                                          std::chrono::microseconds rtt,
                                          std::stop_token stopToken) {
    DeviceObservation observation;
    observation.responseTime = rtt;

    if (options_.resolveHostnames && deps_.hostnameResolver) {
        observation.name = deps_.hostnameResolver->resolveHostname(address);
    }
    if (options_.resolveMacAddresses && deps_.macResolver) {
        observation.macAddress = deps_.macResolver->getMacAddress(address);
    }

    observation.type = deps_.detectorChain->classify(address, stopToken);
    return observation;
}

bool NetworkScanner::processAddress(const std::string& address, std::stop_token stopToken,
                                    bool createWhenOffline) {
    try {
        auto ping = deps_.pingProbe->probe(address, options_.pingTimeout(), stopToken);
        if (stopToken.stop_requested()) {
            return false;
        }

        if (!ping.success) {
            spdlog::trace("{} unreachable: {}", address, ping.errorMessage);
            if (auto device = table_.markOffline(address)) {
                publishDevice(*device);
            } else if (createWhenOffline) {
                std::optional<std::string> name;
                if (options_.resolveHostnames && deps_.hostnameResolver) {
                    name = deps_.hostnameResolver->resolveHostname(address);
                }
                auto change = table_.ensure(address, name);
                if (change.created) {
                    publishDevice(change.device);
                }
            }
            publishProgress(address + " is offline");
            return false;
        }

        auto observation = observe(address, ping.latency, stopToken);
        if (stopToken.stop_requested()) {
            return false;
        }

        auto change = table_.recordOnline(address, observation);
        if (change.changed) {
            spdlog::info("Device {} ({}) online: {}", change.device.address, change.device.name,
                         change.device.displayType());
            publishDevice(change.device);
        }
        publishProgress(address + " is online");
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Processing {} failed: {}", address, e.what());
    } catch (...) {
        spdlog::warn("Processing {} failed: unknown exception", address);
    }

    if (auto device = table_.markOffline(address)) {
        publishDevice(*device);
    }
    return false;
}

void NetworkScanner::startScanning() {
    {
        std::lock_guard lock(schedulerMutex_);
        if (state_ != core::ScannerState::Stopped) {
            spdlog::debug("Background scanning already started");
            return;
        }
        state_ = core::ScannerState::Running;
        wakeRequested_ = true;
    }

    scheduler_ = std::jthread([this](std::stop_token stopToken) { schedulerLoop(stopToken); });
    spdlog::info("Background scanning started (every {} min)", options_.scanIntervalMinutes);
}

void NetworkScanner::pauseScanning() {
    {
        std::lock_guard lock(schedulerMutex_);
        if (state_ != core::ScannerState::Running) {
            return;
        }
        state_ = core::ScannerState::Paused;
    }

    cancelSweep();
    schedulerWake_.notify_all();
    setNextScanTime(std::nullopt);
    spdlog::info("Background scanning paused");
}

void NetworkScanner::resumeScanning() {
    {
        std::lock_guard lock(schedulerMutex_);
        if (state_ != core::ScannerState::Paused) {
            return;
        }
        state_ = core::ScannerState::Running;
        wakeRequested_ = true;
    }

    schedulerWake_.notify_all();
    spdlog::info("Background scanning resumed");
}

void NetworkScanner::stopScanning() {
    {
        std::lock_guard lock(schedulerMutex_);
        if (state_ == core::ScannerState::Stopped) {
            return;
        }
        state_ = core::ScannerState::Stopped;
    }

    cancelSweep();
    scheduler_.request_stop();
    schedulerWake_.notify_all();
    if (scheduler_.joinable() && scheduler_.get_id() != std::this_thread::get_id()) {
        scheduler_.join();
    }

    setNextScanTime(std::nullopt);
    spdlog::info("Background scanning stopped");
}

void NetworkScanner::schedulerLoop(std::stop_token stopToken) {
    while (!stopToken.stop_requested()) {
        {
            std::unique_lock lock(schedulerMutex_);
            while (!stopToken.stop_requested()) {
                bool running = state_ == core::ScannerState::Running;
                if (running && (wakeRequested_ || std::chrono::steady_clock::now() >= nextDue_)) {
                    break;
                }
                if (running) {
                    schedulerWake_.wait_until(lock, stopToken, nextDue_, [this] {
                        return wakeRequested_ || state_ != core::ScannerState::Running;
                    });
                } else {
                    schedulerWake_.wait(lock, stopToken,
                                        [this] { return state_ == core::ScannerState::Running; });
                }
            }
            if (stopToken.stop_requested()) {
                return;
            }
            wakeRequested_ = false;
        }

        runScheduledSweep();

        std::lock_guard lock(schedulerMutex_);
        nextDue_ = std::chrono::steady_clock::now() + options_.scanInterval();
        if (state_ == core::ScannerState::Running) {
            setNextScanTime(std::chrono::system_clock::now() + options_.scanInterval());
        }
    }
}

void NetworkScanner::runScheduledSweep() {
    try {
        scanNetwork();
    } catch (const core::ConfigurationError& e) {
        spdlog::error("Scheduled scan skipped: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Scheduled scan failed: {}", e.what());
        publishProgress(std::string("Error: ") + e.what());
    } catch (...) {
        spdlog::error("Scheduled scan failed: unknown exception");
        publishProgress("Error: Scan failed");
    }
}

void NetworkScanner::setNextScanTime(std::optional<TimePoint> time) {
    {
        std::lock_guard lock(timesMutex_);
        nextScanTime_ = time;
    }

    core::ScanEvent event;
    event.type = core::ScanEventType::NextScanTimeChanged;
    event.time = time;
    events_.publish(std::move(event));
}

std::optional<NetworkScanner::TimePoint> NetworkScanner::lastScanTime() const {
    std::lock_guard lock(timesMutex_);
    return lastScanTime_;
}

std::optional<NetworkScanner::TimePoint> NetworkScanner::nextScanTime() const {
    std::lock_guard lock(timesMutex_);
    return nextScanTime_;
}

std::vector<core::NetworkDevice> NetworkScanner::discoveredDevices() const {
    return table_.snapshot();
}

int64_t NetworkScanner::subscribe(core::ScanEventType type, EventCallback callback) {
    return events_.subscribe(type, std::move(callback));
}

void NetworkScanner::unsubscribe(int64_t subscriptionId) {
    events_.unsubscribe(subscriptionId);
}

size_t NetworkScanner::restoreDevices(const std::vector<core::NetworkDevice>& devices) {
    auto restored = table_.restore(devices);
    spdlog::info("Restored {} known devices", restored);
    return restored;
}

bool NetworkScanner::removeDevice(const std::string& address) {
    return table_.remove(address);
}

void NetworkScanner::flushEvents() {
    events_.flush();
}

void NetworkScanner::publishProgress(const std::string& message) {
    core::ScanEvent event;
    event.type = core::ScanEventType::ScanProgress;
    event.message = message;
    events_.publish(std::move(event));
}

void NetworkScanner::publishDevice(const core::NetworkDevice& device) {
    core::ScanEvent event;
    event.type = core::ScanEventType::DeviceDiscovered;
    event.device = device;
    events_.publish(std::move(event));
}

void NetworkScanner::publishScanning(bool scanning) {
    core::ScanEvent event;
    event.type = core::ScanEventType::ScanningStateChanged;
    event.scanning = scanning;
    events_.publish(std::move(event));
}

} // namespace lanscout::infra
