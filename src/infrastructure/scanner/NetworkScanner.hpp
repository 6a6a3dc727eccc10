/**
 * @file NetworkScanner.hpp
 * @brief Subnet sweeps, classification and the background scan scheduler.
 */

#pragma once

#include "core/services/IHostnameResolver.hpp"
#include "core/services/IMacAddressResolver.hpp"
#include "core/services/INetworkScanner.hpp"
#include "core/services/IPingProbe.hpp"
#include "core/services/ISubnetProvider.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/detection/DetectorChain.hpp"
#include "infrastructure/network/IpRange.hpp"
#include "infrastructure/scanner/DeviceTable.hpp"
#include "infrastructure/scanner/ScanEventHub.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <thread>

namespace lanscout::infra {

/**
 * @brief Sweeps a /24 range with bounded concurrency and keeps the device table.
 *
 * Each address is pinged; responders are named, classified by the detector
 * chain and upserted. Addresses are processed on dedicated worker threads,
 * at most ScannerOptions::maxConcurrentConnections at a time.
 *
 * Background scanning runs sweeps on a scheduler thread every
 * ScannerOptions::scanIntervalMinutes. Pausing cancels the probes of the sweep
 * in progress (nothing partial is committed for them) and holds off the next
 * sweep until resumed.
 */
class NetworkScanner : public core::INetworkScanner {
public:
    /**
     * @brief Collaborators. The ping probe and subnet provider are required;
     *        the others may be null.
     */
    struct Dependencies {
        std::shared_ptr<core::IPingProbe> pingProbe;
        std::shared_ptr<DetectorChain> detectorChain;
        std::shared_ptr<core::ISubnetProvider> subnetProvider;
        std::shared_ptr<core::IHostnameResolver> hostnameResolver;
        std::shared_ptr<core::IMacAddressResolver> macResolver;
    };

    /**
     * @throws core::ConfigurationError for invalid options or missing collaborators.
     */
    NetworkScanner(core::ScannerOptions options, Dependencies dependencies);
    ~NetworkScanner() override;

    NetworkScanner(const NetworkScanner&) = delete;
    NetworkScanner& operator=(const NetworkScanner&) = delete;

    std::vector<core::NetworkDevice> scanNetwork() override;
    std::vector<core::NetworkDevice> scanSingleDevice(const std::string& address) override;

    void startScanning() override;
    void pauseScanning() override;
    void resumeScanning() override;
    void stopScanning() override;

    [[nodiscard]] bool isScanning() const override { return scanning_.load(); }
    [[nodiscard]] core::ScannerState state() const override { return state_.load(); }
    [[nodiscard]] std::optional<TimePoint> lastScanTime() const override;
    [[nodiscard]] std::optional<TimePoint> nextScanTime() const override;
    [[nodiscard]] std::vector<core::NetworkDevice> discoveredDevices() const override;

    int64_t subscribe(core::ScanEventType type, EventCallback callback) override;
    void unsubscribe(int64_t subscriptionId) override;

    /**
     * @brief Seeds the table with persisted devices (all start offline).
     */
    size_t restoreDevices(const std::vector<core::NetworkDevice>& devices);

    /**
     * @brief Prunes a stale entry.
     */
    bool removeDevice(const std::string& address);

    /**
     * @brief Waits until every queued event has been delivered.
     */
    void flushEvents();

    [[nodiscard]] const core::ScannerOptions& options() const { return options_; }

private:
    struct SweepOutcome {
        bool completed{false};
        std::set<std::string> seenOnline;
    };

    SweepOutcome sweep(const IpRange& range, std::stop_token stopToken);
    bool processAddress(const std::string& address, std::stop_token stopToken,
                        bool createWhenOffline);
    DeviceObservation observe(const std::string& address, std::chrono::microseconds rtt,
                              std::stop_token stopToken);

    std::stop_token beginSweep();
    void cancelSweep();

    void schedulerLoop(std::stop_token stopToken);
    void runScheduledSweep();
    void setNextScanTime(std::optional<TimePoint> time);

    void publishProgress(const std::string& message);
    void publishDevice(const core::NetworkDevice& device);
    void publishScanning(bool scanning);

    core::ScannerOptions options_;
    Dependencies deps_;
    DeviceTable table_;
    ScanEventHub events_;

    std::atomic<bool> scanning_{false};
    std::atomic<core::ScannerState> state_{core::ScannerState::Stopped};

    mutable std::mutex timesMutex_;
    std::optional<TimePoint> lastScanTime_;
    std::optional<TimePoint> nextScanTime_;

    std::mutex sweepMutex_;
    std::stop_source sweepStop_;
    std::stop_source shutdown_;

    std::mutex schedulerMutex_;
    std::condition_variable_any schedulerWake_;
    bool wakeRequested_{false};
    std::chrono::steady_clock::time_point nextDue_;
    std::jthread scheduler_;
};

} // namespace lanscout::infra
