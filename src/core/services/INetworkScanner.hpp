/**
 * @file INetworkScanner.hpp
 * @brief Interface for the subnet sweep and background scan scheduler.
 */

#pragma once

#include "core/types/NetworkDevice.hpp"
#include "core/types/ScanEvent.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanscout::core {

/**
 * @brief Background scheduler state.
 */
enum class ScannerState { Stopped, Running, Paused };

/**
 * @brief Discovers and classifies devices on the local subnet.
 *
 * One-shot sweeps (scanNetwork, scanSingleDevice) may be issued at any time.
 * Background scanning repeats sweeps every configured interval until paused
 * or stopped. Subscribers are notified asynchronously and must not block.
 */
class INetworkScanner {
public:
    using EventCallback = std::function<void(const ScanEvent&)>;
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~INetworkScanner() = default;

    /**
     * @brief Sweeps the configured range once.
     * @return Snapshot of the device table after the sweep.
     * @throws ConfigurationError if the range cannot be resolved.
     */
    virtual std::vector<NetworkDevice> scanNetwork() = 0;

    /**
     * @brief Runs the sweep pipeline for one address.
     * @return The device entry, or an empty list for invalid input.
     */
    virtual std::vector<NetworkDevice> scanSingleDevice(const std::string& address) = 0;

    virtual void startScanning() = 0;
    virtual void pauseScanning() = 0;
    virtual void resumeScanning() = 0;
    virtual void stopScanning() = 0;

    [[nodiscard]] virtual bool isScanning() const = 0;
    [[nodiscard]] virtual ScannerState state() const = 0;
    [[nodiscard]] virtual std::optional<TimePoint> lastScanTime() const = 0;
    [[nodiscard]] virtual std::optional<TimePoint> nextScanTime() const = 0;

    /**
     * @brief Returns a copy of every known device.
     */
    [[nodiscard]] virtual std::vector<NetworkDevice> discoveredDevices() const = 0;

    /**
     * @brief Registers a handler for one kind of event.
     * @return Subscription identifier for unsubscribe().
     */
    virtual int64_t subscribe(ScanEventType type, EventCallback callback) = 0;

    virtual void unsubscribe(int64_t subscriptionId) = 0;
};

} // namespace lanscout::core
