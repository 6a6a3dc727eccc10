#pragma once

#include "core/services/IDeviceTypeDetector.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/detection/DiscoveryState.hpp"
#include "infrastructure/detection/PassiveDiscoveryCache.hpp"
#include "infrastructure/detection/SsdpDiscovery.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace lanscout::infra {

/**
 * @brief Highest-priority detector: labels devices from UPnP descriptions
 *        collected by a background SSDP listener.
 *
 * The first lookup starts discovery. On a cache miss an M-SEARCH is re-sent
 * (at most once per grace period) and the lookup waits up to the grace period
 * for the address to be announced.
 */
class UpnpDetector : public core::IDeviceTypeDetector {
public:
    static constexpr int PRIORITY = 90;

    UpnpDetector(AsioContext& context, HttpClient& httpClient,
                 const core::DetectorOptions& options);
    ~UpnpDetector() override;

    UpnpDetector(const UpnpDetector&) = delete;
    UpnpDetector& operator=(const UpnpDetector&) = delete;

    [[nodiscard]] int priority() const override { return PRIORITY; }
    [[nodiscard]] std::string name() const override { return "upnp"; }

    std::optional<std::string> detectDeviceType(const std::string& address,
                                                std::stop_token stopToken) override;

    /**
     * @brief Starts the SSDP listener. Idempotent.
     */
    void startDiscovery();

    [[nodiscard]] DiscoveryState state() const { return state_.load(); }

    [[nodiscard]] const std::shared_ptr<PassiveDiscoveryCache>& cache() const { return cache_; }

private:
    std::shared_ptr<PassiveDiscoveryCache> cache_;
    std::shared_ptr<SsdpDiscovery> discovery_;
    std::chrono::milliseconds gracePeriod_;
    std::mutex startMutex_;
    std::atomic<DiscoveryState> state_{DiscoveryState::NotStarted};
};

} // namespace lanscout::infra
