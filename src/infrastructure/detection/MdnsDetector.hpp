#pragma once

#include "core/services/IDeviceTypeDetector.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/detection/DiscoveryState.hpp"
#include "infrastructure/detection/MdnsDiscovery.hpp"
#include "infrastructure/detection/PassiveDiscoveryCache.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace lanscout::infra {

/**
 * @brief Labels devices from DNS-SD announcements gathered over multicast DNS.
 *
 * Lookups hit the cache first. A miss re-sends the query round (no more often
 * than the re-query interval) and waits up to the grace period.
 */
class MdnsDetector : public core::IDeviceTypeDetector {
public:
    static constexpr int PRIORITY = 85;

    MdnsDetector(AsioContext& context, const core::DetectorOptions& options);
    ~MdnsDetector() override;

    MdnsDetector(const MdnsDetector&) = delete;
    MdnsDetector& operator=(const MdnsDetector&) = delete;

    [[nodiscard]] int priority() const override { return PRIORITY; }
    [[nodiscard]] std::string name() const override { return "mdns"; }

    std::optional<std::string> detectDeviceType(const std::string& address,
                                                std::stop_token stopToken) override;

    /**
     * @brief Starts the mDNS listener. Idempotent.
     */
    void startDiscovery();

    [[nodiscard]] DiscoveryState state() const { return state_.load(); }

    [[nodiscard]] const std::shared_ptr<PassiveDiscoveryCache>& cache() const { return cache_; }

private:
    std::shared_ptr<PassiveDiscoveryCache> cache_;
    std::shared_ptr<MdnsDiscovery> discovery_;
    std::chrono::milliseconds gracePeriod_;
    std::chrono::seconds requeryInterval_;
    std::mutex startMutex_;
    std::atomic<DiscoveryState> state_{DiscoveryState::NotStarted};
};

} // namespace lanscout::infra
