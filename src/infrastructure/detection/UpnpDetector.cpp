#include "infrastructure/detection/UpnpDetector.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

UpnpDetector::UpnpDetector(AsioContext& context, HttpClient& httpClient,
                           const core::DetectorOptions& options)
    : cache_(std::make_shared<PassiveDiscoveryCache>(
          std::chrono::minutes(options.passiveCacheTtlMinutes))),
      gracePeriod_(options.upnpGracePeriodMs) {
    SsdpDiscovery::Settings settings;
    settings.searchInterval = std::chrono::seconds(options.ssdpSearchIntervalSeconds);
    discovery_ = std::make_shared<SsdpDiscovery>(context, httpClient, cache_, settings);
}

UpnpDetector::~UpnpDetector() {
    discovery_->close();
}

void UpnpDetector::startDiscovery() {
    std::lock_guard lock(startMutex_);
    if (state_ != DiscoveryState::NotStarted) {
        return;
    }
    state_ = discovery_->start() ? DiscoveryState::Listening : DiscoveryState::Degraded;
}

std::optional<std::string> UpnpDetector::detectDeviceType(const std::string& address,
                                                          std::stop_token stopToken) {
    try {
        if (auto label = cache_->find(address)) {
            return label;
        }

        startDiscovery();
        if (state_ == DiscoveryState::Degraded || stopToken.stop_requested()) {
            return std::nullopt;
        }

        discovery_->sendSearchIfIdle(gracePeriod_);
        return cache_->waitFor(address, gracePeriod_, stopToken);
    } catch (const std::exception& e) {
        spdlog::debug("UPnP detection for {} failed: {}", address, e.what());
        return std::nullopt;
    }
}

} // namespace lanscout::infra
