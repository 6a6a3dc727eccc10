#include "infrastructure/detection/MdnsDetector.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

MdnsDetector::MdnsDetector(AsioContext& context, const core::DetectorOptions& options)
    : cache_(std::make_shared<PassiveDiscoveryCache>(
          std::chrono::minutes(options.passiveCacheTtlMinutes))),
      discovery_(std::make_shared<MdnsDiscovery>(context, cache_)),
      gracePeriod_(options.mdnsGracePeriodMs),
      requeryInterval_(options.mdnsRequeryIntervalSeconds) {}

MdnsDetector::~MdnsDetector() {
    discovery_->close();
}

void MdnsDetector::startDiscovery() {
    std::lock_guard lock(startMutex_);
    if (state_ != DiscoveryState::NotStarted) {
        return;
    }
    state_ = discovery_->start() ? DiscoveryState::Listening : DiscoveryState::Degraded;
}

std::optional<std::string> MdnsDetector::detectDeviceType(const std::string& address,
                                                          std::stop_token stopToken) {
    try {
        if (auto label = cache_->find(address)) {
            return label;
        }

        startDiscovery();
        if (state_ == DiscoveryState::Degraded || stopToken.stop_requested()) {
            return std::nullopt;
        }

        discovery_->sendQueriesIfIdle(requeryInterval_);
        return cache_->waitFor(address, gracePeriod_, stopToken);
    } catch (const std::exception& e) {
        spdlog::debug("mDNS detection for {} failed: {}", address, e.what());
        return std::nullopt;
    }
}

} // namespace lanscout::infra
