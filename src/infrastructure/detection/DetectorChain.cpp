#include "infrastructure/detection/DetectorChain.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanscout::infra {

DetectorChain::DetectorChain(std::vector<DetectorPtr> detectors) {
    for (auto& detector : detectors) {
        add(std::move(detector));
    }
}

void DetectorChain::add(DetectorPtr detector) {
    if (!detector) {
        return;
    }

    std::lock_guard lock(mutex_);
    spdlog::debug("Registered detector '{}' with priority {}", detector->name(),
                  detector->priority());
    detectors_.push_back(std::move(detector));
    std::stable_sort(detectors_.begin(), detectors_.end(),
                     [](const DetectorPtr& a, const DetectorPtr& b) {
                         return a->priority() > b->priority();
                     });
}

std::optional<std::string> DetectorChain::classify(const std::string& address,
                                                   std::stop_token stopToken) const {
    auto ordered = detectors();

    for (const auto& detector : ordered) {
        if (stopToken.stop_requested()) {
            return std::nullopt;
        }

        try {
            auto label = detector->detectDeviceType(address, stopToken);
            if (label && !label->empty()) {
                spdlog::debug("{} classified by {}: {}", address, detector->name(), *label);
                return label;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Detector '{}' failed for {}: {}", detector->name(), address, e.what());
        } catch (...) {
            spdlog::warn("Detector '{}' failed for {}: unknown exception", detector->name(),
                         address);
        }
    }

    return std::nullopt;
}

std::vector<DetectorChain::DetectorPtr> DetectorChain::detectors() const {
    std::lock_guard lock(mutex_);
    return detectors_;
}

size_t DetectorChain::size() const {
    std::lock_guard lock(mutex_);
    return detectors_.size();
}

} // namespace lanscout::infra
