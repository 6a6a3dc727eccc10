#include "infrastructure/detection/ServiceEndpointDetector.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

ServiceEndpointDetector::ServiceEndpointDetector(TcpProbe& probe,
                                                 core::PortDetectionOptions options)
    : probe_(probe), options_(std::move(options)) {}

std::optional<std::string> ServiceEndpointDetector::detectDeviceType(const std::string& address,
                                                                     std::stop_token stopToken) {
    for (const auto& endpoint : options_.serviceEndpoints) {
        if (stopToken.stop_requested()) {
            return std::nullopt;
        }

        try {
            if (probe_.isPortOpen(address, endpoint.port, options_.connectionTimeout(),
                                  stopToken)) {
                spdlog::debug("Service endpoint {} open on {}", endpoint.port, address);
                return endpoint.label;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Service endpoint probe {}:{} failed: {}", address, endpoint.port,
                          e.what());
        }
    }

    return std::nullopt;
}

} // namespace lanscout::infra
