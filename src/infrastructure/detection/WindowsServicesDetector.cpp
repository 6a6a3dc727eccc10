#include "infrastructure/detection/WindowsServicesDetector.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

WindowsServicesDetector::WindowsServicesDetector(TcpProbe& probe,
                                                 core::PortDetectionOptions options)
    : probe_(probe), options_(std::move(options)) {}

std::string WindowsServicesDetector::classifyPort(const core::ServicePort& service) {
    switch (service.port) {
    case 3389:
    case 5985:
    case 5986:
        return "Windows Server (" + service.label + ")";
    default:
        return "Windows Client (" + service.label + ")";
    }
}

std::optional<std::string> WindowsServicesDetector::detectDeviceType(const std::string& address,
                                                                     std::stop_token stopToken) {
    for (const auto& service : options_.windowsServicePorts) {
        if (stopToken.stop_requested()) {
            return std::nullopt;
        }

        try {
            if (probe_.isPortOpen(address, service.port, options_.connectionTimeout(),
                                  stopToken)) {
                auto label = classifyPort(service);
                spdlog::debug("Windows service on {}:{} -> {}", address, service.port, label);
                return label;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Windows service probe {}:{} failed: {}", address, service.port,
                          e.what());
        }
    }

    return std::nullopt;
}

} // namespace lanscout::infra
