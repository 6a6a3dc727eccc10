#include "infrastructure/detection/DetectorFactory.hpp"

#include "core/types/ConfigurationError.hpp"
#include "infrastructure/detection/HttpDetector.hpp"
#include "infrastructure/detection/MdnsDetector.hpp"
#include "infrastructure/detection/ServiceEndpointDetector.hpp"
#include "infrastructure/detection/SshDetector.hpp"
#include "infrastructure/detection/UpnpDetector.hpp"
#include "infrastructure/detection/WindowsServicesDetector.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

DetectorChain::DetectorPtr DetectorFactory::create(const std::string& name,
                                                   DetectorContext& context,
                                                   const core::PortDetectionOptions& ports,
                                                   const core::DetectorOptions& detectors) {
    if (name == "upnp") {
        return std::make_shared<UpnpDetector>(context.asio, context.httpClient, detectors);
    }
    if (name == "mdns") {
        return std::make_shared<MdnsDetector>(context.asio, detectors);
    }
    if (name == "service_endpoint") {
        return std::make_shared<ServiceEndpointDetector>(context.tcpProbe, ports);
    }
    if (name == "http") {
        return std::make_shared<HttpDetector>(context.tcpProbe, ports);
    }
    if (name == "ssh") {
        return std::make_shared<SshDetector>(context.tcpProbe, ports);
    }
    if (name == "windows_services") {
        return std::make_shared<WindowsServicesDetector>(context.tcpProbe, ports);
    }
    throw core::ConfigurationError("Unknown detector: " + name);
}

std::shared_ptr<DetectorChain> DetectorFactory::createChain(
    DetectorContext& context, const core::PortDetectionOptions& ports,
    const core::DetectorOptions& detectors) {
    ports.validate();
    detectors.validate();

    auto chain = std::make_shared<DetectorChain>();
    for (const auto& name : detectors.enabled) {
        chain->add(create(name, context, ports, detectors));
    }

    spdlog::info("Detector chain ready with {} detectors", chain->size());
    return chain;
}

} // namespace lanscout::infra
