#pragma once

#include "core/types/ScanOptions.hpp"
#include "infrastructure/detection/DetectorChain.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/network/TcpProbe.hpp"

#include <memory>
#include <string>

namespace lanscout::infra {

/**
 * @brief Shared I/O objects handed to detectors. All must outlive the detectors.
 */
struct DetectorContext {
    AsioContext& asio;
    TcpProbe& tcpProbe;
    HttpClient& httpClient;
};

/**
 * @brief Builds detectors from configuration names.
 *
 * Known names: "upnp", "mdns", "service_endpoint", "http", "ssh",
 * "windows_services".
 */
class DetectorFactory {
public:
    /**
     * @brief Creates one detector.
     * @throws core::ConfigurationError for an unknown name.
     */
    static DetectorChain::DetectorPtr create(const std::string& name, DetectorContext& context,
                                             const core::PortDetectionOptions& ports,
                                             const core::DetectorOptions& detectors);

    /**
     * @brief Validates the options and builds a chain of the enabled detectors.
     * @throws core::ConfigurationError for invalid options.
     */
    static std::shared_ptr<DetectorChain> createChain(DetectorContext& context,
                                                      const core::PortDetectionOptions& ports,
                                                      const core::DetectorOptions& detectors);
};

} // namespace lanscout::infra
