#pragma once

#include "core/services/IDeviceTypeDetector.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/network/TcpProbe.hpp"

namespace lanscout::infra {

/**
 * @brief Recognises custom service endpoints by an open port from a configured table.
 *
 * The label of the first open port is returned verbatim.
 */
class ServiceEndpointDetector : public core::IDeviceTypeDetector {
public:
    static constexpr int PRIORITY = 60;

    ServiceEndpointDetector(TcpProbe& probe, core::PortDetectionOptions options);

    [[nodiscard]] int priority() const override { return PRIORITY; }
    [[nodiscard]] std::string name() const override { return "service_endpoint"; }

    std::optional<std::string> detectDeviceType(const std::string& address,
                                                std::stop_token stopToken) override;

private:
    TcpProbe& probe_;
    core::PortDetectionOptions options_;
};

} // namespace lanscout::infra
