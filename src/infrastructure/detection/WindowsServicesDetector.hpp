#pragma once

#include "core/services/IDeviceTypeDetector.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/network/TcpProbe.hpp"

namespace lanscout::infra {

/**
 * @brief Infers Windows hosts from well-known service ports (RDP, WinRM, SMB, ...).
 *
 * Ports are tried in table order and the first open one decides the label.
 * Remote-management ports (3389, 5985, 5986) indicate a server role.
 */
class WindowsServicesDetector : public core::IDeviceTypeDetector {
public:
    static constexpr int PRIORITY = 30;

    WindowsServicesDetector(TcpProbe& probe, core::PortDetectionOptions options);

    [[nodiscard]] int priority() const override { return PRIORITY; }
    [[nodiscard]] std::string name() const override { return "windows_services"; }

    std::optional<std::string> detectDeviceType(const std::string& address,
                                                std::stop_token stopToken) override;

    /**
     * @brief Builds the label for an open service port.
     * @return "Windows Server (label)" or "Windows Client (label)".
     */
    static std::string classifyPort(const core::ServicePort& service);

private:
    TcpProbe& probe_;
    core::PortDetectionOptions options_;
};

} // namespace lanscout::infra
