#pragma once

#include "core/services/IDeviceTypeDetector.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/network/TcpProbe.hpp"

namespace lanscout::infra {

/**
 * @brief Reads the SSH identification banner and maps it to an OS family.
 */
class SshDetector : public core::IDeviceTypeDetector {
public:
    static constexpr int PRIORITY = 40;

    SshDetector(TcpProbe& probe, core::PortDetectionOptions options);

    [[nodiscard]] int priority() const override { return PRIORITY; }
    [[nodiscard]] std::string name() const override { return "ssh"; }

    std::optional<std::string> detectDeviceType(const std::string& address,
                                                std::stop_token stopToken) override;

    /**
     * @brief Maps a banner such as "SSH-2.0-OpenSSH_8.9p1 Ubuntu-3" to a label.
     */
    static std::optional<std::string> classifyBanner(const std::string& banner);

private:
    TcpProbe& probe_;
    core::PortDetectionOptions options_;
};

} // namespace lanscout::infra
