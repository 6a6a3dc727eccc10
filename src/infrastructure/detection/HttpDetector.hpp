#pragma once

#include "core/services/IDeviceTypeDetector.hpp"
#include "core/types/ScanOptions.hpp"
#include "infrastructure/network/TcpProbe.hpp"

namespace lanscout::infra {

/**
 * @brief Classifies web servers from the headers of a HEAD request.
 *
 * Custom IoT ports are tried before the standard HTTP ports; the first port
 * whose response yields a label wins.
 */
class HttpDetector : public core::IDeviceTypeDetector {
public:
    static constexpr int PRIORITY = 50;

    HttpDetector(TcpProbe& probe, core::PortDetectionOptions options);

    [[nodiscard]] int priority() const override { return PRIORITY; }
    [[nodiscard]] std::string name() const override { return "http"; }

    std::optional<std::string> detectDeviceType(const std::string& address,
                                                std::stop_token stopToken) override;

    /**
     * @brief Maps a raw HTTP response to a label.
     *
     * Server headers are matched specific-first (IIS versions before generic
     * IIS). Without a recognised header any "HTTP/1." response is labelled by
     * the port it came from.
     */
    static std::optional<std::string> classifyResponse(const std::string& response,
                                                       uint16_t port);

private:
    TcpProbe& probe_;
    core::PortDetectionOptions options_;
};

} // namespace lanscout::infra
