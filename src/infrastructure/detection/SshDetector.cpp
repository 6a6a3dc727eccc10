#include "infrastructure/detection/SshDetector.hpp"

#include "infrastructure/detection/TextMatch.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

namespace {

constexpr size_t MAX_BANNER_BYTES = 256;

} // namespace

SshDetector::SshDetector(TcpProbe& probe, core::PortDetectionOptions options)
    : probe_(probe), options_(std::move(options)) {}

std::optional<std::string> SshDetector::classifyBanner(const std::string& banner) {
    auto lower = text::toLower(banner);

    if (text::contains(lower, "ubuntu")) {
        return "Ubuntu Linux (SSH)";
    }
    if (text::contains(lower, "debian")) {
        return "Debian Linux (SSH)";
    }
    if (text::contains(lower, "raspbian")) {
        return "Raspberry Pi (SSH)";
    }
    if (text::contains(lower, "openssh")) {
        return "Linux/Unix (SSH)";
    }
    if (text::contains(lower, "ssh")) {
        return "Unknown (SSH)";
    }
    return std::nullopt;
}

std::optional<std::string> SshDetector::detectDeviceType(const std::string& address,
                                                         std::stop_token stopToken) {
    try {
        TcpRequest request;
        request.address = address;
        request.port = options_.sshPort;
        request.maxResponseBytes = MAX_BANNER_BYTES;
        request.timeout = options_.connectionTimeout();

        auto result = probe_.exchange(request, stopToken);
        if (!result.connected || result.response.empty()) {
            return std::nullopt;
        }

        auto label = classifyBanner(result.response);
        if (label) {
            spdlog::debug("SSH detection on {} -> {}", address, *label);
        }
        return label;
    } catch (const std::exception& e) {
        spdlog::debug("SSH detection on {} failed: {}", address, e.what());
        return std::nullopt;
    }
}

} // namespace lanscout::infra
