#include "infrastructure/detection/HttpDetector.hpp"

#include "infrastructure/detection/TextMatch.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace lanscout::infra {

namespace {

constexpr size_t MAX_RESPONSE_BYTES = 1024;

std::optional<std::string> classifyServerHeader(const std::string& value) {
    using text::contains;

    if (contains(value, "microsoft-iis")) {
        if (contains(value, "iis/10.0")) {
            return "Windows Server 2016/2019/2022 (HTTP)";
        }
        if (contains(value, "iis/8.5")) {
            return "Windows Server 2012 R2 (HTTP)";
        }
        if (contains(value, "iis/8.0")) {
            return "Windows Server 2012 (HTTP)";
        }
        return "Windows Server (HTTP)";
    }
    if (contains(value, "kestrel")) {
        return "Windows/Linux (.NET) (HTTP)";
    }
    if (text::containsAny(value, {"apache", "nginx", "lighttpd"})) {
        return "Linux Server (HTTP)";
    }
    return std::nullopt;
}

std::string labelForPort(uint16_t port) {
    switch (port) {
    case 5000:
        return "Unknown (.NET App) (HTTP)";
    case 8000:
    case 8080:
        return "Unknown (Web App) (HTTP)";
    case 8443:
        return "Unknown (Secure Web) (HTTP)";
    default:
        return "Unknown (HTTP)";
    }
}

} // namespace

HttpDetector::HttpDetector(TcpProbe& probe, core::PortDetectionOptions options)
    : probe_(probe), options_(std::move(options)) {}

std::optional<std::string> HttpDetector::classifyResponse(const std::string& response,
                                                          uint16_t port) {
    std::istringstream stream(text::toLower(response));
    std::string line;

    while (std::getline(stream, line)) {
        auto trimmed = text::trim(line);
        if (trimmed.rfind("server:", 0) == 0) {
            if (auto label = classifyServerHeader(trimmed)) {
                return label;
            }
        }
        if (text::contains(trimmed, "asp.net")) {
            return "Windows Server (.NET) (HTTP)";
        }
        if (text::contains(trimmed, "microsoft-httpapi")) {
            return "Windows Server (HTTP)";
        }
    }

    if (text::contains(response, "HTTP/1.")) {
        return labelForPort(port);
    }
    return std::nullopt;
}

std::optional<std::string> HttpDetector::detectDeviceType(const std::string& address,
                                                          std::stop_token stopToken) {
    std::vector<uint16_t> ports = options_.customIoTPorts;
    ports.insert(ports.end(), options_.standardHttpPorts.begin(),
                 options_.standardHttpPorts.end());

    for (uint16_t port : ports) {
        if (stopToken.stop_requested()) {
            return std::nullopt;
        }

        try {
            TcpRequest request;
            request.address = address;
            request.port = port;
            request.payload = "HEAD / HTTP/1.1\r\nHost: " + address +
                              "\r\nConnection: close\r\n\r\n";
            request.maxResponseBytes = MAX_RESPONSE_BYTES;
            request.timeout = options_.connectionTimeout();

            auto result = probe_.exchange(request, stopToken);
            if (!result.connected || result.response.empty()) {
                continue;
            }

            if (auto label = classifyResponse(result.response, port)) {
                spdlog::debug("HTTP detection on {}:{} -> {}", address, port, *label);
                return label;
            }
        } catch (const std::exception& e) {
            spdlog::debug("HTTP detection on {}:{} failed: {}", address, port, e.what());
        }
    }

    return std::nullopt;
}

} // namespace lanscout::infra
