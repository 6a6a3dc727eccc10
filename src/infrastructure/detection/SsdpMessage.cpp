#include "infrastructure/detection/SsdpMessage.hpp"

#include "infrastructure/detection/TextMatch.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lanscout::infra {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::optional<std::string> SsdpMessage::header(const std::string& name) const {
    auto it = headers.find(toUpper(name));
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool SsdpMessage::announcesDevice() const {
    switch (kind) {
    case Kind::SearchResponse:
        return true;
    case Kind::Notify: {
        auto nts = header("NTS");
        return nts && text::toLower(*nts) == "ssdp:alive";
    }
    case Kind::Search:
        return false;
    }
    return false;
}

std::optional<SsdpMessage> SsdpMessage::parse(std::string_view datagram) {
    std::istringstream stream{std::string(datagram)};
    std::string line;
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }

    SsdpMessage message;
    message.startLine = text::trim(line);
    auto upperStart = toUpper(message.startLine);

    if (upperStart.rfind("HTTP/1.", 0) == 0) {
        message.kind = Kind::SearchResponse;
    } else if (upperStart.rfind("NOTIFY ", 0) == 0) {
        message.kind = Kind::Notify;
    } else if (upperStart.rfind("M-SEARCH ", 0) == 0) {
        message.kind = Kind::Search;
    } else {
        return std::nullopt;
    }

    while (std::getline(stream, line)) {
        auto trimmed = text::trim(line);
        if (trimmed.empty()) {
            break;
        }
        auto colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        message.headers[toUpper(text::trim(trimmed.substr(0, colon)))] =
            text::trim(trimmed.substr(colon + 1));
    }

    return message;
}

std::string SsdpMessage::buildSearchRequest(const std::string& searchTarget, int mx) {
    std::string request = "M-SEARCH * HTTP/1.1\r\n";
    request += "HOST: " + std::string(MULTICAST_ADDRESS) + ":" + std::to_string(MULTICAST_PORT) +
               "\r\n";
    request += "MAN: \"ssdp:discover\"\r\n";
    request += "MX: " + std::to_string(mx) + "\r\n";
    request += "ST: " + searchTarget + "\r\n";
    request += "\r\n";
    return request;
}

} // namespace lanscout::infra
