#include "infrastructure/network/ArpTableResolver.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace lanscout::infra {

ArpTableResolver::ArpTableResolver(std::filesystem::path arpPath) : arpPath_(std::move(arpPath)) {}

std::map<std::string, std::string> ArpTableResolver::getArpTable() {
    std::ifstream file(arpPath_);
    if (!file) {
        spdlog::debug("Cannot open neighbour table {}", arpPath_.string());
        return {};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseArpTable(buffer.str());
}

std::map<std::string, std::string> ArpTableResolver::parseArpTable(const std::string& content) {
    std::map<std::string, std::string> table;
    std::istringstream stream(content);
    std::string line;

    // Header: IP address  HW type  Flags  HW address  Mask  Device
    std::getline(stream, line);

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string ip, hwType, flags, mac;
        if (!(fields >> ip >> hwType >> flags >> mac)) {
            continue;
        }
        if (auto normalized = normalizeMac(mac)) {
            table[ip] = *normalized;
        }
    }

    return table;
}

std::optional<std::string> ArpTableResolver::normalizeMac(const std::string& mac) {
    std::string hex;
    for (char c : mac) {
        if (c == ':' || c == '-') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (hex.size() != 12 || hex == "000000000000") {
        return std::nullopt;
    }

    std::string result;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!result.empty()) {
            result += ':';
        }
        result += hex.substr(i, 2);
    }
    return result;
}

} // namespace lanscout::infra
