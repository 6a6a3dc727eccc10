#include "infrastructure/network/IpRange.hpp"

#include "core/types/ConfigurationError.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>

#include <cctype>
#include <sstream>

namespace lanscout::infra {

IpRange::IpRange(std::string base, int startOctet, int endOctet)
    : base_(std::move(base)), startOctet_(startOctet), endOctet_(endOctet) {}

IpRange IpRangeEnumerator::resolve(const std::string& subnetBase, int startOctet, int endOctet,
                                   core::ISubnetProvider& subnetProvider) {
    if (startOctet < 1 || endOctet > 254 || startOctet > endOctet) {
        throw core::ConfigurationError("Invalid host range " + std::to_string(startOctet) +
                                       ".." + std::to_string(endOctet));
    }

    std::string base = subnetBase;
    if (base == "auto") {
        auto subnets = subnetProvider.getSubnetsToScan();
        if (subnets.empty()) {
            throw core::ConfigurationError(
                "Cannot resolve subnet automatically: no active IPv4 interface");
        }
        base = subnets.front();
        spdlog::debug("Resolved automatic subnet to {}.x", base);
    }

    if (!isValidSubnetBase(base)) {
        throw core::ConfigurationError("Invalid subnet base: '" + base + "'");
    }

    return IpRange(base, startOctet, endOctet);
}

bool IpRangeEnumerator::isValidSubnetBase(const std::string& subnetBase) {
    std::istringstream stream(subnetBase);
    std::string part;
    int count = 0;

    while (std::getline(stream, part, '.')) {
        if (part.empty() || part.size() > 3) {
            return false;
        }
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        if (std::stoi(part) > 255) {
            return false;
        }
        ++count;
    }

    return count == 3 && subnetBase.back() != '.';
}

bool IpRangeEnumerator::isValidIpv4(const std::string& address) {
    struct in_addr addr {};
    return inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

} // namespace lanscout::infra
