#include "infrastructure/network/LocalSubnetProvider.hpp"

#include "core/types/NetworkInterface.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanscout::infra {

std::vector<std::string> LocalSubnetProvider::getSubnetsToScan() {
    std::vector<std::string> subnets;
    auto interfaces = core::NetworkInterfaceEnumerator::enumerate();

    if (auto primary = core::NetworkInterfaceEnumerator::findPrimary(interfaces)) {
        subnets.push_back(primary->subnetBase());
        spdlog::debug("Primary interface {} ({})", primary->name, primary->ipAddress);
    }

    for (const auto& iface : interfaces) {
        if (!iface.isUp || iface.isLoopback) {
            continue;
        }
        auto base = iface.subnetBase();
        if (!base.empty() && std::find(subnets.begin(), subnets.end(), base) == subnets.end()) {
            subnets.push_back(base);
        }
    }

    if (subnets.empty()) {
        spdlog::warn("No active non-loopback IPv4 interface found");
    }
    return subnets;
}

} // namespace lanscout::infra
