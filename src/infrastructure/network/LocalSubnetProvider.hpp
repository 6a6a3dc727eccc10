#pragma once

#include "core/services/ISubnetProvider.hpp"

namespace lanscout::infra {

/**
 * @brief Derives /24 subnet bases from the host's active IPv4 interfaces.
 *
 * The first interface that is up and not a loopback comes first; further
 * non-loopback interfaces follow in system order without duplicates.
 */
class LocalSubnetProvider : public core::ISubnetProvider {
public:
    std::vector<std::string> getSubnetsToScan() override;
};

} // namespace lanscout::infra
