#pragma once

#include <string>
#include <vector>

namespace lanscout::core {

/**
 * @brief Supplies /24 subnet bases ("192.168.1") for automatic range selection.
 */
class ISubnetProvider {
public:
    virtual ~ISubnetProvider() = default;

    /**
     * @brief Returns candidate subnet bases, most relevant first.
     * @return Empty when no active local IPv4 interface exists.
     */
    virtual std::vector<std::string> getSubnetsToScan() = 0;
};

} // namespace lanscout::core
