#pragma once

#include <map>
#include <optional>
#include <string>

namespace lanscout::core {

/**
 * @brief Maps IPv4 addresses to hardware addresses using the neighbour table.
 */
class IMacAddressResolver {
public:
    virtual ~IMacAddressResolver() = default;

    /**
     * @brief Reads the complete neighbour table.
     * @return Map from dotted-quad address to "AA:BB:CC:DD:EE:FF".
     */
    virtual std::map<std::string, std::string> getArpTable() = 0;

    /**
     * @brief Looks up a single address.
     */
    virtual std::optional<std::string> getMacAddress(const std::string& address) {
        auto table = getArpTable();
        auto it = table.find(address);
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

} // namespace lanscout::core
