#pragma once

#include "core/services/IMacAddressResolver.hpp"

#include <filesystem>

namespace lanscout::infra {

/**
 * @brief Reads the kernel neighbour table from /proc/net/arp.
 *
 * Entries only exist for hosts the kernel has talked to recently, so lookups
 * are most useful right after a successful ping.
 */
class ArpTableResolver : public core::IMacAddressResolver {
public:
    explicit ArpTableResolver(std::filesystem::path arpPath = "/proc/net/arp");

    std::map<std::string, std::string> getArpTable() override;

    /**
     * @brief Parses the text format of /proc/net/arp.
     */
    static std::map<std::string, std::string> parseArpTable(const std::string& content);

    /**
     * @brief Normalises "aa-bb-cc-dd-ee-ff" or "aa:bb:..." to "AA:BB:CC:DD:EE:FF".
     * @return nullopt for malformed or all-zero (incomplete) addresses.
     */
    static std::optional<std::string> normalizeMac(const std::string& mac);

private:
    std::filesystem::path arpPath_;
};

} // namespace lanscout::infra
