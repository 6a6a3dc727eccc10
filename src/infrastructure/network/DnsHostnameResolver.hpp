#pragma once

#include "core/services/IHostnameResolver.hpp"

namespace lanscout::infra {

/**
 * @brief Reverse DNS lookup through the system resolver (getnameinfo).
 *
 * "nas.home.lan" becomes "NAS (home)"; a domain label of two characters or
 * fewer is dropped, so "printer.lan" becomes "PRINTER". Blocks the calling
 * sweep worker while the system resolver runs.
 */
class DnsHostnameResolver : public core::IHostnameResolver {
public:
    std::optional<std::string> resolveHostname(const std::string& address) override;

    /**
     * @brief Formats a fully qualified name for display.
     * @return nullopt when @p fqdn is empty or just echoes the address.
     */
    static std::optional<std::string> formatHostname(const std::string& fqdn,
                                                     const std::string& address);
};

} // namespace lanscout::infra
