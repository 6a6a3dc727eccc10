#pragma once

#include <optional>
#include <string>

namespace lanscout::core {

/**
 * @brief Resolves a display name for an address (reverse DNS or similar).
 */
class IHostnameResolver {
public:
    virtual ~IHostnameResolver() = default;

    /**
     * @brief Looks up a name for @p address.
     * @return The name, or nullopt when nothing is known.
     */
    virtual std::optional<std::string> resolveHostname(const std::string& address) = 0;
};

} // namespace lanscout::core
