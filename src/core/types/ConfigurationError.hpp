#pragma once

#include <stdexcept>
#include <string>

namespace lanscout::core {

/**
 * @brief Raised for invalid scanner settings, surfaced before any probing starts.
 *
 * Covers malformed subnet bases and ranges, an "auto" subnet that cannot be
 * resolved to a local interface, and invalid port tables or intervals.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace lanscout::core
