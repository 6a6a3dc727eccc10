/**
 * @file IDeviceTypeDetector.hpp
 * @brief Capability interface for device classification strategies.
 */

#pragma once

#include <optional>
#include <stop_token>
#include <string>

namespace lanscout::core {

/**
 * @brief One strategy for deriving a device type label from an address.
 *
 * Detectors are ordered by priority (higher runs first). A label carries the
 * detection method as a suffix, e.g. "Ubuntu Linux (SSH)".
 *
 * @note detectDeviceType() must not throw. Network failures, timeouts and
 *       cancellation all yield std::nullopt.
 */
class IDeviceTypeDetector {
public:
    virtual ~IDeviceTypeDetector() = default;

    /**
     * @brief Ordering weight; higher values are consulted first.
     */
    [[nodiscard]] virtual int priority() const = 0;

    /**
     * @brief Short identifier used in logs and configuration.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Attempts to classify the device at @p address.
     * @param address Dotted-quad IPv4 address of an online device.
     * @param stopToken Requests early abandonment of in-flight probes.
     * @return A label on match, nullopt otherwise.
     */
    virtual std::optional<std::string> detectDeviceType(const std::string& address,
                                                        std::stop_token stopToken) = 0;
};

} // namespace lanscout::core
