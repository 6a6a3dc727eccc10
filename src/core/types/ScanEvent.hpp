/**
 * @file ScanEvent.hpp
 * @brief Notifications emitted by the network scanner.
 */

#pragma once

#include "core/types/NetworkDevice.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lanscout::core {

/**
 * @brief Kinds of scanner notifications.
 */
enum class ScanEventType {
    DeviceDiscovered,      ///< A device was created or its online state or type changed
    ScanProgress,          ///< Free-form progress message
    ScanningStateChanged,  ///< A sweep started or finished
    NextScanTimeChanged,   ///< The background scheduler picked a new time
    LastScanTimeChanged    ///< A sweep completed
};

/**
 * @brief Payload of a scanner notification. Only the fields relevant to
 *        @c type are populated.
 */
struct ScanEvent {
    ScanEventType type{ScanEventType::ScanProgress};
    std::optional<NetworkDevice> device;   ///< DeviceDiscovered
    std::string message;                   ///< ScanProgress
    bool scanning{false};                  ///< ScanningStateChanged
    std::optional<std::chrono::system_clock::time_point> time; ///< Next/LastScanTimeChanged
};

std::string toString(ScanEventType type);

} // namespace lanscout::core
