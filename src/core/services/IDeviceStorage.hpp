/**
 * @file IDeviceStorage.hpp
 * @brief Interface for persisting device inventory snapshots.
 */

#pragma once

#include "core/types/NetworkDevice.hpp"

#include <vector>

namespace lanscout::core {

/**
 * @brief Loads and saves the list of known devices.
 */
class IDeviceStorage {
public:
    virtual ~IDeviceStorage() = default;

    /**
     * @brief Loads previously saved devices.
     * @return Saved devices, or an empty list if nothing could be read.
     */
    virtual std::vector<NetworkDevice> loadDevices() = 0;

    /**
     * @brief Replaces the stored snapshot.
     * @return True on success.
     */
    virtual bool saveDevices(const std::vector<NetworkDevice>& devices) = 0;
};

} // namespace lanscout::core
